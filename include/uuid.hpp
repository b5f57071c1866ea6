#pragma once
#include <cstdint>
#include <random>
#include <string>

namespace orodb {

class UUID {
public:
    // Random RFC 4122 version 4 id, lowercase 8-4-4-4-12 hex.
    static std::string get_id() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        uint64_t hi = gen();
        uint64_t lo = gen();

        uint8_t bytes[16] = {};
        for (int i = 0; i < 8; ++i) {
            bytes[i] = (hi >> (56 - 8 * i)) & 0xFF;
            bytes[8 + i] = (lo >> (56 - 8 * i)) & 0xFF;
        }
        // version 4
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        // variant 10xx
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        static const char* HEX = "0123456789abcdef";

        std::string out;
        out.reserve(36);
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += HEX[(bytes[i] >> 4) & 0x0F];
            out += HEX[bytes[i] & 0x0F];
        }
        return out;
    }
};

inline std::string generate_id() { return UUID::get_id(); }

} // namespace orodb
