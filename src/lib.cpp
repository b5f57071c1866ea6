#include "lib.hpp"

#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <vector>

#include "errors.hpp"

namespace orodb {

namespace {

    // Two passes: the first vsnprintf with a null buffer returns the size
    // the formatted string needs, the second writes it.
    std::string vformat(const char* fmt, va_list args) {
        va_list args_copy;
        va_copy(args_copy, args);
        int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (required_size < 0) {
            throw DatabaseError("Failed to determine required buffer size.");
        }

        std::vector<char> buffer(required_size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        return std::string(buffer.data(), required_size);
    }

} // namespace

std::string strfmt(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string body = vformat(msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << body;
    throw DatabaseError(ss.str());
}

} // namespace orodb
