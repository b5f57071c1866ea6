#include "utils.hpp"

#include <cctype>

namespace orodb {

std::string escape_ilike(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '%' || c == '_') out += '\\';
        out += c;
    }
    return out;
}

std::string slugify(const std::string& text) {
    std::string out;
    bool gap = false;
    for (unsigned char c : text) {
        // bytes >= 0x80 belong to multi-byte UTF-8 sequences and are kept as-is
        if (c >= 0x80 || std::isalnum(c)) {
            if (gap && !out.empty()) out += '_';
            out += c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
            gap = false;
        } else {
            gap = true;
        }
    }
    return out;
}

std::string quote_ident(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

} // namespace orodb
