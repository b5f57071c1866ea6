#pragma once
#include <string>

namespace orodb {

using str = std::string;

// printf-style message, prefixed with the call site, thrown as DatabaseError.
[[noreturn]] void error(const std::string& msg, const char* file, int line, ...);

// printf-style formatting into a std::string.
std::string strfmt(const char* fmt, ...);

} // namespace orodb

// A helper macro to automatically pass __FILE__ and __LINE__
#define ORODB_THROW(msg, ...) ::orodb::error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
