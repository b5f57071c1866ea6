#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace orodb {
struct CoreSettings;
}

namespace orodb::logging {

struct LogField {
    std::string key;
    std::string value;
};

LogField str_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField bool_field(std::string_view key, bool value);

// "DEBUG", "info", "WARNING", ... Throws ConfigError on an unknown name.
spdlog::level::level_enum parse_level(const std::string& name);

// Installs the "orodb" default logger. Safe to call more than once.
void init_logging(const CoreSettings& settings);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace orodb::logging

#define ORODB_LOG_DEBUG(message, ...) ::orodb::logging::log_debug((message), ##__VA_ARGS__)
#define ORODB_LOG_INFO(message, ...) ::orodb::logging::log_info((message), ##__VA_ARGS__)
#define ORODB_LOG_WARN(message, ...) ::orodb::logging::log_warn((message), ##__VA_ARGS__)
#define ORODB_LOG_ERROR(message, ...) ::orodb::logging::log_error((message), ##__VA_ARGS__)
