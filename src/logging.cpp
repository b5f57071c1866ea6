#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"

namespace orodb::logging {
namespace {

    constexpr const char* LOGGER_NAME = "orodb";
    constexpr const char* DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    constexpr const char* JSON_PATTERN = R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l","logger":"%n","message":"%v"})";

    std::string resolve_pattern(const CoreSettings& settings) {
        if (settings.log_format.empty()) return DEFAULT_PATTERN;
        if (settings.log_format == "json") return JSON_PATTERN;
        return settings.log_format;
    }

    std::string serialize_fields(std::initializer_list<LogField> fields) {
        std::ostringstream out;
        bool first = true;
        for (const auto& field : fields) {
            if (!first) {
                out << ' ';
            }
            first = false;
            out << field.key << '=' << field.value;
        }
        return out.str();
    }

} // namespace

LogField str_field(std::string_view key, std::string_view value) {
    return { std::string(key), std::string(value) };
}

LogField int_field(std::string_view key, std::int64_t value) {
    return { std::string(key), std::to_string(value) };
}

LogField bool_field(std::string_view key, bool value) {
    return { std::string(key), value ? "true" : "false" };
}

spdlog::level::level_enum parse_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "warning") n = "warn";
    if (n == "error") n = "err";
    if (n == "fatal") n = "critical";

    auto level = spdlog::level::from_str(n);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && n != "off") {
        throw ConfigError("Unknown log level '" + name + "'", { "ORO_LOG_LEVEL" });
    }
    return level;
}

void init_logging(const CoreSettings& settings) {
    const auto level = parse_level(settings.log_level);

    spdlog::drop(LOGGER_NAME);
    std::shared_ptr<spdlog::logger> logger;
    try {
        if (settings.log_file) {
            logger = spdlog::basic_logger_mt(LOGGER_NAME, *settings.log_file);
        } else {
            logger = spdlog::stdout_color_mt(LOGGER_NAME);
        }
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError(std::string("Failed to initialise logging: ") + e.what(), { "ORO_LOG_FILE" });
    }
    logger->set_pattern(resolve_pattern(settings));
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto serialized_fields = serialize_fields(fields);
    if (!serialized_fields.empty()) {
        spdlog::log(level, "{} {}", message, serialized_fields);
        return;
    }
    spdlog::log(level, "{}", message);
}

} // namespace orodb::logging
