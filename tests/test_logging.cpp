#include <catch2/catch.hpp>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "test_support.hpp"

using namespace orodb;
using namespace orodb::test;

TEST_CASE("log levels parse case-insensitively", "[logging]") {
    CHECK(logging::parse_level("DEBUG") == spdlog::level::debug);
    CHECK(logging::parse_level("info") == spdlog::level::info);
    CHECK(logging::parse_level("WARNING") == spdlog::level::warn);
    CHECK(logging::parse_level("Error") == spdlog::level::err);
    CHECK(logging::parse_level("off") == spdlog::level::off);
    CHECK_THROWS_AS(logging::parse_level("chatty"), ConfigError);
}

TEST_CASE("fields render as key=value", "[logging]") {
    CHECK(logging::str_field("version", "001").value == "001");
    CHECK(logging::int_field("count", 3).value == "3");
    CHECK(logging::bool_field("dry_run", true).value == "true");
}

TEST_CASE("file logging writes structured lines", "[logging]") {
    TempDir tmp;
    CoreSettings s;
    s.log_level = "debug";
    s.log_file = (tmp / "orodb.log").string();
    s.log_format = "%l %v";
    logging::init_logging(s);

    ORODB_LOG_INFO("Applied migration", { logging::str_field("version", "001") });
    ORODB_LOG_DEBUG("Discovered migrations", { logging::int_field("count", 2) });
    spdlog::default_logger()->flush();

    auto text = read_file(tmp / "orodb.log");
    CHECK_THAT(text, Catch::Contains("info Applied migration version=001"));
    CHECK_THAT(text, Catch::Contains("debug Discovered migrations count=2"));

    // back to the console so later tests do not write into a removed file
    CoreSettings console;
    console.log_level = "warning";
    logging::init_logging(console);
}
