#include <catch2/catch.hpp>

#include "errors.hpp"
#include "jsonhlp.hpp"
#include "lib.hpp"

using namespace orodb;

TEST_CASE("every error is an OroDbError", "[errors]") {
    CHECK_THROWS_AS(throw DatabaseError("boom"), OroDbError);
    CHECK_THROWS_AS(throw ValidationError("bad"), OroDbError);
    CHECK_THROWS_AS(throw ConfigError("bad"), OroDbError);
    CHECK_THROWS_AS(throw NotFoundError("Migration", "001"), OroDbError);
    CHECK_THROWS_AS(throw ConflictError("exists"), std::runtime_error);
}

TEST_CASE("errors carry details", "[errors]") {
    ValidationError v("bad steps", std::string("steps"), std::string("0"));
    CHECK(v.message() == "bad steps");
    CHECK(v.details().at("field") == "steps");
    CHECK(v.details().at("value") == "0");

    ConfigError c("missing", { "ORO_DB_HOST", "ORO_DB_PORT" });
    CHECK(c.details().at("missing_vars") == "ORO_DB_HOST,ORO_DB_PORT");
    CHECK(ConfigError("plain").details().empty());

    NotFoundError n("Migration", "007");
    CHECK(n.message() == "Migration not found: 007");
    CHECK(n.details().at("resource_type") == "Migration");
    CHECK(n.details().at("resource_id") == "007");

    ConflictError k("exists", std::string("001"));
    CHECK(k.details().at("existing_id") == "001");
}

TEST_CASE("to_json renders type, message and details", "[errors][json]") {
    NotFoundError n("Table", "users");
    jdoc doc;
    REQUIRE(jhlp::parse_str(n.to_json(), doc));
    CHECK(jhlp::get<std::string>(doc, "error") == "NotFoundError");
    CHECK(jhlp::get<std::string>(doc, "message") == "Table not found: users");
    REQUIRE(doc["details"].IsObject());
    CHECK(jhlp::get<std::string>(doc["details"], "resource_id") == "users");

    jdoc plain;
    REQUIRE(jhlp::parse_str(DatabaseError("x").to_json(), plain));
    CHECK(plain["details"].ObjectEmpty());
}

TEST_CASE("ORODB_THROW prefixes the call site", "[errors]") {
    try {
        ORODB_THROW("failed on %s (%d)", "users", 3);
        FAIL("expected DatabaseError");
    } catch (const DatabaseError& e) {
        CHECK_THAT(e.message(), Catch::Contains("test_errors.cpp:"));
        CHECK_THAT(e.message(), Catch::EndsWith("failed on users (3)"));
    }
    CHECK(strfmt("%03d_%s", 7, "x") == "007_x");
}
