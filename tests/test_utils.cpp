#include <catch2/catch.hpp>

#include <regex>
#include <set>

#include "utils.hpp"
#include "uuid.hpp"

using namespace orodb;

TEST_CASE("escape_ilike escapes pattern characters", "[utils]") {
    CHECK(escape_ilike("hello") == "hello");
    CHECK(escape_ilike("100%") == "100\\%");
    CHECK(escape_ilike("user_name") == "user\\_name");
    CHECK(escape_ilike("path\\to") == "path\\\\to");
    CHECK(escape_ilike("%_\\") == "\\%\\_\\\\");
    CHECK(escape_ilike("") == "");
}

TEST_CASE("slugify builds file-name safe slugs", "[utils]") {
    CHECK(slugify("add users table") == "add_users_table");
    CHECK(slugify("  Add   Users--Table!  ") == "add_users_table");
    CHECK(slugify("v2 schema") == "v2_schema");
    CHECK(slugify("!!!") == "");
    CHECK(slugify("") == "");
}

TEST_CASE("slugify keeps non-ASCII text", "[utils]") {
    CHECK(slugify("\xC3\x96lspur") == "\xC3\x96lspur");
    CHECK(slugify("a\xC3\xB1" "adir \xC3\xAD" "ndice") == "a\xC3\xB1" "adir_\xC3\xAD" "ndice");
    CHECK(slugify("\xE6\x97\xA5\xE6\x9C\xAC \xE8\xAA\x9E") == "\xE6\x97\xA5\xE6\x9C\xAC_\xE8\xAA\x9E");
}

TEST_CASE("quote_ident doubles embedded quotes", "[utils]") {
    CHECK(quote_ident("users") == "\"users\"");
    CHECK(quote_ident("we\"ird") == "\"we\"\"ird\"");
}

TEST_CASE("generate_id returns random v4 uuids", "[utils][uuid]") {
    const std::regex v4(R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_id();
        CHECK(std::regex_match(id, v4));
        ids.insert(id);
    }
    CHECK(ids.size() == 100);
}
