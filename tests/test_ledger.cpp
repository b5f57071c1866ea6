#include <catch2/catch.hpp>

#include <regex>

#include "errors.hpp"
#include "ledger.hpp"
#include "test_support.hpp"

using namespace orodb;
using namespace orodb::test;

namespace {

Migration unit(const std::string& version) {
    Migration m;
    m.version = version;
    m.description = "migration " + version;
    m.checksum = checksum_bytes(version);
    return m;
}

struct LedgerFixture {
    TempDir tmp;
    PSQLConnection conn = make_sqlite_connection();

    LedgerFixture() { conn->connect((tmp / "ledger.sqlite").string()); }
};

} // namespace

TEST_CASE("ledger table creation is idempotent", "[ledger]") {
    LedgerFixture f;
    Ledger ledger(*f.conn);
    ledger.ensure();
    ledger.ensure();
    CHECK(ledger.entries().empty());
    CHECK(ledger.count() == 0);
}

TEST_CASE("ledger records and removes entries", "[ledger]") {
    LedgerFixture f;
    Ledger ledger(*f.conn);
    ledger.ensure();

    ledger.record(unit("002"), "2024-01-02 00:00:00.000000");
    ledger.record(unit("001"), "2024-01-01 00:00:00.000000");

    auto all = ledger.entries();
    REQUIRE(all.size() == 2);
    CHECK(all[0].version == "001");
    CHECK(all[0].description == "migration 001");
    CHECK(all[0].checksum == checksum_bytes("001"));
    CHECK(all[0].applied_at == "2024-01-01 00:00:00.000000");

    auto map = ledger.by_version();
    CHECK(map.count("002") == 1);

    CHECK(ledger.remove("002"));
    CHECK_FALSE(ledger.remove("002"));
    CHECK(ledger.count() == 1);
}

TEST_CASE("ledger rejects a version twice", "[ledger]") {
    LedgerFixture f;
    Ledger ledger(*f.conn);
    ledger.ensure();
    ledger.record(unit("001"));
    CHECK_THROWS_AS(ledger.record(unit("001")), DatabaseError);
}

TEST_CASE("latest orders by applied_at then version, newest first", "[ledger]") {
    LedgerFixture f;
    Ledger ledger(*f.conn);
    ledger.ensure();
    ledger.record(unit("001"), "2024-01-01 00:00:00.000000");
    ledger.record(unit("003"), "2024-01-02 00:00:00.000000");
    ledger.record(unit("002"), "2024-01-03 00:00:00.000000");
    ledger.record(unit("004"), "2024-01-03 00:00:00.000000");

    auto two = ledger.latest(2);
    REQUIRE(two.size() == 2);
    CHECK(two[0].version == "004");
    CHECK(two[1].version == "002");

    auto all = ledger.latest(10);
    REQUIRE(all.size() == 4);
    CHECK(all[2].version == "003");
    CHECK(all[3].version == "001");
}

TEST_CASE("ledger writes roll back with the surrounding transaction", "[ledger]") {
    LedgerFixture f;
    Ledger ledger(*f.conn);
    ledger.ensure();

    f.conn->begin();
    ledger.record(unit("001"));
    f.conn->rollback();
    CHECK(ledger.count() == 0);
}

TEST_CASE("ledger timestamps are UTC with microseconds", "[ledger]") {
    auto now = Ledger::now();
    CHECK(std::regex_match(now, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})")));
}
