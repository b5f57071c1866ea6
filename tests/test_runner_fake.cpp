#include <catch2/catch.hpp>

#include "errors.hpp"
#include "fake_sql.hpp"
#include "migration_runner.hpp"
#include "test_support.hpp"

using namespace orodb;
using namespace orodb::test;

namespace {

struct Fixture {
    TempDir tmp;
    std::shared_ptr<FakeState> st = std::make_shared<FakeState>();

    MigrationRunner runner(MigrationRegistry registry = {}) {
        return MigrationRunner(tmp.path(), fake_connected_factory(st), std::move(registry));
    }

    void applied(std::vector<SQLRow> rows) {
        st->results.emplace_back("FROM schema_migrations", std::move(rows));
    }
};

} // namespace

TEST_CASE("status uses the factory and closes what it opened", "[runner][factory]") {
    Fixture f;
    auto runner = f.runner();
    CHECK(runner.status().empty());
    CHECK(f.st->connects > 0);
    CHECK(f.st->closes == f.st->connects);
    CHECK(f.st->ran("CREATE TABLE IF NOT EXISTS schema_migrations"));
}

TEST_CASE("status cross-references the ledger", "[runner][status]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "first");
    write_migration(f.tmp.path(), "002", "second");
    auto runner = f.runner();
    const auto cs = runner.discover()[0]->checksum;
    f.applied({ ledger_row("001", "first", cs, "2024-01-01 10:00:00.000000") });

    auto rows = runner.status();
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].version == "001");
    CHECK(rows[0].applied);
    REQUIRE(rows[0].applied_at);
    CHECK(*rows[0].applied_at == "2024-01-01 10:00:00.000000");
    CHECK_FALSE(rows[0].drifted);
    CHECK(rows[1].version == "002");
    CHECK_FALSE(rows[1].applied);
    CHECK_FALSE(rows[1].applied_at);
}

TEST_CASE("status flags drift without failing", "[runner][status]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "first");
    f.applied({ ledger_row("001", "first", "0000000000000000") });

    auto rows = f.runner().status();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].applied);
    CHECK(rows[0].drifted);
}

TEST_CASE("up applies pending migrations and records them", "[runner][up]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "test", R"(["SELECT 1"])");
    auto runner = f.runner();

    auto applied = runner.up();
    CHECK(applied == std::vector<std::string> { "001" });
    CHECK(f.st->begins == 1);
    CHECK(f.st->commits == 1);
    CHECK(f.st->rollbacks == 0);
    CHECK(f.st->ran("SELECT 1"));
    CHECK(f.st->closes == f.st->connects);

    // the ledger insert carries version, description and checksum
    bool found = false;
    for (std::size_t i = 0; i < f.st->executed.size(); ++i) {
        if (f.st->executed[i].find("INSERT INTO schema_migrations") == std::string::npos) continue;
        const auto& b = f.st->binds[i];
        REQUIRE(b.size() == 4);
        CHECK(b[0] == std::optional<std::string>("001"));
        CHECK(b[1] == std::optional<std::string>("test"));
        CHECK(b[2] == std::optional<std::string>(runner.discover()[0]->checksum));
        CHECK(b[3].has_value());
        found = true;
    }
    CHECK(found);
}

TEST_CASE("up runs migrations in version order, one transaction each", "[runner][up]") {
    Fixture f;
    write_migration(f.tmp.path(), "002", "b", R"j("CREATE TABLE b (id INTEGER)")j");
    write_migration(f.tmp.path(), "001", "a", R"j("CREATE TABLE a (id INTEGER)")j");
    write_migration(f.tmp.path(), "003", "c", R"j("CREATE TABLE c (id INTEGER)")j");

    auto applied = f.runner().up();
    CHECK(applied == std::vector<std::string> { "001", "002", "003" });
    CHECK(f.st->begins == 3);
    CHECK(f.st->commits == 3);
    CHECK(f.st->count("INSERT INTO schema_migrations") == 3);

    std::vector<std::string> order;
    for (const auto& sql : f.st->executed) {
        if (sql.rfind("CREATE TABLE ", 0) == 0 && sql.find("schema_migrations") == std::string::npos) order.push_back(sql);
    }
    CHECK(order == std::vector<std::string> { "CREATE TABLE a (id INTEGER)", "CREATE TABLE b (id INTEGER)", "CREATE TABLE c (id INTEGER)" });
}

TEST_CASE("up dry run touches nothing", "[runner][up][dry-run]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "test", R"(["SELECT 1"])");

    auto applied = f.runner().up(true);
    CHECK(applied == std::vector<std::string> { "001" });
    CHECK(f.st->begins == 0);
    CHECK(f.st->commits == 0);
    CHECK_FALSE(f.st->ran("SELECT 1"));
    CHECK_FALSE(f.st->ran("INSERT INTO schema_migrations"));
    // one connection for the ledger read, one for the unit
    CHECK(f.st->connects == 2);
    CHECK(f.st->closes == 2);
}

TEST_CASE("up with nothing pending is a no-op", "[runner][up]") {
    Fixture f;
    f.applied({ ledger_row("001") });
    auto runner = f.runner();
    CHECK(runner.up().empty());

    write_migration(f.tmp.path(), "001", "test");
    runner.invalidate_cache();
    CHECK(runner.up().empty());
    CHECK(f.st->begins == 0);
}

TEST_CASE("up stops at the first failure and keeps earlier work", "[runner][up][failure]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a", R"j("CREATE TABLE a (id INTEGER)")j");
    write_migration(f.tmp.path(), "002", "b", R"j("CREATE TABLE b (id INTEGER)")j");
    write_migration(f.tmp.path(), "003", "c", R"j("CREATE TABLE c (id INTEGER)")j");
    f.st->fail_on = "CREATE TABLE b";

    CHECK_THROWS_AS(f.runner().up(), DatabaseError);
    CHECK(f.st->commits == 1);
    CHECK(f.st->rollbacks == 1);
    CHECK(f.st->count("INSERT INTO schema_migrations") == 1);
    CHECK_FALSE(f.st->ran("CREATE TABLE c"));
    CHECK(f.st->closes == f.st->connects);
}

TEST_CASE("up rolls back when the commit fails", "[runner][up][failure]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a");
    f.st->fail_on = "COMMIT";

    CHECK_THROWS_AS(f.runner().up(), DatabaseError);
    CHECK(f.st->commits == 0);
    CHECK(f.st->rollbacks == 1);
}

TEST_CASE("up runs registered handlers", "[runner][up][registry]") {
    Fixture f;
    write_file(f.tmp / "001_seed.json", descriptor("001", "seed", R"({"handler": "seed"})"));

    MigrationRegistry reg;
    reg.add("seed", [](SQLConnection& conn) {
        auto stmt = conn.prepare("INSERT INTO settings (k, v) VALUES ($1, $2)");
        stmt->bind(1, "mode");
        stmt->bind(2, "on");
        stmt->exec();
    });

    CHECK(f.runner(std::move(reg)).up() == std::vector<std::string> { "001" });
    CHECK(f.st->ran("INSERT INTO settings"));
    CHECK(f.st->commits == 1);
}

TEST_CASE("down with nothing applied is a no-op", "[runner][down]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a");
    CHECK(f.runner().down().empty());
    CHECK(f.st->begins == 0);
}

TEST_CASE("down rejects non-positive steps", "[runner][down]") {
    Fixture f;
    auto runner = f.runner();
    try {
        runner.down(0);
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.field());
        CHECK(*e.field() == "steps");
    }
    CHECK_THROWS_AS(runner.down(-3), ValidationError);
    CHECK(f.st->connects == 0);
}

TEST_CASE("down reverts the latest entries in ledger order", "[runner][down]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a", "[]", R"("DROP TABLE a")");
    write_migration(f.tmp.path(), "002", "b", "[]", R"("DROP TABLE b")");
    // the ledger answers in applied_at DESC order
    f.applied({ ledger_row("002"), ledger_row("001") });

    auto runner = f.runner();
    CHECK(runner.down() == std::vector<std::string> { "002" });
    CHECK(f.st->ran("DROP TABLE b"));
    CHECK_FALSE(f.st->ran("DROP TABLE a"));
    CHECK(f.st->count("DELETE FROM schema_migrations") == 1);
    CHECK(f.st->commits == 1);

    CHECK(runner.down(5) == std::vector<std::string> { "002", "001" });
    CHECK(f.st->ran("DROP TABLE a"));
}

TEST_CASE("down fails before running anything when a descriptor is gone", "[runner][down]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a", "[]", R"("DROP TABLE a")");
    f.applied({ ledger_row("002"), ledger_row("001") });

    try {
        f.runner().down(2);
        FAIL("expected NotFoundError");
    } catch (const NotFoundError& e) {
        CHECK(e.resource_type() == "Migration");
        CHECK(e.resource_id() == "002");
    }
    CHECK(f.st->begins == 0);
    CHECK_FALSE(f.st->ran("DROP TABLE a"));
}

TEST_CASE("bootstrap refuses a non-empty ledger", "[runner][bootstrap]") {
    Fixture f;
    f.applied({ ledger_row("001") });

    try {
        f.runner().bootstrap();
        FAIL("expected ConflictError");
    } catch (const ConflictError& e) {
        CHECK_THAT(e.message(), Catch::StartsWith("Cannot bootstrap"));
        CHECK_THAT(e.message(), Catch::Contains("1 migration(s)"));
    }
    CHECK(f.st->begins == 0);
}

TEST_CASE("bootstrap records the earliest migration without running it", "[runner][bootstrap]") {
    Fixture f;
    write_migration(f.tmp.path(), "002", "b", R"j("CREATE TABLE b (id INTEGER)")j");
    write_migration(f.tmp.path(), "001", "a", R"j("CREATE TABLE a (id INTEGER)")j");

    CHECK(f.runner().bootstrap() == std::vector<std::string> { "001" });
    CHECK_FALSE(f.st->ran("CREATE TABLE a"));
    CHECK(f.st->count("INSERT INTO schema_migrations") == 1);
    CHECK(f.st->binds.back()[0] == std::optional<std::string>("001"));
    CHECK(f.st->commits == 1);
}

TEST_CASE("bootstrap with no migrations returns empty", "[runner][bootstrap]") {
    Fixture f;
    CHECK(f.runner().bootstrap().empty());
    CHECK(f.st->begins == 0);
}

TEST_CASE("pending is discovered minus applied", "[runner]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a");
    write_migration(f.tmp.path(), "002", "b");
    f.applied({ ledger_row("001") });

    auto todo = f.runner().pending();
    REQUIRE(todo.size() == 1);
    CHECK(todo[0]->version == "002");
}

TEST_CASE("runner surfaces connection failures", "[runner][factory]") {
    Fixture f;
    write_migration(f.tmp.path(), "001", "a");
    f.st->fail_connect = true;
    CHECK_THROWS_AS(f.runner().up(), DatabaseError);
}

TEST_CASE("runner requires a connection provider", "[runner]") {
    TempDir tmp;
    CHECK_THROWS_AS(MigrationRunner(tmp.path(), std::unique_ptr<pool::ConnectionProvider> {}), DatabaseError);
    CHECK_THROWS_AS(MigrationRunner(tmp.path(), ConnectionFactory {}), DatabaseError);
}

TEST_CASE("runner leases from a pool and returns every connection", "[runner][pool]") {
    TempDir tmp;
    auto st = std::make_shared<FakeState>();
    write_migration(tmp.path(), "001", "a", R"j("CREATE TABLE a (id INTEGER)")j");
    write_migration(tmp.path(), "002", "b", R"j("CREATE TABLE b (id INTEGER)")j");

    DbPool pool(1, 2, "fake", fake_factory(st));
    MigrationRunner runner(tmp.path(), pool);
    CHECK(runner.up() == std::vector<std::string> { "001", "002" });

    auto stats = pool.stats();
    CHECK(stats.in_use == 0);
    CHECK(stats.size == 1);
    CHECK(st->commits == 2);
    CHECK(st->closes == 0);
}
