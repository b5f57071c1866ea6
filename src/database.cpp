#include "database.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "logging.hpp"
#include "utils.hpp"

namespace orodb {

using logging::str_field;

pool::Lease Database::acquire_() {
    auto r = pool_.acquire(pool::DbIntent::Write, timeout_);
    if (!r.ok) {
        throw DatabaseError(r.error == pool::PoolAcquireError::Shutdown
                ? "Connection pool is shut down"
                : "Failed to get connection from pool");
    }
    return std::move(r.lease);
}

bool Database::check_connection() {
    try {
        return with_conn([](SQLConnection& conn) {
            return conn.prepare("SELECT 1")->fetch_one().has_value();
        });
    } catch (const OroDbError& e) {
        ORODB_LOG_WARN("Database connection check failed", { str_field("error", e.message()) });
        return false;
    }
}

bool Database::table_exists(const std::string& table) {
    return with_conn([&table](SQLConnection& conn) {
        std::unique_ptr<SQLStatement> stmt;
        if (conn.dialect() == Dialect::SQLite) {
            stmt = conn.prepare("SELECT name FROM sqlite_master WHERE type = 'table' AND name = $1");
        } else {
            stmt = conn.prepare("SELECT table_name FROM information_schema.tables "
                                "WHERE table_schema = current_schema() AND table_name = $1");
        }
        stmt->bind(1, table);
        return stmt->fetch_one().has_value();
    });
}

int64_t Database::count_rows(const std::string& table, const std::set<std::string>& allowlist) {
    if (!allowlist.empty() && !allowlist.count(table)) {
        throw ValidationError("Table '" + table + "' not in allowlist", "table", table);
    }
    if (!table_exists(table)) {
        throw NotFoundError("Table", table);
    }
    return with_conn([&table](SQLConnection& conn) -> int64_t {
        auto row = conn.prepare("SELECT COUNT(*) AS count FROM " + quote_ident(table))->fetch_one();
        if (!row) return 0;
        return std::stoll(row->text("count"));
    });
}

void Database::init_schema(const std::filesystem::path& dir, const std::vector<std::string>& files) {
    with_tr([&](SQLConnection& conn) {
        for (const auto& name : files) {
            const auto path = dir / name;
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                ORODB_LOG_DEBUG("Schema file not found, skipping", { str_field("file", path.string()) });
                continue;
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            conn.execute(ss.str());
            ORODB_LOG_INFO("Executed schema file", { str_field("file", path.string()) });
        }
    });
}

ConnectionFactory make_connection_factory(const CoreSettings& settings) {
    switch (settings.db_backend) {
    case Backend::SQLite:
        return [] { return make_sqlite_connection(); };
    case Backend::Postgres:
#if ORODB_HAVE_POSTGRESQL
        return [] { return make_postgres_connection(); };
#else
        throw ConfigError("orodb was built without PostgreSQL support", { "ORO_DB_BACKEND" });
#endif
    }
    throw ConfigError("Unknown database backend");
}

ConnectionFactory make_connected_factory(const CoreSettings& settings) {
    return [make = make_connection_factory(settings), dsn = settings.dsn()] {
        PSQLConnection conn = make();
        conn->connect(dsn);
        return conn;
    };
}

std::unique_ptr<DbPool> make_pool(const CoreSettings& settings) {
    auto cfg = settings.pool_config();
    if (settings.db_backend == Backend::SQLite) {
        cfg.minconn = std::min<std::size_t>(cfg.minconn, 1);
        cfg.maxconn = 1;
    }
    return std::make_unique<DbPool>(cfg.minconn, cfg.maxconn, settings.dsn(), make_connection_factory(settings));
}

} // namespace orodb
