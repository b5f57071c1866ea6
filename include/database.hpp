#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <vector>
#include "config.hpp"
#include "dbpool.hpp"
#include "errors.hpp"
#include "sqlconnection.hpp"

namespace orodb {

using namespace std::literals::chrono_literals;

/**
 * Small utility queries over a pool. Every call leases one connection for
 * its own duration.
 */
class Database {
public:
    explicit Database(pool::IDbPool& pool, std::chrono::milliseconds timeout = 1000ms)
        : pool_(pool)
        , timeout_(timeout) { }

    /**
     * @brief Run @p fn with a leased connection kept alive for the call.
     *
     * @throws DatabaseError when no connection is available in time
     */
    template <class F>
    auto with_conn(F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        auto lease = acquire_();
        return std::forward<F>(fn)(lease.conn());
    }

    // Same as with_conn, inside begin/commit; rolls back and rethrows on failure.
    template <class F>
    auto with_tr(F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        using R = std::invoke_result_t<F, SQLConnection&>;
        auto lease = acquire_(); // keep lease alive for whole TX
        SQLConnection& conn = lease.conn();

        conn.begin();
        try {
            if constexpr (std::is_void_v<R>) {
                std::forward<F>(fn)(conn);
                conn.commit();
            } else {
                R result = std::forward<F>(fn)(conn);
                conn.commit();
                return result;
            }
        } catch (...) {
            try {
                conn.rollback();
            } catch (const OroDbError&) {
                conn.disconnect();
            }
            throw; // propagate
        }
    }

    // SELECT 1; false on any OroDbError.
    bool check_connection();

    bool table_exists(const std::string& table);

    /**
     * @brief COUNT(*) of @p table.
     *
     * @param allowlist when non-empty, @p table must be one of these
     * @throws ValidationError when the table is not in the allowlist
     * @throws NotFoundError when the table does not exist
     */
    int64_t count_rows(const std::string& table, const std::set<std::string>& allowlist = {});

    // Executes each existing file of @p files under @p dir in one transaction.
    void init_schema(const std::filesystem::path& dir, const std::vector<std::string>& files = { "schema.sql" });

private:
    pool::Lease acquire_();

    pool::IDbPool& pool_;
    std::chrono::milliseconds timeout_;
};

// Fresh, unconnected driver for the configured backend (what DbPool wants).
ConnectionFactory make_connection_factory(const CoreSettings& settings);

// Like make_connection_factory, but each connection is already open on settings.dsn().
ConnectionFactory make_connected_factory(const CoreSettings& settings);

// Pool sized by settings.pool_config(); sqlite always gets a ceiling of one writer.
std::unique_ptr<DbPool> make_pool(const CoreSettings& settings);

} // namespace orodb
