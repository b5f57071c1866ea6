#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "migration.hpp"
#include "sqlconnection.hpp"

namespace orodb {

struct LedgerEntry {
    std::string version;
    std::string description;
    std::string checksum;
    std::string applied_at;
};

/**
 * The schema_migrations table: one row per applied migration.
 *
 * Works on a borrowed connection and never opens or commits transactions
 * itself, so a ledger write shares the transaction of the migration step.
 */
class Ledger {
public:
    static constexpr const char* TABLE = "schema_migrations";

    explicit Ledger(SQLConnection& conn)
        : conn_(conn) { }

    // CREATE TABLE IF NOT EXISTS; identical text for SQLite and Postgres.
    void ensure();

    // All entries, ascending by version.
    std::vector<LedgerEntry> entries();
    std::map<std::string, LedgerEntry> by_version();
    std::size_t count();

    // Most recently applied first (applied_at DESC, version DESC), at most @p n.
    std::vector<LedgerEntry> latest(std::size_t n);

    void record(const Migration& m, const std::string& applied_at = now());
    // Returns false when no entry matched.
    bool remove(const std::string& version);

    // UTC "YYYY-MM-DD HH:MM:SS.ffffff"
    static std::string now();

private:
    std::vector<LedgerEntry> query_(const std::string& order_by);

    SQLConnection& conn_;
};

} // namespace orodb
