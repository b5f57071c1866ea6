#include "ledger.hpp"

#include <chrono>
#include <ctime>

#include "lib.hpp"

namespace orodb {

namespace {

    constexpr const char* CREATE_SQL = "CREATE TABLE IF NOT EXISTS schema_migrations ("
                                       "version TEXT PRIMARY KEY, "
                                       "description TEXT NOT NULL, "
                                       "checksum TEXT NOT NULL, "
                                       "applied_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP)";

    LedgerEntry to_entry(const SQLRow& row) {
        return { row.text("version"), row.text("description"), row.text("checksum"), row.text("applied_at") };
    }

} // namespace

void Ledger::ensure() {
    conn_.execute(CREATE_SQL);
}

std::vector<LedgerEntry> Ledger::query_(const std::string& order_by) {
    auto stmt = conn_.prepare(
        "SELECT version, description, checksum, applied_at FROM schema_migrations ORDER BY " + order_by);
    std::vector<LedgerEntry> out;
    for (const auto& row : stmt->fetch_all()) {
        out.push_back(to_entry(row));
    }
    return out;
}

std::vector<LedgerEntry> Ledger::entries() {
    return query_("version");
}

std::map<std::string, LedgerEntry> Ledger::by_version() {
    std::map<std::string, LedgerEntry> out;
    for (auto& e : entries()) {
        auto key = e.version;
        out.emplace(std::move(key), std::move(e));
    }
    return out;
}

std::size_t Ledger::count() {
    return entries().size();
}

std::vector<LedgerEntry> Ledger::latest(std::size_t n) {
    auto rows = query_("applied_at DESC, version DESC");
    if (rows.size() > n) rows.resize(n);
    return rows;
}

void Ledger::record(const Migration& m, const std::string& applied_at) {
    auto stmt = conn_.prepare(
        "INSERT INTO schema_migrations (version, description, checksum, applied_at) VALUES ($1, $2, $3, $4)");
    stmt->bind(1, m.version);
    stmt->bind(2, m.description);
    stmt->bind(3, m.checksum);
    stmt->bind(4, applied_at);
    stmt->exec();
}

bool Ledger::remove(const std::string& version) {
    auto stmt = conn_.prepare("DELETE FROM schema_migrations WHERE version = $1");
    stmt->bind(1, version);
    return stmt->exec() > 0;
}

std::string Ledger::now() {
    using namespace std::chrono;
    const auto tp = system_clock::now();
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm {};
    gmtime_r(&t, &tm);
    return strfmt("%04d-%02d-%02d %02d:%02d:%02d.%06lld",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
        static_cast<long long>(us));
}

} // namespace orodb
