#include "migration_runner.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "errors.hpp"
#include "jsonhlp.hpp"
#include "lib.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace orodb {

using logging::int_field;
using logging::str_field;

namespace {

    bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    // numeric value of an all-digit version, -1 otherwise
    long long numeric_version(const std::string& v) {
        if (v.empty() || v.size() > 18) return -1;
        for (unsigned char c : v) {
            if (!std::isdigit(c)) return -1;
        }
        return std::stoll(v);
    }

    void rollback_after_failure(SQLConnection& conn) {
        try {
            conn.rollback();
        } catch (const OroDbError& e) {
            ORODB_LOG_WARN("Rollback failed", { str_field("error", e.message()) });
        }
    }

} // namespace

MigrationRunner::MigrationRunner(fs::path migrations_dir,
    std::unique_ptr<pool::ConnectionProvider> provider,
    MigrationRegistry registry)
    : dir_(std::move(migrations_dir))
    , provider_(std::move(provider))
    , registry_(std::move(registry)) {
    if (!provider_) throw DatabaseError("MigrationRunner: null connection provider");
}

MigrationRunner::MigrationRunner(fs::path migrations_dir, pool::IDbPool& pool, MigrationRegistry registry)
    : MigrationRunner(std::move(migrations_dir), std::make_unique<pool::PoolProvider>(pool), std::move(registry)) { }

MigrationRunner::MigrationRunner(fs::path migrations_dir, ConnectionFactory factory, MigrationRegistry registry)
    : MigrationRunner(std::move(migrations_dir), std::make_unique<pool::FactoryProvider>(std::move(factory)), std::move(registry)) { }

std::vector<MigrationPtr> MigrationRunner::scan_(const fs::path& dir, const MigrationRegistry& registry) {
    std::vector<MigrationPtr> out;

    std::error_code ec;
    if (!fs::exists(dir, ec)) return out;
    if (!fs::is_directory(dir, ec)) {
        throw ValidationError("Migrations path is not a directory: " + dir.string(), "migrations_dir", dir.string());
    }

    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file()) continue;
            const std::string name = entry.path().filename().string();
            if (starts_with(name, "__") || entry.path().extension() != ".json") continue;

            auto m = load_migration(entry.path(), registry);
            if (!m) {
                ORODB_LOG_DEBUG("Skipping non-migration file", { str_field("file", name) });
                continue;
            }
            out.push_back(std::move(m));
        }
    } catch (const fs::filesystem_error& e) {
        throw OroDbError(std::string("Failed to scan migrations directory: ") + e.what(), { { "path", dir.string() } });
    }

    std::sort(out.begin(), out.end(), [](const MigrationPtr& a, const MigrationPtr& b) { return a->version < b->version; });

    for (std::size_t i = 1; i < out.size(); ++i) {
        if (out[i]->version == out[i - 1]->version) {
            throw ValidationError("Duplicate migration version '" + out[i]->version + "' in "
                    + out[i - 1]->path.filename().string() + " and " + out[i]->path.filename().string(),
                "version", out[i]->version);
        }
    }
    return out;
}

const std::vector<MigrationPtr>& MigrationRunner::discover() {
    if (!cache_) {
        cache_ = scan_(dir_, registry_);
        ORODB_LOG_DEBUG("Discovered migrations", { str_field("dir", dir_.string()), int_field("count", static_cast<int64_t>(cache_->size())) });
    }
    return *cache_;
}

std::string MigrationRunner::compute_checksum(const fs::path& path) {
    return checksum_file(path);
}

std::map<std::string, LedgerEntry> MigrationRunner::applied_() {
    auto lease = provider_->acquire();
    Ledger ledger(lease.conn());
    ledger.ensure();
    return ledger.by_version();
}

void MigrationRunner::transact_(const std::function<void(SQLConnection&)>& fn) {
    auto lease = provider_->acquire();
    SQLConnection& conn = lease.conn();

    conn.begin();
    try {
        fn(conn);
        conn.commit();
    } catch (...) {
        rollback_after_failure(conn);
        throw;
    }
}

std::vector<MigrationStatus> MigrationRunner::status() {
    const auto& all = discover();
    const auto applied = applied_();

    std::vector<MigrationStatus> out;
    out.reserve(all.size());
    for (const auto& m : all) {
        MigrationStatus s { m->version, m->description, m->checksum, false, std::nullopt, false };
        auto it = applied.find(m->version);
        if (it != applied.end()) {
            s.applied = true;
            s.applied_at = it->second.applied_at;
            s.drifted = it->second.checksum != m->checksum;
        }
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<MigrationPtr> MigrationRunner::pending() {
    const auto& all = discover();
    const auto applied = applied_();

    std::vector<MigrationPtr> out;
    for (const auto& m : all) {
        if (!applied.count(m->version)) out.push_back(m);
    }
    return out;
}

std::vector<std::string> MigrationRunner::up(bool dry_run) {
    const auto todo = pending();
    std::vector<std::string> done;
    if (todo.empty()) {
        ORODB_LOG_INFO("No pending migrations");
        return done;
    }

    for (const auto& m : todo) {
        if (dry_run) {
            auto lease = provider_->acquire();
            ORODB_LOG_INFO("Would apply migration", { str_field("version", m->version), str_field("description", m->description) });
            done.push_back(m->version);
            continue;
        }

        try {
            transact_([&m](SQLConnection& conn) {
                m->up(conn);
                Ledger(conn).record(*m);
            });
        } catch (const std::exception& e) {
            ORODB_LOG_ERROR("Migration failed", { str_field("version", m->version), str_field("error", e.what()) });
            throw;
        }
        ORODB_LOG_INFO("Applied migration", { str_field("version", m->version), str_field("description", m->description) });
        done.push_back(m->version);
    }
    return done;
}

std::vector<std::string> MigrationRunner::down(int steps) {
    if (steps < 1) {
        throw ValidationError("steps must be at least 1", "steps", std::to_string(steps));
    }

    std::vector<LedgerEntry> latest;
    {
        auto lease = provider_->acquire();
        Ledger ledger(lease.conn());
        ledger.ensure();
        latest = ledger.latest(static_cast<std::size_t>(steps));
    }
    std::vector<std::string> done;
    if (latest.empty()) {
        ORODB_LOG_INFO("No applied migrations to roll back");
        return done;
    }

    const auto& all = discover();
    std::vector<MigrationPtr> units;
    units.reserve(latest.size());
    for (const auto& e : latest) {
        auto it = std::find_if(all.begin(), all.end(), [&e](const MigrationPtr& m) { return m->version == e.version; });
        if (it == all.end()) throw NotFoundError("Migration", e.version);
        units.push_back(*it);
    }

    for (const auto& m : units) {
        try {
            transact_([&m](SQLConnection& conn) {
                m->down(conn);
                Ledger(conn).remove(m->version);
            });
        } catch (const std::exception& e) {
            ORODB_LOG_ERROR("Rollback of migration failed", { str_field("version", m->version), str_field("error", e.what()) });
            throw;
        }
        ORODB_LOG_INFO("Rolled back migration", { str_field("version", m->version), str_field("description", m->description) });
        done.push_back(m->version);
    }
    return done;
}

std::vector<std::string> MigrationRunner::bootstrap() {
    std::vector<std::string> done;
    auto lease = provider_->acquire();
    SQLConnection& conn = lease.conn();
    Ledger ledger(conn);
    ledger.ensure();

    const std::size_t recorded = ledger.count();
    if (recorded > 0) {
        throw ConflictError(strfmt("Cannot bootstrap: %zu migration(s) already recorded in %s",
            recorded, Ledger::TABLE));
    }

    const auto& all = discover();
    if (all.empty()) {
        ORODB_LOG_WARN("No migrations found to bootstrap", { str_field("dir", dir_.string()) });
        return done;
    }

    const auto& first = all.front();
    conn.begin();
    try {
        ledger.record(*first);
        conn.commit();
    } catch (...) {
        rollback_after_failure(conn);
        throw;
    }
    ORODB_LOG_INFO("Bootstrapped migration ledger", { str_field("version", first->version), str_field("description", first->description) });
    done.push_back(first->version);
    return done;
}

fs::path MigrationRunner::create_migration(const fs::path& dir, const std::string& description, const MigrationRegistry& registry) {
    if (std::all_of(description.begin(), description.end(), [](unsigned char c) { return std::isspace(c); })) {
        throw ValidationError("Migration description must not be empty", "description", description);
    }
    std::string slug = slugify(description);
    if (slug.empty()) slug = "migration";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw OroDbError("Cannot create migrations directory " + dir.string() + ": " + ec.message(), { { "path", dir.string() } });
    }

    long long highest = 0;
    for (const auto& m : scan_(dir, registry)) {
        highest = std::max(highest, numeric_version(m->version));
    }
    const std::string version = strfmt("%03lld", highest + 1);
    const fs::path path = dir / (version + "_" + slug + ".json");

    if (fs::exists(path, ec)) {
        throw ConflictError("Migration file already exists: " + path.string(), path.filename().string());
    }

    jdoc doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    jhlp::set(doc, "version", version);
    jhlp::set(doc, "description", description);
    doc.AddMember("up", jval(json::kArrayType).Move(), alloc);
    doc.AddMember("down", jval(json::kArrayType).Move(), alloc);

    std::ofstream out(path, std::ios::binary);
    if (!out) throw OroDbError("Cannot write migration file " + path.string(), { { "path", path.string() } });
    out << jhlp::stringify(doc, true) << '\n';
    out.close();
    if (!out) throw OroDbError("Cannot write migration file " + path.string(), { { "path", path.string() } });

    ORODB_LOG_INFO("Created migration", { str_field("version", version), str_field("path", path.string()) });
    return path;
}

} // namespace orodb
