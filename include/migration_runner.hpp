#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dbpool.hpp"
#include "ledger.hpp"
#include "migration.hpp"

namespace orodb {

struct MigrationStatus {
    std::string version;
    std::string description;
    std::string checksum;
    bool applied { false };
    std::optional<std::string> applied_at;
    // applied, but the file on disk no longer matches the recorded checksum
    bool drifted { false };
};

/**
 * Applies and reverts the migrations found in one directory.
 *
 * Every migration runs on its own connection inside its own transaction:
 * the action and the ledger write commit together or not at all. A failure
 * stops the batch; migrations committed before it stay applied.
 */
class MigrationRunner {
public:
    MigrationRunner(std::filesystem::path migrations_dir,
        std::unique_ptr<pool::ConnectionProvider> provider,
        MigrationRegistry registry = {});

    // Leases from @p pool, which must outlive the runner.
    MigrationRunner(std::filesystem::path migrations_dir, pool::IDbPool& pool, MigrationRegistry registry = {});

    // @p factory returns a connected SQLConnection; it is closed after each step.
    MigrationRunner(std::filesystem::path migrations_dir, ConnectionFactory factory, MigrationRegistry registry = {});

    const std::filesystem::path& migrations_dir() const { return dir_; }
    const MigrationRegistry& registry() const { return registry_; }

    /**
     * @brief Migrations in the directory, ascending by version.
     *
     * Scanned once and cached; the same vector is returned until
     * invalidate_cache(). A missing directory yields an empty list.
     *
     * @throws ValidationError for malformed descriptors or duplicate versions.
     */
    const std::vector<MigrationPtr>& discover();
    void invalidate_cache() { cache_.reset(); }
    bool cached() const { return cache_.has_value(); }

    std::vector<MigrationStatus> status();
    std::vector<MigrationPtr> pending();

    /**
     * @brief Apply every pending migration in version order.
     *
     * @param dry_run report what would run without touching schema or ledger
     * @return versions applied (or that would be applied)
     */
    std::vector<std::string> up(bool dry_run = false);

    /**
     * @brief Revert the @p steps most recently applied migrations.
     *
     * @throws ValidationError if steps < 1
     * @throws NotFoundError if an applied version has no descriptor on disk
     */
    std::vector<std::string> down(int steps = 1);

    /**
     * @brief Mark the earliest migration applied without running it, for a
     * database whose baseline schema already exists.
     *
     * @throws ConflictError if the ledger already holds any entry
     */
    std::vector<std::string> bootstrap();

    /**
     * @brief Write a new descriptor "<next version>_<slug>.json" with empty
     * up/down lists and return its path. Creates @p dir if needed.
     *
     * Versions are zero-padded to three digits. Past 999 they grow wider
     * ("1000"), which sorts before "101" in discovery order, so a directory
     * that outgrows three digits has to be renumbered by hand.
     * A description without ASCII letters, digits or UTF-8 text gets the slug
     * "migration".
     *
     * @throws ValidationError if @p description is empty or only whitespace
     * @throws ConflictError if the target file exists
     */
    static std::filesystem::path create_migration(const std::filesystem::path& dir,
        const std::string& description,
        const MigrationRegistry& registry = {});

    static std::string compute_checksum(const std::filesystem::path& path);

private:
    static std::vector<MigrationPtr> scan_(const std::filesystem::path& dir, const MigrationRegistry& registry);

    std::map<std::string, LedgerEntry> applied_();
    // acquire, begin, fn, commit; rollback and rethrow on failure
    void transact_(const std::function<void(SQLConnection&)>& fn);

    std::filesystem::path dir_;
    std::unique_ptr<pool::ConnectionProvider> provider_;
    MigrationRegistry registry_;
    std::optional<std::vector<MigrationPtr>> cache_;
};

} // namespace orodb
