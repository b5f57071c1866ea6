#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

namespace orodb {

// A step run against an open connection; throwing aborts the migration.
using MigrationAction = std::function<void(SQLConnection&)>;

/**
 * One versioned, reversible schema change loaded from a JSON descriptor:
 *
 *   { "version": "001", "description": "create users",
 *     "up":   ["CREATE TABLE users (...)", "CREATE INDEX ..."],
 *     "down": "DROP TABLE users" }
 *
 * "up"/"down" accept a SQL string, an array of SQL strings or
 * {"handler": "<name>"} naming an action in a MigrationRegistry.
 */
struct Migration {
    std::string version;
    std::string description;
    std::string checksum;
    std::filesystem::path path;
    MigrationAction up;
    MigrationAction down;
};

using MigrationPtr = std::shared_ptr<const Migration>;

// Compiled-in actions that descriptors reference by name.
class MigrationRegistry {
public:
    // Throws ValidationError on an empty name, an empty action or a duplicate.
    MigrationRegistry& add(const std::string& name, MigrationAction action);

    bool has(const std::string& name) const { return actions_.count(name) > 0; }
    const MigrationAction* find(const std::string& name) const;
    std::size_t size() const { return actions_.size(); }
    bool empty() const { return actions_.empty(); }

private:
    std::map<std::string, MigrationAction> actions_;
};

// Runs each statement in order through SQLConnection::execute().
MigrationAction sql_action(std::vector<std::string> statements);

// First 16 lowercase hex chars of SHA-256(bytes).
std::string checksum_bytes(const std::string& bytes);

// checksum_bytes() over the whole file. Throws NotFoundError if unreadable.
std::string checksum_file(const std::filesystem::path& path);

/**
 * @brief Build a Migration from one descriptor file.
 *
 * @return nullptr when the file is JSON but not a migration (not an object,
 *         or no "version" member).
 * @throws ValidationError on unparsable JSON, a missing description/up/down,
 *         wrongly typed members or an unknown handler.
 */
MigrationPtr load_migration(const std::filesystem::path& path, const MigrationRegistry& registry = {});

} // namespace orodb
