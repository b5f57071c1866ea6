#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace orodb {

enum class Backend { Postgres, SQLite };

struct PoolConfig {
    std::size_t minconn = 5;
    std::size_t maxconn = 20;

    bool operator==(const PoolConfig& o) const { return minconn == o.minconn && maxconn == o.maxconn; }
};

/**
 * Runtime settings. Defaults below, overridden by ORO_* environment
 * variables (ORO_DB_HOST, ORO_DB_PORT, ...), optionally seeded from a YAML
 * file whose keys are the field names.
 */
struct CoreSettings {
    std::string db_host = "localhost";
    int db_port = 5432;
    std::string db_name = "postgres";
    std::string db_user = "postgres";
    std::string db_password = "";
    int db_pool_min = 5;
    int db_pool_max = 20;
    Backend db_backend = Backend::Postgres;
    std::string sqlite_path = "orodb.sqlite";

    std::string log_level = "INFO";
    std::string log_format = "";
    std::optional<std::string> log_file;

    std::string migrations_dir = "migrations";

    // Defaults + environment.
    static CoreSettings from_env();
    // YAML file + environment. Throws ConfigError on unreadable files or unknown keys.
    static CoreSettings load_yaml(const std::string& path);

    void apply_env();
    // Throws ConfigError.
    void validate() const;

    std::string database_url() const;
    std::string conninfo() const;   // libpq keyword/value string
    std::string dsn() const;        // conninfo or sqlite path, per backend
    PoolConfig pool_config() const;
};

Backend parse_backend(const std::string& name);
const char* backend_name(Backend b);

// Process-wide settings, built from the environment on first use.
std::shared_ptr<const CoreSettings> get_config();
void set_config(CoreSettings settings);
void clear_config_cache();

} // namespace orodb
