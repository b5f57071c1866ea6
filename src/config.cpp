#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "errors.hpp"

namespace orodb {

namespace {

    std::mutex g_config_mx;
    std::shared_ptr<const CoreSettings> g_config;

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    int parse_int(const std::string& key, const std::string& text) {
        std::size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != text.size()) {
            throw ConfigError("Invalid integer for " + key + ": '" + text + "'", { key });
        }
        return v;
    }

    const char* env(const char* name) {
        const char* v = std::getenv(name);
        return v;
    }

    // libpq keyword values: quote when empty or containing space, quote or backslash.
    std::string conninfo_value(const std::string& v) {
        bool quote = v.empty();
        for (char c : v) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '\\') quote = true;
        }
        if (!quote) return v;
        std::string out = "'";
        for (char c : v) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        return out + "'";
    }

    void set_field(CoreSettings& s, const std::string& key, const std::string& value) {
        if (key == "db_host") s.db_host = value;
        else if (key == "db_port") s.db_port = parse_int(key, value);
        else if (key == "db_name") s.db_name = value;
        else if (key == "db_user") s.db_user = value;
        else if (key == "db_password") s.db_password = value;
        else if (key == "db_pool_min") s.db_pool_min = parse_int(key, value);
        else if (key == "db_pool_max") s.db_pool_max = parse_int(key, value);
        else if (key == "db_backend") s.db_backend = parse_backend(value);
        else if (key == "sqlite_path") s.sqlite_path = value;
        else if (key == "log_level") s.log_level = value;
        else if (key == "log_format") s.log_format = value;
        else if (key == "log_file") s.log_file = value.empty() ? std::nullopt : std::optional<std::string>(value);
        else if (key == "migrations_dir") s.migrations_dir = value;
        else throw ConfigError("Unknown configuration key '" + key + "'");
    }

    struct EnvKey {
        const char* var;
        const char* field;
    };

    constexpr EnvKey ENV_KEYS[] = {
        { "ORO_DB_HOST", "db_host" },
        { "ORO_DB_PORT", "db_port" },
        { "ORO_DB_NAME", "db_name" },
        { "ORO_DB_USER", "db_user" },
        { "ORO_DB_PASSWORD", "db_password" },
        { "ORO_DB_POOL_MIN", "db_pool_min" },
        { "ORO_DB_POOL_MAX", "db_pool_max" },
        { "ORO_DB_BACKEND", "db_backend" },
        { "ORO_SQLITE_PATH", "sqlite_path" },
        { "ORO_LOG_LEVEL", "log_level" },
        { "ORO_LOG_FORMAT", "log_format" },
        { "ORO_LOG_FILE", "log_file" },
        { "ORO_MIGRATIONS_DIR", "migrations_dir" },
    };

} // namespace

Backend parse_backend(const std::string& name) {
    auto n = lower(name);
    if (n == "postgres" || n == "postgresql") return Backend::Postgres;
    if (n == "sqlite" || n == "sqlite3") return Backend::SQLite;
    throw ConfigError("Unknown database backend '" + name + "'");
}

const char* backend_name(Backend b) {
    return b == Backend::SQLite ? "sqlite" : "postgres";
}

void CoreSettings::apply_env() {
    for (const auto& k : ENV_KEYS) {
        if (const char* v = env(k.var)) {
            try {
                set_field(*this, k.field, v);
            } catch (const ConfigError& e) {
                throw ConfigError(e.message() + " (from " + k.var + ")", { k.var });
            }
        }
    }
}

CoreSettings CoreSettings::from_env() {
    CoreSettings s;
    s.apply_env();
    s.validate();
    return s;
}

CoreSettings CoreSettings::load_yaml(const std::string& path) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load YAML config " + path + ": " + e.what());
    }

    CoreSettings s;
    if (yaml.IsMap()) {
        try {
            for (auto it : yaml) {
                const auto key = it.first.as<std::string>();
                const YAML::Node& val = it.second;
                if (val.IsNull()) {
                    set_field(s, key, "");
                    continue;
                }
                if (!val.IsScalar()) {
                    throw ConfigError("Configuration key '" + key + "' must be a scalar");
                }
                set_field(s, key, val.Scalar());
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError("Invalid YAML config " + path + ": " + e.what());
        }
    } else if (!yaml.IsNull()) {
        throw ConfigError("YAML config " + path + " must be a mapping");
    }

    s.apply_env();
    s.validate();
    return s;
}

void CoreSettings::validate() const {
    if (db_port <= 0 || db_port > 65535) {
        throw ConfigError("db_port out of range: " + std::to_string(db_port), { "ORO_DB_PORT" });
    }
    if (db_pool_min < 0 || db_pool_max < 1 || db_pool_min > db_pool_max) {
        throw ConfigError("Invalid pool bounds: min=" + std::to_string(db_pool_min) + " max=" + std::to_string(db_pool_max),
            { "ORO_DB_POOL_MIN", "ORO_DB_POOL_MAX" });
    }
    if (db_backend == Backend::SQLite && sqlite_path.empty()) {
        throw ConfigError("sqlite_path is required for the sqlite backend", { "ORO_SQLITE_PATH" });
    }
}

std::string CoreSettings::database_url() const {
    return "postgresql://" + db_user + ":" + db_password + "@" + db_host + ":" + std::to_string(db_port) + "/" + db_name;
}

std::string CoreSettings::conninfo() const {
    return "host=" + conninfo_value(db_host)
        + " port=" + std::to_string(db_port)
        + " dbname=" + conninfo_value(db_name)
        + " user=" + conninfo_value(db_user)
        + " password=" + conninfo_value(db_password);
}

std::string CoreSettings::dsn() const {
    return db_backend == Backend::SQLite ? sqlite_path : conninfo();
}

PoolConfig CoreSettings::pool_config() const {
    return { static_cast<std::size_t>(db_pool_min), static_cast<std::size_t>(db_pool_max) };
}

std::shared_ptr<const CoreSettings> get_config() {
    std::lock_guard<std::mutex> lk(g_config_mx);
    if (!g_config) {
        g_config = std::make_shared<const CoreSettings>(CoreSettings::from_env());
    }
    return g_config;
}

void set_config(CoreSettings settings) {
    std::lock_guard<std::mutex> lk(g_config_mx);
    g_config = std::make_shared<const CoreSettings>(std::move(settings));
}

void clear_config_cache() {
    std::lock_guard<std::mutex> lk(g_config_mx);
    g_config.reset();
}

} // namespace orodb
