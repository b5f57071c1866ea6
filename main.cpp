#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "migration_runner.hpp"

using namespace orodb;

static void usage() {
    std::cout << "Usage:\n"
              << "  orodb-migrate [--config file.yaml] [--dir path] status\n"
              << "  orodb-migrate [--config file.yaml] [--dir path] up [--dry-run]\n"
              << "  orodb-migrate [--config file.yaml] [--dir path] down [steps]\n"
              << "  orodb-migrate [--config file.yaml] [--dir path] bootstrap\n"
              << "  orodb-migrate [--dir path] create <description...>\n";
}

static std::optional<int> parse_steps(const std::string& s) {
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (used != s.size()) return std::nullopt;
    return v;
}

static void print_versions(const char* verb, const std::vector<std::string>& versions) {
    if (versions.empty()) {
        std::cout << "nothing to do\n";
        return;
    }
    for (const auto& v : versions) {
        std::cout << verb << ' ' << v << '\n';
    }
}

static void print_status(const std::vector<MigrationStatus>& rows) {
    if (rows.empty()) {
        std::cout << "no migrations found\n";
        return;
    }
    for (const auto& s : rows) {
        std::cout << (s.applied ? "[x] " : "[ ] ") << s.version << "  " << s.description;
        if (s.applied_at) std::cout << "  (applied " << *s.applied_at << ')';
        if (s.drifted) std::cout << "  CHANGED SINCE APPLIED";
        std::cout << '\n';
    }
}

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::optional<std::string> dir;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" || a == "--dir") {
            if (i + 1 >= argc) {
                usage();
                return 2;
            }
            (a == "--config" ? config_path : dir) = argv[++i];
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            args.push_back(std::move(a));
        }
    }
    if (args.empty()) {
        usage();
        return 2;
    }

    const std::string cmd = args[0];
    try {
        CoreSettings settings = config_path ? CoreSettings::load_yaml(*config_path) : CoreSettings::from_env();
        if (dir) settings.migrations_dir = *dir;
        logging::init_logging(settings);
        set_config(settings);

        if (cmd == "create") {
            if (args.size() < 2) {
                usage();
                return 2;
            }
            std::string description = args[1];
            for (std::size_t i = 2; i < args.size(); ++i) description += " " + args[i];
            auto path = MigrationRunner::create_migration(settings.migrations_dir, description);
            std::cout << path.string() << '\n';
            return 0;
        }

        MigrationRunner runner(settings.migrations_dir, make_connected_factory(settings));

        if (cmd == "status" && args.size() == 1) {
            print_status(runner.status());
        } else if (cmd == "up" && args.size() <= 2) {
            bool dry_run = false;
            if (args.size() == 2) {
                if (args[1] != "--dry-run") {
                    usage();
                    return 2;
                }
                dry_run = true;
            }
            print_versions(dry_run ? "would apply" : "applied", runner.up(dry_run));
        } else if (cmd == "down" && args.size() <= 2) {
            int steps = 1;
            if (args.size() == 2) {
                auto parsed = parse_steps(args[1]);
                if (!parsed) {
                    usage();
                    return 2;
                }
                steps = *parsed;
            }
            print_versions("rolled back", runner.down(steps));
        } else if (cmd == "bootstrap" && args.size() == 1) {
            print_versions("recorded", runner.bootstrap());
        } else {
            usage();
            return 2;
        }
    } catch (const OroDbError& e) {
        ORODB_LOG_ERROR(e.message(), { logging::str_field("error", e.type_name()) });
        std::cerr << e.to_json() << '\n';
        return 1;
    }
    return 0;
}
