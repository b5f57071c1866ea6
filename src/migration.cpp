#include "migration.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iterator>
#include <sstream>

#include "errors.hpp"
#include "jsonhlp.hpp"

namespace orodb {

namespace {

    struct evp_md_ctx_deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) EVP_MD_CTX_free(ctx);
        }
    };
    using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

    constexpr std::size_t CHECKSUM_LEN = 16;

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw NotFoundError("Migration file", path.string());
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    MigrationAction parse_action(const jval& v, const std::string& attr,
        const std::filesystem::path& path, const MigrationRegistry& registry) {
        const std::string where = path.filename().string();

        if (v.IsString()) {
            return sql_action({ std::string(v.GetString(), v.GetStringLength()) });
        }
        if (v.IsArray()) {
            std::vector<std::string> stmts;
            stmts.reserve(v.Size());
            for (const auto& s : v.GetArray()) {
                if (!s.IsString()) {
                    throw ValidationError("Migration " + where + ": '" + attr + "' must contain only SQL strings", attr);
                }
                stmts.emplace_back(s.GetString(), s.GetStringLength());
            }
            return sql_action(std::move(stmts));
        }
        if (v.IsObject()) {
            auto name = jhlp::get<std::string>(v, "handler");
            if (name.empty()) {
                throw ValidationError("Migration " + where + ": '" + attr + "' object needs a 'handler' name", attr);
            }
            const MigrationAction* fn = registry.find(name);
            if (!fn) {
                throw ValidationError("Migration " + where + ": unknown handler '" + name + "'", attr, name);
            }
            return *fn;
        }
        throw ValidationError("Migration " + where + ": '" + attr + "' must be SQL text, a list of SQL or a handler", attr);
    }

} // namespace

MigrationRegistry& MigrationRegistry::add(const std::string& name, MigrationAction action) {
    if (name.empty()) throw ValidationError("Handler name must not be empty", "name");
    if (!action) throw ValidationError("Handler '" + name + "' has no action", "name", name);
    if (!actions_.emplace(name, std::move(action)).second) {
        throw ValidationError("Handler '" + name + "' is already registered", "name", name);
    }
    return *this;
}

const MigrationAction* MigrationRegistry::find(const std::string& name) const {
    auto it = actions_.find(name);
    return it == actions_.end() ? nullptr : &it->second;
}

MigrationAction sql_action(std::vector<std::string> statements) {
    return [stmts = std::move(statements)](SQLConnection& conn) {
        for (const auto& sql : stmts) {
            conn.execute(sql);
        }
    };
}

std::string checksum_bytes(const std::string& bytes) {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) throw OroDbError("Failed to create digest context");

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest {};
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &md_len) != 1) {
        throw OroDbError("SHA-256 digest failed");
    }

    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out += HEX[(digest[i] >> 4) & 0x0F];
        out += HEX[digest[i] & 0x0F];
    }
    return out.substr(0, CHECKSUM_LEN);
}

std::string checksum_file(const std::filesystem::path& path) {
    return checksum_bytes(read_file(path));
}

MigrationPtr load_migration(const std::filesystem::path& path, const MigrationRegistry& registry) {
    const std::string bytes = read_file(path);
    const std::string where = path.filename().string();

    jdoc doc;
    std::string err;
    if (!jhlp::parse_str(bytes, doc, &err)) {
        throw ValidationError("Migration " + where + " is not valid JSON: " + err, "path", path.string());
    }
    // plain JSON files that happen to sit in the directory
    if (!doc.IsObject() || !doc.HasMember("version")) return nullptr;

    for (const char* attr : { "description", "up", "down" }) {
        if (!doc.HasMember(attr)) {
            throw ValidationError("Migration " + where + " missing required attribute '" + attr + "'", std::string(attr));
        }
    }

    const jval& version = doc["version"];
    if (!version.IsString() || version.GetStringLength() == 0) {
        throw ValidationError("Migration " + where + ": 'version' must be a non-empty string", "version");
    }
    const jval& description = doc["description"];
    if (!description.IsString() || description.GetStringLength() == 0) {
        throw ValidationError("Migration " + where + ": 'description' must be a non-empty string", "description");
    }

    auto m = std::make_shared<Migration>();
    m->version.assign(version.GetString(), version.GetStringLength());
    m->description.assign(description.GetString(), description.GetStringLength());
    m->checksum = checksum_bytes(bytes);
    m->path = path;
    m->up = parse_action(doc["up"], "up", path, registry);
    m->down = parse_action(doc["down"], "down", path, registry);
    return m;
}

} // namespace orodb
