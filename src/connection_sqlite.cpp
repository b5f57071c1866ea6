#include "sqlconnection.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>
#include "lib.hpp"

namespace orodb {

class SQLiteStatement final : public SQLStatement {
public:
    explicit SQLiteStatement(sqlite3_stmt* stmt)
        : stmt_(stmt) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    int exec() override {
        int rc = sqlite3_step(stmt_);
        while (rc == SQLITE_ROW) {
            rc = sqlite3_step(stmt_);
        }
        if (rc != SQLITE_DONE) {
            fail_("SQLite exec failed");
        }
        sqlite3_reset(stmt_);
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    std::vector<SQLRow> fetch_all() override {
        std::vector<SQLRow> rows;
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
            SQLRow row;
            const int cols = sqlite3_column_count(stmt_);
            for (int i = 0; i < cols; ++i) {
                const char* name = sqlite3_column_name(stmt_, i);
                if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) {
                    row.set(name ? name : "", std::nullopt);
                    continue;
                }
                const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                const int len = sqlite3_column_bytes(stmt_, i);
                row.set(name ? name : "", std::string(txt ? txt : "", txt ? len : 0));
            }
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            fail_("SQLite query failed");
        }
        sqlite3_reset(stmt_);
        return rows;
    }

protected:
    void set_text(int idx, std::string value) override {
        // handle unicode string UTF-8
        sqlite3_bind_text(stmt_, slot_(idx), value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void set_int(int idx, int64_t value) override {
        sqlite3_bind_int64(stmt_, slot_(idx), value);
    }

    void set_null(int idx) override {
        sqlite3_bind_null(stmt_, slot_(idx));
    }

private:
    // "$1" is a named parameter for SQLite; resolve it so binding does not
    // depend on the order placeholders first appear in the text.
    int slot_(int idx) {
        if (idx < 1) ORODB_THROW("bind: index must be >= 1");
        const std::string name = "$" + std::to_string(idx);
        int slot = sqlite3_bind_parameter_index(stmt_, name.c_str());
        return slot > 0 ? slot : idx;
    }

    [[noreturn]] void fail_(const char* what) {
        std::string err = sqlite3_errmsg(sqlite3_db_handle(stmt_));
        sqlite3_reset(stmt_);
        ORODB_THROW("%s: %s", what, err.c_str());
    }

    sqlite3_stmt* stmt_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open_v2(dsn.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
            disconnect();
            ORODB_THROW("Failed to open SQLite DB %s: %s", dsn.c_str(), err.c_str());
        }
        // wait for locks instead of failing immediately
        sqlite3_busy_timeout(db_, 5000);
        execute("PRAGMA foreign_keys=ON;");
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    bool connected() const override { return db_ != nullptr; }

    Dialect dialect() const override { return Dialect::SQLite; }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        execute("BEGIN;");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execute("COMMIT;");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        execute("ROLLBACK;");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) ORODB_THROW("prepare: not connected");
        sqlite3_stmt* stmt = nullptr;
        // the number of chars where 1 char = 1 byte, + 1 null_terminator
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size() + 1), &stmt, nullptr) != SQLITE_OK) {
            ORODB_THROW("SQLite prepare failed: %s (%s)", sqlite3_errmsg(db_), sql.c_str());
        }
        return std::make_unique<SQLiteStatement>(stmt);
    }

    void execute(const std::string& sql) override {
        if (!db_) ORODB_THROW("execute: not connected");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : "unknown";
            sqlite3_free(errmsg);
            ORODB_THROW("SQLite error: %s", err.c_str());
        }
    }

private:
    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}

} // namespace orodb
