#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orodb {

enum class Dialect { SQLite, Postgres };

/**
 * One result row, columns kept in select order. NULL is an empty optional.
 */
class SQLRow {
public:
    void set(std::string column, std::optional<std::string> value) {
        cols_.emplace_back(std::move(column), std::move(value));
    }

    bool has(const std::string& column) const;
    std::optional<std::string> get(const std::string& column) const;
    // Column text; NULL reads as "". Throws DatabaseError on an unknown column.
    std::string text(const std::string& column) const;

    std::size_t size() const { return cols_.size(); }
    bool empty() const { return cols_.empty(); }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> cols_;
};

/**
 * Prepared statement. Parameters are positional and 1-based ($1, $2, ...),
 * both dialects use the same placeholder text.
 */
class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    void bind(int idx, const std::string& value) { set_text(idx, value); }
    void bind(int idx, const char* value) { set_text(idx, value); }
    void bind(int idx, int64_t value) { set_int(idx, value); }
    void bind(int idx, const std::optional<std::string>& value) {
        if (value) set_text(idx, *value);
        else set_null(idx);
    }
    void bind_null(int idx) { set_null(idx); }

    virtual int exec() = 0;  // return rows affected
    virtual std::vector<SQLRow> fetch_all() = 0;

    std::optional<SQLRow> fetch_one() {
        auto rows = fetch_all();
        if (rows.empty()) return std::nullopt;
        return std::move(rows.front());
    }

protected:
    virtual void set_null(int idx) = 0;
    virtual void set_text(int idx, std::string value) = 0;

    virtual void set_int(int idx, int64_t value) {
        set_text(idx, std::to_string(value));
    }

    void set_bool(int idx, bool value) {
        set_text(idx, value ? "true" : "false");
    }
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;
    virtual bool connected() const = 0;

    virtual Dialect dialect() const = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Run parameterless SQL, possibly several ';'-separated statements.
    virtual void execute(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    bool in_transaction() const { return tr_started_; }

protected:
    bool tr_started_ = false;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if ORODB_HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif

} // namespace orodb
