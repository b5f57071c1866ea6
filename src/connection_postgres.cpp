// connection_postgres.cpp
#include <libpq-fe.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "lib.hpp"
#include "sqlconnection.hpp"

namespace orodb {

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn), sql_(std::move(sql)) { }

    ~PgStatement() override = default;

    // Execute and return rows affected (INSERT/UPDATE/DELETE) or row count for SELECT
    int exec() override {
        PGresult* res = run_();
        int rows = 0;
        if (PQresultStatus(res) == PGRES_COMMAND_OK) {
            const char* t = PQcmdTuples(res);
            rows = (t && *t) ? std::atoi(t) : 0;
        } else {
            rows = PQntuples(res);
        }
        PQclear(res);
        return rows;
    }

    std::vector<SQLRow> fetch_all() override {
        PGresult* res = run_();
        std::vector<SQLRow> rows;
        const int ntuples = PQntuples(res);
        const int nfields = PQnfields(res);
        rows.reserve(ntuples);
        for (int r = 0; r < ntuples; ++r) {
            SQLRow row;
            for (int c = 0; c < nfields; ++c) {
                if (PQgetisnull(res, r, c)) {
                    row.set(PQfname(res, c), std::nullopt);
                } else {
                    row.set(PQfname(res, c), std::string(PQgetvalue(res, r, c), PQgetlength(res, r, c)));
                }
            }
            rows.push_back(std::move(row));
        }
        PQclear(res);
        return rows;
    }

protected:
    void set_null(int idx) override {
        ensure_slot_(idx);
        params_[idx-1]  = nullptr;  // SQL NULL
        lengths_[idx-1] = 0;
        formats_[idx-1] = 0;        // text format
        bound_[idx-1]   = false;
    }

    void set_text(int idx, std::string value) override {
        ensure_slot_(idx);
        values_[idx-1]  = std::move(value);      // own storage
        lengths_[idx-1] = static_cast<int>(values_[idx-1].size());
        formats_[idx-1] = 0;
        bound_[idx-1]   = true;
    }

private:
    PGresult* run_() {
        const int nParams = static_cast<int>(values_.size());
        // values_ may have reallocated since binding; rebuild the pointer array now.
        for (int i = 0; i < nParams; ++i) {
            params_[i] = bound_[i] ? values_[i].c_str() : nullptr;
        }
        PGresult* res = PQexecParams(
            conn_,
            sql_.c_str(),
            nParams,
            nullptr,                                   // let server infer types
            (nParams ? params_.data()  : nullptr),
            (nParams ? lengths_.data() : nullptr),
            (nParams ? formats_.data() : nullptr),     // all text format
            0                                          // text results
        );
        if (!res) ORODB_THROW("Postgres exec failed: %s", PQerrorMessage(conn_));

        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            std::string err = PQresultErrorMessage(res);
            PQclear(res);
            ORODB_THROW("Postgres exec failed: %s", err.c_str());
        }
        return res;
    }

    void ensure_slot_(int idx) {
        if (idx < 1) ORODB_THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > params_.size()) {
            params_.resize(idx, nullptr);
            lengths_.resize(idx, 0);
            formats_.resize(idx, 0);
            bound_.resize(idx, false);
        }
        if (static_cast<size_t>(idx) > values_.size())
            values_.resize(idx);
    }

    PGconn* conn_;
    std::string sql_;
    std::vector<const char*> params_;
    std::vector<std::string> values_; // backing for params_
    std::vector<int> lengths_;
    std::vector<int> formats_;
    std::vector<bool> bound_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            ORODB_THROW("Postgres connect failed: %s", err.c_str());
        }
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    bool connected() const override { return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK; }

    Dialect dialect() const override { return Dialect::Postgres; }

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
        if (!conn_) ORODB_THROW("prepare: not connected");
        return std::make_unique<PgStatement>(conn_, sql);
    }

    void execute(const std::string& sql) override {
        if (!conn_) ORODB_THROW("execute: not connected");
        PGresult* res = PQexec(conn_, sql.c_str());
        if (!res) ORODB_THROW("Postgres error executing: %s", PQerrorMessage(conn_));
        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK && st != PGRES_EMPTY_QUERY) {
            std::string err = PQresultErrorMessage(res);
            PQclear(res);
            ORODB_THROW("Postgres error: %s", err.c_str());
        }
        PQclear(res);
    }

private:
    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}

} // namespace orodb
