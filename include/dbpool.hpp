#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "errors.hpp"
#include "sqlconnection.hpp"

namespace orodb {

using PConn = std::shared_ptr<SQLConnection>;
using ConnectionFactory = std::function<PSQLConnection()>;

namespace pool {

enum class DbIntent { Read,
    Write };
enum class PoolAcquireError { Timeout,
    Shutdown };

struct PoolStats {
    std::size_t size { 0 };     // live connections
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 1500 }; // never block forever
};

// Forward decl
class IDbPool;

// --------- RAII Lease ----------
// A lease without an owner pool closes its connection on release.
class Lease {
public:
    Lease(IDbPool* owner, PConn conn, DbIntent intent)
        : owner_(owner)
        , conn_(std::move(conn))
        , intent_(intent) { }

    Lease(const Lease&) = delete; // disable copy constructor
    Lease& operator=(const Lease&) = delete; // disable copy assignment operator a=b (a receives b);

    Lease(Lease&& other) noexcept { move_from(other); }
    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            release_();
            move_from(other);
        }
        return *this;
    }

    ~Lease() { release_(); }

    SQLConnection& conn() const { return *conn_; }
    std::shared_ptr<SQLConnection> shared() const { return conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return !!conn_; }

private:
    void release_();
    void move_from(Lease& o) noexcept {
        owner_ = o.owner_;
        o.owner_ = nullptr;
        conn_ = std::move(o.conn_);
        intent_ = o.intent_;
    }

    IDbPool* owner_ { nullptr };
    std::shared_ptr<SQLConnection> conn_ {};
    DbIntent intent_ { DbIntent::Read };

    friend class IDbPool;
};

// --------- Pool interface (polymorphic) ----------
class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease { nullptr, nullptr, DbIntent::Read };
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeoutOverride = std::chrono::milliseconds::zero())
        = 0;

    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;

protected:
    // Only pools are allowed to “return” leases:
    virtual void release(std::shared_ptr<SQLConnection> conn, DbIntent intent) = 0;
    friend class Lease;
};

// Lease releases back to its owner, or closes an unpooled connection.
inline void Lease::release_() {
    if (owner_ && conn_) {
        owner_->release(conn_, intent_);
    } else if (conn_) {
        conn_->disconnect();
    }
    owner_ = nullptr;
    conn_.reset();
}

// --------- Connection providers ----------
// Where a migration step gets its connection from, and where it goes back.
class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;
    // Throws DatabaseError when no connection can be handed out.
    virtual Lease acquire() = 0;
};

// Leases from a pool owned elsewhere; the pool must outlive the provider.
class PoolProvider final : public ConnectionProvider {
public:
    explicit PoolProvider(IDbPool& pool, std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
        : pool_(pool)
        , timeout_(timeout) { }

    Lease acquire() override {
        auto r = pool_.acquire(DbIntent::Write, timeout_);
        if (!r.ok) {
            throw DatabaseError(r.error == PoolAcquireError::Shutdown
                    ? "Connection pool is shut down"
                    : "Connection pool exhausted: acquire timed out");
        }
        return std::move(r.lease);
    }

private:
    IDbPool& pool_;
    std::chrono::milliseconds timeout_;
};

// Calls a factory for a live connection per step and closes it afterwards.
class FactoryProvider final : public ConnectionProvider {
public:
    explicit FactoryProvider(ConnectionFactory factory)
        : factory_(std::move(factory)) {
        if (!factory_) throw DatabaseError("FactoryProvider: null connection factory");
    }

    Lease acquire() override {
        PSQLConnection up = factory_();
        if (!up) throw DatabaseError("connection factory returned null connection");
        return Lease { nullptr, PConn(up.release()), DbIntent::Write };
    }

private:
    ConnectionFactory factory_;
};

} // namespace pool

/**
 * Fixed-ceiling pool. @p min_size connections are opened up front, more are
 * opened on demand up to @p max_size; acquire() waits (bounded by the policy
 * timeout) once every connection is leased.
 */
class DbPool final : public pool::IDbPool {
public:
    DbPool(std::size_t min_size,
        std::size_t max_size,
        std::string dsn,
        ConnectionFactory factory,
        pool::AcquirePolicy policy = {})
        : min_(min_size)
        , cap_(max_size == 0 ? 1 : max_size)
        , dsn_(std::move(dsn))
        , policy_(policy)
        , factory_(std::move(factory)) {
        if (min_ > cap_) throw DatabaseError("DbPool: min size exceeds max size");
        load_();
    }

    AcquireResult acquire(
        pool::DbIntent intent,
        std::chrono::milliseconds to = std::chrono::milliseconds::zero()) override {
        auto deadline = std::chrono::steady_clock::now() + (to.count() ? to : policy_.acquire_timeout);

        std::unique_lock<std::mutex> lk(mx_);
        ++stats_.waiters;
        auto on_exit = Finally([&]() { --stats_.waiters; });

        while (!shutdown_ && free_.empty() && live_ >= cap_) {
            if (cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
                return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Timeout };
            }
        }
        if (shutdown_) {
            return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Shutdown };
        }

        std::shared_ptr<SQLConnection> conn;
        if (!free_.empty()) {
            conn = std::move(free_.front());
            free_.pop_front();
        } else {
            ++live_;
            lk.unlock();
            try {
                conn = open_();
            } catch (...) {
                lk.lock();
                --live_;
                cv_.notify_one();
                throw;
            }
            lk.lock();
        }
        ++stats_.in_use;

        return { true, pool::Lease { this, std::move(conn), intent }, {} };
    }

    pool::PoolStats stats() const override {
        std::lock_guard<std::mutex> lk(mx_);
        auto s = stats_;
        s.size = live_;
        return s;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lk(mx_);
        shutdown_ = true;
        for (auto& c : free_) c->disconnect();
        live_ -= free_.size();
        free_.clear();
        cv_.notify_all();
    }

    std::size_t min_size() const { return min_; }
    std::size_t max_size() const { return cap_; }

protected:
    void release(std::shared_ptr<SQLConnection> conn, pool::DbIntent) override {
        std::lock_guard<std::mutex> lk(mx_);
        // a connection left mid-transaction is not reusable
        if (conn && conn->in_transaction()) {
            try {
                conn->rollback();
            } catch (const OroDbError&) {
                conn->disconnect();
            }
        }
        if (conn && !shutdown_ && conn->connected()) {
            free_.push_back(std::move(conn));
        } else {
            if (conn) conn->disconnect();
            if (live_) --live_;
        }
        if (stats_.in_use)
            --stats_.in_use;
        cv_.notify_one();
    }

private:
    struct Finally {
        std::function<void()> f;
        explicit Finally(std::function<void()> fn)
            : f(std::move(fn)) { }
        ~Finally() {
            if (f) {
                f();
            }
        }
        // non-copyable
        Finally(const Finally&) = delete;
        Finally& operator=(const Finally&) = delete;
    };

    std::shared_ptr<SQLConnection> open_() {
        if (!factory_) throw DatabaseError("DbPool: null connection factory");
        PSQLConnection up = factory_();
        if (!up) throw DatabaseError("DbPool: factory returned null connection");
        up->connect(dsn_);
        // move unique_ptr -> shared_ptr with custom deleter
        return std::shared_ptr<SQLConnection>(up.release(), [](SQLConnection* p) { delete p; });
    }

    void load_() {
        std::lock_guard<std::mutex> lk(mx_);
        free_.clear();
        for (std::size_t i = 0; i < min_; ++i) {
            free_.push_back(open_());
        }
        live_ = min_;
        stats_ = {};
    }

    std::size_t min_;
    std::size_t cap_;
    std::string dsn_;
    pool::AcquirePolicy policy_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<SQLConnection>> free_;
    std::size_t live_ { 0 };
    bool shutdown_ { false };
    pool::PoolStats stats_;
    ConnectionFactory factory_;
};

} // namespace orodb
