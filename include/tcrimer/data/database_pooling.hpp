// include/tcrimer/data/database_pooling.hpp
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "tcrimer/core/config_base.hpp"
#include "tcrimer/core/event_bus.hpp"
#include "tcrimer/data/backend_selector.hpp"
#include "tcrimer/data/database_interface.hpp"

namespace tcrimer {

/**
 * @brief Creates an unconnected backend handle
 */
using DatabaseFactory = std::function<std::shared_ptr<DatabaseInterface>()>;

enum class ConnectionState { IDLE, IN_USE, BROKEN };

/**
 * @brief A connection owned by the pool
 */
struct PooledConnection {
    uint64_t id{0};
    BackendKind backend{BackendKind::PRIMARY};
    std::shared_ptr<DatabaseInterface> handle;
    ConnectionState state{ConnectionState::IDLE};
    std::chrono::steady_clock::time_point last_health_check_at;
    std::chrono::steady_clock::time_point idle_since;
};

struct PoolConfig : public ConfigBase {
    size_t min_size{1};
    size_t max_size{10};
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds staleness_threshold{30000};  // idle time before a probe
    int primary_failure_threshold{3};
    std::chrono::seconds reconciliation_backoff{60};
    std::chrono::milliseconds maintenance_interval{1000};  // 0 disables the thread

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct PoolStats {
    BackendKind backend{BackendKind::PRIMARY};
    size_t idle{0};
    size_t in_use{0};
    size_t total{0};
    size_t created{0};
    size_t retired{0};
    size_t acquire_timeouts{0};
};

/**
 * @brief Bounded per-backend connection pool with health checks and failover
 *
 * New connections route to the backend the BackendSelector reports as
 * authoritative. Three consecutive failed opens or probes against the primary
 * switch the selector to fallback; a maintenance pass later reconciles back.
 * The pool must outlive every ConnectionGuard it hands out.
 */
class ConnectionPool {
public:
    /**
     * @param primary_factory May be empty, in which case the pool serves the
     *        fallback only
     */
    ConnectionPool(PoolConfig config, DatabaseFactory primary_factory,
                   DatabaseFactory fallback_factory, std::shared_ptr<BackendSelector> selector,
                   std::shared_ptr<EventBus> event_bus = nullptr);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Probe the primary, pre-open min_size connections on the
     * authoritative backend and start maintenance
     * @return CONNECTION_ERROR if no backend can be reached
     */
    Result<void> initialize();

    /**
     * @brief Scoped handle; the connection goes back to the pool when the
     * guard is destroyed, on every exit path
     */
    class ConnectionGuard {
    public:
        ConnectionGuard() = default;
        ConnectionGuard(std::shared_ptr<PooledConnection> connection, ConnectionPool* pool)
            : connection_(std::move(connection)), pool_(pool) {}

        ~ConnectionGuard() {
            release();
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : connection_(std::move(other.connection_)),
              pool_(other.pool_),
              broken_(other.broken_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                release();
                connection_ = std::move(other.connection_);
                pool_ = other.pool_;
                broken_ = other.broken_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        DatabaseInterface* operator->() const {
            return connection_->handle.get();
        }
        DatabaseInterface& operator*() const {
            return *connection_->handle;
        }
        DatabaseInterface* get() const {
            return connection_ ? connection_->handle.get() : nullptr;
        }

        BackendKind backend() const {
            return connection_->backend;
        }

        /**
         * @brief Retire the connection instead of returning it to the pool
         */
        void mark_broken() {
            broken_ = true;
        }

        /**
         * @brief Return the connection early
         */
        void release() {
            if (connection_ && pool_) {
                pool_->release(std::move(connection_), broken_);
            }
            connection_.reset();
            pool_ = nullptr;
        }

    private:
        std::shared_ptr<PooledConnection> connection_;
        ConnectionPool* pool_{nullptr};
        bool broken_{false};
    };

    /**
     * @brief Acquire a connection, waiting up to the configured timeout
     * @param backend Explicit backend, or the authoritative one when empty
     * @return POOL_EXHAUSTED when the pool stays at max size for the whole
     *         timeout, CONNECTION_ERROR when a new connection cannot be opened
     */
    Result<ConnectionGuard> acquire(std::optional<BackendKind> backend = std::nullopt);
    Result<ConnectionGuard> acquire(std::optional<BackendKind> backend,
                                    std::chrono::milliseconds timeout);

    /**
     * @brief Retire broken connections, reconcile with the primary when due
     * and publish occupancy. Called periodically by the maintenance thread.
     */
    void run_maintenance();

    /**
     * @brief Probe the primary and revert to it on success
     * @return true if the primary became authoritative again
     */
    bool reconcile_primary();

    bool has_backend(BackendKind backend) const;
    PoolStats stats(BackendKind backend) const;
    const std::shared_ptr<BackendSelector>& selector() const {
        return selector_;
    }

    /**
     * @brief Stop maintenance and close every idle connection
     */
    void shutdown();

private:
    struct BackendPool {
        DatabaseFactory factory;
        std::deque<std::shared_ptr<PooledConnection>> idle;
        std::vector<std::shared_ptr<PooledConnection>> retiring;
        size_t total{0};  // idle + in use + being opened
        size_t in_use{0};
        size_t created{0};
        size_t retired{0};
        size_t acquire_timeouts{0};
        std::condition_variable cv;
    };

    BackendPool& pool_for(BackendKind backend) {
        return pools_[static_cast<size_t>(backend)];
    }
    const BackendPool& pool_for(BackendKind backend) const {
        return pools_[static_cast<size_t>(backend)];
    }

    Result<ConnectionGuard> acquire_from(BackendKind backend,
                                         std::chrono::steady_clock::time_point deadline);
    Result<std::shared_ptr<PooledConnection>> open_connection(BackendKind backend);
    bool probe(PooledConnection& connection);
    void release(std::shared_ptr<PooledConnection> connection, bool broken);
    // Requires mutex_. Returns true when the caller must disconnect the
    // connection itself because no maintenance pass will.
    bool retire_locked(BackendPool& pool, const std::shared_ptr<PooledConnection>& connection);
    void park_idle_locked(BackendPool& pool, std::shared_ptr<PooledConnection> connection,
                          bool most_recent);
    void note_primary_outcome(bool ok, const std::string& reason);
    void publish_occupancy();
    void maintenance_loop();

    PoolConfig config_;
    std::shared_ptr<BackendSelector> selector_;
    std::shared_ptr<EventBus> event_bus_;
    std::array<BackendPool, 2> pools_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> next_id_{1};

    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    bool stopping_{false};
    std::atomic<bool> shut_down_{false};
};

}  // namespace tcrimer
