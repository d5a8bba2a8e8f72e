// src/data/database_pooling.cpp

#include "tcrimer/data/database_pooling.hpp"
#include "tcrimer/core/logger.hpp"

namespace tcrimer {

nlohmann::json PoolConfig::to_json() const {
    nlohmann::json j;
    j["min_size"] = min_size;
    j["max_size"] = max_size;
    j["acquire_timeout_ms"] = acquire_timeout.count();
    j["staleness_threshold_ms"] = staleness_threshold.count();
    j["primary_failure_threshold"] = primary_failure_threshold;
    j["reconciliation_backoff_s"] = reconciliation_backoff.count();
    j["maintenance_interval_ms"] = maintenance_interval.count();
    return j;
}

void PoolConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_size"))
        min_size = j.at("min_size").get<size_t>();
    if (j.contains("max_size"))
        max_size = j.at("max_size").get<size_t>();
    if (j.contains("acquire_timeout_ms"))
        acquire_timeout = std::chrono::milliseconds(j.at("acquire_timeout_ms").get<int64_t>());
    if (j.contains("staleness_threshold_ms"))
        staleness_threshold =
            std::chrono::milliseconds(j.at("staleness_threshold_ms").get<int64_t>());
    if (j.contains("primary_failure_threshold"))
        primary_failure_threshold = j.at("primary_failure_threshold").get<int>();
    if (j.contains("reconciliation_backoff_s"))
        reconciliation_backoff =
            std::chrono::seconds(j.at("reconciliation_backoff_s").get<int64_t>());
    if (j.contains("maintenance_interval_ms"))
        maintenance_interval =
            std::chrono::milliseconds(j.at("maintenance_interval_ms").get<int64_t>());
}

ConnectionPool::ConnectionPool(PoolConfig config, DatabaseFactory primary_factory,
                               DatabaseFactory fallback_factory,
                               std::shared_ptr<BackendSelector> selector,
                               std::shared_ptr<EventBus> event_bus)
    : config_(std::move(config)), selector_(std::move(selector)), event_bus_(std::move(event_bus)) {
    pool_for(BackendKind::PRIMARY).factory = std::move(primary_factory);
    pool_for(BackendKind::FALLBACK).factory = std::move(fallback_factory);
    if (!selector_) {
        selector_ = std::make_shared<BackendSelector>(
            FailoverPolicy{config_.primary_failure_threshold, config_.reconciliation_backoff});
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

bool ConnectionPool::has_backend(BackendKind backend) const {
    return static_cast<bool>(pool_for(backend).factory);
}

Result<void> ConnectionPool::initialize() {
    if (config_.max_size == 0 || config_.min_size > config_.max_size) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Pool size must satisfy 0 <= min_size <= max_size, max_size > 0",
                                "ConnectionPool");
    }
    if (!has_backend(BackendKind::FALLBACK) && !has_backend(BackendKind::PRIMARY)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No database backend configured",
                                "ConnectionPool");
    }

    if (event_bus_) {
        auto bus = event_bus_;
        selector_->set_transition_listener(
            [bus](BackendKind from, BackendKind to, const std::string& reason) {
                MonitoringEvent event;
                event.type = MonitoringEventType::FAILOVER;
                event.source = "BackendSelector";
                event.timestamp = std::chrono::system_clock::now();
                event.string_fields["from"] = backend_kind_to_string(from);
                event.string_fields["to"] = backend_kind_to_string(to);
                event.string_fields["reason"] = reason;
                bus->publish(std::move(event));
            });
    }

    if (!has_backend(BackendKind::PRIMARY)) {
        selector_->force_fallback("no primary backend configured");
    } else if (selector_->authoritative() == BackendKind::PRIMARY) {
        for (int attempt = 0; attempt < config_.primary_failure_threshold; ++attempt) {
            auto opened = open_connection(BackendKind::PRIMARY);
            if (opened.is_ok()) {
                note_primary_outcome(true, "");
                std::lock_guard<std::mutex> lock(mutex_);
                auto& pool = pool_for(BackendKind::PRIMARY);
                ++pool.total;
                ++pool.created;
                park_idle_locked(pool, opened.value(), false);
                break;
            }
            note_primary_outcome(false, opened.error()->what());
            if (selector_->authoritative() != BackendKind::PRIMARY) {
                break;
            }
        }
    }

    const BackendKind backend = selector_->authoritative();
    if (backend == BackendKind::FALLBACK && !has_backend(BackendKind::FALLBACK)) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Primary unreachable and no fallback backend configured",
                                "ConnectionPool");
    }

    size_t existing = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        existing = pool_for(backend).total;
    }
    for (size_t i = existing; i < config_.min_size; ++i) {
        auto opened = open_connection(backend);
        if (opened.is_error()) {
            if (i == 0) {
                return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                        "Cannot open any " + backend_kind_to_string(backend) +
                                            " connection: " + opened.error()->what(),
                                        "ConnectionPool");
            }
            WARN("Opened only " << i << " of " << config_.min_size << " "
                                << backend_kind_to_string(backend)
                                << " connections: " << opened.error()->what());
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto& pool = pool_for(backend);
        ++pool.total;
        ++pool.created;
        park_idle_locked(pool, opened.value(), false);
    }

    if (config_.maintenance_interval.count() > 0 && !maintenance_thread_.joinable()) {
        maintenance_thread_ = std::thread(&ConnectionPool::maintenance_loop, this);
    }

    INFO("Connection pool initialized on " << backend_kind_to_string(backend) << " backend (min "
                                           << config_.min_size << ", max " << config_.max_size
                                           << ")");
    return Result<void>();
}

Result<ConnectionPool::ConnectionGuard> ConnectionPool::acquire(std::optional<BackendKind> backend) {
    return acquire(backend, config_.acquire_timeout);
}

Result<ConnectionPool::ConnectionGuard> ConnectionPool::acquire(
    std::optional<BackendKind> backend, std::chrono::milliseconds timeout) {
    if (shut_down_.load()) {
        return make_error<ConnectionGuard>(ErrorCode::NOT_INITIALIZED, "Pool is shut down",
                                           "ConnectionPool");
    }

    const BackendKind target = backend.value_or(selector_->authoritative());
    auto result = acquire_from(target, std::chrono::steady_clock::now() + timeout);

    // A failure that just tripped failover is retried once on the new
    // authoritative backend so the caller only sees latency
    if (result.is_error() && !backend && target == BackendKind::PRIMARY &&
        selector_->authoritative() == BackendKind::FALLBACK &&
        result.error()->code() != ErrorCode::POOL_EXHAUSTED) {
        WARN("Primary acquire failed, routing to fallback: " << result.error()->what());
        return acquire_from(BackendKind::FALLBACK, std::chrono::steady_clock::now() + timeout);
    }
    return result;
}

Result<ConnectionPool::ConnectionGuard> ConnectionPool::acquire_from(
    BackendKind backend, std::chrono::steady_clock::time_point deadline) {
    auto& pool = pool_for(backend);
    if (!pool.factory) {
        return make_error<ConnectionGuard>(
            ErrorCode::CONNECTION_ERROR,
            "No " + backend_kind_to_string(backend) + " backend configured", "ConnectionPool");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!pool.idle.empty()) {
            auto connection = pool.idle.front();
            pool.idle.pop_front();
            connection->state = ConnectionState::IN_USE;
            ++pool.in_use;

            auto idle_for = std::chrono::steady_clock::now() - connection->idle_since;
            if (idle_for <= config_.staleness_threshold) {
                return ConnectionGuard(connection, this);
            }

            lock.unlock();
            bool healthy = probe(*connection);
            if (backend == BackendKind::PRIMARY) {
                note_primary_outcome(healthy, "stale connection failed health check");
            }
            lock.lock();

            if (healthy) {
                return ConnectionGuard(connection, this);
            }
            DEBUG("Retiring " << backend_kind_to_string(backend) << " connection "
                              << connection->id << " after failed probe");
            --pool.in_use;
            const bool close_now = retire_locked(pool, connection);
            pool.cv.notify_one();
            if (close_now) {
                lock.unlock();
                connection->handle->disconnect();
                lock.lock();
            }
            continue;  // open a replacement
        }

        if (pool.total < config_.max_size) {
            ++pool.total;
            ++pool.in_use;
            lock.unlock();
            auto opened = open_connection(backend);
            if (backend == BackendKind::PRIMARY) {
                note_primary_outcome(opened.is_ok(),
                                     opened.is_ok() ? "" : opened.error()->what());
            }
            lock.lock();

            if (opened.is_error()) {
                --pool.total;
                --pool.in_use;
                pool.cv.notify_one();
                return forward_error<ConnectionGuard>(opened.error());
            }
            ++pool.created;
            return ConnectionGuard(opened.value(), this);
        }

        if (pool.cv.wait_until(lock, deadline) == std::cv_status::timeout &&
            pool.idle.empty() && pool.total >= config_.max_size) {
            ++pool.acquire_timeouts;
            return make_error<ConnectionGuard>(
                ErrorCode::POOL_EXHAUSTED,
                "Timed out waiting for a " + backend_kind_to_string(backend) + " connection (" +
                    std::to_string(config_.max_size) + " in use)",
                "ConnectionPool");
        }
    }
}

Result<std::shared_ptr<PooledConnection>> ConnectionPool::open_connection(BackendKind backend) {
    std::shared_ptr<DatabaseInterface> handle;
    try {
        handle = pool_for(backend).factory();
    } catch (const std::exception& e) {
        return make_error<std::shared_ptr<PooledConnection>>(
            ErrorCode::CONNECTION_ERROR,
            "Failed to create " + backend_kind_to_string(backend) + " handle: " + e.what(),
            "ConnectionPool");
    }
    if (!handle) {
        return make_error<std::shared_ptr<PooledConnection>>(
            ErrorCode::CONNECTION_ERROR,
            "Factory returned no " + backend_kind_to_string(backend) + " handle",
            "ConnectionPool");
    }

    auto connected = handle->connect();
    if (connected.is_error()) {
        return make_error<std::shared_ptr<PooledConnection>>(
            ErrorCode::CONNECTION_ERROR, connected.error()->what(), "ConnectionPool");
    }

    auto connection = std::make_shared<PooledConnection>();
    connection->id = next_id_.fetch_add(1);
    connection->backend = backend;
    connection->handle = std::move(handle);
    connection->state = ConnectionState::IN_USE;
    connection->last_health_check_at = std::chrono::steady_clock::now();
    connection->idle_since = connection->last_health_check_at;
    return connection;
}

bool ConnectionPool::probe(PooledConnection& connection) {
    if (!connection.handle->is_connected()) {
        if (connection.handle->connect().is_error()) {
            return false;
        }
    }
    auto result = connection.handle->ping();
    if (result.is_error()) {
        DEBUG("Probe of connection " << connection.id << " failed: " << result.error()->what());
        return false;
    }
    connection.last_health_check_at = std::chrono::steady_clock::now();
    return true;
}

void ConnectionPool::release(std::shared_ptr<PooledConnection> connection, bool broken) {
    const BackendKind backend = connection->backend;
    std::shared_ptr<PooledConnection> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& pool = pool_for(backend);
        --pool.in_use;
        if (broken || shut_down_.load()) {
            if (retire_locked(pool, connection)) {
                to_close = std::move(connection);
            }
        } else {
            park_idle_locked(pool, std::move(connection), true);
        }
        pool.cv.notify_one();
    }
    if (to_close) {
        to_close->handle->disconnect();
    }

    if (broken && backend == BackendKind::PRIMARY) {
        note_primary_outcome(false, "connection released as broken");
    }
}

bool ConnectionPool::retire_locked(BackendPool& pool,
                                   const std::shared_ptr<PooledConnection>& connection) {
    connection->state = ConnectionState::BROKEN;
    --pool.total;
    ++pool.retired;
    if (config_.maintenance_interval.count() <= 0 || shut_down_.load()) {
        return true;
    }
    pool.retiring.push_back(connection);
    return false;
}

void ConnectionPool::park_idle_locked(BackendPool& pool,
                                      std::shared_ptr<PooledConnection> connection,
                                      bool most_recent) {
    connection->state = ConnectionState::IDLE;
    connection->idle_since = std::chrono::steady_clock::now();
    if (most_recent) {
        pool.idle.push_front(std::move(connection));
    } else {
        pool.idle.push_back(std::move(connection));
    }
}

void ConnectionPool::note_primary_outcome(bool ok, const std::string& reason) {
    if (ok) {
        selector_->record_primary_success();
    } else {
        selector_->record_primary_failure(reason);
    }
}

void ConnectionPool::run_maintenance() {
    std::vector<std::shared_ptr<PooledConnection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pool : pools_) {
            for (auto& connection : pool.retiring) {
                to_close.push_back(std::move(connection));
            }
            pool.retiring.clear();
        }
    }
    for (auto& connection : to_close) {
        connection->handle->disconnect();
    }

    if (selector_->authoritative() == BackendKind::FALLBACK && has_backend(BackendKind::PRIMARY)) {
        reconcile_primary();
    }

    publish_occupancy();
}

bool ConnectionPool::reconcile_primary() {
    if (!has_backend(BackendKind::PRIMARY) || !selector_->try_begin_reconciliation()) {
        return false;
    }

    INFO("Attempting reconciliation with primary backend");
    auto opened = open_connection(BackendKind::PRIMARY);
    bool healthy = opened.is_ok() && probe(*opened.value());
    selector_->complete_reconciliation(healthy);

    if (!healthy) {
        if (opened.is_ok()) {
            opened.value()->handle->disconnect();
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& pool = pool_for(BackendKind::PRIMARY);
    if (pool.total < config_.max_size) {
        ++pool.total;
        ++pool.created;
        park_idle_locked(pool, opened.value(), true);
        pool.cv.notify_one();
    } else {
        opened.value()->handle->disconnect();
    }
    return true;
}

PoolStats ConnectionPool::stats(BackendKind backend) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& pool = pool_for(backend);
    PoolStats stats;
    stats.backend = backend;
    stats.idle = pool.idle.size();
    stats.in_use = pool.in_use;
    stats.total = pool.total;
    stats.created = pool.created;
    stats.retired = pool.retired;
    stats.acquire_timeouts = pool.acquire_timeouts;
    return stats;
}

void ConnectionPool::publish_occupancy() {
    if (!event_bus_) {
        return;
    }
    const std::string authoritative = backend_kind_to_string(selector_->authoritative());
    for (BackendKind backend : {BackendKind::PRIMARY, BackendKind::FALLBACK}) {
        if (!has_backend(backend)) {
            continue;
        }
        PoolStats s = stats(backend);
        MonitoringEvent event;
        event.type = MonitoringEventType::POOL_OCCUPANCY;
        event.source = "ConnectionPool";
        event.timestamp = std::chrono::system_clock::now();
        event.string_fields["backend"] = backend_kind_to_string(backend);
        event.string_fields["authoritative"] = authoritative;
        event.numeric_fields["idle"] = static_cast<double>(s.idle);
        event.numeric_fields["in_use"] = static_cast<double>(s.in_use);
        event.numeric_fields["total"] = static_cast<double>(s.total);
        event.numeric_fields["max"] = static_cast<double>(config_.max_size);
        event.numeric_fields["acquire_timeouts"] = static_cast<double>(s.acquire_timeouts);
        event_bus_->publish(std::move(event));
    }
}

void ConnectionPool::maintenance_loop() {
    Logger::register_component("ConnectionPool");
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (!stopping_) {
        maintenance_cv_.wait_for(lock, config_.maintenance_interval, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        try {
            run_maintenance();
        } catch (const std::exception& e) {
            ERROR("Pool maintenance failed: " << e.what());
        }
        lock.lock();
    }
}

void ConnectionPool::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        stopping_ = true;
    }
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    std::vector<std::shared_ptr<PooledConnection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pool : pools_) {
            for (auto& connection : pool.idle) {
                to_close.push_back(connection);
            }
            pool.total -= pool.idle.size();
            pool.idle.clear();
            for (auto& connection : pool.retiring) {
                to_close.push_back(connection);
            }
            pool.retiring.clear();
            pool.cv.notify_all();
        }
    }
    for (auto& connection : to_close) {
        connection->handle->disconnect();
    }
}

}  // namespace tcrimer
