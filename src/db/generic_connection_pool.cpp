#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace nlquery {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(std::max<size_t>(config.max_connections, 1))) {

    for (size_t i = 0; i < config_.min_connections && i < config_.max_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for '{}'",
                i + 1, db_name_));
            break;
        }
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("ConnectionPool initialized for '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<ConnectionLease> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Shutdown may have been set while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point last_used{};
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    // Only connections idle longer than idle_timeout pay for a round trip
    if (conn && std::chrono::steady_clock::now() - last_used > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            discard(conn);
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c) {
        this->return_connection(std::move(c));
    };
    return std::make_unique<ConnectionLease>(std::move(conn), std::move(return_fn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();
    last_used_.clear();

    utils::log::info(std::format("ConnectionPool drained for '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto opened = factory_->open(config_.connection_string);
    if (opened.is_error()) {
        utils::log::error(opened.error_message());
        std::lock_guard lock(mutex_);
        last_error_ = opened.error_message();
        return nullptr;
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return std::move(opened.value());
}

std::string GenericConnectionPool::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection>& conn) {
    {
        std::lock_guard lock(mutex_);
        last_used_.erase(conn.get());
    }
    conn->close();
    conn.reset();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard(conn);
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }
    semaphore_.release();
}

} // namespace nlquery
