#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/connection_lease.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace nlquery {

/**
 * @brief Database-agnostic connection pool
 *
 * - Bounded: max_connections enforced via counting_semaphore
 * - Lazy: connections created on demand up to max, min pre-warmed
 * - Health checking: connections idle longer than idle_timeout are
 *   validated before being handed out
 * - RAII: ConnectionLease returns itself on destruction
 *
 * The pool must outlive every ConnectionLease it hands out.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<ConnectionLease> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

    std::string last_error() const override;

private:
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Return connection to pool (called by ConnectionLease destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    void discard(std::unique_ptr<IDbConnection>& conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
    std::string last_error_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace nlquery
