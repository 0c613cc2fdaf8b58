#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace nlquery {

/**
 * @brief A connection checked out of a pool for one statement or one
 *        discovery pass. Hands the connection back when it goes out of scope.
 */
class ConnectionLease {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    ConnectionLease(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
        : conn_(std::move(conn)),
          return_fn_(std::move(return_fn)),
          acquired_at_(std::chrono::steady_clock::now()) {}

    ~ConnectionLease() { give_back(); }

    ConnectionLease(ConnectionLease&& other) noexcept
        : conn_(std::move(other.conn_)),
          return_fn_(std::move(other.return_fn_)),
          acquired_at_(other.acquired_at_) {}

    ConnectionLease& operator=(ConnectionLease&& other) noexcept {
        if (this != &other) {
            give_back();
            conn_ = std::move(other.conn_);
            return_fn_ = std::move(other.return_fn_);
            acquired_at_ = other.acquired_at_;
        }
        return *this;
    }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    [[nodiscard]] std::chrono::milliseconds held_for() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - acquired_at_);
    }

private:
    void give_back() {
        if (conn_ && return_fn_) {
            return_fn_(std::move(conn_));
        }
    }

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    std::chrono::steady_clock::time_point acquired_at_;
};

} // namespace nlquery
