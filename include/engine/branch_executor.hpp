#pragma once

#include "core/error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

namespace nlquery {

/**
 * @brief Fixed set of worker threads that run query branches
 *
 * Branches are queued and picked up by the first idle worker. At most
 * `max_pending` branches wait in the queue; submitting past that fails the
 * branch at once. The destructor stops the workers, fails whatever is still
 * queued and joins every thread, so a branch that overran its deadline
 * finishes before the executor goes away. Submitted work must own everything
 * it uses.
 */
class BranchExecutor {
public:
    static constexpr size_t kDefaultWorkers = 8;
    static constexpr size_t kDefaultMaxPending = 64;

    explicit BranchExecutor(size_t workers = kDefaultWorkers,
                            size_t max_pending = kDefaultMaxPending);
    ~BranchExecutor();

    BranchExecutor(const BranchExecutor&) = delete;
    BranchExecutor& operator=(const BranchExecutor&) = delete;

    template<typename T>
    [[nodiscard]] std::future<Result<T>> submit(std::function<Result<T>()> work) {
        auto promise = std::make_shared<std::promise<Result<T>>>();
        auto future = promise->get_future();

        const bool queued = enqueue([work = std::move(work), promise](bool run) {
            if (!run) {
                promise->set_value(Result<T>::error(ErrorCategory::INTERNAL_ERROR,
                    "Query engine is shutting down"));
                return;
            }
            try {
                promise->set_value(work());
            } catch (const std::exception& e) {
                promise->set_value(Result<T>::error(ErrorCategory::INTERNAL_ERROR, e.what()));
            }
        });
        if (!queued) {
            promise->set_value(Result<T>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Too many query branches in flight ({} queued)", max_pending_)));
        }
        return future;
    }

    [[nodiscard]] size_t worker_count() const { return workers_.size(); }
    [[nodiscard]] size_t pending() const;

private:
    /// `run` is false when the task is dropped at shutdown
    using Task = std::function<void(bool run)>;

    [[nodiscard]] bool enqueue(Task task);
    void worker_loop(std::stop_token stop);

    size_t max_pending_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::vector<std::jthread> workers_;
};

/// Wait for a submitted branch until `deadline`; overrun is TIMEOUT_ERROR
template<typename T>
[[nodiscard]] Result<T> await_branch(std::future<Result<T>>& future,
                                     std::chrono::steady_clock::time_point deadline,
                                     std::string_view branch) {
    if (future.wait_until(deadline) != std::future_status::ready) {
        return Result<T>::error(ErrorCategory::TIMEOUT_ERROR,
            std::format("{} branch did not finish before the deadline", branch));
    }
    return future.get();
}

} // namespace nlquery
