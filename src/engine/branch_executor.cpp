#include "engine/branch_executor.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace nlquery {

BranchExecutor::BranchExecutor(size_t workers, size_t max_pending)
    : max_pending_(std::max<size_t>(max_pending, 1)) {
    workers = std::max<size_t>(workers, 1);
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
    utils::log::debug(std::format("BranchExecutor started {} workers (queue limit {})",
        workers, max_pending_));
}

BranchExecutor::~BranchExecutor() {
    std::deque<Task> dropped;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        dropped.swap(tasks_);
    }
    for (auto& w : workers_) {
        w.request_stop();
    }
    cv_.notify_all();

    for (auto& task : dropped) {
        task(false);
    }
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

size_t BranchExecutor::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

bool BranchExecutor::enqueue(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || tasks_.size() >= max_pending_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void BranchExecutor::worker_loop(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !tasks_.empty(); })) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task(true);
    }
}

} // namespace nlquery
