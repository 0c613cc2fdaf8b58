#pragma once

#include "db/iquery_executor.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace nlquery::testing {

/**
 * @brief Mock query executor returning a canned result and recording the plan
 */
class MockQueryExecutor : public IQueryExecutor {
public:
    explicit MockQueryExecutor(QueryResult result = default_result())
        : result_(std::move(result)) {}

    [[nodiscard]] Result<QueryResult> execute(
        const QueryPlan& plan, std::chrono::milliseconds /*timeout*/) override {
        execute_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            last_plan_ = plan;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        std::lock_guard lock(mutex_);
        if (fail_category_ != ErrorCategory::NONE) {
            return Result<QueryResult>::error(fail_category_, "Mock failure");
        }
        return Result<QueryResult>::ok(result_);
    }

    static QueryResult default_result() {
        QueryResult r;
        r.column_names = {"id", "name"};
        r.column_types = {{LogicalType::IDENTIFIER, "INTEGER"}, {LogicalType::TEXT, "TEXT"}};
        r.rows = {{"1", "Alice Smith"}, {"2", "Bob Jones"}};
        return r;
    }

    void fail_with(ErrorCategory category) {
        std::lock_guard lock(mutex_);
        fail_category_ = category;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    [[nodiscard]] uint64_t execute_count() const {
        return execute_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::optional<QueryPlan> last_plan() const {
        std::lock_guard lock(mutex_);
        return last_plan_;
    }

private:
    mutable std::mutex mutex_;
    QueryResult result_;
    ErrorCategory fail_category_ = ErrorCategory::NONE;
    std::chrono::milliseconds delay_{0};
    std::optional<QueryPlan> last_plan_;
    std::atomic<uint64_t> execute_count_{0};
};

} // namespace nlquery::testing
