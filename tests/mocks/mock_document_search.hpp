#pragma once

#include "search/idocument_search.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace nlquery::testing {

/**
 * @brief Mock document search with configurable hits, failure and latency
 */
class MockDocumentSearch : public IDocumentSearch {
public:
    explicit MockDocumentSearch(std::vector<DocumentHit> hits = default_hits())
        : hits_(std::move(hits)) {}

    [[nodiscard]] Result<std::vector<DocumentHit>> search(
        const std::string& text, size_t limit, std::chrono::milliseconds /*timeout*/) override {
        search_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            last_query_ = text;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        std::lock_guard lock(mutex_);
        if (fail_category_ != ErrorCategory::NONE) {
            return Result<std::vector<DocumentHit>>::error(fail_category_, "Mock index failure");
        }
        auto hits = hits_;
        if (hits.size() > limit) hits.resize(limit);
        return Result<std::vector<DocumentHit>>::ok(std::move(hits));
    }

    static std::vector<DocumentHit> default_hits() {
        DocumentHit a;
        a.text = "Alice Smith: eight years of Python and distributed systems.";
        a.metadata = {{"source", "resumes/alice.pdf"}};
        a.score = 0.91;

        DocumentHit b;
        b.text = "Bob Jones: Python, Go, Kubernetes.";
        b.metadata = {{"source", "resumes/bob.pdf"}};
        return {a, b};
    }

    void fail_with(ErrorCategory category) {
        std::lock_guard lock(mutex_);
        fail_category_ = category;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    [[nodiscard]] uint64_t search_count() const {
        return search_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string last_query() const {
        std::lock_guard lock(mutex_);
        return last_query_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<DocumentHit> hits_;
    ErrorCategory fail_category_ = ErrorCategory::NONE;
    std::chrono::milliseconds delay_{0};
    std::string last_query_;
    std::atomic<uint64_t> search_count_{0};
};

} // namespace nlquery::testing
