#pragma once

#include "core/types.hpp"

#include <chrono>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nlquery {

struct HistoryRecord {
    std::string query;
    QueryType query_type = QueryType::STRUCTURED;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Capped, append-only record of submitted questions
 *
 * Oldest records are dropped once capacity is reached. Reads return a copy,
 * most recent first.
 */
class QueryHistory {
public:
    static constexpr size_t kDefaultCapacity = 50;

    explicit QueryHistory(size_t capacity = kDefaultCapacity);

    void record(HistoryRecord record);

    [[nodiscard]] std::vector<HistoryRecord> snapshot() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::deque<HistoryRecord> records_;     // oldest at front
};

} // namespace nlquery
