#include "engine/query_history.hpp"

#include <algorithm>
#include <mutex>

namespace nlquery {

QueryHistory::QueryHistory(size_t capacity)
    : capacity_(std::max(capacity, size_t{1})) {}

void QueryHistory::record(HistoryRecord record) {
    std::unique_lock lock(mutex_);
    records_.emplace_back(std::move(record));

    // Bounded history
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<HistoryRecord> QueryHistory::snapshot() const {
    std::shared_lock lock(mutex_);
    return {records_.rbegin(), records_.rend()};
}

size_t QueryHistory::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace nlquery
