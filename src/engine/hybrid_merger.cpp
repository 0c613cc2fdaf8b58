#include "engine/hybrid_merger.hpp"
#include "core/utils.hpp"

#include <format>

namespace nlquery {

HybridMerger::HybridMerger(BranchExecutor& executor, std::chrono::milliseconds deadline)
    : executor_(executor), deadline_(deadline) {}

Result<HybridResult> HybridMerger::run(StructuredBranch structured,
                                       DocumentBranch documents) const {
    const auto deadline = std::chrono::steady_clock::now() + deadline_;

    auto rows_future = executor_.submit<QueryResult>(std::move(structured));
    auto docs_future = executor_.submit<std::vector<DocumentHit>>(std::move(documents));

    auto rows = await_branch(rows_future, deadline, "structured");
    auto docs = await_branch(docs_future, deadline, "document");

    if (rows.is_error() && docs.is_error()) {
        utils::log::warn(std::format("Hybrid query failed in both branches: {} / {}",
            rows.error_message(), docs.error_message()));
        return Result<HybridResult>::error(rows.error_category(), rows.error_message());
    }

    HybridResult merged;
    if (rows.is_ok()) {
        merged.table = std::move(rows.value());
    } else {
        merged.partial_failure = true;
        merged.errors.push_back({"structured", rows.error_category(), rows.error_message()});
        utils::log::warn(std::format("Structured branch failed: {}", rows.error_message()));
    }

    if (docs.is_ok()) {
        merged.documents = std::move(docs.value());
    } else {
        merged.partial_failure = true;
        merged.errors.push_back({"document", docs.error_category(), docs.error_message()});
        utils::log::warn(std::format("Document branch failed: {}", docs.error_message()));
    }

    return Result<HybridResult>::ok(std::move(merged));
}

} // namespace nlquery
