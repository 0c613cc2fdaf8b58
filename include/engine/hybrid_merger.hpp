#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "engine/branch_executor.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace nlquery {

// ============================================================================
// HybridMerger
// ============================================================================

struct BranchError {
    std::string branch;         // "structured" or "document"
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
};

/**
 * @brief Structured rows and document passages side by side
 *
 * A failed branch contributes nothing; `partial_failure` is set and its
 * error is kept in `errors`.
 */
struct HybridResult {
    QueryResult table;
    std::vector<DocumentHit> documents;
    bool partial_failure = false;
    std::vector<BranchError> errors;
};

/**
 * @brief Runs the structured and document branches concurrently
 *
 * Both branches share one deadline. Row order is the executor's and document
 * order is the collaborator's; nothing is re-ranked. Branches run on
 * `executor`, which must outlive the merger.
 */
class HybridMerger {
public:
    using StructuredBranch = std::function<Result<QueryResult>()>;
    using DocumentBranch = std::function<Result<std::vector<DocumentHit>>()>;

    HybridMerger(BranchExecutor& executor, std::chrono::milliseconds deadline);

    /**
     * @return HybridResult when at least one branch succeeded; otherwise the
     *         structured branch's error
     */
    [[nodiscard]] Result<HybridResult> run(StructuredBranch structured,
                                           DocumentBranch documents) const;

    [[nodiscard]] std::chrono::milliseconds deadline() const { return deadline_; }

private:
    BranchExecutor& executor_;
    std::chrono::milliseconds deadline_;
};

} // namespace nlquery
