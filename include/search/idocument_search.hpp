#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace nlquery {

/**
 * @brief Document search interface (vector-search collaborator)
 *
 * Implementations:
 * - HttpDocumentSearch: JSON over HTTP to an external index
 *
 * Errors: TIMEOUT_ERROR when the deadline passes, INDEX_UNAVAILABLE for
 * anything else the collaborator does wrong.
 */
class IDocumentSearch {
public:
    virtual ~IDocumentSearch() = default;

    [[nodiscard]] virtual Result<std::vector<DocumentHit>> search(
        const std::string& text,
        size_t limit,
        std::chrono::milliseconds timeout) = 0;
};

} // namespace nlquery
