#pragma once

#include "core/column_type.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace nlquery {

// ============================================================================
// Basic Enums
// ============================================================================

enum class QueryType {
    STRUCTURED,
    DOCUMENT,
    HYBRID
};

[[nodiscard]] inline std::string_view query_type_to_string(QueryType type) {
    switch (type) {
        case QueryType::STRUCTURED: return "structured";
        case QueryType::DOCUMENT:   return "document";
        case QueryType::HYBRID:     return "hybrid";
    }
    return "structured";
}

[[nodiscard]] inline std::optional<QueryType> parse_query_type(std::string_view text) {
    if (text == "structured") return QueryType::STRUCTURED;
    if (text == "document") return QueryType::DOCUMENT;
    if (text == "hybrid") return QueryType::HYBRID;
    return std::nullopt;
}

// ============================================================================
// Result Types
// ============================================================================

/**
 * @brief Rows returned by the structured branch
 *
 * Cell values are text; SQL NULL is an empty string.
 */
struct QueryResult {
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::string>> rows;

    // Performance metrics
    std::chrono::microseconds execution_time{0};
};

/**
 * @brief One passage returned by the document-search collaborator
 */
struct DocumentHit {
    std::string text;
    std::map<std::string, std::string> metadata;
    std::optional<double> score;
};

} // namespace nlquery
