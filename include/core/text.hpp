#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nlquery::text {

// ============================================================================
// Identifier Normalization
// ============================================================================

/**
 * @brief Split an identifier into lower-case words
 *
 * Breaks on punctuation, underscores, whitespace, letter/digit changes and
 * camelCase humps: "annualSalary" -> {"annual", "salary"},
 * "dept_id" -> {"dept", "id"}, "HRRecords2024" -> {"hr", "records", "2024"}.
 */
[[nodiscard]] std::vector<std::string> split_identifier(std::string_view name);

/**
 * @brief Reduce an English plural to its singular form
 *
 * Rule based: handles -ies, -ses/-xes/-ches/-shes, plain -s and a short list
 * of irregular nouns common in business schemas. Words shorter than four
 * characters are returned unchanged.
 */
[[nodiscard]] std::string singularize(std::string_view word);

/**
 * @brief Canonical form of a table/column/phrase used for matching
 *
 * split_identifier + singularize, joined by single spaces:
 * "Employees" -> "employee", "annual_salaries" -> "annual salary".
 */
[[nodiscard]] std::string normalize_identifier(std::string_view name);

// ============================================================================
// Similarity
// ============================================================================

[[nodiscard]] size_t levenshtein_distance(std::string_view a, std::string_view b);

/// 1 - distance / max(len); 0 when either side is empty
[[nodiscard]] double edit_similarity(std::string_view a, std::string_view b);

/// Shared space-separated words over the larger word count
[[nodiscard]] double token_overlap(std::string_view a, std::string_view b);

/// max(edit_similarity, token_overlap) over normalized inputs
[[nodiscard]] double match_score(std::string_view a, std::string_view b);

} // namespace nlquery::text
