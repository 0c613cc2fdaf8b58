#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace nlquery {

enum class HintTarget {
    TABLE,
    COLUMN,
    ANY
};

[[nodiscard]] std::optional<HintTarget> parse_hint_target(std::string_view text);

/**
 * @brief One data-driven labeling rule: identifiers resembling any synonym get the hint
 */
struct HintRule {
    std::string hint;                    // e.g. "salary-like"
    HintTarget target = HintTarget::ANY;
    std::vector<std::string> synonyms;   // normalized on insertion
};

/**
 * @brief Ordered set of hint rules
 *
 * Defaults cover the common business vocabulary (employees, departments,
 * salaries, names, dates, managers, locations, positions). Deployments append
 * their own vocabulary through `[[hint_rules]]` in the config file; rules
 * with an existing hint label extend that label's synonym list.
 *
 * Matching runs on normalized identifiers (text::normalize_identifier):
 *   - the whole identifier equals a synonym, or
 *   - a single-word synonym equals one of the identifier's words, or
 *   - a multi-word synonym appears as a word sequence, or
 *   - a word of five or more letters is within `fuzzy_threshold` edit
 *     similarity of a single-word synonym ("compensaton" -> "compensation").
 */
class HintRuleSet {
public:
    static constexpr double kDefaultFuzzyThreshold = 0.85;

    HintRuleSet() = default;

    [[nodiscard]] static HintRuleSet defaults();

    void add_rule(HintRule rule);

    /// Hint labels for a table or column name; deterministic and idempotent
    [[nodiscard]] std::set<std::string> hints_for(std::string_view identifier,
                                                  HintTarget target) const;

    /// Normalized synonyms of a hint label (empty when unknown)
    [[nodiscard]] std::vector<std::string> synonyms_for(std::string_view hint) const;

    /// Labels whose synonym list contains the normalized term exactly
    [[nodiscard]] std::set<std::string> hints_for_term(std::string_view term) const;

    [[nodiscard]] const std::vector<HintRule>& rules() const { return rules_; }

    void set_fuzzy_threshold(double threshold) { fuzzy_threshold_ = threshold; }
    [[nodiscard]] double fuzzy_threshold() const { return fuzzy_threshold_; }

private:
    [[nodiscard]] bool matches(const std::string& normalized,
                               const std::vector<std::string>& words,
                               const std::string& synonym) const;

    std::vector<HintRule> rules_;
    double fuzzy_threshold_ = kDefaultFuzzyThreshold;
};

} // namespace nlquery
