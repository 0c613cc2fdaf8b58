#include "catalog/hint_rules.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace nlquery {

std::optional<HintTarget> parse_hint_target(std::string_view text) {
    const auto lower = utils::to_lower(text);
    if (lower == "table") return HintTarget::TABLE;
    if (lower == "column") return HintTarget::COLUMN;
    if (lower == "any" || lower.empty()) return HintTarget::ANY;
    return std::nullopt;
}

HintRuleSet HintRuleSet::defaults() {
    HintRuleSet set;
    set.add_rule({"employee-like", HintTarget::TABLE,
        {"employee", "emp", "staff", "personnel", "person", "worker", "member", "developer"}});
    set.add_rule({"department-like", HintTarget::ANY,
        {"department", "dept", "division", "team", "unit"}});
    set.add_rule({"salary-like", HintTarget::COLUMN,
        {"salary", "compensation", "pay", "wage", "income", "earning", "pay rate"}});
    set.add_rule({"name-like", HintTarget::COLUMN,
        {"name", "full name", "first name", "last name", "username"}});
    set.add_rule({"date-like", HintTarget::COLUMN,
        {"date", "day", "timestamp", "hired", "hire", "joined", "start", "created", "dob", "birthday"}});
    set.add_rule({"manager-like", HintTarget::COLUMN,
        {"manager", "supervisor", "boss", "head", "lead", "reports to"}});
    set.add_rule({"location-like", HintTarget::COLUMN,
        {"location", "office", "city", "address", "country", "region", "site"}});
    set.add_rule({"position-like", HintTarget::COLUMN,
        {"position", "role", "job", "title", "designation"}});
    return set;
}

void HintRuleSet::add_rule(HintRule rule) {
    std::vector<std::string> normalized;
    normalized.reserve(rule.synonyms.size());
    for (const auto& s : rule.synonyms) {
        auto n = text::normalize_identifier(s);
        if (!n.empty() && std::find(normalized.begin(), normalized.end(), n) == normalized.end()) {
            normalized.push_back(std::move(n));
        }
    }

    for (auto& existing : rules_) {
        if (existing.hint == rule.hint && existing.target == rule.target) {
            for (auto& n : normalized) {
                if (std::find(existing.synonyms.begin(), existing.synonyms.end(), n) ==
                    existing.synonyms.end()) {
                    existing.synonyms.push_back(std::move(n));
                }
            }
            return;
        }
    }

    rule.synonyms = std::move(normalized);
    rules_.push_back(std::move(rule));
}

bool HintRuleSet::matches(const std::string& normalized,
                          const std::vector<std::string>& words,
                          const std::string& synonym) const {
    if (normalized == synonym) return true;

    if (synonym.find(' ') != std::string::npos) {
        const std::string padded = " " + normalized + " ";
        return padded.find(" " + synonym + " ") != std::string::npos;
    }

    for (const auto& w : words) {
        if (w == synonym) return true;
        if (w.size() >= 5 && synonym.size() >= 5 &&
            text::edit_similarity(w, synonym) >= fuzzy_threshold_) {
            return true;
        }
    }
    return false;
}

std::set<std::string> HintRuleSet::hints_for(std::string_view identifier, HintTarget target) const {
    std::set<std::string> hints;
    const auto normalized = text::normalize_identifier(identifier);
    if (normalized.empty()) return hints;
    const auto words = utils::split(normalized, ' ');

    for (const auto& rule : rules_) {
        if (rule.target != HintTarget::ANY && rule.target != target) continue;
        for (const auto& synonym : rule.synonyms) {
            if (matches(normalized, words, synonym)) {
                hints.insert(rule.hint);
                break;
            }
        }
    }
    return hints;
}

std::vector<std::string> HintRuleSet::synonyms_for(std::string_view hint) const {
    std::vector<std::string> result;
    for (const auto& rule : rules_) {
        if (rule.hint != hint) continue;
        for (const auto& s : rule.synonyms) {
            if (std::find(result.begin(), result.end(), s) == result.end()) {
                result.push_back(s);
            }
        }
    }
    return result;
}

std::set<std::string> HintRuleSet::hints_for_term(std::string_view term) const {
    std::set<std::string> hints;
    const auto normalized = text::normalize_identifier(term);
    for (const auto& rule : rules_) {
        if (std::find(rule.synonyms.begin(), rule.synonyms.end(), normalized) != rule.synonyms.end()) {
            hints.insert(rule.hint);
        }
    }
    return hints;
}

} // namespace nlquery
