#include "mapper/entity_mapper.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_set>

namespace nlquery {

namespace {

constexpr double kEpsilon = 1e-9;

const std::unordered_set<std::string_view>& stop_words() {
    static const std::unordered_set<std::string_view> words = {
        "a", "an", "the", "of", "in", "on", "at", "to", "for", "with", "and", "or",
        "not", "no", "me", "my", "show", "list", "find", "get", "give", "display",
        "tell", "what", "which", "who", "whom", "whose", "where", "when", "is", "are",
        "was", "were", "be", "been", "being", "do", "does", "did", "we", "our", "us",
        "you", "your", "i", "have", "has", "had", "there", "their", "that", "these",
        "those", "it", "its", "from", "into", "about", "please", "all", "any", "some",
        "every", "can", "could", "would", "should", "will", "as", "so", "just", "also",
        "currently", "now", "only", "want", "need", "see", "this", "during", "whom",
        "they", "them", "he", "she", "his", "her", "within", "work", "works", "working",
    };
    return words;
}

const std::unordered_set<std::string_view>& operation_words() {
    static const std::unordered_set<std::string_view> words = {
        "how", "many", "much", "count", "total", "sum", "average", "avg", "mean",
        "min", "minimum", "lowest", "smallest", "max", "maximum", "highest", "largest",
        "biggest", "per", "each", "by", "group", "grouped",
    };
    return words;
}

const std::unordered_set<std::string_view>& cue_words() {
    static const std::unordered_set<std::string_view> words = {
        "over", "above", "exceeding", "exceeds", "more", "less", "fewer", "greater",
        "higher", "lower", "larger", "smaller", "than", "under", "below", "before",
        "after", "since", "between", "least", "most",
    };
    return words;
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool is_iso_date(std::string_view s) {
    return s.size() == 10 && s[4] == '-' && s[7] == '-' &&
           all_digits(s.substr(0, 4)) && all_digits(s.substr(5, 2)) && all_digits(s.substr(8, 2));
}

/// "120,000" -> "120000", "100k" -> "100000", "1.5" -> "1.5"; nullopt otherwise
std::optional<std::string> parse_number(std::string_view s) {
    std::string out;
    bool thousands = false;
    if (s.size() > 1 && (s.back() == 'k' || s.back() == 'K')) {
        thousands = true;
        s.remove_suffix(1);
    }
    bool dot = false;
    for (const char c : s) {
        if (c == ',') continue;
        if (c == '.') {
            if (dot) return std::nullopt;
            dot = true;
            out += c;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        out += c;
    }
    if (out.empty() || out.front() == '.' || out.back() == '.') return std::nullopt;
    if (thousands) {
        if (dot) return std::nullopt;
        out += "000";
    }
    return out;
}

std::optional<int> parse_year(std::string_view s) {
    if (s.size() != 4) return std::nullopt;
    const auto y = utils::try_parse_int<int>(s);
    if (!y || *y < 1900 || *y > 2100) return std::nullopt;
    return y;
}

std::string year_start(int year) {
    return std::format("{:04d}-01-01", year);
}

struct Cue {
    CompareOp op = CompareOp::EQ;
    size_t span = 0;            // tokens consumed before the literal
    bool numeric = false;       // "more than" style: the literal is a quantity
};

std::optional<Cue> cue_before(const std::vector<Token>& tokens, size_t i) {
    if (i >= 2) {
        const auto& a = tokens[i - 2].lower;
        const auto& b = tokens[i - 1].lower;
        if (b == "than") {
            if (a == "more" || a == "greater" || a == "higher" || a == "larger") {
                return Cue{CompareOp::GT, 2, true};
            }
            if (a == "less" || a == "fewer" || a == "lower" || a == "smaller") {
                return Cue{CompareOp::LT, 2, true};
            }
        }
        if (a == "at" && b == "least") return Cue{CompareOp::GE, 2, true};
        if (a == "at" && b == "most") return Cue{CompareOp::LE, 2, true};
    }
    if (i >= 1) {
        const auto& b = tokens[i - 1].lower;
        if (b == "over" || b == "above" || b == "exceeding" || b == "exceeds") {
            return Cue{CompareOp::GT, 1, true};
        }
        if (b == "under" || b == "below") return Cue{CompareOp::LT, 1, true};
        if (b == "before") return Cue{CompareOp::LT, 1, false};
        if (b == "after") return Cue{CompareOp::GT, 1, false};
        if (b == "since") return Cue{CompareOp::GE, 1, false};
    }
    return std::nullopt;
}

/// Literal classification of a single token
struct LiteralValue {
    LiteralKind kind = LiteralKind::NONE;
    std::string value;
    int year = 0;
};

std::optional<LiteralValue> literal_of(const Token& token, bool numeric_context) {
    if (token.quoted) return std::nullopt;
    if (is_iso_date(token.lower)) {
        return LiteralValue{LiteralKind::DATE, token.lower, 0};
    }
    if (!numeric_context) {
        if (const auto y = parse_year(token.lower)) {
            return LiteralValue{LiteralKind::YEAR, token.lower, *y};
        }
    }
    if (auto n = parse_number(token.lower)) {
        return LiteralValue{LiteralKind::NUMBER, std::move(*n), 0};
    }
    return std::nullopt;
}

bool compatible(LiteralKind kind, LogicalType type) {
    if (kind == LiteralKind::NUMBER) return type == LogicalType::NUMERIC;
    return type == LogicalType::DATE;
}

std::string join_texts(const std::vector<Token>& tokens, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to && i < tokens.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += tokens[i].text;
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

EntityMapper::EntityMapper(std::shared_ptr<const SchemaCatalog> catalog,
                           HintRuleSet rules,
                           double threshold)
    : catalog_(std::move(catalog)), threshold_(threshold) {
    if (!catalog_) {
        catalog_ = std::make_shared<const SchemaCatalog>();
    }
    build_index(rules);
}

void EntityMapper::build_index(const HintRuleSet& rules) {
    const auto synonyms_of = [&rules](const std::set<std::string>& hints) {
        std::vector<std::string> out;
        for (const auto& h : hints) {
            for (auto& s : rules.synonyms_for(h)) {
                if (std::find(out.begin(), out.end(), s) == out.end()) out.push_back(std::move(s));
            }
        }
        return out;
    };

    for (const auto& table : catalog_->tables()) {
        NameTarget t;
        t.kind = EntityKind::TABLE;
        t.table = table.name;
        t.normalized = text::normalize_identifier(table.name);
        t.synonyms = synonyms_of(table.hints);
        names_.push_back(std::move(t));

        for (const auto& col : table.columns) {
            NameTarget c;
            c.kind = EntityKind::COLUMN;
            c.table = table.name;
            c.column = col.name;
            c.normalized = text::normalize_identifier(col.name);
            c.synonyms = synonyms_of(col.hints);
            names_.push_back(std::move(c));

            for (const auto& sample : col.samples) {
                auto key = utils::normalize_whitespace_lower(sample);
                if (key.empty()) continue;
                values_[std::move(key)].push_back({table.name, col.name, sample});
            }
        }
    }
}

// ============================================================================
// Tokenization
// ============================================================================

std::vector<Token> EntityMapper::tokenize(std::string_view input) {
    std::vector<Token> tokens;
    std::string current;

    const auto push = [&tokens](std::string word, bool quoted) {
        if (word.empty()) return;
        Token t;
        t.lower = utils::to_lower(word);
        t.text = std::move(word);
        t.quoted = quoted;
        tokens.push_back(std::move(t));
    };

    const auto flush = [&]() {
        if (current.size() > 2 && current.ends_with("'s")) {
            current.resize(current.size() - 2);
        }
        while (!current.empty() && std::string_view("-.,'").find(current.back()) != std::string_view::npos) {
            current.pop_back();
        }
        push(std::move(current), false);
        current.clear();
    };

    const auto is_word = [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc >= 0x80;
    };

    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        if (is_word(c)) {
            current += c;
            continue;
        }

        // Quoted phrase: "Sr Engineer" or 'Sr Engineer' at a word boundary
        if ((c == '"' || c == '\'') && current.empty()) {
            const size_t close = input.find(c, i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                auto phrase = utils::trim(std::string(input.substr(i + 1, close - i - 1)));
                push(std::move(phrase), true);
                i = close;
            }
            continue;
        }

        // Inner punctuation: 2023-01-15, 1.5, 120,000, o'brien, full-time
        if ((c == '-' || c == '.' || c == ',' || c == '\'') && !current.empty() &&
            i + 1 < input.size() && is_word(input[i + 1])) {
            const bool digits_around = std::isdigit(static_cast<unsigned char>(current.back())) &&
                                       std::isdigit(static_cast<unsigned char>(input[i + 1]));
            if (c != ',' || digits_around) {
                current += c;
                continue;
            }
        }
        flush();
    }
    flush();
    return tokens;
}

TokenRole EntityMapper::role_of(std::string_view lower) {
    if (stop_words().count(lower)) return TokenRole::STOP;
    if (operation_words().count(lower)) return TokenRole::OPERATION;
    if (cue_words().count(lower)) return TokenRole::CUE;
    return TokenRole::CONTENT;
}

// ============================================================================
// Literals
// ============================================================================

void EntityMapper::extract_literals(const std::vector<Token>& tokens,
                                    std::vector<bool>& consumed,
                                    std::vector<MappedEntity>& literals,
                                    std::vector<std::pair<size_t, size_t>>& spans,
                                    std::chrono::system_clock::time_point now) const {
    const int current_year = utils::year_of(now);

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (consumed[i] || tokens[i].quoted) continue;
        const auto& lower = tokens[i].lower;

        // Relative periods
        if (i + 1 < tokens.size() && (tokens[i + 1].lower == "year")) {
            std::optional<int> year;
            if (lower == "this" || lower == "current") year = current_year;
            if (lower == "last" || lower == "previous" || lower == "past") year = current_year - 1;
            if (year) {
                MappedEntity e;
                e.kind = EntityKind::LITERAL;
                e.literal = LiteralKind::PERIOD;
                e.op = CompareOp::RANGE;
                e.value = year_start(*year);
                e.upper = year_start(*year + 1);
                e.phrase = join_texts(tokens, i, i + 2);
                e.position = i;
                e.confidence = 1.0;
                consumed[i] = consumed[i + 1] = true;
                literals.push_back(std::move(e));
                spans.emplace_back(i, i + 2);
                ++i;
                continue;
            }
        }

        // between X and Y
        if (lower == "between" && i + 3 < tokens.size() && tokens[i + 2].lower == "and") {
            const auto lo = literal_of(tokens[i + 1], false);
            const auto hi = literal_of(tokens[i + 3], false);
            if (lo && hi && lo->kind == hi->kind) {
                MappedEntity e;
                e.kind = EntityKind::LITERAL;
                e.literal = lo->kind;
                e.phrase = join_texts(tokens, i, i + 4);
                e.position = i + 1;
                e.confidence = 1.0;
                if (lo->kind == LiteralKind::YEAR) {
                    e.op = CompareOp::RANGE;
                    e.value = year_start(std::min(lo->year, hi->year));
                    e.upper = year_start(std::max(lo->year, hi->year) + 1);
                } else {
                    e.op = CompareOp::BETWEEN;
                    e.value = lo->value;
                    e.upper = hi->value;
                    // Bounds may come high-first; ISO dates order as strings
                    const bool reversed = lo->kind == LiteralKind::NUMBER
                        ? utils::parse_double(lo->value) > utils::parse_double(hi->value)
                        : lo->value > hi->value;
                    if (reversed) std::swap(e.value, e.upper);
                }
                for (size_t k = i; k < i + 4; ++k) consumed[k] = true;
                literals.push_back(std::move(e));
                spans.emplace_back(i, i + 4);
                i += 3;
                continue;
            }
        }

        const auto cue = cue_before(tokens, i);
        const bool numeric_context = cue && cue->numeric;
        const auto lit = literal_of(tokens[i], numeric_context);
        if (!lit) continue;

        MappedEntity e;
        e.kind = EntityKind::LITERAL;
        e.literal = lit->kind;
        e.position = i;
        e.confidence = 1.0;
        e.op = cue ? cue->op : CompareOp::EQ;
        e.value = lit->value;

        if (lit->kind == LiteralKind::YEAR) {
            if (!cue) {
                e.op = CompareOp::RANGE;
                e.upper = year_start(lit->year + 1);
                e.value = year_start(lit->year);
            } else if (e.op == CompareOp::GT) {
                e.op = CompareOp::GE;   // after 2022 = from 2023-01-01
                e.value = year_start(lit->year + 1);
            } else {
                e.value = year_start(lit->year);
            }
        }

        const size_t first = cue ? i - cue->span : i;
        for (size_t k = first; k <= i; ++k) consumed[k] = true;
        e.phrase = join_texts(tokens, first, i + 1);
        literals.push_back(std::move(e));
        spans.emplace_back(first, i + 1);
    }
}

void EntityMapper::attach_literals(std::vector<MappedEntity>& literals,
                                   const std::vector<MappedEntity>& entities) const {
    // Fallback table: best table entity, else the table of the best column/value entity
    const TableInfo* fallback = nullptr;
    for (const auto& e : entities) {
        if (e.kind == EntityKind::TABLE) {
            fallback = catalog_->find_table(e.table);
            break;
        }
    }
    if (!fallback) {
        for (const auto& e : entities) {
            if (e.kind == EntityKind::COLUMN || e.kind == EntityKind::VALUE) {
                fallback = catalog_->find_table(e.table);
                break;
            }
        }
    }

    for (auto& lit : literals) {
        const MappedEntity* nearest = nullptr;
        size_t best_distance = 0;
        for (const auto& e : entities) {
            if (e.kind != EntityKind::COLUMN) continue;
            const auto* col = catalog_->find_column(e.table, e.column);
            if (!col || !compatible(lit.literal, col->logical_type)) continue;
            const size_t distance = e.position > lit.position ? e.position - lit.position
                                                              : lit.position - e.position;
            if (!nearest || distance < best_distance) {
                nearest = &e;
                best_distance = distance;
            }
        }
        if (nearest) {
            lit.table = nearest->table;
            lit.column = nearest->column;
            continue;
        }

        // A bare number with no nearby column is too ambiguous to guess a target for
        if (!fallback || (lit.literal == LiteralKind::NUMBER && lit.op == CompareOp::EQ)) continue;
        const std::string_view preferred = lit.literal == LiteralKind::NUMBER ? "salary-like" : "date-like";
        const ColumnInfo* target = nullptr;
        for (const auto& col : fallback->columns) {
            if (!compatible(lit.literal, col.logical_type) || col.hints.empty()) continue;
            if (col.has_hint(preferred)) {
                target = &col;
                break;
            }
            if (!target) target = &col;
        }
        if (target) {
            lit.table = fallback->name;
            lit.column = target->name;
        }
    }
}

// ============================================================================
// Name and value matching
// ============================================================================

std::vector<MappedEntity> EntityMapper::candidates_for(std::string_view phrase, size_t position) const {
    std::vector<MappedEntity> out;

    const auto value_key = utils::normalize_whitespace_lower(phrase);
    if (const auto it = values_.find(value_key); it != values_.end()) {
        for (const auto& v : it->second) {
            MappedEntity e;
            e.kind = EntityKind::VALUE;
            e.phrase = std::string(phrase);
            e.table = v.table;
            e.column = v.column;
            e.value = v.value;
            e.confidence = 1.0;
            e.position = position;
            out.push_back(std::move(e));
        }
    }

    const auto normalized = text::normalize_identifier(phrase);
    if (normalized.empty() || all_digits(normalized)) return out;

    for (const auto& target : names_) {
        double score = text::match_score(normalized, target.normalized);
        for (const auto& s : target.synonyms) {
            score = std::max(score, text::match_score(normalized, s) * kSynonymWeight);
        }
        if (score + kEpsilon < threshold_) continue;

        MappedEntity e;
        e.kind = target.kind;
        e.phrase = std::string(phrase);
        e.table = target.table;
        e.column = target.column;
        e.confidence = std::min(score, 1.0);
        e.position = position;
        out.push_back(std::move(e));
    }
    return out;
}

EntityMapping EntityMapper::map(std::string_view input, std::chrono::system_clock::time_point now) const {
    EntityMapping mapping;
    mapping.tokens = tokenize(input);
    const auto& tokens = mapping.tokens;
    std::vector<bool> consumed(tokens.size(), false);

    std::vector<MappedEntity> literals;
    std::vector<std::pair<size_t, size_t>> literal_spans;
    extract_literals(tokens, consumed, literals, literal_spans, now);

    const auto is_content = [&](size_t i) {
        if (consumed[i]) return false;
        if (tokens[i].quoted) return true;
        if (tokens[i].lower == "number" && i + 1 < tokens.size() && tokens[i + 1].lower == "of") {
            return false;
        }
        return role_of(tokens[i].lower) == TokenRole::CONTENT;
    };

    // Phrase candidates: quoted, then bigram, then unigram
    struct PhraseMatch {
        size_t start = 0;
        size_t length = 1;
        std::vector<MappedEntity> candidates;
    };
    std::vector<PhraseMatch> phrases;

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!is_content(i)) continue;

        if (!tokens[i].quoted && i + 1 < tokens.size() && is_content(i + 1) && !tokens[i + 1].quoted) {
            auto cands = candidates_for(join_texts(tokens, i, i + 2), i);
            if (!cands.empty()) {
                consumed[i] = consumed[i + 1] = true;
                phrases.push_back({i, 2, std::move(cands)});
                ++i;
                continue;
            }
        }

        auto cands = candidates_for(tokens[i].text, i);
        if (!cands.empty()) {
            consumed[i] = true;
            phrases.push_back({i, 1, std::move(cands)});
        }
    }

    // Tie-breaking: confidence, then a table matched by another phrase, then the shortest name
    const auto name_length = [](const MappedEntity& e) {
        return e.column.empty() ? e.table.size() : e.column.size();
    };
    const auto base_order = [&](const MappedEntity& a, const MappedEntity& b) {
        if (std::abs(a.confidence - b.confidence) > kEpsilon) return a.confidence > b.confidence;
        if (name_length(a) != name_length(b)) return name_length(a) < name_length(b);
        return std::tie(a.table, a.column, a.value) < std::tie(b.table, b.column, b.value);
    };

    std::vector<std::string> top_tables;
    for (auto& p : phrases) {
        std::sort(p.candidates.begin(), p.candidates.end(), base_order);
        top_tables.push_back(utils::to_lower(p.candidates.front().table));
    }

    std::vector<MappedEntity> entities;
    for (size_t p = 0; p < phrases.size(); ++p) {
        std::set<std::string> elsewhere;
        for (size_t q = 0; q < phrases.size(); ++q) {
            if (q != p) elsewhere.insert(top_tables[q]);
        }
        const auto in_elsewhere = [&](const MappedEntity& e) {
            return elsewhere.count(utils::to_lower(e.table)) > 0;
        };

        auto& cands = phrases[p].candidates;
        const auto best = std::min_element(cands.begin(), cands.end(),
            [&](const MappedEntity& a, const MappedEntity& b) {
                if (std::abs(a.confidence - b.confidence) > kEpsilon) return a.confidence > b.confidence;
                if (in_elsewhere(a) != in_elsewhere(b)) return in_elsewhere(a);
                return base_order(a, b);
            });
        entities.push_back(*best);
    }

    attach_literals(literals, entities);
    for (size_t l = 0; l < literals.size(); ++l) {
        if (literals[l].column.empty()) {
            // No compatible column: the literal's words stay available as free text
            for (size_t k = literal_spans[l].first; k < literal_spans[l].second; ++k) {
                consumed[k] = false;
            }
            continue;
        }
        entities.push_back(std::move(literals[l]));
    }

    std::stable_sort(entities.begin(), entities.end(), [](const MappedEntity& a, const MappedEntity& b) {
        if (std::abs(a.confidence - b.confidence) > kEpsilon) return a.confidence > b.confidence;
        return a.position < b.position;
    });
    mapping.entities = std::move(entities);

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (consumed[i]) continue;
        const bool content = tokens[i].quoted || role_of(tokens[i].lower) == TokenRole::CONTENT;
        const bool number_of = tokens[i].lower == "number" && i + 1 < tokens.size() && tokens[i + 1].lower == "of";
        if (content && !number_of) {
            mapping.free_text.push_back(tokens[i].text);
        }
    }

    utils::log::debug(std::format("Mapped '{}': {} entities, {} free-text tokens",
        input, mapping.entities.size(), mapping.free_text.size()));
    return mapping;
}

} // namespace nlquery
