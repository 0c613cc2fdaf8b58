#pragma once

#include "catalog/hint_rules.hpp"
#include "catalog/schema_catalog.hpp"
#include "planner/query_types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nlquery {

struct Token {
    std::string text;       // as written (quotes stripped)
    std::string lower;
    bool quoted = false;
};

enum class TokenRole {
    CONTENT,
    STOP,           // function words, never mapped, never free text
    OPERATION,      // how/many/count/average/by/per ... read by the classifier
    CUE             // comparison cue words (over, before, between ...)
};

struct EntityMapping {
    std::vector<Token> tokens;
    std::vector<MappedEntity> entities;     // highest confidence first
    std::vector<std::string> free_text;     // unmapped content, text order
};

/**
 * @brief Resolves question phrases to catalog elements
 *
 * Built once per catalog; the name and value indexes are immutable so a
 * mapper can be shared across request threads.
 *
 * Matching order per position: quoted phrase, bigram, unigram. A phrase is
 * compared with every table and column name and with the synonyms of the
 * hints they carry (text::match_score), and exactly against sampled values.
 * Candidates below the threshold are rejected.
 */
class EntityMapper {
public:
    static constexpr double kDefaultThreshold = 0.8;
    static constexpr double kSynonymWeight = 0.95;

    EntityMapper(std::shared_ptr<const SchemaCatalog> catalog,
                 HintRuleSet rules,
                 double threshold = kDefaultThreshold);

    [[nodiscard]] EntityMapping map(
        std::string_view text,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    [[nodiscard]] static std::vector<Token> tokenize(std::string_view text);

    [[nodiscard]] static TokenRole role_of(std::string_view lower);

    [[nodiscard]] const SchemaCatalog& catalog() const { return *catalog_; }
    [[nodiscard]] const std::shared_ptr<const SchemaCatalog>& catalog_ptr() const { return catalog_; }
    [[nodiscard]] double threshold() const { return threshold_; }

private:
    struct NameTarget {
        EntityKind kind = EntityKind::TABLE;
        std::string table;
        std::string column;
        std::string normalized;                 // normalized catalog name
        std::vector<std::string> synonyms;      // from the hints it carries
    };

    struct ValueTarget {
        std::string table;
        std::string column;
        std::string value;
    };

    void build_index(const HintRuleSet& rules);

    /// Best candidates for a phrase, all at or above the threshold
    [[nodiscard]] std::vector<MappedEntity> candidates_for(
        std::string_view phrase, size_t position) const;

    void extract_literals(const std::vector<Token>& tokens,
                          std::vector<bool>& consumed,
                          std::vector<MappedEntity>& literals,
                          std::vector<std::pair<size_t, size_t>>& spans,
                          std::chrono::system_clock::time_point now) const;

    void attach_literals(std::vector<MappedEntity>& literals,
                         const std::vector<MappedEntity>& entities) const;

    std::shared_ptr<const SchemaCatalog> catalog_;
    double threshold_;
    std::vector<NameTarget> names_;
    std::unordered_map<std::string, std::vector<ValueTarget>> values_;   // lower-cased sample
};

} // namespace nlquery
