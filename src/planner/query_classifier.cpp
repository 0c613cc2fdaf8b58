#include "planner/query_classifier.hpp"

namespace nlquery {

Operation QueryClassifier::detect_operation(const std::vector<Token>& tokens, AggregateFunc& aggregate) {
    aggregate = AggregateFunc::NONE;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& w = tokens[i].lower;
        const std::string_view next = i + 1 < tokens.size() ? std::string_view(tokens[i + 1].lower) : "";
        if ((w == "how" && next == "many") || w == "count" || (w == "number" && next == "of")) {
            aggregate = AggregateFunc::COUNT;
            return Operation::COUNT;
        }
    }

    for (const auto& t : tokens) {
        const auto& w = t.lower;
        if (w == "sum" || w == "total") aggregate = AggregateFunc::SUM;
        else if (w == "average" || w == "avg" || w == "mean") aggregate = AggregateFunc::AVG;
        else if (w == "min" || w == "minimum" || w == "lowest" || w == "smallest") aggregate = AggregateFunc::MIN;
        else if (w == "max" || w == "maximum" || w == "highest" || w == "largest" || w == "biggest") {
            aggregate = AggregateFunc::MAX;
        }
        if (aggregate != AggregateFunc::NONE) return Operation::AGGREGATE;
    }
    return Operation::LOOKUP;
}

Result<QueryIntent> QueryClassifier::classify(const EntityMapping& mapping) {
    QueryIntent intent;
    intent.entities = mapping.entities;
    intent.free_text = mapping.free_text;

    const bool structured = !intent.entities.empty();
    const bool descriptive = !intent.free_text.empty();

    if (!structured && !descriptive) {
        return Result<QueryIntent>::error(ErrorCategory::QUERY_NOT_UNDERSTOOD,
            "Nothing in the question matched the schema and no searchable text remains");
    }
    if (structured && descriptive) {
        intent.type = QueryType::HYBRID;
    } else if (structured) {
        intent.type = QueryType::STRUCTURED;
    } else {
        intent.type = QueryType::DOCUMENT;
    }

    intent.operation = detect_operation(mapping.tokens, intent.aggregate);

    // Group-by: the first entity starting after "by" / "per" / "each" (stop words skipped)
    const auto& tokens = mapping.tokens;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& w = tokens[i].lower;
        if (w != "by" && w != "per" && w != "each") continue;

        size_t j = i + 1;
        while (j < tokens.size() && EntityMapper::role_of(tokens[j].lower) == TokenRole::STOP) ++j;
        if (j >= tokens.size()) break;

        for (const auto& e : intent.entities) {
            if (e.position == j && e.kind != EntityKind::LITERAL) {
                intent.group_by_phrase = e.phrase;
                break;
            }
        }
        if (intent.group_by_phrase.empty()) intent.group_by_phrase = tokens[j].text;
        break;
    }

    return Result<QueryIntent>::ok(std::move(intent));
}

} // namespace nlquery
