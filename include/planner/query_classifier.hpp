#pragma once

#include "core/error.hpp"
#include "mapper/entity_mapper.hpp"
#include "planner/query_types.hpp"

namespace nlquery {

/**
 * @brief Decides query type and operation shape from a mapped question
 *
 *   structured: entities mapped, no descriptive free text left
 *   document:   nothing mapped, free text left
 *   hybrid:     both
 *   neither:    QUERY_NOT_UNDERSTOOD
 *
 * Operation cues: "how many" / "count" / "number of" give COUNT;
 * sum/total, avg/average/mean, min/minimum/lowest, max/maximum/highest give
 * AGGREGATE; anything else is a filtered LOOKUP. "by", "per" and "each"
 * introduce the group-by phrase.
 */
class QueryClassifier {
public:
    [[nodiscard]] static Result<QueryIntent> classify(const EntityMapping& mapping);

    [[nodiscard]] static Operation detect_operation(const std::vector<Token>& tokens,
                                                    AggregateFunc& aggregate);
};

} // namespace nlquery
