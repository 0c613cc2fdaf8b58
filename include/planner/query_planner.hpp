#pragma once

#include "catalog/schema_catalog.hpp"
#include "planner/query_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nlquery {

struct PlannerConfig {
    size_t default_page_size = 50;
    size_t max_page_size = 200;
};

struct Pagination {
    size_t page = 1;
    size_t page_size = 50;
    size_t limit = 50;
    size_t offset = 0;
};

/**
 * @brief Turns a classified intent into a safe, parameterized QueryPlan
 *
 * Primary table: best table entity that is not the group-by target, else
 * the table of the best column/value/literal entity. At most one join,
 * through a declared foreign key between the primary table and one other
 * table; entities on tables that cannot be reached that way are dropped and
 * the plan carries a note saying so.
 *
 * Every identifier in the plan is copied from the catalog and the finished
 * plan is validated against it before it is returned.
 */
class QueryPlanner {
public:
    explicit QueryPlanner(PlannerConfig config = {});

    /**
     * @param original_text question as submitted; becomes the document query
     *        for DOCUMENT intents
     */
    [[nodiscard]] PlanResult plan(const QueryIntent& intent,
                                  const SchemaCatalog& catalog,
                                  int64_t page,
                                  int64_t page_size,
                                  std::string_view original_text) const;

    /// page < 1 -> 1; page_size < 1 -> default; page_size > max -> max
    [[nodiscard]] Pagination paginate(int64_t page, int64_t page_size) const;

    /**
     * @brief Check every identifier and parameter reference of a plan
     * @return Error description, or nullopt when the plan is consistent
     */
    [[nodiscard]] static std::optional<std::string> validate(const QueryPlan& plan,
                                                             const SchemaCatalog& catalog);

    [[nodiscard]] const PlannerConfig& config() const { return config_; }

private:
    PlannerConfig config_;
};

} // namespace nlquery
