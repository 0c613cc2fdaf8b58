#pragma once

#include "core/column_type.hpp"
#include "core/database_type.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace nlquery {

// ============================================================================
// Catalog Elements
// ============================================================================

struct ForeignKeyRef {
    std::string column;
    std::string ref_table;
    std::string ref_column;
    bool inferred = false;        // naming-convention guess, never a join path
    double confidence = 1.0;

    bool operator==(const ForeignKeyRef&) const = default;
};

struct ColumnInfo {
    std::string name;
    std::string sql_type;
    LogicalType logical_type = LogicalType::UNKNOWN;
    bool nullable = true;
    bool is_primary_key = false;
    std::set<std::string> hints;
    std::vector<std::string> samples;   // bounded, distinct, for value matching only

    [[nodiscard]] bool has_hint(std::string_view hint) const {
        return hints.find(std::string(hint)) != hints.end();
    }

    bool operator==(const ColumnInfo&) const = default;
};

struct TableInfo {
    std::string name;
    std::vector<ColumnInfo> columns;          // ordinal order
    std::vector<ForeignKeyRef> foreign_keys;  // sorted by (column, ref_table)
    std::set<std::string> hints;

    [[nodiscard]] const ColumnInfo* find_column(std::string_view column) const;
    [[nodiscard]] const ColumnInfo* primary_key() const;

    /// First column (ordinal order) carrying the hint
    [[nodiscard]] const ColumnInfo* column_with_hint(std::string_view hint) const;

    [[nodiscard]] bool has_hint(std::string_view hint) const {
        return hints.find(std::string(hint)) != hints.end();
    }

    bool operator==(const TableInfo&) const = default;
};

/**
 * @brief A declared foreign key usable as a single-hop join
 *
 * `from_*` is the referencing side, `to_*` the referenced side.
 */
struct JoinLink {
    std::string from_table;
    std::string from_column;
    std::string to_table;
    std::string to_column;
};

// ============================================================================
// SchemaCatalog
// ============================================================================

/**
 * @brief Immutable snapshot of a discovered relational schema
 *
 * Tables are kept sorted by name and names are unique: the constructor drops
 * later duplicates and records a warning. Lookups are case-insensitive.
 * Shared between threads as `std::shared_ptr<const SchemaCatalog>`.
 */
class SchemaCatalog {
public:
    SchemaCatalog() = default;
    SchemaCatalog(DatabaseType dialect, std::vector<TableInfo> tables,
                  std::vector<std::string> warnings = {});

    [[nodiscard]] DatabaseType dialect() const { return dialect_; }
    [[nodiscard]] const std::vector<TableInfo>& tables() const { return tables_; }
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }
    [[nodiscard]] bool empty() const { return tables_.empty(); }

    [[nodiscard]] const TableInfo* find_table(std::string_view name) const;
    [[nodiscard]] const ColumnInfo* find_column(std::string_view table, std::string_view column) const;

    /**
     * @brief Declared (non-inferred) foreign key linking two tables, either direction
     */
    [[nodiscard]] std::optional<JoinLink> declared_link(
        std::string_view table_a, std::string_view table_b) const;

    /// Structural equality: dialect, tables, columns, keys, hints, samples
    [[nodiscard]] bool same_structure(const SchemaCatalog& other) const;

    /**
     * @brief JSON view for the schema route
     *
     * Sample values are reported as counts only.
     */
    [[nodiscard]] nlohmann::json to_json() const;

private:
    DatabaseType dialect_ = DatabaseType::SQLITE;
    std::vector<TableInfo> tables_;
    std::vector<std::string> warnings_;
};

} // namespace nlquery
