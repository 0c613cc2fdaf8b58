#include "catalog/schema_catalog.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace nlquery {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

// ============================================================================
// TableInfo
// ============================================================================

const ColumnInfo* TableInfo::find_column(std::string_view column) const {
    for (const auto& col : columns) {
        if (iequals(col.name, column)) return &col;
    }
    return nullptr;
}

const ColumnInfo* TableInfo::primary_key() const {
    for (const auto& col : columns) {
        if (col.is_primary_key) return &col;
    }
    return nullptr;
}

const ColumnInfo* TableInfo::column_with_hint(std::string_view hint) const {
    for (const auto& col : columns) {
        if (col.has_hint(hint)) return &col;
    }
    return nullptr;
}

// ============================================================================
// SchemaCatalog
// ============================================================================

SchemaCatalog::SchemaCatalog(DatabaseType dialect, std::vector<TableInfo> tables,
                             std::vector<std::string> warnings)
    : dialect_(dialect), warnings_(std::move(warnings)) {
    std::stable_sort(tables.begin(), tables.end(),
        [](const TableInfo& a, const TableInfo& b) {
            return utils::to_lower(a.name) < utils::to_lower(b.name);
        });

    tables_.reserve(tables.size());
    for (auto& table : tables) {
        if (!tables_.empty() && iequals(tables_.back().name, table.name)) {
            warnings_.push_back(std::format("Duplicate table name '{}' ignored", table.name));
            continue;
        }
        std::sort(table.foreign_keys.begin(), table.foreign_keys.end(),
            [](const ForeignKeyRef& a, const ForeignKeyRef& b) {
                return std::tie(a.column, a.ref_table, a.ref_column) <
                       std::tie(b.column, b.ref_table, b.ref_column);
            });
        tables_.push_back(std::move(table));
    }
}

const TableInfo* SchemaCatalog::find_table(std::string_view name) const {
    for (const auto& table : tables_) {
        if (iequals(table.name, name)) return &table;
    }
    return nullptr;
}

const ColumnInfo* SchemaCatalog::find_column(std::string_view table, std::string_view column) const {
    const auto* t = find_table(table);
    return t ? t->find_column(column) : nullptr;
}

std::optional<JoinLink> SchemaCatalog::declared_link(
    std::string_view table_a, std::string_view table_b) const {
    const auto* a = find_table(table_a);
    const auto* b = find_table(table_b);
    if (!a || !b || a == b) return std::nullopt;

    for (const auto* from : {a, b}) {
        const auto* to = (from == a) ? b : a;
        for (const auto& fk : from->foreign_keys) {
            if (fk.inferred || !iequals(fk.ref_table, to->name)) continue;
            if (!from->find_column(fk.column) || !to->find_column(fk.ref_column)) continue;
            return JoinLink{from->name, fk.column, to->name, fk.ref_column};
        }
    }
    return std::nullopt;
}

bool SchemaCatalog::same_structure(const SchemaCatalog& other) const {
    return dialect_ == other.dialect_ && tables_ == other.tables_;
}

nlohmann::json SchemaCatalog::to_json() const {
    nlohmann::json tables = nlohmann::json::array();
    for (const auto& table : tables_) {
        nlohmann::json columns = nlohmann::json::array();
        for (const auto& col : table.columns) {
            columns.push_back({
                {"name", col.name},
                {"type", col.sql_type},
                {"logical_type", logical_type_to_string(col.logical_type)},
                {"nullable", col.nullable},
                {"primary_key", col.is_primary_key},
                {"hints", col.hints},
                {"sample_count", col.samples.size()},
            });
        }

        nlohmann::json fks = nlohmann::json::array();
        for (const auto& fk : table.foreign_keys) {
            fks.push_back({
                {"column", fk.column},
                {"references", std::format("{}.{}", fk.ref_table, fk.ref_column)},
                {"inferred", fk.inferred},
                {"confidence", fk.confidence},
            });
        }

        tables.push_back({
            {"name", table.name},
            {"hints", table.hints},
            {"columns", std::move(columns)},
            {"foreign_keys", std::move(fks)},
        });
    }

    return {
        {"dialect", std::string(database_type_to_string(dialect_))},
        {"tables", std::move(tables)},
        {"warnings", warnings_},
    };
}

} // namespace nlquery
