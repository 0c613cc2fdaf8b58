#pragma once

#include "schema/schema_discovery.hpp"

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>

namespace nlquery::testing {

/**
 * @brief Throwaway SQLite file with a small HR schema
 *
 *   departments(id, dept_name, location)
 *   employees(id, name, dept_id -> departments.id, annual_salary, join_date,
 *             manager_id, position)
 *
 * Engineering has Alice (120000, 2021) and Bob (95000, 2023); HR has Carol
 * (70000, 2022). The file is removed on destruction.
 */
class DemoDatabase {
public:
    DemoDatabase() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() / std::format("nlquery_demo_{}_{}.db",
            std::chrono::steady_clock::now().time_since_epoch().count(), counter++);
        exec(kSchema);
    }

    ~DemoDatabase() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    DemoDatabase(const DemoDatabase&) = delete;
    DemoDatabase& operator=(const DemoDatabase&) = delete;

    /// Run statements with a writable connection (the engine only reads)
    void exec(const std::string& sql) const {
        sqlite3* db = nullptr;
        if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
            const std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw std::runtime_error("Cannot create demo database: " + msg);
        }
        char* err = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        const std::string msg = err ? err : "";
        sqlite3_free(err);
        sqlite3_close(db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Demo database statement failed: " + msg);
        }
    }

    [[nodiscard]] std::string path() const { return path_.string(); }

    /// sqlite:////abs/path.db
    [[nodiscard]] std::string url() const { return "sqlite:///" + path_.string(); }

private:
    static constexpr const char* kSchema = R"sql(
        CREATE TABLE departments (
            id INTEGER PRIMARY KEY,
            dept_name TEXT NOT NULL,
            location TEXT
        );
        CREATE TABLE employees (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            dept_id INTEGER REFERENCES departments(id),
            annual_salary REAL,
            join_date TEXT,
            manager_id INTEGER,
            position TEXT
        );
        INSERT INTO departments VALUES (1, 'Engineering', 'Berlin');
        INSERT INTO departments VALUES (2, 'HR', 'London');
        INSERT INTO employees VALUES (1, 'Alice Smith', 1, 120000, '2021-03-15', NULL, 'Staff Engineer');
        INSERT INTO employees VALUES (2, 'Bob Jones', 1, 95000, '2023-06-01', 1, 'Software Engineer');
        INSERT INTO employees VALUES (3, 'Carol White', 2, 70000, '2022-01-10', NULL, 'Recruiter');
    )sql";

    std::filesystem::path path_;
};

/**
 * @brief The demo schema as discovery would catalog it, without a database
 */
inline std::shared_ptr<const SchemaCatalog> demo_catalog() {
    const auto column = [](std::string name, std::string type, bool pk = false,
                           std::vector<std::string> samples = {}) {
        ColumnInfo c;
        c.name = std::move(name);
        c.sql_type = std::move(type);
        c.is_primary_key = pk;
        c.samples = std::move(samples);
        return c;
    };

    TableInfo departments;
    departments.name = "departments";
    departments.columns = {
        column("id", "INTEGER", true),
        column("dept_name", "TEXT", false, {"Engineering", "HR"}),
        column("location", "TEXT", false, {"Berlin", "London"}),
    };

    TableInfo employees;
    employees.name = "employees";
    employees.columns = {
        column("id", "INTEGER", true),
        column("name", "TEXT", false, {"Alice Smith", "Bob Jones", "Carol White"}),
        column("dept_id", "INTEGER"),
        column("annual_salary", "REAL"),
        column("join_date", "TEXT", false, {"2021-03-15", "2022-01-10", "2023-06-01"}),
        column("manager_id", "INTEGER"),
        column("position", "TEXT", false, {"Recruiter", "Software Engineer", "Staff Engineer"}),
    };
    employees.foreign_keys = {{"dept_id", "departments", "id"}};

    std::vector<TableInfo> tables{departments, employees};
    SchemaDiscovery(HintRuleSet::defaults()).annotate(tables);
    // Sampling turns ISO-formatted text columns into dates
    for (auto& col : tables[1].columns) {
        if (col.name == "join_date") col.logical_type = LogicalType::DATE;
    }
    return std::make_shared<const SchemaCatalog>(DatabaseType::SQLITE, std::move(tables));
}

} // namespace nlquery::testing
