#pragma once

#include <array>
#include <string_view>

namespace fibermeta::catalog {

struct CatalogTableSpec final {
    std::string_view name{};
    std::string_view ddl{};
};

inline constexpr std::string_view kDatabasesTable = "catalog_databases";
inline constexpr std::string_view kTablesTable = "catalog_tables";
inline constexpr std::string_view kColumnsTable = "catalog_columns";
inline constexpr std::string_view kFibersTable = "catalog_fibers";
inline constexpr std::string_view kFiberTimeRangesTable = "catalog_fiber_time_ranges";

// Creation order honours foreign keys.
inline constexpr std::array<CatalogTableSpec, 5> kCatalogTables{{
    {kDatabasesTable,
     "CREATE TABLE catalog_databases ("
     " id INTEGER PRIMARY KEY AUTOINCREMENT,"
     " name TEXT NOT NULL,"
     " comment TEXT,"
     " owner TEXT,"
     " location TEXT NOT NULL);"
     "CREATE UNIQUE INDEX catalog_databases_name ON catalog_databases (name);"},
    {kTablesTable,
     "CREATE TABLE catalog_tables ("
     " id INTEGER PRIMARY KEY AUTOINCREMENT,"
     " database_id INTEGER NOT NULL REFERENCES catalog_databases (id),"
     " name TEXT NOT NULL,"
     " location TEXT NOT NULL,"
     " storage_format TEXT NOT NULL,"
     " fiber_key TEXT,"
     " fiber_function TEXT,"
     " time_key TEXT);"
     "CREATE UNIQUE INDEX catalog_tables_name ON catalog_tables (database_id, name);"},
    {kColumnsTable,
     "CREATE TABLE catalog_columns ("
     " id INTEGER PRIMARY KEY AUTOINCREMENT,"
     " table_id INTEGER NOT NULL REFERENCES catalog_tables (id),"
     " name TEXT NOT NULL,"
     " ordinal INTEGER NOT NULL,"
     " data_type TEXT NOT NULL,"
     " column_role TEXT NOT NULL,"
     " nullable INTEGER NOT NULL DEFAULT 1);"
     "CREATE UNIQUE INDEX catalog_columns_name ON catalog_columns (table_id, name);"},
    {kFibersTable,
     "CREATE TABLE catalog_fibers ("
     " id INTEGER PRIMARY KEY AUTOINCREMENT,"
     " table_id INTEGER NOT NULL REFERENCES catalog_tables (id),"
     " fiber_value INTEGER NOT NULL);"
     "CREATE UNIQUE INDEX catalog_fibers_value ON catalog_fibers (table_id, fiber_value);"},
    {kFiberTimeRangesTable,
     "CREATE TABLE catalog_fiber_time_ranges ("
     " id INTEGER PRIMARY KEY AUTOINCREMENT,"
     " fiber_id INTEGER NOT NULL REFERENCES catalog_fibers (id),"
     " time_begin INTEGER NOT NULL,"
     " time_end INTEGER NOT NULL,"
     " path TEXT NOT NULL);"
     "CREATE UNIQUE INDEX catalog_fiber_time_ranges_path ON catalog_fiber_time_ranges (path);"},
}};

}  // namespace fibermeta::catalog
