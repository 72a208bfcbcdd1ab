#pragma once

#include "fibermeta/catalog/catalog_records.hpp"
#include "fibermeta/catalog/partition_function_registry.hpp"
#include "fibermeta/catalog/path_resolver.hpp"
#include "fibermeta/storage/directory_manager.hpp"
#include "fibermeta/store/relational_store.hpp"
#include "fibermeta/store/store_transaction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fibermeta::catalog {

inline constexpr std::string_view kDefaultDatabaseName = "default";
inline constexpr std::string_view kDefaultOwner = "default";

// Catalog service over a relational store. Every operation other than
// initialize() fails with operation_not_permitted until initialize() has
// succeeded. Results are written to out-parameters only on success.
class CatalogStore final {
public:
    struct Config final {
        store::RelationalStore* store = nullptr;
        storage::DirectoryManager* directories = nullptr;
        // Defaults to PartitionFunctionRegistry::instance().
        PartitionFunctionRegistry* functions = nullptr;
        std::string storage_root{};
    };

    explicit CatalogStore(Config config);

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    // Bootstraps the backing tables on first use and seeds the default
    // database. A partially bootstrapped store fails with CorruptedCatalog.
    [[nodiscard]] std::error_code initialize();
    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

    [[nodiscard]] std::error_code list_databases(std::vector<std::string>& names);
    [[nodiscard]] std::error_code database(std::string_view name, DatabaseDescriptor& descriptor);
    [[nodiscard]] std::error_code list_tables(const TableFilter& filter, std::vector<SchemaTableName>& tables);

    [[nodiscard]] std::error_code table_handle(std::string_view database,
                                               std::string_view table,
                                               TableHandle& handle);
    [[nodiscard]] std::error_code table_layout(std::string_view database,
                                               std::string_view table,
                                               TableLayout& layout);
    [[nodiscard]] std::error_code columns(std::string_view database,
                                          std::string_view table,
                                          std::vector<ColumnHandle>& columns);

    std::error_code create_database(const CreateDatabaseRequest& request);
    std::error_code create_table(const CreateTableRequest& request);

    std::error_code register_fiber(std::string_view database,
                                   std::string_view table,
                                   std::int64_t fiber_value,
                                   std::int64_t& fiber_id);
    std::error_code register_fiber_segment(const FiberSegment& segment, std::int64_t& segment_id);
    [[nodiscard]] std::error_code list_fiber_segments(std::string_view database,
                                                      std::string_view table,
                                                      const SegmentFilter& filter,
                                                      std::vector<FiberSegment>& segments);

    [[nodiscard]] const PathResolver& paths() const noexcept { return paths_; }
    [[nodiscard]] PartitionFunctionRegistry& functions() const noexcept { return *functions_; }

private:
    struct TableRow final {
        std::int64_t id = 0;
        std::string database{};
        std::string name{};
        std::string location{};
        std::string storage_format{};
        std::optional<std::string> fiber_key{};
        std::optional<std::string> fiber_function{};
        std::optional<std::string> time_key{};
    };

    [[nodiscard]] std::error_code require_initialized() const noexcept;
    [[nodiscard]] std::error_code map_store_error(std::error_code ec, std::string_view context) const;

    // A directory created here is removed if `enclosing` later rolls back.
    std::error_code insert_database(const CreateDatabaseRequest& request,
                                    store::StoreTransaction* enclosing = nullptr);
    [[nodiscard]] std::error_code find_database(std::string_view name, DatabaseDescriptor& descriptor);
    [[nodiscard]] std::error_code find_table(std::string_view database, std::string_view table, TableRow& row);
    [[nodiscard]] std::error_code load_columns(std::int64_t table_id, std::vector<ColumnHandle>& columns);
    [[nodiscard]] std::error_code validate_partitioning(const CreateTableRequest& request) const;
    void remove_created_directory(const std::string& location) const;

    store::RelationalStore* store_ = nullptr;
    storage::DirectoryManager* directories_ = nullptr;
    PartitionFunctionRegistry* functions_ = nullptr;
    PathResolver paths_;
    bool initialized_ = false;
};

}  // namespace fibermeta::catalog
