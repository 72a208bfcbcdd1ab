#include "fibermeta/catalog/catalog_errors.hpp"
#include "fibermeta/catalog/catalog_store.hpp"
#include "fibermeta/storage/directory_manager.hpp"
#include "fibermeta/store/sqlite_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace fibermeta;
using catalog::CatalogErrc;
using catalog::ColumnRole;
using catalog::DataType;
using catalog::TypeKind;

namespace {

std::filesystem::path make_temp_dir(const std::string& name)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (name + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    (void)std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

struct CatalogHarness final {
    explicit CatalogHarness(catalog::PartitionFunctionRegistry* functions = nullptr)
        : root{make_temp_dir("fibermeta_catalog_")}
        , store{store::SqliteStoreConfig{":memory:"}}
    {
        REQUIRE_FALSE(store.open());
        catalog_store = make_catalog(functions);
        REQUIRE_FALSE(catalog_store->initialize());
    }

    ~CatalogHarness()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::unique_ptr<catalog::CatalogStore> make_catalog(catalog::PartitionFunctionRegistry* functions)
    {
        catalog::CatalogStore::Config config{};
        config.store = &store;
        config.directories = &directories;
        config.functions = functions;
        config.storage_root = root.string();
        return std::make_unique<catalog::CatalogStore>(config);
    }

    void create_database(const std::string& name)
    {
        catalog::CreateDatabaseRequest request{};
        request.name = name;
        REQUIRE_FALSE(catalog_store->create_database(request));
    }

    void create_table(const std::string& schema, const std::string& table)
    {
        catalog::CreateTableRequest request{};
        request.table = {schema, table};
        request.columns = {{"id", "bigint", false}, {"payload", "varchar(64)", true}};
        REQUIRE_FALSE(catalog_store->create_table(request));
    }

    std::filesystem::path root;
    store::SqliteStore store;
    storage::LocalDirectoryManager directories;
    std::unique_ptr<catalog::CatalogStore> catalog_store;
};

catalog::CreateTableRequest partitioned_request(const std::string& schema, const std::string& table)
{
    catalog::CreateTableRequest request{};
    request.table = {schema, table};
    request.columns = {{"customer", "bigint", false}, {"ts", "timestamp", false}, {"amount", "decimal(12,2)", true}};
    request.fiber_key = "customer";
    request.fiber_function = "function0";
    request.time_key = "ts";
    return request;
}

}  // namespace

TEST_CASE("CatalogStore requires its collaborators")
{
    store::SqliteStore store{store::SqliteStoreConfig{":memory:"}};
    storage::LocalDirectoryManager directories;

    catalog::CatalogStore::Config config{};
    config.directories = &directories;
    config.storage_root = "/tmp";
    CHECK_THROWS_AS(catalog::CatalogStore{config}, std::invalid_argument);

    config.store = &store;
    config.directories = nullptr;
    CHECK_THROWS_AS(catalog::CatalogStore{config}, std::invalid_argument);

    config.directories = &directories;
    config.storage_root = "";
    CHECK_THROWS_AS(catalog::CatalogStore{config}, std::invalid_argument);
}

TEST_CASE("CatalogStore creates and lists databases")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;

    harness.create_database("sales");
    harness.create_database("analytics");

    std::vector<std::string> names;
    REQUIRE_FALSE(catalog_store.list_databases(names));
    CHECK(names == std::vector<std::string>{"analytics", "default", "sales"});
    CHECK(std::filesystem::is_directory(harness.root / "sales"));

    SECTION("duplicates surface as AlreadyExists")
    {
        catalog::CreateDatabaseRequest request{};
        request.name = "sales";
        CHECK(catalog_store.create_database(request) == CatalogErrc::AlreadyExists);
        CHECK(std::filesystem::is_directory(harness.root / "sales"));
    }

    SECTION("comment and owner come from the request or the session")
    {
        catalog::CreateDatabaseRequest request{};
        request.name = "ops";
        request.comment = "operational data";
        request.session.user = "alex";
        REQUIRE_FALSE(catalog_store.create_database(request));

        catalog::DatabaseDescriptor descriptor{};
        REQUIRE_FALSE(catalog_store.database("ops", descriptor));
        CHECK(descriptor.comment == "operational data");
        CHECK(descriptor.owner == "alex");
        CHECK(descriptor.location == (harness.root / "ops").string());
    }

    SECTION("unknown databases are NotFound")
    {
        catalog::DatabaseDescriptor descriptor{};
        CHECK(catalog_store.database("missing", descriptor) == CatalogErrc::NotFound);
    }

    SECTION("names that do not map to one directory are rejected")
    {
        for (const auto* name : {"", ".", "..", "sales/", "/sales", "../../escaped", "a/b"}) {
            catalog::CreateDatabaseRequest request{};
            request.name = name;
            CHECK(catalog_store.create_database(request) == std::errc::invalid_argument);
        }

        REQUIRE_FALSE(catalog_store.list_databases(names));
        CHECK(names == std::vector<std::string>{"analytics", "default", "sales"});
        CHECK_FALSE(std::filesystem::exists(harness.root.parent_path() / "escaped"));
        CHECK_FALSE(std::filesystem::exists(harness.root / "a"));
    }

    SECTION("directory failures persist nothing")
    {
        std::ofstream{harness.root / "blocked"} << "not a directory";
        catalog::CreateDatabaseRequest request{};
        request.name = "blocked";
        CHECK(catalog_store.create_database(request) == CatalogErrc::DirectoryFailure);

        catalog::DatabaseDescriptor descriptor{};
        CHECK(catalog_store.database("blocked", descriptor) == CatalogErrc::NotFound);
    }
}

TEST_CASE("CatalogStore filters tables by exact name")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;
    harness.create_database("db1");
    harness.create_database("db10");
    harness.create_table("db1", "orders");
    harness.create_table("db10", "orders");
    harness.create_table("db10", "customers");

    std::vector<catalog::SchemaTableName> tables;
    REQUIRE_FALSE(catalog_store.list_tables({}, tables));
    CHECK(tables
          == std::vector<catalog::SchemaTableName>{{"db1", "orders"}, {"db10", "customers"}, {"db10", "orders"}});

    catalog::TableFilter by_schema{};
    by_schema.schema = "db1";
    REQUIRE_FALSE(catalog_store.list_tables(by_schema, tables));
    CHECK(tables == std::vector<catalog::SchemaTableName>{{"db1", "orders"}});

    catalog::TableFilter by_table{};
    by_table.table = "orders";
    REQUIRE_FALSE(catalog_store.list_tables(by_table, tables));
    CHECK(tables.size() == 2U);

    catalog::TableFilter none{};
    none.schema = "db";
    REQUIRE_FALSE(catalog_store.list_tables(none, tables));
    CHECK(tables.empty());
}

TEST_CASE("CatalogStore resolves table handles")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;
    harness.create_table("default", "events");

    catalog::TableHandle handle{};
    REQUIRE_FALSE(catalog_store.table_handle("default", "events", handle));
    CHECK(handle.schema == "default");
    CHECK(handle.name == "events");
    CHECK(handle.location == (harness.root / "default" / "events").string());
    CHECK(std::filesystem::is_directory(handle.location));

    CHECK(catalog_store.table_handle("default", "missing", handle) == CatalogErrc::NotFound);
    CHECK(catalog_store.table_handle("missing", "events", handle) == CatalogErrc::NotFound);

    SECTION("duplicate rows are Ambiguous")
    {
        REQUIRE_FALSE(harness.store.execute_script("DROP INDEX catalog_tables_name;"));
        REQUIRE_FALSE(harness.store.execute_script(
            "INSERT INTO catalog_tables (database_id, name, location, storage_format)"
            " SELECT database_id, name, location, storage_format FROM catalog_tables WHERE name = 'events';"));
        CHECK(catalog_store.table_handle("default", "events", handle) == CatalogErrc::Ambiguous);
    }
}

TEST_CASE("CatalogStore returns columns in declaration order")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;
    REQUIRE_FALSE(catalog_store.create_table(partitioned_request("default", "payments")));

    std::vector<catalog::ColumnHandle> columns;
    REQUIRE_FALSE(catalog_store.columns("default", "payments", columns));
    REQUIRE(columns.size() == 3U);
    CHECK(columns[0].name == "customer");
    CHECK(columns[0].role == ColumnRole::Fiber);
    CHECK(columns[0].type == DataType::of(TypeKind::BigInt));
    CHECK_FALSE(columns[0].nullable);
    CHECK(columns[1].name == "ts");
    CHECK(columns[1].role == ColumnRole::Time);
    CHECK(columns[2].name == "amount");
    CHECK(columns[2].role == ColumnRole::Regular);
    CHECK(columns[2].type == DataType::decimal(12U, 2U));
    CHECK(columns[2].nullable);
    CHECK(columns[0].ordinal < columns[1].ordinal);
    CHECK(columns[1].ordinal < columns[2].ordinal);

    SECTION("tables without columns are NotFound")
    {
        REQUIRE_FALSE(harness.store.execute_script("DELETE FROM catalog_columns;"));
        CHECK(catalog_store.columns("default", "payments", columns) == CatalogErrc::NotFound);
    }

    SECTION("unrecognised roles are InvalidRecord")
    {
        REQUIRE_FALSE(harness.store.execute_script("UPDATE catalog_columns SET column_role = 'partition';"));
        CHECK(catalog_store.columns("default", "payments", columns) == CatalogErrc::InvalidRecord);
    }

    SECTION("unparseable stored types are InvalidType")
    {
        REQUIRE_FALSE(harness.store.execute_script("UPDATE catalog_columns SET data_type = 'varchar(0)';"));
        CHECK(catalog_store.columns("default", "payments", columns) == CatalogErrc::InvalidType);
    }
}

TEST_CASE("CatalogStore resolves table layouts")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;
    REQUIRE_FALSE(catalog_store.create_table(partitioned_request("default", "payments")));
    harness.create_table("default", "plain");

    catalog::TableLayout layout{};
    REQUIRE_FALSE(catalog_store.table_layout("default", "payments", layout));
    CHECK(layout.handle.name == "payments");
    REQUIRE(layout.fiber_column);
    CHECK(layout.fiber_column->name == "customer");
    REQUIRE(layout.time_column);
    CHECK(layout.time_column->name == "ts");
    REQUIRE(layout.function);
    CHECK(layout.function->name() == "function0");
    CHECK(layout.format == catalog::StorageFormat::Parquet);

    REQUIRE_FALSE(catalog_store.table_layout("default", "plain", layout));
    CHECK_FALSE(layout.fiber_column);
    CHECK_FALSE(layout.time_column);
    CHECK_FALSE(layout.function);

    CHECK(catalog_store.table_layout("default", "missing", layout) == CatalogErrc::NotFound);

    SECTION("a key that names no column is InvalidColumnRole")
    {
        REQUIRE_FALSE(harness.store.execute_script("UPDATE catalog_tables SET time_key = 'gone' WHERE name = 'payments';"));
        CHECK(catalog_store.table_layout("default", "payments", layout) == CatalogErrc::InvalidColumnRole);
    }

    SECTION("an unknown storage format is InvalidRecord")
    {
        REQUIRE_FALSE(harness.store.execute_script("UPDATE catalog_tables SET storage_format = 'orc';"));
        CHECK(catalog_store.table_layout("default", "plain", layout) == CatalogErrc::InvalidRecord);
    }
}

TEST_CASE("CatalogStore reports functions that are no longer registered")
{
    catalog::PartitionFunctionRegistry functions;
    REQUIRE(functions.register_function(std::make_shared<catalog::BucketPartitionFunction>("buckets16", 16)));
    CatalogHarness harness{&functions};

    auto request = partitioned_request("default", "payments");
    request.fiber_function = "buckets16";
    REQUIRE_FALSE(harness.catalog_store->create_table(request));

    catalog::PartitionFunctionRegistry fresh;
    auto restarted = harness.make_catalog(&fresh);
    REQUIRE_FALSE(restarted->initialize());

    catalog::TableLayout layout{};
    CHECK(restarted->table_layout("default", "payments", layout) == CatalogErrc::UnsupportedFunction);
}

TEST_CASE("CatalogStore applies a session timeout for one call")
{
    CatalogHarness harness;
    auto& catalog_store = *harness.catalog_store;
    const auto store_default = harness.store.busy_timeout();

    catalog::CreateDatabaseRequest request{};
    request.name = "timed";
    request.session.timeout = std::chrono::milliseconds{250};
    REQUIRE_FALSE(catalog_store.create_database(request));
    CHECK(harness.store.busy_timeout() == store_default);

    SECTION("a timeout the store cannot honor persists nothing")
    {
        auto table = partitioned_request("timed", "orders");
        table.session.timeout = std::chrono::milliseconds{-5};
        CHECK(catalog_store.create_table(table) == std::errc::invalid_argument);
        CHECK(harness.store.busy_timeout() == store_default);

        catalog::TableHandle handle{};
        CHECK(catalog_store.table_handle("timed", "orders", handle) == CatalogErrc::NotFound);
        CHECK_FALSE(std::filesystem::exists(harness.root / "timed" / "orders"));
    }
}

TEST_CASE("CatalogStore rejects calls before initialization")
{
    store::SqliteStore store{store::SqliteStoreConfig{":memory:"}};
    REQUIRE_FALSE(store.open());
    storage::LocalDirectoryManager directories;
    catalog::CatalogStore::Config config{};
    config.store = &store;
    config.directories = &directories;
    config.storage_root = "/tmp/fibermeta-unused";
    catalog::CatalogStore catalog_store{config};

    catalog::TableHandle handle{};
    CHECK(catalog_store.table_handle("default", "t", handle) == std::errc::operation_not_permitted);
    CHECK(catalog_store.create_table(partitioned_request("default", "t")) == std::errc::operation_not_permitted);
    CHECK_FALSE(std::filesystem::exists("/tmp/fibermeta-unused"));
}
