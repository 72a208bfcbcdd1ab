#include "fibermeta/catalog/catalog_store.hpp"

#include "fibermeta/catalog/catalog_errors.hpp"
#include "fibermeta/catalog/schema_bootstrapper.hpp"
#include "fibermeta/catalog/type_translator.hpp"
#include "fibermeta/store/store_transaction.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace fibermeta::catalog {

namespace {

using store::StoreRow;
using store::StoreValue;

constexpr std::string_view kInsertDatabaseSql =
    "INSERT INTO catalog_databases (name, comment, owner, location) VALUES (?1, ?2, ?3, ?4)";

constexpr std::string_view kSelectDatabaseSql =
    "SELECT id, name, comment, owner, location FROM catalog_databases WHERE name = ?1";

constexpr std::string_view kListDatabasesSql = "SELECT name FROM catalog_databases ORDER BY name";

constexpr std::string_view kListTablesSql =
    "SELECT d.name, t.name FROM catalog_tables t"
    " JOIN catalog_databases d ON d.id = t.database_id"
    " WHERE (?1 IS NULL OR d.name = ?1) AND (?2 IS NULL OR t.name = ?2)"
    " ORDER BY d.name, t.name";

constexpr std::string_view kSelectTableSql =
    "SELECT t.id, d.name, t.name, t.location, t.storage_format, t.fiber_key, t.fiber_function, t.time_key"
    " FROM catalog_tables t JOIN catalog_databases d ON d.id = t.database_id"
    " WHERE d.name = ?1 AND t.name = ?2";

constexpr std::string_view kInsertTableSql =
    "INSERT INTO catalog_tables"
    " (database_id, name, location, storage_format, fiber_key, fiber_function, time_key)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)";

constexpr std::string_view kInsertColumnSql =
    "INSERT INTO catalog_columns (table_id, name, ordinal, data_type, column_role, nullable)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6)";

constexpr std::string_view kSelectColumnsSql =
    "SELECT name, ordinal, data_type, column_role, nullable FROM catalog_columns"
    " WHERE table_id = ?1 ORDER BY ordinal";

constexpr std::string_view kSelectFiberSql =
    "SELECT id FROM catalog_fibers WHERE table_id = ?1 AND fiber_value = ?2";

constexpr std::string_view kInsertFiberSql = "INSERT INTO catalog_fibers (table_id, fiber_value) VALUES (?1, ?2)";

constexpr std::string_view kFiberExistsSql = "SELECT count(*) FROM catalog_fibers WHERE id = ?1";

constexpr std::string_view kInsertSegmentSql =
    "INSERT INTO catalog_fiber_time_ranges (fiber_id, time_begin, time_end, path) VALUES (?1, ?2, ?3, ?4)";

constexpr std::string_view kListSegmentsSql =
    "SELECT r.id, r.fiber_id, f.fiber_value, r.time_begin, r.time_end, r.path"
    " FROM catalog_fiber_time_ranges r JOIN catalog_fibers f ON f.id = r.fiber_id"
    " WHERE f.table_id = ?1"
    " AND (?2 IS NULL OR f.fiber_value = ?2)"
    " AND (?3 IS NULL OR r.time_end >= ?3)"
    " AND (?4 IS NULL OR r.time_begin <= ?4)"
    " ORDER BY f.fiber_value, r.time_begin, r.path";

std::error_code record_error(std::error_code ec) noexcept
{
    return ec ? make_error_code(CatalogErrc::InvalidRecord) : std::error_code{};
}

std::int64_t to_micros(SegmentTime time) noexcept
{
    return time.time_since_epoch().count();
}

SegmentTime from_micros(std::int64_t micros) noexcept
{
    return SegmentTime{std::chrono::microseconds{micros}};
}

StoreValue optional_micros(const std::optional<SegmentTime>& time)
{
    if (!time) {
        return store::null_value();
    }
    return StoreValue{to_micros(*time)};
}

ColumnRole role_for(std::string_view name, const CreateTableRequest& request) noexcept
{
    if (request.fiber_key && *request.fiber_key == name) {
        return ColumnRole::Fiber;
    }
    if (request.time_key && *request.time_key == name) {
        return ColumnRole::Time;
    }
    return ColumnRole::Regular;
}

// Applies a session's lock-wait deadline to the store for one call and puts
// the previous value back on scope exit.
class SessionTimeoutScope final {
public:
    SessionTimeoutScope(store::RelationalStore& backing, const SessionContext& session)
        : store_{backing}
        , previous_{backing.busy_timeout()}
    {
        if (session.timeout) {
            status_ = store_.set_busy_timeout(*session.timeout);
            applied_ = !status_;
        }
    }

    ~SessionTimeoutScope()
    {
        if (!applied_) {
            return;
        }
        if (auto ec = store_.set_busy_timeout(previous_); ec) {
            spdlog::warn("Could not restore the catalog store lock timeout: {}", ec.message());
        }
    }

    SessionTimeoutScope(const SessionTimeoutScope&) = delete;
    SessionTimeoutScope& operator=(const SessionTimeoutScope&) = delete;

    [[nodiscard]] std::error_code status() const noexcept { return status_; }

private:
    store::RelationalStore& store_;
    std::chrono::milliseconds previous_;
    std::error_code status_{};
    bool applied_ = false;
};

// "/" is a valid root even though it trims to an empty prefix.
std::string require_storage_root(std::string root)
{
    if (root.empty()) {
        throw std::invalid_argument{"CatalogStore requires a storage root"};
    }
    return root;
}

bool has_column(const CreateTableRequest& request, std::string_view name) noexcept
{
    return std::any_of(request.columns.begin(), request.columns.end(), [&](const ColumnDefinition& column) {
        return column.name == name;
    });
}

}  // namespace

CatalogStore::CatalogStore(Config config)
    : store_{config.store}
    , directories_{config.directories}
    , functions_{config.functions != nullptr ? config.functions : &PartitionFunctionRegistry::instance()}
    , paths_{require_storage_root(std::move(config.storage_root))}
{
    if (store_ == nullptr) {
        throw std::invalid_argument{"CatalogStore requires a relational store"};
    }
    if (directories_ == nullptr) {
        throw std::invalid_argument{"CatalogStore requires a directory manager"};
    }
}

std::error_code CatalogStore::initialize()
{
    if (initialized_) {
        return {};
    }

    SchemaBootstrapConfig bootstrap_config{};
    bootstrap_config.store = store_;
    bootstrap_config.seed_default_database = [this](store::StoreTransaction& transaction) {
        CreateDatabaseRequest request{};
        request.name = std::string{kDefaultDatabaseName};
        return insert_database(request, &transaction);
    };

    SchemaBootstrapper bootstrapper{std::move(bootstrap_config)};
    if (auto ec = bootstrapper.run(); ec) {
        return map_store_error(ec, "bootstrap");
    }

    initialized_ = true;
    spdlog::info("Catalog initialized (storage root {})", paths_.root());
    return {};
}

std::error_code CatalogStore::list_databases(std::vector<std::string>& names)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kListDatabasesSql, {}, rows); ec) {
        return map_store_error(ec, "list_databases");
    }

    std::vector<std::string> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        std::string name;
        if (auto ec = store::read_string(row.at(0), name); ec) {
            return record_error(ec);
        }
        result.push_back(std::move(name));
    }
    names = std::move(result);
    return {};
}

std::error_code CatalogStore::database(std::string_view name, DatabaseDescriptor& descriptor)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }
    return find_database(name, descriptor);
}

std::error_code CatalogStore::list_tables(const TableFilter& filter, std::vector<SchemaTableName>& tables)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    const std::array<StoreValue, 2> params{store::optional_value(filter.schema), store::optional_value(filter.table)};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kListTablesSql, params, rows); ec) {
        return map_store_error(ec, "list_tables");
    }

    std::vector<SchemaTableName> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        SchemaTableName name{};
        if (auto ec = store::read_string(row.at(0), name.schema); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_string(row.at(1), name.table); ec) {
            return record_error(ec);
        }
        result.push_back(std::move(name));
    }
    tables = std::move(result);
    return {};
}

std::error_code CatalogStore::table_handle(std::string_view database, std::string_view table, TableHandle& handle)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    TableRow row{};
    if (auto ec = find_table(database, table, row); ec) {
        return ec;
    }
    handle = TableHandle{std::move(row.database), std::move(row.name), std::move(row.location)};
    return {};
}

std::error_code CatalogStore::table_layout(std::string_view database, std::string_view table, TableLayout& layout)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    TableRow row{};
    if (auto ec = find_table(database, table, row); ec) {
        return ec;
    }

    TableLayout result{};
    if (!parse_storage_format(row.storage_format, result.format)) {
        spdlog::error("Table {}.{} has unrecognised storage format '{}'", row.database, row.name, row.storage_format);
        return make_error_code(CatalogErrc::InvalidRecord);
    }

    if (row.fiber_function) {
        result.function = functions_->resolve(*row.fiber_function);
        if (!result.function) {
            spdlog::warn("Table {}.{} uses unregistered partition function {}",
                         row.database,
                         row.name,
                         *row.fiber_function);
            return make_error_code(CatalogErrc::UnsupportedFunction);
        }
    }

    if (row.fiber_key || row.time_key) {
        std::vector<ColumnHandle> handles;
        if (auto ec = load_columns(row.id, handles); ec) {
            return ec;
        }
        auto find_column = [&handles](const std::string& name) -> std::optional<ColumnHandle> {
            auto it = std::find_if(handles.begin(), handles.end(), [&](const ColumnHandle& column) {
                return column.name == name;
            });
            if (it == handles.end()) {
                return std::nullopt;
            }
            return *it;
        };

        if (row.fiber_key) {
            result.fiber_column = find_column(*row.fiber_key);
            if (!result.fiber_column) {
                return make_error_code(CatalogErrc::InvalidColumnRole);
            }
        }
        if (row.time_key) {
            result.time_column = find_column(*row.time_key);
            if (!result.time_column) {
                return make_error_code(CatalogErrc::InvalidColumnRole);
            }
        }
    }

    result.handle = TableHandle{std::move(row.database), std::move(row.name), std::move(row.location)};
    layout = std::move(result);
    return {};
}

std::error_code CatalogStore::columns(std::string_view database,
                                      std::string_view table,
                                      std::vector<ColumnHandle>& columns)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    TableRow row{};
    if (auto ec = find_table(database, table, row); ec) {
        return ec;
    }

    std::vector<ColumnHandle> handles;
    if (auto ec = load_columns(row.id, handles); ec) {
        return ec;
    }
    if (handles.empty()) {
        return make_error_code(CatalogErrc::NotFound);
    }
    columns = std::move(handles);
    return {};
}

std::error_code CatalogStore::create_database(const CreateDatabaseRequest& request)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }
    SessionTimeoutScope timeout{*store_, request.session};
    if (auto ec = timeout.status(); ec) {
        return ec;
    }
    return insert_database(request);
}

std::error_code CatalogStore::create_table(const CreateTableRequest& request)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }
    SessionTimeoutScope timeout{*store_, request.session};
    if (auto ec = timeout.status(); ec) {
        return ec;
    }

    const auto& target = request.table;
    spdlog::debug("create_table {}.{} (query {})", target.schema, target.table, request.session.query_id);

    if (auto ec = validate_partitioning(request); ec) {
        return ec;
    }
    if (!is_valid_path_segment(target.schema) || !is_valid_path_segment(target.table) || request.columns.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<DataType> types;
    types.reserve(request.columns.size());
    for (const auto& column : request.columns) {
        auto type = parse_data_type(column.type_text);
        if (!type.is_known()) {
            spdlog::warn("Column {} of {}.{} has unsupported type '{}'",
                         column.name,
                         target.schema,
                         target.table,
                         column.type_text);
            return make_error_code(CatalogErrc::InvalidType);
        }
        types.push_back(type);
    }

    DatabaseDescriptor owner{};
    if (auto ec = find_database(target.schema, owner); ec) {
        return ec;
    }

    const auto location = paths_.table_location(target.schema, target.table);
    bool created = false;
    if (auto ec = directories_->create_directories(location, created); ec) {
        spdlog::error("Cannot create storage for {}.{} at {}: {}", target.schema, target.table, location, ec.message());
        return make_error_code(CatalogErrc::DirectoryFailure);
    }

    store::StoreTransaction transaction{*store_};
    if (auto ec = transaction.begin(); ec) {
        if (created) {
            remove_created_directory(location);
        }
        return map_store_error(ec, "create_table");
    }
    if (created) {
        transaction.register_abort_hook([this, location]() { remove_created_directory(location); });
    }

    const std::array<StoreValue, 7> table_params{StoreValue{owner.id},
                                                 StoreValue{target.table},
                                                 StoreValue{location},
                                                 StoreValue{std::string{storage_format_name(request.format)}},
                                                 store::optional_value(request.fiber_key),
                                                 store::optional_value(request.fiber_function),
                                                 store::optional_value(request.time_key)};
    store::StoreExecResult inserted{};
    if (auto ec = store_->execute(kInsertTableSql, table_params, &inserted); ec) {
        (void)transaction.abort();
        return map_store_error(ec, "create_table");
    }

    for (std::size_t index = 0U; index < request.columns.size(); ++index) {
        const auto& column = request.columns[index];
        const std::array<StoreValue, 6> column_params{StoreValue{inserted.last_insert_id},
                                                      StoreValue{column.name},
                                                      StoreValue{static_cast<std::int64_t>(index + 1U)},
                                                      StoreValue{format_data_type(types[index])},
                                                      StoreValue{std::string{column_role_name(role_for(column.name, request))}},
                                                      StoreValue{static_cast<std::int64_t>(column.nullable ? 1 : 0)}};
        if (auto ec = store_->execute(kInsertColumnSql, column_params); ec) {
            (void)transaction.abort();
            return map_store_error(ec, "create_table");
        }
    }

    if (auto ec = transaction.commit(); ec) {
        return map_store_error(ec, "create_table");
    }

    spdlog::info("Created table {}.{} at {} ({} columns)",
                 target.schema,
                 target.table,
                 location,
                 request.columns.size());
    return {};
}

std::error_code CatalogStore::register_fiber(std::string_view database,
                                             std::string_view table,
                                             std::int64_t fiber_value,
                                             std::int64_t& fiber_id)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    TableRow row{};
    if (auto ec = find_table(database, table, row); ec) {
        return ec;
    }

    const std::array<StoreValue, 2> params{StoreValue{row.id}, StoreValue{fiber_value}};
    auto lookup = [&](bool& found) -> std::error_code {
        found = false;
        std::vector<StoreRow> rows;
        if (auto ec = store_->query(kSelectFiberSql, params, rows); ec) {
            return map_store_error(ec, "register_fiber");
        }
        if (rows.empty()) {
            return {};
        }
        if (auto ec = store::read_int64(rows.front().at(0), fiber_id); ec) {
            return record_error(ec);
        }
        found = true;
        return {};
    };

    bool found = false;
    if (auto ec = lookup(found); ec || found) {
        return ec;
    }

    store::StoreExecResult inserted{};
    if (auto ec = store_->execute(kInsertFiberSql, params, &inserted); ec) {
        // Lost a race with a concurrent writer; the row is there now.
        if (ec == store::StoreErrc::ConstraintViolation) {
            if (auto lookup_ec = lookup(found); lookup_ec || found) {
                return lookup_ec;
            }
        }
        return map_store_error(ec, "register_fiber");
    }

    fiber_id = inserted.last_insert_id;
    spdlog::debug("Registered fiber {} of {}.{} as {}", fiber_value, row.database, row.name, fiber_id);
    return {};
}

std::error_code CatalogStore::register_fiber_segment(const FiberSegment& segment, std::int64_t& segment_id)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }
    if (segment.time_begin > segment.time_end || segment.path.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    const std::array<StoreValue, 1> fiber_params{StoreValue{segment.fiber_id}};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kFiberExistsSql, fiber_params, rows); ec) {
        return map_store_error(ec, "register_fiber_segment");
    }
    std::int64_t count = 0;
    if (rows.empty()) {
        return make_error_code(CatalogErrc::InvalidRecord);
    }
    if (auto ec = store::read_int64(rows.front().at(0), count); ec) {
        return record_error(ec);
    }
    if (count == 0) {
        return make_error_code(CatalogErrc::NotFound);
    }

    const std::array<StoreValue, 4> params{StoreValue{segment.fiber_id},
                                           StoreValue{to_micros(segment.time_begin)},
                                           StoreValue{to_micros(segment.time_end)},
                                           StoreValue{segment.path}};
    store::StoreExecResult inserted{};
    if (auto ec = store_->execute(kInsertSegmentSql, params, &inserted); ec) {
        return map_store_error(ec, "register_fiber_segment");
    }

    segment_id = inserted.last_insert_id;
    spdlog::debug("Registered segment {} for fiber {}", segment.path, segment.fiber_id);
    return {};
}

std::error_code CatalogStore::list_fiber_segments(std::string_view database,
                                                  std::string_view table,
                                                  const SegmentFilter& filter,
                                                  std::vector<FiberSegment>& segments)
{
    if (auto ec = require_initialized(); ec) {
        return ec;
    }

    TableRow row{};
    if (auto ec = find_table(database, table, row); ec) {
        return ec;
    }

    auto fiber_value = filter.fiber_value;
    if (filter.fiber_key) {
        if (!row.fiber_function) {
            return make_error_code(CatalogErrc::InvalidColumnRole);
        }
        const auto function = functions_->resolve(*row.fiber_function);
        if (!function) {
            return make_error_code(CatalogErrc::UnsupportedFunction);
        }
        const auto mapped = function->apply(*filter.fiber_key);
        if (fiber_value && *fiber_value != mapped) {
            segments.clear();
            return {};
        }
        fiber_value = mapped;
    }

    const std::array<StoreValue, 4> params{StoreValue{row.id},
                                           store::optional_value(fiber_value),
                                           optional_micros(filter.window_begin),
                                           optional_micros(filter.window_end)};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kListSegmentsSql, params, rows); ec) {
        return map_store_error(ec, "list_fiber_segments");
    }

    std::vector<FiberSegment> result;
    result.reserve(rows.size());
    for (const auto& values : rows) {
        FiberSegment segment{};
        std::int64_t begin = 0;
        std::int64_t end = 0;
        if (auto ec = store::read_int64(values.at(0), segment.id); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(1), segment.fiber_id); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(2), segment.fiber_value); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(3), begin); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(4), end); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_string(values.at(5), segment.path); ec) {
            return record_error(ec);
        }
        segment.time_begin = from_micros(begin);
        segment.time_end = from_micros(end);
        result.push_back(std::move(segment));
    }
    segments = std::move(result);
    return {};
}

std::error_code CatalogStore::require_initialized() const noexcept
{
    if (!initialized_) {
        return std::make_error_code(std::errc::operation_not_permitted);
    }
    return {};
}

std::error_code CatalogStore::map_store_error(std::error_code ec, std::string_view context) const
{
    if (!ec || ec.category() == catalog_error_category()) {
        return ec;
    }
    if (ec == store::StoreErrc::ConstraintViolation) {
        return make_error_code(CatalogErrc::AlreadyExists);
    }
    spdlog::error("Catalog store failure in {}: {}", context, ec.message());
    return make_error_code(CatalogErrc::StoreFailure);
}

std::error_code CatalogStore::insert_database(const CreateDatabaseRequest& request,
                                              store::StoreTransaction* enclosing)
{
    if (!is_valid_path_segment(request.name)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    const auto location = paths_.database_location(request.name);
    bool created = false;
    if (auto ec = directories_->create_directories(location, created); ec) {
        spdlog::error("Cannot create storage for database {} at {}: {}", request.name, location, ec.message());
        return make_error_code(CatalogErrc::DirectoryFailure);
    }

    std::string owner = request.owner.value_or(request.session.user);
    if (owner.empty()) {
        owner = std::string{kDefaultOwner};
    }
    const std::array<StoreValue, 4> params{StoreValue{request.name},
                                           StoreValue{request.comment.value_or("db " + request.name)},
                                           StoreValue{std::move(owner)},
                                           StoreValue{location}};
    if (auto ec = store_->execute(kInsertDatabaseSql, params); ec) {
        if (created) {
            remove_created_directory(location);
        }
        return map_store_error(ec, "create_database");
    }
    if (created && enclosing != nullptr) {
        enclosing->register_abort_hook([this, location]() { remove_created_directory(location); });
    }

    spdlog::info("Created database {} at {}", request.name, location);
    return {};
}

std::error_code CatalogStore::find_database(std::string_view name, DatabaseDescriptor& descriptor)
{
    const std::array<StoreValue, 1> params{StoreValue{std::string{name}}};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kSelectDatabaseSql, params, rows); ec) {
        return map_store_error(ec, "database");
    }
    if (rows.empty()) {
        return make_error_code(CatalogErrc::NotFound);
    }
    if (rows.size() > 1U) {
        return make_error_code(CatalogErrc::Ambiguous);
    }

    const auto& row = rows.front();
    DatabaseDescriptor result{};
    std::optional<std::string> comment;
    std::optional<std::string> owner;
    if (auto ec = store::read_int64(row.at(0), result.id); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(row.at(1), result.name); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_optional_string(row.at(2), comment); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_optional_string(row.at(3), owner); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(row.at(4), result.location); ec) {
        return record_error(ec);
    }
    result.comment = comment.value_or(std::string{});
    result.owner = owner.value_or(std::string{});
    descriptor = std::move(result);
    return {};
}

std::error_code CatalogStore::find_table(std::string_view database, std::string_view table, TableRow& row)
{
    const std::array<StoreValue, 2> params{StoreValue{std::string{database}}, StoreValue{std::string{table}}};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kSelectTableSql, params, rows); ec) {
        return map_store_error(ec, "table lookup");
    }
    if (rows.empty()) {
        return make_error_code(CatalogErrc::NotFound);
    }
    if (rows.size() > 1U) {
        spdlog::warn("Catalog holds {} rows for table {}.{}", rows.size(), database, table);
        return make_error_code(CatalogErrc::Ambiguous);
    }

    const auto& values = rows.front();
    TableRow result{};
    if (auto ec = store::read_int64(values.at(0), result.id); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(values.at(1), result.database); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(values.at(2), result.name); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(values.at(3), result.location); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_string(values.at(4), result.storage_format); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_optional_string(values.at(5), result.fiber_key); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_optional_string(values.at(6), result.fiber_function); ec) {
        return record_error(ec);
    }
    if (auto ec = store::read_optional_string(values.at(7), result.time_key); ec) {
        return record_error(ec);
    }
    row = std::move(result);
    return {};
}

std::error_code CatalogStore::load_columns(std::int64_t table_id, std::vector<ColumnHandle>& columns)
{
    const std::array<StoreValue, 1> params{StoreValue{table_id}};
    std::vector<StoreRow> rows;
    if (auto ec = store_->query(kSelectColumnsSql, params, rows); ec) {
        return map_store_error(ec, "columns");
    }

    std::vector<ColumnHandle> result;
    result.reserve(rows.size());
    for (const auto& values : rows) {
        ColumnHandle column{};
        std::int64_t ordinal = 0;
        std::string type_text;
        std::string role_text;
        std::int64_t nullable = 1;
        if (auto ec = store::read_string(values.at(0), column.name); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(1), ordinal); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_string(values.at(2), type_text); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_string(values.at(3), role_text); ec) {
            return record_error(ec);
        }
        if (auto ec = store::read_int64(values.at(4), nullable); ec) {
            return record_error(ec);
        }

        column.type = parse_data_type(type_text);
        if (!column.type.is_known()) {
            spdlog::error("Column {} holds unparseable type '{}'", column.name, type_text);
            return make_error_code(CatalogErrc::InvalidType);
        }
        if (!parse_column_role(role_text, column.role)) {
            spdlog::error("Column {} holds unrecognised role '{}'", column.name, role_text);
            return make_error_code(CatalogErrc::InvalidRecord);
        }
        column.ordinal = static_cast<std::uint32_t>(ordinal);
        column.nullable = nullable != 0;
        result.push_back(std::move(column));
    }
    columns = std::move(result);
    return {};
}

std::error_code CatalogStore::validate_partitioning(const CreateTableRequest& request) const
{
    if (!request.fiber_key && !request.fiber_function && !request.time_key) {
        return {};
    }

    if (!request.fiber_key || !request.time_key || *request.fiber_key == *request.time_key) {
        return make_error_code(CatalogErrc::InvalidColumnRole);
    }
    if (!has_column(request, *request.fiber_key) || !has_column(request, *request.time_key)) {
        spdlog::warn("Fiber key {} or time key {} is not a column of {}.{}",
                     *request.fiber_key,
                     *request.time_key,
                     request.table.schema,
                     request.table.table);
        return make_error_code(CatalogErrc::InvalidColumnRole);
    }
    if (!request.fiber_function || !functions_->resolve(*request.fiber_function)) {
        return make_error_code(CatalogErrc::UnsupportedFunction);
    }
    return {};
}

void CatalogStore::remove_created_directory(const std::string& location) const
{
    if (auto ec = directories_->remove_directory(location); ec) {
        spdlog::warn("Could not remove storage directory {} after a failed create: {}", location, ec.message());
    }
}

}  // namespace fibermeta::catalog
