#pragma once

#include "fibermeta/catalog/data_type.hpp"
#include "fibermeta/catalog/partition_function_registry.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fibermeta::catalog {

using SegmentTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

struct SessionContext final {
    std::string user{};
    std::string query_id{};
    // Lock wait allowed to this call's store statements; the store default
    // applies when absent.
    std::optional<std::chrono::milliseconds> timeout{};
};

struct DatabaseDescriptor final {
    std::int64_t id = 0;
    std::string name{};
    std::string comment{};
    std::string owner{};
    std::string location{};
};

struct SchemaTableName final {
    std::string schema{};
    std::string table{};

    friend bool operator==(const SchemaTableName&, const SchemaTableName&) = default;
};

// Absent fields match everything; present fields match exactly.
struct TableFilter final {
    std::optional<std::string> schema{};
    std::optional<std::string> table{};
};

struct TableHandle final {
    std::string schema{};
    std::string name{};
    std::string location{};
};

enum class ColumnRole : std::uint8_t {
    Regular = 0,
    Fiber,
    Time
};

enum class StorageFormat : std::uint8_t {
    Parquet = 0,
    Text
};

[[nodiscard]] std::string_view column_role_name(ColumnRole role) noexcept;
[[nodiscard]] bool parse_column_role(std::string_view text, ColumnRole& role) noexcept;

[[nodiscard]] std::string_view storage_format_name(StorageFormat format) noexcept;
[[nodiscard]] bool parse_storage_format(std::string_view text, StorageFormat& format) noexcept;

struct ColumnHandle final {
    std::string name{};
    DataType type{};
    ColumnRole role = ColumnRole::Regular;
    std::uint32_t ordinal = 0U;
    bool nullable = true;
};

struct TableLayout final {
    TableHandle handle{};
    std::optional<ColumnHandle> fiber_column{};
    std::optional<ColumnHandle> time_column{};
    std::shared_ptr<const PartitionFunction> function{};
    StorageFormat format = StorageFormat::Parquet;
};

struct ColumnDefinition final {
    std::string name{};
    std::string type_text{};
    bool nullable = true;
};

struct CreateDatabaseRequest final {
    std::string name{};
    std::optional<std::string> comment{};
    std::optional<std::string> owner{};
    SessionContext session{};
};

struct CreateTableRequest final {
    SchemaTableName table{};
    std::vector<ColumnDefinition> columns{};
    std::optional<std::string> fiber_key{};
    std::optional<std::string> fiber_function{};
    std::optional<std::string> time_key{};
    StorageFormat format = StorageFormat::Parquet;
    SessionContext session{};
};

// One FiberTimeRange row. fiber_value is filled in by listings.
struct FiberSegment final {
    std::int64_t id = 0;
    std::int64_t fiber_id = 0;
    std::int64_t fiber_value = 0;
    SegmentTime time_begin{};
    SegmentTime time_end{};
    std::string path{};
};

// A segment is kept when its fiber matches and [time_begin, time_end]
// overlaps the window. fiber_key is mapped through the table's partition
// function; when both fiber_key and fiber_value are set they must agree.
struct SegmentFilter final {
    std::optional<FiberKeyValue> fiber_key{};
    std::optional<std::int64_t> fiber_value{};
    std::optional<SegmentTime> window_begin{};
    std::optional<SegmentTime> window_end{};
};

}  // namespace fibermeta::catalog
