#pragma once

#include "fibermeta/store/store_errors.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace fibermeta::store {

using StoreValue = std::variant<std::monostate, std::int64_t, double, std::string>;
using StoreRow = std::vector<StoreValue>;

struct StoreExecResult final {
    std::int64_t changes = 0;
    std::int64_t last_insert_id = 0;
};

// Client of the relational database that backs the catalog. Parameters are
// bound by position; implementations never splice values into SQL text.
class RelationalStore {
public:
    virtual ~RelationalStore() = default;

    virtual std::error_code execute(std::string_view sql,
                                    std::span<const StoreValue> params,
                                    StoreExecResult* result = nullptr) = 0;

    // Runs a parameterless script of one or more statements.
    virtual std::error_code execute_script(std::string_view sql) = 0;

    virtual std::error_code query(std::string_view sql,
                                  std::span<const StoreValue> params,
                                  std::vector<StoreRow>& rows) = 0;

    virtual std::error_code table_exists(std::string_view name, bool& exists) = 0;

    // How long a statement waits on a locked store before failing Busy.
    virtual std::error_code set_busy_timeout(std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual std::chrono::milliseconds busy_timeout() const noexcept = 0;

    // Transactions nest; only the outermost commit makes changes durable.
    virtual std::error_code begin() = 0;
    virtual std::error_code commit() = 0;
    virtual std::error_code rollback() = 0;
    [[nodiscard]] virtual std::size_t transaction_depth() const noexcept = 0;
};

[[nodiscard]] inline bool is_null(const StoreValue& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] inline StoreValue null_value() noexcept
{
    return StoreValue{std::monostate{}};
}

template <typename T>
[[nodiscard]] StoreValue optional_value(const std::optional<T>& value)
{
    if (!value) {
        return null_value();
    }
    return StoreValue{*value};
}

std::error_code read_int64(const StoreValue& value, std::int64_t& out) noexcept;
std::error_code read_string(const StoreValue& value, std::string& out);
std::error_code read_optional_string(const StoreValue& value, std::optional<std::string>& out);

}  // namespace fibermeta::store
