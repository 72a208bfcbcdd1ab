#include "fibermeta/store/sqlite_store.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <array>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace fibermeta::store {

namespace {

struct StatementDeleter final {
    void operator()(sqlite3_stmt* statement) const noexcept
    {
        if (statement != nullptr) {
            sqlite3_finalize(statement);
        }
    }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

int bind_value(sqlite3_stmt* statement, int index, const StoreValue& value)
{
    return std::visit(
        [&](const auto& held) -> int {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, std::monostate>) {
                return sqlite3_bind_null(statement, index);
            } else if constexpr (std::is_same_v<Held, std::int64_t>) {
                return sqlite3_bind_int64(statement, index, static_cast<sqlite3_int64>(held));
            } else if constexpr (std::is_same_v<Held, double>) {
                return sqlite3_bind_double(statement, index, held);
            } else {
                return sqlite3_bind_text(statement,
                                         index,
                                         held.data(),
                                         static_cast<int>(held.size()),
                                         SQLITE_TRANSIENT);
            }
        },
        value);
}

StoreValue read_column(sqlite3_stmt* statement, int column)
{
    switch (sqlite3_column_type(statement, column)) {
    case SQLITE_INTEGER:
        return StoreValue{static_cast<std::int64_t>(sqlite3_column_int64(statement, column))};
    case SQLITE_FLOAT:
        return StoreValue{sqlite3_column_double(statement, column)};
    case SQLITE_TEXT:
    case SQLITE_BLOB: {
        const auto* data = static_cast<const char*>(sqlite3_column_blob(statement, column));
        const auto size = static_cast<std::size_t>(sqlite3_column_bytes(statement, column));
        if (data == nullptr) {
            return StoreValue{std::string{}};
        }
        return StoreValue{std::string(data, size)};
    }
    case SQLITE_NULL:
    default:
        return null_value();
    }
}

}  // namespace

SqliteStore::SqliteStore(SqliteStoreConfig config)
    : config_{std::move(config)}
{
    if (config_.uri.empty()) {
        throw std::invalid_argument{"SqliteStore requires a database uri"};
    }
}

SqliteStore::~SqliteStore()
{
    close();
}

std::error_code SqliteStore::open()
{
    if (db_ != nullptr) {
        return {};
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    if (config_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(config_.uri.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to open catalog store {}: {}",
                      config_.uri,
                      handle != nullptr ? sqlite3_errmsg(handle) : sqlite3_errstr(rc));
        sqlite3_close(handle);
        return make_error_code(StoreErrc::OpenFailed);
    }

    db_ = handle;
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));

    if (auto ec = execute_script("PRAGMA foreign_keys = ON;"); ec) {
        close();
        return make_error_code(StoreErrc::OpenFailed);
    }

    spdlog::debug("Opened catalog store {}", config_.uri);
    return {};
}

std::error_code SqliteStore::set_busy_timeout(std::chrono::milliseconds timeout)
{
    if (timeout.count() < 0 || timeout.count() > std::numeric_limits<int>::max()) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (db_ != nullptr) {
        if (const int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())); rc != SQLITE_OK) {
            return translate_error(rc, "busy_timeout");
        }
    }
    config_.busy_timeout = timeout;
    return {};
}

void SqliteStore::close() noexcept
{
    if (db_ == nullptr) {
        return;
    }
    if (depth_ > 0U) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        depth_ = 0U;
    }
    sqlite3_close_v2(db_);
    db_ = nullptr;
}

std::error_code SqliteStore::execute(std::string_view sql,
                                     std::span<const StoreValue> params,
                                     StoreExecResult* result)
{
    std::vector<StoreRow> ignored;
    if (auto ec = query(sql, params, ignored); ec) {
        return ec;
    }
    if (result != nullptr) {
        result->changes = static_cast<std::int64_t>(sqlite3_changes(db_));
        result->last_insert_id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
    }
    return {};
}

std::error_code SqliteStore::execute_script(std::string_view sql)
{
    if (db_ == nullptr) {
        return make_error_code(StoreErrc::OpenFailed);
    }

    const std::string script{sql};
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, script.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        sqlite3_free(message);
        return translate_error(rc, "script");
    }
    return {};
}

std::error_code SqliteStore::query(std::string_view sql,
                                   std::span<const StoreValue> params,
                                   std::vector<StoreRow>& rows)
{
    rows.clear();
    if (db_ == nullptr) {
        return make_error_code(StoreErrc::OpenFailed);
    }

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    StatementPtr statement{raw};
    if (rc != SQLITE_OK) {
        return translate_error(rc, sql);
    }

    for (std::size_t index = 0U; index < params.size(); ++index) {
        rc = bind_value(statement.get(), static_cast<int>(index + 1U), params[index]);
        if (rc != SQLITE_OK) {
            return translate_error(rc, sql);
        }
    }

    const int column_count = sqlite3_column_count(statement.get());
    while (true) {
        rc = sqlite3_step(statement.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            rows.clear();
            return translate_error(rc, sql);
        }

        StoreRow row;
        row.reserve(static_cast<std::size_t>(column_count));
        for (int column = 0; column < column_count; ++column) {
            row.push_back(read_column(statement.get(), column));
        }
        rows.push_back(std::move(row));
    }

    return {};
}

std::error_code SqliteStore::table_exists(std::string_view name, bool& exists)
{
    exists = false;
    const std::array<StoreValue, 1> params{StoreValue{std::string{name}}};
    std::vector<StoreRow> rows;
    if (auto ec = query("SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?1", params, rows); ec) {
        return ec;
    }

    std::int64_t count = 0;
    if (rows.size() != 1U || rows.front().empty()) {
        return make_error_code(StoreErrc::QueryFailed);
    }
    if (auto ec = read_int64(rows.front().front(), count); ec) {
        return ec;
    }
    exists = count > 0;
    return {};
}

std::error_code SqliteStore::begin()
{
    const std::string statement = depth_ == 0U ? std::string{"BEGIN IMMEDIATE;"}
                                               : "SAVEPOINT " + savepoint_name(depth_) + ";";
    if (auto ec = execute_script(statement); ec) {
        return ec;
    }
    ++depth_;
    return {};
}

std::error_code SqliteStore::commit()
{
    if (depth_ == 0U) {
        return make_error_code(StoreErrc::TransactionState);
    }

    const std::string statement = depth_ == 1U ? std::string{"COMMIT;"}
                                               : "RELEASE SAVEPOINT " + savepoint_name(depth_ - 1U) + ";";
    if (auto ec = execute_script(statement); ec) {
        return ec;
    }
    --depth_;
    return {};
}

std::error_code SqliteStore::rollback()
{
    if (depth_ == 0U) {
        return make_error_code(StoreErrc::TransactionState);
    }

    if (sqlite3_get_autocommit(db_) != 0) {
        // The engine already rolled the whole transaction back on an error.
        depth_ = 0U;
        return {};
    }

    std::string statement;
    if (depth_ == 1U) {
        statement = "ROLLBACK;";
    } else {
        const auto name = savepoint_name(depth_ - 1U);
        statement = "ROLLBACK TO SAVEPOINT " + name + "; RELEASE SAVEPOINT " + name + ";";
    }
    if (auto ec = execute_script(statement); ec) {
        if (sqlite3_get_autocommit(db_) != 0) {
            depth_ = 0U;
        }
        return ec;
    }
    --depth_;
    return {};
}

std::error_code SqliteStore::translate_error(int code, std::string_view context) const
{
    const int primary = code & 0xFF;
    const char* message = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(code);

    switch (primary) {
    case SQLITE_CONSTRAINT:
        spdlog::debug("Constraint violation: {} ({})", message, context);
        return make_error_code(StoreErrc::ConstraintViolation);
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        spdlog::warn("Catalog store busy: {} ({})", message, context);
        return make_error_code(StoreErrc::Busy);
    default:
        spdlog::error("Catalog store error {}: {} ({})", code, message, context);
        return make_error_code(StoreErrc::QueryFailed);
    }
}

std::string SqliteStore::savepoint_name(std::size_t depth) const
{
    return "fibermeta_sp_" + std::to_string(depth);
}

}  // namespace fibermeta::store
