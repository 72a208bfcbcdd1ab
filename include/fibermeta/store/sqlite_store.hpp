#pragma once

#include "fibermeta/store/relational_store.hpp"

#include <chrono>
#include <string>

struct sqlite3;

namespace fibermeta::store {

struct SqliteStoreConfig final {
    // File path, ":memory:" or a "file:" URI.
    std::string uri{};
    std::chrono::milliseconds busy_timeout{5000};
    bool create_if_missing = true;
};

class SqliteStore final : public RelationalStore {
public:
    explicit SqliteStore(SqliteStoreConfig config);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;
    SqliteStore(SqliteStore&&) = delete;
    SqliteStore& operator=(SqliteStore&&) = delete;

    [[nodiscard]] std::error_code open();
    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    std::error_code execute(std::string_view sql,
                            std::span<const StoreValue> params,
                            StoreExecResult* result = nullptr) override;
    std::error_code execute_script(std::string_view sql) override;
    std::error_code query(std::string_view sql,
                          std::span<const StoreValue> params,
                          std::vector<StoreRow>& rows) override;
    std::error_code table_exists(std::string_view name, bool& exists) override;

    std::error_code set_busy_timeout(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::chrono::milliseconds busy_timeout() const noexcept override { return config_.busy_timeout; }

    std::error_code begin() override;
    std::error_code commit() override;
    std::error_code rollback() override;
    [[nodiscard]] std::size_t transaction_depth() const noexcept override { return depth_; }

    [[nodiscard]] const SqliteStoreConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::error_code translate_error(int code, std::string_view context) const;
    [[nodiscard]] std::string savepoint_name(std::size_t depth) const;

    SqliteStoreConfig config_{};
    sqlite3* db_ = nullptr;
    std::size_t depth_ = 0U;
};

}  // namespace fibermeta::store
