#include "fibermeta/store/sqlite_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fibermeta::store;

namespace {

std::int64_t count_rows(SqliteStore& store)
{
    std::vector<StoreRow> rows;
    REQUIRE_FALSE(store.query("SELECT count(*) FROM items", {}, rows));
    REQUIRE(rows.size() == 1U);
    std::int64_t count = 0;
    REQUIRE_FALSE(read_int64(rows.front().front(), count));
    return count;
}

}  // namespace

TEST_CASE("SqliteStore requires a uri")
{
    CHECK_THROWS_AS(SqliteStore{SqliteStoreConfig{}}, std::invalid_argument);
}

TEST_CASE("SqliteStore rejects work before open")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    SqliteStore store{config};
    CHECK_FALSE(store.is_open());
    CHECK(store.execute_script("SELECT 1;") == StoreErrc::OpenFailed);
}

TEST_CASE("SqliteStore binds parameters by position")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    SqliteStore store{config};
    REQUIRE_FALSE(store.open());
    REQUIRE_FALSE(store.execute_script("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT UNIQUE, score REAL, note TEXT);"));

    const std::array<StoreValue, 3> params{StoreValue{std::string{"o'brien"}}, StoreValue{1.5}, null_value()};
    StoreExecResult result{};
    REQUIRE_FALSE(store.execute("INSERT INTO items (name, score, note) VALUES (?1, ?2, ?3)", params, &result));
    CHECK(result.changes == 1);
    CHECK(result.last_insert_id == 1);

    const std::array<StoreValue, 1> lookup{StoreValue{std::string{"o'brien"}}};
    std::vector<StoreRow> rows;
    REQUIRE_FALSE(store.query("SELECT id, name, score, note FROM items WHERE name = ?1", lookup, rows));
    REQUIRE(rows.size() == 1U);
    CHECK(std::get<std::int64_t>(rows[0][0]) == 1);
    CHECK(std::get<std::string>(rows[0][1]) == "o'brien");
    CHECK(std::get<double>(rows[0][2]) == 1.5);
    CHECK(is_null(rows[0][3]));

    std::optional<std::string> note;
    CHECK_FALSE(read_optional_string(rows[0][3], note));
    CHECK_FALSE(note.has_value());
    std::int64_t wrong = 0;
    CHECK(read_int64(rows[0][1], wrong) == StoreErrc::TypeMismatch);
}

TEST_CASE("SqliteStore reports constraint violations")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    SqliteStore store{config};
    REQUIRE_FALSE(store.open());
    REQUIRE_FALSE(store.execute_script("CREATE TABLE items (name TEXT NOT NULL); CREATE UNIQUE INDEX items_name ON items (name);"));

    const std::array<StoreValue, 1> params{StoreValue{std::string{"a"}}};
    REQUIRE_FALSE(store.execute("INSERT INTO items (name) VALUES (?1)", params));
    CHECK(store.execute("INSERT INTO items (name) VALUES (?1)", params) == StoreErrc::ConstraintViolation);
    CHECK(store.execute("INSERT INTO missing (name) VALUES (?1)", params) == StoreErrc::QueryFailed);
}

TEST_CASE("SqliteStore reports table existence")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    SqliteStore store{config};
    REQUIRE_FALSE(store.open());

    bool exists = true;
    REQUIRE_FALSE(store.table_exists("items", exists));
    CHECK_FALSE(exists);
    REQUIRE_FALSE(store.execute_script("CREATE TABLE items (name TEXT);"));
    REQUIRE_FALSE(store.table_exists("items", exists));
    CHECK(exists);
}

TEST_CASE("SqliteStore nests transactions with savepoints")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    SqliteStore store{config};
    REQUIRE_FALSE(store.open());
    REQUIRE_FALSE(store.execute_script("CREATE TABLE items (name TEXT);"));

    const std::array<StoreValue, 1> outer{StoreValue{std::string{"outer"}}};
    const std::array<StoreValue, 1> inner{StoreValue{std::string{"inner"}}};

    SECTION("inner rollback keeps outer work")
    {
        REQUIRE_FALSE(store.begin());
        REQUIRE_FALSE(store.execute("INSERT INTO items (name) VALUES (?1)", outer));
        REQUIRE_FALSE(store.begin());
        CHECK(store.transaction_depth() == 2U);
        REQUIRE_FALSE(store.execute("INSERT INTO items (name) VALUES (?1)", inner));
        REQUIRE_FALSE(store.rollback());
        REQUIRE_FALSE(store.commit());
        CHECK(store.transaction_depth() == 0U);
        CHECK(count_rows(store) == 1);
    }

    SECTION("outer rollback discards released inner work")
    {
        REQUIRE_FALSE(store.begin());
        REQUIRE_FALSE(store.begin());
        REQUIRE_FALSE(store.execute("INSERT INTO items (name) VALUES (?1)", inner));
        REQUIRE_FALSE(store.commit());
        REQUIRE_FALSE(store.rollback());
        CHECK(count_rows(store) == 0);
    }

    SECTION("commit without begin is a state error")
    {
        CHECK(store.commit() == StoreErrc::TransactionState);
        CHECK(store.rollback() == StoreErrc::TransactionState);
    }
}

TEST_CASE("SqliteStore adjusts its busy timeout")
{
    SqliteStoreConfig config{};
    config.uri = ":memory:";
    config.busy_timeout = std::chrono::milliseconds{1500};
    SqliteStore store{config};
    CHECK(store.busy_timeout() == std::chrono::milliseconds{1500});

    REQUIRE_FALSE(store.set_busy_timeout(std::chrono::milliseconds{20}));
    REQUIRE_FALSE(store.open());
    CHECK(store.busy_timeout() == std::chrono::milliseconds{20});

    REQUIRE_FALSE(store.set_busy_timeout(std::chrono::milliseconds{0}));
    CHECK(store.busy_timeout() == std::chrono::milliseconds{0});

    CHECK(store.set_busy_timeout(std::chrono::milliseconds{-1}) == std::errc::invalid_argument);
    CHECK(store.busy_timeout() == std::chrono::milliseconds{0});
}
