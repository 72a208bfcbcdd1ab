#include "fibermeta/store/store_transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fibermeta::store;

namespace {

struct StubStore final : RelationalStore {
    std::error_code execute(std::string_view, std::span<const StoreValue>, StoreExecResult*) override
    {
        return {};
    }

    std::error_code execute_script(std::string_view) override
    {
        return {};
    }

    std::error_code query(std::string_view, std::span<const StoreValue>, std::vector<StoreRow>& rows) override
    {
        rows.clear();
        return {};
    }

    std::error_code table_exists(std::string_view, bool& exists) override
    {
        exists = false;
        return {};
    }

    std::error_code set_busy_timeout(std::chrono::milliseconds timeout) override
    {
        lock_timeout = timeout;
        return {};
    }

    std::chrono::milliseconds busy_timeout() const noexcept override
    {
        return lock_timeout;
    }

    std::error_code begin() override
    {
        ++begins;
        ++depth;
        return {};
    }

    std::error_code commit() override
    {
        if (fail_commit) {
            return make_error_code(StoreErrc::Busy);
        }
        ++commits;
        --depth;
        return {};
    }

    std::error_code rollback() override
    {
        ++rollbacks;
        --depth;
        return {};
    }

    std::size_t transaction_depth() const noexcept override
    {
        return depth;
    }

    std::chrono::milliseconds lock_timeout{0};
    std::size_t depth = 0U;
    int begins = 0;
    int commits = 0;
    int rollbacks = 0;
    bool fail_commit = false;
};

}  // namespace

TEST_CASE("StoreTransaction commits once")
{
    StubStore store;
    StoreTransaction transaction{store};
    REQUIRE_FALSE(transaction.begin());
    CHECK(transaction.is_active());
    CHECK(transaction.begin() == StoreErrc::TransactionState);

    REQUIRE_FALSE(transaction.commit());
    CHECK(transaction.is_committed());
    CHECK(store.commits == 1);
    CHECK(transaction.commit() == StoreErrc::TransactionState);
    CHECK(transaction.abort() == StoreErrc::TransactionState);
}

TEST_CASE("StoreTransaction runs abort hooks in reverse order")
{
    StubStore store;
    std::vector<std::string> events;
    {
        StoreTransaction transaction{store};
        REQUIRE_FALSE(transaction.begin());
        transaction.register_abort_hook([&] { events.emplace_back("first"); });
        transaction.register_abort_hook([&] { events.emplace_back("second"); });
    }

    CHECK(store.rollbacks == 1);
    CHECK(events == std::vector<std::string>{"second", "first"});
}

TEST_CASE("StoreTransaction aborts when commit fails")
{
    StubStore store;
    store.fail_commit = true;
    bool hook_ran = false;

    StoreTransaction transaction{store};
    REQUIRE_FALSE(transaction.begin());
    transaction.register_abort_hook([&] { hook_ran = true; });
    CHECK(transaction.commit() == StoreErrc::Busy);
    CHECK(transaction.is_aborted());
    CHECK(store.rollbacks == 1);
    CHECK(hook_ran);
}

TEST_CASE("StoreTransaction keeps running hooks after one throws")
{
    StubStore store;
    bool later_hook_ran = false;

    StoreTransaction transaction{store};
    REQUIRE_FALSE(transaction.begin());
    transaction.register_abort_hook([&] { later_hook_ran = true; });
    transaction.register_abort_hook([] { throw std::runtime_error{"boom"}; });
    CHECK_FALSE(transaction.abort());
    CHECK(later_hook_ran);
}

TEST_CASE("StoreTransaction validates abort hooks")
{
    StubStore store;
    StoreTransaction transaction{store};
    CHECK_THROWS_AS(transaction.register_abort_hook([] {}), std::logic_error);
    REQUIRE_FALSE(transaction.begin());
    CHECK_THROWS_AS(transaction.register_abort_hook({}), std::invalid_argument);
}
