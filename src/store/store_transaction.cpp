#include "fibermeta/store/store_transaction.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace fibermeta::store {

StoreTransaction::StoreTransaction(RelationalStore& store)
    : store_{store}
{
}

StoreTransaction::~StoreTransaction()
{
    if (state_ == State::Active) {
        (void)abort();
    }
}

std::error_code StoreTransaction::begin()
{
    if (state_ != State::Idle) {
        return make_error_code(StoreErrc::TransactionState);
    }
    if (auto ec = store_.begin(); ec) {
        return ec;
    }
    state_ = State::Active;
    return {};
}

std::error_code StoreTransaction::commit()
{
    if (state_ != State::Active) {
        return make_error_code(StoreErrc::TransactionState);
    }

    if (auto ec = store_.commit(); ec) {
        spdlog::warn("Catalog store commit failed ({}); rolling back", ec.message());
        (void)abort();
        return ec;
    }

    state_ = State::Committed;
    abort_hooks_.clear();
    return {};
}

std::error_code StoreTransaction::abort()
{
    if (state_ == State::Committed) {
        return make_error_code(StoreErrc::TransactionState);
    }
    if (state_ != State::Active) {
        return {};
    }

    state_ = State::Aborted;
    auto ec = store_.rollback();
    if (ec) {
        spdlog::error("Catalog store rollback failed: {}", ec.message());
    }
    run_abort_hooks();
    return ec;
}

void StoreTransaction::register_abort_hook(AbortHook hook)
{
    if (!hook) {
        throw std::invalid_argument{"StoreTransaction::register_abort_hook requires valid hook"};
    }
    if (state_ != State::Active) {
        throw std::logic_error{"StoreTransaction::register_abort_hook requires active transaction"};
    }
    abort_hooks_.push_back(std::move(hook));
}

void StoreTransaction::run_abort_hooks() noexcept
{
    for (auto it = abort_hooks_.rbegin(); it != abort_hooks_.rend(); ++it) {
        try {
            (*it)();
        } catch (const std::exception& error) {
            spdlog::error("Abort hook failed: {}", error.what());
        }
    }
    abort_hooks_.clear();
}

}  // namespace fibermeta::store
