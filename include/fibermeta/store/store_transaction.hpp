#pragma once

#include "fibermeta/store/relational_store.hpp"

#include <functional>
#include <system_error>
#include <vector>

namespace fibermeta::store {

// Unit of work over a RelationalStore. Rolls back on destruction unless
// committed; abort hooks run in reverse registration order whenever the work
// is rolled back, including when commit itself fails.
class StoreTransaction final {
public:
    using AbortHook = std::function<void()>;

    explicit StoreTransaction(RelationalStore& store);
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;
    StoreTransaction(StoreTransaction&&) = delete;
    StoreTransaction& operator=(StoreTransaction&&) = delete;

    [[nodiscard]] std::error_code begin();
    std::error_code commit();
    std::error_code abort();

    void register_abort_hook(AbortHook hook);

    [[nodiscard]] bool is_active() const noexcept { return state_ == State::Active; }
    [[nodiscard]] bool is_committed() const noexcept { return state_ == State::Committed; }
    [[nodiscard]] bool is_aborted() const noexcept { return state_ == State::Aborted; }

private:
    enum class State {
        Idle,
        Active,
        Committed,
        Aborted
    };

    void run_abort_hooks() noexcept;

    RelationalStore& store_;
    std::vector<AbortHook> abort_hooks_{};
    State state_ = State::Idle;
};

}  // namespace fibermeta::store
