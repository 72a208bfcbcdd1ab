#pragma once

#include <system_error>

namespace fibermeta::store {

enum class StoreErrc {
    Success = 0,
    OpenFailed,
    ConstraintViolation,
    Busy,
    QueryFailed,
    TransactionState,
    TypeMismatch
};

const std::error_category& store_error_category() noexcept;
std::error_code make_error_code(StoreErrc value) noexcept;

}  // namespace fibermeta::store

namespace std {

template <>
struct is_error_code_enum<fibermeta::store::StoreErrc> : true_type {
};

}  // namespace std
