#pragma once

#include <system_error>

namespace fibermeta::catalog {

enum class CatalogErrc {
    Success = 0,
    NotFound,
    Ambiguous,
    InvalidType,
    InvalidColumnRole,
    UnsupportedFunction,
    AlreadyExists,
    CorruptedCatalog,
    DirectoryFailure,
    InvalidRecord,
    StoreFailure
};

const std::error_category& catalog_error_category() noexcept;
std::error_code make_error_code(CatalogErrc value) noexcept;

}  // namespace fibermeta::catalog

namespace std {

template <>
struct is_error_code_enum<fibermeta::catalog::CatalogErrc> : true_type {
};

}  // namespace std
