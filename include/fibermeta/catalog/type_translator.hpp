#pragma once

#include "fibermeta/catalog/data_type.hpp"

#include <string>
#include <string_view>

namespace fibermeta::catalog {

// Case-insensitive. Returns a DataType of kind Unknown for anything outside
// the supported forms, including malformed or out-of-range parameters.
[[nodiscard]] DataType parse_data_type(std::string_view text);

// Canonical lowercase rendering; parse_data_type(format_data_type(t)) == t.
[[nodiscard]] std::string format_data_type(const DataType& type);

[[nodiscard]] std::string_view type_kind_name(TypeKind kind) noexcept;

}  // namespace fibermeta::catalog
