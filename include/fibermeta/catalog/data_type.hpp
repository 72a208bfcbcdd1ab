#pragma once

#include <cstdint>

namespace fibermeta::catalog {

enum class TypeKind : std::uint8_t {
    Unknown = 0,
    Boolean,
    TinyInt,
    SmallInt,
    Integer,
    BigInt,
    Real,
    Double,
    Date,
    Time,
    Timestamp,
    Varchar,
    Char,
    Decimal
};

inline constexpr std::uint32_t kMaxDecimalPrecision = 38U;

struct DataType final {
    TypeKind kind = TypeKind::Unknown;
    std::uint32_t length = 0U;     // varchar, char
    std::uint32_t precision = 0U;  // decimal
    std::uint32_t scale = 0U;      // decimal

    [[nodiscard]] constexpr bool is_known() const noexcept { return kind != TypeKind::Unknown; }

    [[nodiscard]] static constexpr DataType of(TypeKind kind) noexcept { return DataType{kind, 0U, 0U, 0U}; }
    [[nodiscard]] static constexpr DataType varchar(std::uint32_t length) noexcept
    {
        return DataType{TypeKind::Varchar, length, 0U, 0U};
    }
    [[nodiscard]] static constexpr DataType fixed_char(std::uint32_t length) noexcept
    {
        return DataType{TypeKind::Char, length, 0U, 0U};
    }
    [[nodiscard]] static constexpr DataType decimal(std::uint32_t precision, std::uint32_t scale = 0U) noexcept
    {
        return DataType{TypeKind::Decimal, 0U, precision, scale};
    }
};

constexpr bool operator==(const DataType& lhs, const DataType& rhs) noexcept
{
    return lhs.kind == rhs.kind && lhs.length == rhs.length && lhs.precision == rhs.precision
           && lhs.scale == rhs.scale;
}

constexpr bool operator!=(const DataType& lhs, const DataType& rhs) noexcept
{
    return !(lhs == rhs);
}

}  // namespace fibermeta::catalog
