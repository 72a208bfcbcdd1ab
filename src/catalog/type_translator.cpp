#include "fibermeta/catalog/type_translator.hpp"

#include <tao/pegtl.hpp>

#include <charconv>
#include <optional>
#include <system_error>

namespace fibermeta::catalog {

namespace {

namespace pegtl = tao::pegtl;

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct optional_space : pegtl::star<pegtl::space> {
};

struct left_paren : pegtl::one<'('> {
};

struct right_paren : pegtl::one<')'> {
};

struct comma : pegtl::one<','> {
};

struct length_digits : pegtl::plus<pegtl::digit> {
};

struct precision_digits : pegtl::plus<pegtl::digit> {
};

struct scale_digits : pegtl::plus<pegtl::digit> {
};

struct kw_varchar : keyword<'v', 'a', 'r', 'c', 'h', 'a', 'r'> {
};

struct kw_char : keyword<'c', 'h', 'a', 'r'> {
};

struct kw_decimal : keyword<'d', 'e', 'c', 'i', 'm', 'a', 'l'> {
};

struct length_clause
    : pegtl::seq<optional_space, left_paren, optional_space, length_digits, optional_space, right_paren> {
};

struct varchar_rule : pegtl::seq<kw_varchar, length_clause> {
};

struct char_rule : pegtl::seq<kw_char, length_clause> {
};

struct scale_clause : pegtl::seq<comma, optional_space, scale_digits, optional_space> {
};

struct decimal_rule
    : pegtl::seq<kw_decimal,
                 optional_space,
                 left_paren,
                 optional_space,
                 precision_digits,
                 optional_space,
                 pegtl::opt<scale_clause>,
                 right_paren> {
};

struct boolean_rule : keyword<'b', 'o', 'o', 'l', 'e', 'a', 'n'> {
};

struct tinyint_rule : keyword<'t', 'i', 'n', 'y', 'i', 'n', 't'> {
};

struct smallint_rule : keyword<'s', 'm', 'a', 'l', 'l', 'i', 'n', 't'> {
};

struct integer_rule : keyword<'i', 'n', 't', 'e', 'g', 'e', 'r'> {
};

struct bigint_rule : keyword<'b', 'i', 'g', 'i', 'n', 't'> {
};

struct real_rule : keyword<'r', 'e', 'a', 'l'> {
};

struct double_rule : keyword<'d', 'o', 'u', 'b', 'l', 'e'> {
};

struct date_rule : keyword<'d', 'a', 't', 'e'> {
};

struct time_rule : keyword<'t', 'i', 'm', 'e'> {
};

struct timestamp_rule : keyword<'t', 'i', 'm', 'e', 's', 't', 'a', 'm', 'p'> {
};

struct type_rule
    : pegtl::sor<varchar_rule,
                 char_rule,
                 decimal_rule,
                 boolean_rule,
                 tinyint_rule,
                 smallint_rule,
                 integer_rule,
                 bigint_rule,
                 real_rule,
                 double_rule,
                 date_rule,
                 timestamp_rule,
                 time_rule> {
};

struct type_grammar : pegtl::seq<optional_space, type_rule, optional_space, pegtl::eof> {
};

struct TypeParseState final {
    TypeKind kind = TypeKind::Unknown;
    std::string length{};
    std::string precision{};
    std::string scale{};
};

template <TypeKind Kind>
struct set_kind {
    template <typename Input>
    static void apply(const Input&, TypeParseState& state)
    {
        state.kind = Kind;
    }
};

template <typename Rule>
struct type_action {
    template <typename Input>
    static void apply(const Input&, TypeParseState&)
    {
    }
};

template <>
struct type_action<varchar_rule> : set_kind<TypeKind::Varchar> {
};

template <>
struct type_action<char_rule> : set_kind<TypeKind::Char> {
};

template <>
struct type_action<decimal_rule> : set_kind<TypeKind::Decimal> {
};

template <>
struct type_action<boolean_rule> : set_kind<TypeKind::Boolean> {
};

template <>
struct type_action<tinyint_rule> : set_kind<TypeKind::TinyInt> {
};

template <>
struct type_action<smallint_rule> : set_kind<TypeKind::SmallInt> {
};

template <>
struct type_action<integer_rule> : set_kind<TypeKind::Integer> {
};

template <>
struct type_action<bigint_rule> : set_kind<TypeKind::BigInt> {
};

template <>
struct type_action<real_rule> : set_kind<TypeKind::Real> {
};

template <>
struct type_action<double_rule> : set_kind<TypeKind::Double> {
};

template <>
struct type_action<date_rule> : set_kind<TypeKind::Date> {
};

template <>
struct type_action<time_rule> : set_kind<TypeKind::Time> {
};

template <>
struct type_action<timestamp_rule> : set_kind<TypeKind::Timestamp> {
};

template <>
struct type_action<length_digits> {
    template <typename Input>
    static void apply(const Input& in, TypeParseState& state)
    {
        state.length = in.string();
    }
};

template <>
struct type_action<precision_digits> {
    template <typename Input>
    static void apply(const Input& in, TypeParseState& state)
    {
        state.precision = in.string();
    }
};

template <>
struct type_action<scale_digits> {
    template <typename Input>
    static void apply(const Input& in, TypeParseState& state)
    {
        state.scale = in.string();
    }
};

[[nodiscard]] std::optional<std::uint32_t> parse_unsigned(std::string_view digits) noexcept
{
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint32_t value = 0U;
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] DataType build_type(const TypeParseState& state) noexcept
{
    switch (state.kind) {
    case TypeKind::Varchar:
    case TypeKind::Char: {
        const auto length = parse_unsigned(state.length);
        if (!length || *length == 0U) {
            return {};
        }
        return state.kind == TypeKind::Varchar ? DataType::varchar(*length) : DataType::fixed_char(*length);
    }
    case TypeKind::Decimal: {
        const auto precision = parse_unsigned(state.precision);
        if (!precision || *precision == 0U || *precision > kMaxDecimalPrecision) {
            return {};
        }
        std::uint32_t scale = 0U;
        if (!state.scale.empty()) {
            const auto parsed_scale = parse_unsigned(state.scale);
            if (!parsed_scale || *parsed_scale > *precision) {
                return {};
            }
            scale = *parsed_scale;
        }
        return DataType::decimal(*precision, scale);
    }
    default:
        return DataType::of(state.kind);
    }
}

}  // namespace

DataType parse_data_type(std::string_view text)
{
    TypeParseState state{};
    pegtl::memory_input in(text, "data_type");

    try {
        if (!pegtl::parse<type_grammar, type_action>(in, state)) {
            return {};
        }
    } catch (const pegtl::parse_error&) {
        return {};
    }

    return build_type(state);
}

std::string format_data_type(const DataType& type)
{
    switch (type.kind) {
    case TypeKind::Varchar:
    case TypeKind::Char:
        return std::string{type_kind_name(type.kind)} + "(" + std::to_string(type.length) + ")";
    case TypeKind::Decimal:
        return "decimal(" + std::to_string(type.precision) + "," + std::to_string(type.scale) + ")";
    default:
        return std::string{type_kind_name(type.kind)};
    }
}

std::string_view type_kind_name(TypeKind kind) noexcept
{
    switch (kind) {
    case TypeKind::Boolean:
        return "boolean";
    case TypeKind::TinyInt:
        return "tinyint";
    case TypeKind::SmallInt:
        return "smallint";
    case TypeKind::Integer:
        return "integer";
    case TypeKind::BigInt:
        return "bigint";
    case TypeKind::Real:
        return "real";
    case TypeKind::Double:
        return "double";
    case TypeKind::Date:
        return "date";
    case TypeKind::Time:
        return "time";
    case TypeKind::Timestamp:
        return "timestamp";
    case TypeKind::Varchar:
        return "varchar";
    case TypeKind::Char:
        return "char";
    case TypeKind::Decimal:
        return "decimal";
    case TypeKind::Unknown:
    default:
        return "unknown";
    }
}

}  // namespace fibermeta::catalog
