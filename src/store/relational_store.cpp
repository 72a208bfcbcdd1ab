#include "fibermeta/store/relational_store.hpp"

namespace fibermeta::store {

std::error_code read_int64(const StoreValue& value, std::int64_t& out) noexcept
{
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        out = *integer;
        return {};
    }
    return make_error_code(StoreErrc::TypeMismatch);
}

std::error_code read_string(const StoreValue& value, std::string& out)
{
    if (const auto* text = std::get_if<std::string>(&value)) {
        out = *text;
        return {};
    }
    return make_error_code(StoreErrc::TypeMismatch);
}

std::error_code read_optional_string(const StoreValue& value, std::optional<std::string>& out)
{
    if (is_null(value)) {
        out.reset();
        return {};
    }
    std::string text;
    if (auto ec = read_string(value, text); ec) {
        return ec;
    }
    out = std::move(text);
    return {};
}

}  // namespace fibermeta::store
