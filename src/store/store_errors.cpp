#include "fibermeta/store/store_errors.hpp"

#include <string>

namespace fibermeta::store {

namespace {

class StoreErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "fibermeta.store";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<StoreErrc>(condition)) {
        case StoreErrc::Success:
            return "success";
        case StoreErrc::OpenFailed:
            return "store could not be opened";
        case StoreErrc::ConstraintViolation:
            return "constraint violation";
        case StoreErrc::Busy:
            return "store busy";
        case StoreErrc::QueryFailed:
            return "query failed";
        case StoreErrc::TransactionState:
            return "invalid transaction state";
        case StoreErrc::TypeMismatch:
            return "value type mismatch";
        default:
            return "unknown store error";
        }
    }
};

const StoreErrorCategory kCategory{};

}  // namespace

const std::error_category& store_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(StoreErrc value) noexcept
{
    return {static_cast<int>(value), store_error_category()};
}

}  // namespace fibermeta::store
