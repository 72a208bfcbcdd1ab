#include "fibermeta/catalog/catalog_errors.hpp"

#include <string>

namespace fibermeta::catalog {

namespace {

class CatalogErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "fibermeta.catalog";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CatalogErrc>(condition)) {
        case CatalogErrc::Success:
            return "success";
        case CatalogErrc::NotFound:
            return "catalog entry not found";
        case CatalogErrc::Ambiguous:
            return "more than one catalog entry matched";
        case CatalogErrc::InvalidType:
            return "invalid data type";
        case CatalogErrc::InvalidColumnRole:
            return "fiber or time key does not name a column";
        case CatalogErrc::UnsupportedFunction:
            return "unsupported partition function";
        case CatalogErrc::AlreadyExists:
            return "catalog entry already exists";
        case CatalogErrc::CorruptedCatalog:
            return "catalog tables are incomplete";
        case CatalogErrc::DirectoryFailure:
            return "storage directory could not be created";
        case CatalogErrc::InvalidRecord:
            return "catalog record holds an unrecognised value";
        case CatalogErrc::StoreFailure:
            return "catalog store failure";
        default:
            return "unknown catalog error";
        }
    }
};

const CatalogErrorCategory kCategory{};

}  // namespace

const std::error_category& catalog_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CatalogErrc value) noexcept
{
    return {static_cast<int>(value), catalog_error_category()};
}

}  // namespace fibermeta::catalog
