#include "fibermeta/catalog/catalog_records.hpp"

namespace fibermeta::catalog {

std::string_view column_role_name(ColumnRole role) noexcept
{
    switch (role) {
    case ColumnRole::Fiber:
        return "fiber";
    case ColumnRole::Time:
        return "time";
    case ColumnRole::Regular:
    default:
        return "regular";
    }
}

bool parse_column_role(std::string_view text, ColumnRole& role) noexcept
{
    if (text == "fiber") {
        role = ColumnRole::Fiber;
        return true;
    }
    if (text == "time") {
        role = ColumnRole::Time;
        return true;
    }
    if (text == "regular") {
        role = ColumnRole::Regular;
        return true;
    }
    return false;
}

std::string_view storage_format_name(StorageFormat format) noexcept
{
    switch (format) {
    case StorageFormat::Text:
        return "text";
    case StorageFormat::Parquet:
    default:
        return "parquet";
    }
}

bool parse_storage_format(std::string_view text, StorageFormat& format) noexcept
{
    if (text == "parquet") {
        format = StorageFormat::Parquet;
        return true;
    }
    if (text == "text") {
        format = StorageFormat::Text;
        return true;
    }
    return false;
}

}  // namespace fibermeta::catalog
