#include "fibermeta/catalog/path_resolver.hpp"

namespace fibermeta::catalog {

namespace {

std::string_view trim_trailing_separators(std::string_view text) noexcept
{
    while (!text.empty() && text.back() == kPathSeparator) {
        text.remove_suffix(1U);
    }
    return text;
}

std::string_view trim_leading_separators(std::string_view text) noexcept
{
    while (!text.empty() && text.front() == kPathSeparator) {
        text.remove_prefix(1U);
    }
    return text;
}

void append_segment(std::string& path, std::string_view segment)
{
    segment = trim_trailing_separators(trim_leading_separators(segment));
    if (segment.empty()) {
        return;
    }
    path.push_back(kPathSeparator);
    path.append(segment);
}

}  // namespace

std::string resolve_path(std::string_view root, std::span<const std::string_view> segments)
{
    std::string path{trim_trailing_separators(root)};
    for (auto segment : segments) {
        append_segment(path, segment);
    }
    return path;
}

std::string resolve_path(std::string_view root, std::initializer_list<std::string_view> segments)
{
    return resolve_path(root, std::span<const std::string_view>{segments.begin(), segments.size()});
}

bool is_valid_path_segment(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find(kPathSeparator) == std::string_view::npos;
}

PathResolver::PathResolver(std::string root)
    : root_{trim_trailing_separators(root)}
{
}

std::string PathResolver::database_location(std::string_view database) const
{
    return resolve_path(root_, {database});
}

std::string PathResolver::table_location(std::string_view database, std::string_view table) const
{
    return resolve_path(root_, {database, table});
}

}  // namespace fibermeta::catalog
