#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace fibermeta::catalog {

inline constexpr char kPathSeparator = '/';

// Joins logical name segments onto a storage root. Trailing separators are
// stripped from the root and from every segment; each non-empty segment gets
// exactly one leading separator.
[[nodiscard]] std::string resolve_path(std::string_view root, std::span<const std::string_view> segments);
[[nodiscard]] std::string resolve_path(std::string_view root, std::initializer_list<std::string_view> segments);

// A database or table name that maps to exactly one directory directly below
// its parent: non-empty, no separator, not "." or "..".
[[nodiscard]] bool is_valid_path_segment(std::string_view name) noexcept;

class PathResolver final {
public:
    explicit PathResolver(std::string root);

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    [[nodiscard]] std::string database_location(std::string_view database) const;
    [[nodiscard]] std::string table_location(std::string_view database, std::string_view table) const;

private:
    std::string root_{};
};

}  // namespace fibermeta::catalog
