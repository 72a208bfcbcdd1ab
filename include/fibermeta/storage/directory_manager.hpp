#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace fibermeta::storage {

class DirectoryManager {
public:
    virtual ~DirectoryManager() = default;

    // Idempotent. `created` reports whether this call made the leaf directory.
    virtual std::error_code create_directories(const std::string& location, bool& created) = 0;

    // Removes an empty directory; a missing directory is not an error.
    virtual std::error_code remove_directory(const std::string& location) = 0;
};

class LocalDirectoryManager final : public DirectoryManager {
public:
    std::error_code create_directories(const std::string& location, bool& created) override;
    std::error_code remove_directory(const std::string& location) override;

    // Accepts plain paths and file:// URIs.
    [[nodiscard]] static std::filesystem::path to_local_path(std::string_view location);
};

}  // namespace fibermeta::storage
