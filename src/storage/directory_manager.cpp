#include "fibermeta/storage/directory_manager.hpp"

#include <spdlog/spdlog.h>

namespace fibermeta::storage {

namespace {

constexpr std::string_view kFileScheme = "file://";

}  // namespace

std::filesystem::path LocalDirectoryManager::to_local_path(std::string_view location)
{
    if (location.substr(0, kFileScheme.size()) == kFileScheme) {
        location.remove_prefix(kFileScheme.size());
    }
    return std::filesystem::path{std::string{location}};
}

std::error_code LocalDirectoryManager::create_directories(const std::string& location, bool& created)
{
    created = false;
    const auto path = to_local_path(location);
    if (path.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::error_code ec;
    created = std::filesystem::create_directories(path, ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", path.string(), ec.message());
        return ec;
    }
    if (!std::filesystem::is_directory(path, ec)) {
        spdlog::error("Storage location {} exists and is not a directory", path.string());
        return ec ? ec : std::make_error_code(std::errc::not_a_directory);
    }

    spdlog::debug("Directory {} {}", path.string(), created ? "created" : "already present");
    return {};
}

std::error_code LocalDirectoryManager::remove_directory(const std::string& location)
{
    const auto path = to_local_path(location);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove directory {}: {}", path.string(), ec.message());
        return ec;
    }
    return {};
}

}  // namespace fibermeta::storage
