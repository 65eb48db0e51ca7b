#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace clouddrive::client
{

    // Writes to a unique "<path>.tmp.<pid>.<n>" with owner-only permissions and renames it over path.
    void write_private_file(const std::filesystem::path &path, std::string_view content);

    // nullopt when the file does not exist.
    std::optional<std::string> read_file_if_exists(const std::filesystem::path &path);

    void ensure_directory(const std::filesystem::path &path);

} // namespace clouddrive::client
