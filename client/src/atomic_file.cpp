#include "clouddrive/client/atomic_file.hpp"

#include <atomic>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <unistd.h>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {
        [[noreturn]] void throw_io(const std::string &action, const std::filesystem::path &path, const std::error_code &ec)
        {
            throw ApiError(ErrorCode::Internal, action + " " + path.string() + ": " + ec.message());
        }
    } // namespace

    void write_private_file(const std::filesystem::path &path, std::string_view content)
    {
        static std::atomic<unsigned> sequence{0};
        // Unique per writer, so concurrent replacements never share a temporary file.
        auto temp_path = path;
        temp_path += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(sequence.fetch_add(1));
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ApiError(ErrorCode::Internal, "cannot open " + temp_path.string() + " for writing");
            }
            std::error_code ec;
            std::filesystem::permissions(temp_path,
                                         std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                         std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                throw_io("cannot restrict permissions of", temp_path, ec);
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out)
            {
                throw ApiError(ErrorCode::Internal, "failed writing " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw_io("cannot replace", path, ec);
        }
    }

    std::optional<std::string> read_file_if_exists(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec) && !ec)
            {
                return std::nullopt;
            }
            throw ApiError(ErrorCode::Internal, "cannot open " + path.string() + " for reading");
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw ApiError(ErrorCode::Internal, "failed reading " + path.string());
        }
        return content;
    }

    void ensure_directory(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw_io("cannot create directory", path, ec);
        }
    }

} // namespace clouddrive::client
