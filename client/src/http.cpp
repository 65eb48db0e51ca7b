#include "clouddrive/client/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

#include "clouddrive/error_codes.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    namespace
    {

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        constexpr std::array<int, 4> kDefaultSuccess{200, 201, 202, 204};

    } // namespace

    std::optional<std::string> find_header(const Headers &headers, std::string_view name)
    {
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string redact_url(std::string_view url)
    {
        const auto query = url.find('?');
        if (query == std::string_view::npos)
        {
            return std::string(url);
        }
        return std::string(url.substr(0, query)) + "?...";
    }

    BufferBody::BufferBody(std::string data) : data_(std::move(data)) {}

    std::size_t BufferBody::read(std::span<char> buffer)
    {
        const auto count = std::min(buffer.size(), data_.size() - offset_);
        std::memcpy(buffer.data(), data_.data() + offset_, count);
        offset_ += count;
        return count;
    }

    bool BufferBody::rewind()
    {
        offset_ = 0;
        return true;
    }

    FileRangeBody::FileRangeBody(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
        : file_(path, std::ios::binary), offset_(offset), length_(length)
    {
        if (!file_.is_open())
        {
            throw ApiError(ErrorCode::Internal, "cannot open " + path.string() + " for reading");
        }
        file_.seekg(static_cast<std::streamoff>(offset_));
        if (!file_)
        {
            throw ApiError(ErrorCode::Internal, "cannot seek to " + std::to_string(offset_) + " in " + path.string());
        }
    }

    std::size_t FileRangeBody::read(std::span<char> buffer)
    {
        const auto remaining = length_ - consumed_;
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
        if (wanted == 0)
        {
            return 0;
        }
        file_.read(buffer.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(file_.gcount());
        if (got != wanted)
        {
            throw ApiError(ErrorCode::Internal, "local file shrank while uploading");
        }
        consumed_ += got;
        return got;
    }

    bool FileRangeBody::rewind()
    {
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(offset_));
        consumed_ = 0;
        return static_cast<bool>(file_);
    }

    std::string_view to_string(HttpMethod method) noexcept
    {
        switch (method)
        {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Delete:
            return "DELETE";
        }
        return "GET";
    }

    void HttpRequest::set_header(std::string name, std::string value)
    {
        for (auto &[key, existing] : headers)
        {
            if (iequals(key, name))
            {
                existing = std::move(value);
                return;
            }
        }
        headers.emplace_back(std::move(name), std::move(value));
    }

    bool HttpRequest::accepts(int status) const
    {
        if (expected_status.empty())
        {
            return std::find(kDefaultSuccess.begin(), kDefaultSuccess.end(), status) != kDefaultSuccess.end();
        }
        return std::find(expected_status.begin(), expected_status.end(), status) != expected_status.end();
    }

    HttpRequest make_form_post(std::string url, const std::vector<std::pair<std::string, std::string>> &fields)
    {
        std::string encoded;
        for (const auto &[name, value] : fields)
        {
            if (!encoded.empty())
            {
                encoded.push_back('&');
            }
            encoded += protocol::form_encode(name);
            encoded.push_back('=');
            encoded += protocol::form_encode(value);
        }
        HttpRequest request;
        request.method = HttpMethod::Post;
        request.url = std::move(url);
        request.set_header("Content-Type", "application/x-www-form-urlencoded");
        request.body = std::make_shared<BufferBody>(std::move(encoded));
        return request;
    }

} // namespace clouddrive::client
