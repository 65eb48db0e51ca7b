/**
 * CloudDrive - Transport neutral HTTP request/response model.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clouddrive::client
{

    using Headers = std::vector<std::pair<std::string, std::string>>;
    using Deadline = std::chrono::steady_clock::time_point;

    // Case-insensitive header lookup.
    std::optional<std::string> find_header(const Headers &headers, std::string_view name);

    // Drops the query string, which carries the credentials of pre-authorized URLs.
    std::string redact_url(std::string_view url);

    class RequestBody
    {
    public:
        virtual ~RequestBody() = default;

        virtual std::uint64_t size() const = 0;

        // Returns the number of bytes copied, 0 once the body is exhausted.
        virtual std::size_t read(std::span<char> buffer) = 0;

        // Positions the body at its first byte again. False when the body cannot be replayed.
        virtual bool rewind() = 0;
    };

    class BufferBody : public RequestBody
    {
    public:
        explicit BufferBody(std::string data);

        std::uint64_t size() const override { return data_.size(); }
        std::size_t read(std::span<char> buffer) override;
        bool rewind() override;

    private:
        std::string data_;
        std::size_t offset_{0};
    };

    // Reads [offset, offset + length) of a file.
    class FileRangeBody : public RequestBody
    {
    public:
        FileRangeBody(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length);

        std::uint64_t size() const override { return length_; }
        std::size_t read(std::span<char> buffer) override;
        bool rewind() override;

    private:
        std::ifstream file_;
        std::uint64_t offset_;
        std::uint64_t length_;
        std::uint64_t consumed_{0};
    };

    enum class HttpMethod
    {
        Get,
        Post,
        Put,
        Delete
    };

    std::string_view to_string(HttpMethod method) noexcept;

    struct HttpRequest
    {
        HttpMethod method{HttpMethod::Get};
        std::string url{};
        Headers headers{};
        std::shared_ptr<RequestBody> body{};
        // Statuses treated as success; empty means 200, 201, 202 and 204.
        std::vector<int> expected_status{};
        std::optional<Deadline> deadline{};

        void set_header(std::string name, std::string value);
        bool accepts(int status) const;
    };

    struct HttpResponse
    {
        int status{};
        Headers headers{};
        std::string body{};

        std::optional<std::string> header(std::string_view name) const { return find_header(headers, name); }
    };

    HttpRequest make_form_post(std::string url, const std::vector<std::pair<std::string, std::string>> &fields);

    // One request, one response. No retries and no authentication.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Throws ApiError(NetworkFailed) when no HTTP response was received.
        virtual HttpResponse perform(HttpRequest &request) = 0;
    };

} // namespace clouddrive::client
