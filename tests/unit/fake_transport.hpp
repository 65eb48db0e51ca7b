#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clouddrive/client/http.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::testing
{

    struct RecordedRequest
    {
        client::HttpMethod method{client::HttpMethod::Get};
        std::string url{};
        client::Headers headers{};
        std::string body{};
        std::optional<client::Deadline> deadline{};

        std::optional<std::string> header(std::string_view name) const
        {
            return client::find_header(headers, name);
        }
    };

    // Answers requests from a script, in order. Once the script is exhausted the
    // fallback handler answers; without one the request fails the test.
    class FakeTransport : public client::HttpTransport
    {
    public:
        using Handler = std::function<client::HttpResponse(const RecordedRequest &)>;

        void push(int status, std::string body = {}, client::Headers headers = {});
        void push(Handler handler);
        void push_failure(ErrorCode code = ErrorCode::NetworkFailed);
        void set_fallback(Handler handler);

        client::HttpResponse perform(client::HttpRequest &request) override;

        std::vector<RecordedRequest> requests() const;
        std::size_t count() const;

    private:
        mutable std::mutex mutex_;
        std::deque<Handler> script_;
        Handler fallback_;
        std::vector<RecordedRequest> requests_;
    };

    client::HttpResponse json_response(int status, std::string body);

    // Records requested delays instead of sleeping.
    struct RecordingSleep
    {
        std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
            std::make_shared<std::vector<std::chrono::milliseconds>>();

        void operator()(std::chrono::milliseconds delay) const { delays->push_back(delay); }
    };

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name);
        ~TempDir();

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    void write_file(const std::filesystem::path &path, const std::string &content);
    std::string read_file(const std::filesystem::path &path);
    // Deterministic content of the given size.
    std::string pattern_bytes(std::size_t size);

} // namespace clouddrive::testing
