#include "clouddrive/client/curl_transport.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

#include "clouddrive/error_codes.hpp"
#include "clouddrive/version.hpp"

namespace clouddrive::client
{

    namespace
    {

        struct CurlEasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct CurlListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;
        using unique_curl_list = std::unique_ptr<curl_slist, CurlListDeleter>;

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw std::runtime_error("curl_global_init failed");
                } });
        }

        struct TransferContext
        {
            RequestBody *body{nullptr};
            HttpResponse *response{nullptr};
            std::string failure{};
        };

        std::size_t write_body(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto *context = static_cast<TransferContext *>(user);
            context->response->body.append(data, size * count);
            return size * count;
        }

        std::size_t write_header(char *data, std::size_t size, std::size_t count, void *user)
        {
            auto *context = static_cast<TransferContext *>(user);
            const std::string_view line(data, size * count);
            if (line.rfind("HTTP/", 0) == 0)
            {
                // A new status line starts a new header block (redirects, 100 Continue).
                context->response->headers.clear();
                return size * count;
            }
            const auto colon = line.find(':');
            if (colon != std::string_view::npos)
            {
                auto value = line.substr(colon + 1);
                while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                {
                    value.remove_prefix(1);
                }
                while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
                {
                    value.remove_suffix(1);
                }
                context->response->headers.emplace_back(std::string(line.substr(0, colon)), std::string(value));
            }
            return size * count;
        }

        std::size_t read_body(char *buffer, std::size_t size, std::size_t count, void *user)
        {
            auto *context = static_cast<TransferContext *>(user);
            try
            {
                return context->body->read(std::span<char>(buffer, size * count));
            }
            catch (const std::exception &ex)
            {
                context->failure = ex.what();
                return CURL_READFUNC_ABORT;
            }
        }

        long effective_timeout_ms(std::chrono::milliseconds timeout, const std::optional<Deadline> &deadline)
        {
            auto budget = timeout;
            if (deadline)
            {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now());
                budget = std::min(budget, std::max(remaining, std::chrono::milliseconds(1)));
            }
            return static_cast<long>(budget.count());
        }

    } // namespace

    CurlTransport::CurlTransport(std::chrono::milliseconds timeout, Logger logger)
        : timeout_(timeout), logger_(std::move(logger))
    {
        ensure_curl_global_init();
    }

    HttpResponse CurlTransport::perform(HttpRequest &request)
    {
        unique_curl_easy curl{curl_easy_init()};
        if (!curl)
        {
            throw ApiError(ErrorCode::Internal, "curl_easy_init failed");
        }

        if (!request.body && (request.method == HttpMethod::Put || request.method == HttpMethod::Post))
        {
            request.body = std::make_shared<BufferBody>(std::string{});
        }

        HttpResponse response;
        TransferContext context;
        context.body = request.body.get();
        context.response = &response;

        unique_curl_list header_list;
        auto append_header = [&header_list](const std::string &line)
        {
            curl_slist *next = curl_slist_append(header_list.get(), line.c_str());
            if (!next)
            {
                throw ApiError(ErrorCode::Internal, "curl_slist_append failed");
            }
            header_list.release();
            header_list.reset(next);
        };
        for (const auto &[name, value] : request.headers)
        {
            append_header(name + ": " + value);
        }
        // Chunk PUTs must not wait for a 100 Continue round trip.
        append_header("Expect:");

        const std::string user_agent = "clouddrive/" + std::string(kVersion);
        char error_buffer[CURL_ERROR_SIZE] = {};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, effective_timeout_ms(timeout_, request.deadline));
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &context);

        const auto body_size = request.body ? static_cast<curl_off_t>(request.body->size()) : curl_off_t{0};
        switch (request.method)
        {
        case HttpMethod::Get:
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, body_size);
            curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_body);
            curl_easy_setopt(curl.get(), CURLOPT_READDATA, &context);
            break;
        case HttpMethod::Put:
            curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, body_size);
            curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_body);
            curl_easy_setopt(curl.get(), CURLOPT_READDATA, &context);
            break;
        case HttpMethod::Delete:
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        }
        if (header_list)
        {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }

        logger_.debug("http", to_string(request.method), " ", redact_url(request.url));
        const CURLcode result = curl_easy_perform(curl.get());
        if (result != CURLE_OK)
        {
            std::string reason = context.failure;
            if (reason.empty())
            {
                reason = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(result));
            }
            logger_.warn("http", to_string(request.method), " ", redact_url(request.url), " failed: ", reason);
            throw ApiError(ErrorCode::NetworkFailed,
                           std::string(describe(ErrorCode::NetworkFailed)) + ": " + reason);
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
        logger_.debug("http", to_string(request.method), " ", redact_url(request.url), " -> ", response.status);
        return response;
    }

} // namespace clouddrive::client
