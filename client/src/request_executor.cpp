#include "clouddrive/client/request_executor.hpp"

#include <algorithm>
#include <array>
#include <thread>

#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    namespace
    {

        struct StatusMapping
        {
            int status;
            ErrorCode code;
        };

        constexpr std::array<StatusMapping, 15> kStatusCodes{{
            {400, ErrorCode::InvalidRequest},
            {401, ErrorCode::ReauthRequired},
            {403, ErrorCode::AccessDenied},
            {404, ErrorCode::ResourceNotFound},
            {405, ErrorCode::InvalidRequest},
            {406, ErrorCode::InvalidRequest},
            {409, ErrorCode::Conflict},
            {410, ErrorCode::ResourceNotFound},
            {412, ErrorCode::Conflict},
            {413, ErrorCode::QuotaExceeded},
            {416, ErrorCode::InvalidRequest},
            {422, ErrorCode::InvalidRequest},
            {429, ErrorCode::RetryLater},
            {503, ErrorCode::RetryLater},
            {507, ErrorCode::QuotaExceeded},
        }};

        ErrorCode code_for_status(int status) noexcept
        {
            for (const auto &entry : kStatusCodes)
            {
                if (entry.status == status)
                {
                    return entry.code;
                }
            }
            return ErrorCode::OperationFailed;
        }

        void default_sleep(std::chrono::milliseconds delay)
        {
            std::this_thread::sleep_for(delay);
        }

    } // namespace

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int retry)
    {
        auto delay = policy.base_delay;
        for (int i = 1; i < retry && delay < policy.max_delay; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, policy.max_delay);
    }

    ApiError classify_response(const HttpRequest &request, const HttpResponse &response)
    {
        std::string context = std::string(to_string(request.method)) + " " + redact_url(request.url) + ": HTTP " +
                              std::to_string(response.status);
        const auto service_error = protocol::parse_service_error(response.body);
        if (service_error)
        {
            context += " " + service_error->code;
            if (!service_error->message.empty())
            {
                context += " (" + service_error->message + ")";
            }
            if (const auto code = protocol::error_code_from_service(service_error->code))
            {
                return ApiError(*code, std::string(describe(*code)) + ": " + context);
            }
        }
        const auto code = code_for_status(response.status);
        return ApiError(code, std::string(describe(code)) + ": " + context);
    }

    nlohmann::json parse_json_body(const HttpResponse &response)
    {
        auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded())
        {
            throw ApiError(ErrorCode::DecodingFailed, "response body of HTTP " + std::to_string(response.status) +
                                                          " is not valid JSON");
        }
        return json;
    }

    RequestExecutor::RequestExecutor(HttpTransport &transport, RetryPolicy policy, Logger logger, SleepFunction sleep)
        : transport_(transport),
          policy_(policy),
          logger_(std::move(logger)),
          sleep_(sleep ? std::move(sleep) : SleepFunction(default_sleep))
    {
        if (policy_.max_attempts < 1)
        {
            policy_.max_attempts = 1;
        }
    }

    std::optional<std::chrono::milliseconds> RequestExecutor::retry_after(const HttpResponse &response) const
    {
        const auto value = response.header("Retry-After");
        if (!value || value->empty() || value->size() > 9 ||
            !std::all_of(value->begin(), value->end(), [](char ch)
                         { return ch >= '0' && ch <= '9'; }))
        {
            return std::nullopt;
        }
        const auto seconds = std::chrono::seconds(std::stoll(*value));
        return std::min<std::chrono::milliseconds>(seconds, policy_.max_delay);
    }

    HttpResponse RequestExecutor::execute(HttpRequest &request)
    {
        bool unauthorized_retried = false;
        for (int attempt = 1;; ++attempt)
        {
            if (request.deadline && std::chrono::steady_clock::now() >= *request.deadline)
            {
                throw ApiError(ErrorCode::NetworkFailed,
                               "deadline exceeded before " + std::string(to_string(request.method)) + " " +
                                   redact_url(request.url));
            }

            std::optional<ApiError> failure;
            std::optional<std::chrono::milliseconds> server_delay;
            bool retryable = false;
            try
            {
                auto response = transport_.perform(request);
                if (request.accepts(response.status))
                {
                    return response;
                }
                failure = classify_response(request, response);
                server_delay = retry_after(response);
                if (response.status == 401)
                {
                    retryable = !unauthorized_retried;
                    unauthorized_retried = true;
                }
                else
                {
                    retryable = is_retryable(failure->code());
                }
            }
            catch (const ApiError &error)
            {
                // Credential failures and local I/O errors are final.
                if (!is_retryable(error.code()))
                {
                    throw;
                }
                failure = error;
                retryable = true;
            }

            if (!retryable || attempt >= policy_.max_attempts)
            {
                logger_.debug("http", "giving up after ", attempt, " attempt(s): ", failure->what());
                throw *failure;
            }
            if (request.body && !request.body->rewind())
            {
                logger_.warn("http", "request body cannot be replayed, not retrying");
                throw *failure;
            }

            const auto delay = server_delay ? *server_delay : backoff_delay(policy_, attempt);
            logger_.log("http", "attempt ", attempt, " of ", policy_.max_attempts, " failed (",
                        to_string(failure->code()), "), retrying in ", delay.count(), "ms");
            sleep_(delay);
        }
    }

} // namespace clouddrive::client
