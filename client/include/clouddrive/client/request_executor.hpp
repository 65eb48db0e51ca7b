#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include <nlohmann/json.hpp>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    // Delay before retry number `retry` (1-based): base * 2^(retry-1), capped at max_delay.
    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int retry);

    // Server error envelope first, then the HTTP status.
    ApiError classify_response(const HttpRequest &request, const HttpResponse &response);

    // Throws DecodingFailed when the body is not JSON.
    nlohmann::json parse_json_body(const HttpResponse &response);

    class RequestExecutor
    {
    public:
        RequestExecutor(HttpTransport &transport, RetryPolicy policy, Logger logger, SleepFunction sleep = {});

        // Returns the first response accepted by request.accepts(); throws ApiError otherwise.
        HttpResponse execute(HttpRequest &request);

        const RetryPolicy &policy() const noexcept { return policy_; }

    private:
        std::optional<std::chrono::milliseconds> retry_after(const HttpResponse &response) const;

        HttpTransport &transport_;
        RetryPolicy policy_;
        Logger logger_;
        SleepFunction sleep_;
    };

} // namespace clouddrive::client
