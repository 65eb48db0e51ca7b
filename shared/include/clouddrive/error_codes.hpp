/**
 * CloudDrive - Closed error taxonomy shared by every client layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clouddrive
{

    enum class ErrorCode : std::uint16_t
    {
        ReauthRequired = 1,
        AccessDenied = 2,
        RetryLater = 3,
        InvalidRequest = 4,
        ResourceNotFound = 5,
        Conflict = 6,
        QuotaExceeded = 7,
        AuthorizationPending = 8,
        AuthorizationDeclined = 9,
        TokenExpired = 10,
        DecodingFailed = 11,
        NetworkFailed = 12,
        OperationFailed = 13,
        Internal = 14,
        Locked = 15
    };

    // Stable machine label, e.g. "retry_later".
    std::string_view to_string(ErrorCode code) noexcept;

    // Human readable sentence used as the default error message.
    std::string_view describe(ErrorCode code) noexcept;

    // Whether the request executor may repeat a request that failed with this code.
    constexpr bool is_retryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::RetryLater || code == ErrorCode::NetworkFailed;
    }

    class ApiError : public std::runtime_error
    {
    public:
        explicit ApiError(ErrorCode code);
        ApiError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

        // Prepends context to the message and keeps the category.
        static ApiError wrap(const ApiError &inner, std::string_view context);

    private:
        ErrorCode code_;
    };

} // namespace clouddrive
