#include "clouddrive/error_codes.hpp"

#include <array>

namespace clouddrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
            std::string_view sentence;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::ReauthRequired, "reauth_required", "re-authentication required"},
            {ErrorCode::AccessDenied, "access_denied", "access denied"},
            {ErrorCode::RetryLater, "retry_later", "service busy or unavailable, retry later"},
            {ErrorCode::InvalidRequest, "invalid_request", "invalid request"},
            {ErrorCode::ResourceNotFound, "resource_not_found", "resource not found"},
            {ErrorCode::Conflict, "conflict", "conflict with existing resource"},
            {ErrorCode::QuotaExceeded, "quota_exceeded", "storage quota exceeded"},
            {ErrorCode::AuthorizationPending, "authorization_pending", "authorization pending"},
            {ErrorCode::AuthorizationDeclined, "authorization_declined", "authorization declined by user"},
            {ErrorCode::TokenExpired, "token_expired", "token expired"},
            {ErrorCode::DecodingFailed, "decoding_failed", "response decoding failed"},
            {ErrorCode::NetworkFailed, "network_failed", "network operation failed"},
            {ErrorCode::OperationFailed, "operation_failed", "operation failed"},
            {ErrorCode::Internal, "internal", "internal SDK error"},
            {ErrorCode::Locked, "locked", "resource is locked by another instance"},
        }};

        const ErrorCodeDescription *find_description(ErrorCode code) noexcept
        {
            for (const auto &entry : kDescriptions)
            {
                if (entry.code == code)
                {
                    return &entry;
                }
            }
            return nullptr;
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        const auto *entry = find_description(code);
        return entry ? entry->label : "unknown";
    }

    std::string_view describe(ErrorCode code) noexcept
    {
        const auto *entry = find_description(code);
        return entry ? entry->sentence : "unknown error";
    }

    ApiError::ApiError(ErrorCode code)
        : std::runtime_error(std::string(describe(code))), code_(code) {}

    ApiError::ApiError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    ApiError ApiError::wrap(const ApiError &inner, std::string_view context)
    {
        std::string message(context);
        message += ": ";
        message += inner.what();
        return ApiError(inner.code(), message);
    }

} // namespace clouddrive
