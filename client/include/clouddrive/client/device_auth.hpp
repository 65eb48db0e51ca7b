#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/credential_store.hpp"
#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/request_executor.hpp"
#include "clouddrive/client/session_store.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    enum class LoginStart
    {
        Started,
        AlreadyPending,
        AlreadyLoggedIn
    };

    struct LoginInstructions
    {
        LoginStart outcome{LoginStart::Started};
        std::string user_code{};
        std::string verification_uri{};
        std::int64_t expires_in{};
        std::string message{};
    };

    enum class LoginProgress
    {
        NoSession,
        Pending,
        Authenticated,
        Failed
    };

    struct LoginCheck
    {
        LoginProgress state{LoginProgress::NoSession};
        PendingAuthState pending{};
        // Set when state is Failed.
        ErrorCode failure{ErrorCode::OperationFailed};
        std::string reason{};
    };

    struct DeviceAuthSettings
    {
        std::string device_code_url;
        std::string token_url;
        std::string client_id;
        std::string scopes;
    };

    // OAuth2 device authorization grant, advanced by at most one token poll per call.
    class DeviceAuthFlow
    {
    public:
        using NowFunction = std::function<protocol::TimePoint()>;

        DeviceAuthFlow(HttpTransport &transport, RetryPolicy policy, SessionStore &sessions,
                       CredentialStore &credentials, DeviceAuthSettings settings, Logger logger,
                       SleepFunction sleep = {}, NowFunction now = [] { return protocol::Clock::now(); });

        LoginInstructions initiate();

        LoginCheck advance();

        void logout();

    private:
        RequestExecutor request_executor_;
        RequestExecutor poll_executor_;
        SessionStore &sessions_;
        CredentialStore &credentials_;
        DeviceAuthSettings settings_;
        Logger logger_;
        NowFunction now_;
    };

} // namespace clouddrive::client
