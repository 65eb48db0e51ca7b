#include "clouddrive/client/device_auth.hpp"

#include "clouddrive/error_codes.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    namespace
    {
        constexpr const char *kDeviceCodeGrant = "urn:ietf:params:oauth:grant-type:device_code";

        RetryPolicy single_attempt(RetryPolicy policy)
        {
            policy.max_attempts = 1;
            return policy;
        }

        // Outcomes after which the device code can never succeed.
        bool is_terminal(ErrorCode code) noexcept
        {
            switch (code)
            {
            case ErrorCode::AuthorizationDeclined:
            case ErrorCode::TokenExpired:
            case ErrorCode::InvalidRequest:
            case ErrorCode::AccessDenied:
            case ErrorCode::ReauthRequired:
                return true;
            default:
                return false;
            }
        }
    } // namespace

    DeviceAuthFlow::DeviceAuthFlow(HttpTransport &transport, RetryPolicy policy, SessionStore &sessions,
                                   CredentialStore &credentials, DeviceAuthSettings settings, Logger logger,
                                   SleepFunction sleep, NowFunction now)
        : request_executor_(transport, policy, logger, sleep),
          poll_executor_(transport, single_attempt(policy), logger, sleep),
          sessions_(sessions),
          credentials_(credentials),
          settings_(std::move(settings)),
          logger_(std::move(logger)),
          now_(std::move(now)) {}

    LoginInstructions DeviceAuthFlow::initiate()
    {
        LoginInstructions instructions;
        if (credentials_.load())
        {
            instructions.outcome = LoginStart::AlreadyLoggedIn;
            return instructions;
        }
        if (const auto pending = sessions_.load_auth_state())
        {
            instructions.outcome = LoginStart::AlreadyPending;
            instructions.user_code = pending->user_code;
            instructions.verification_uri = pending->verification_uri;
            return instructions;
        }

        auto request = make_form_post(settings_.device_code_url, {
                                                                     {"client_id", settings_.client_id},
                                                                     {"scope", settings_.scopes},
                                                                 });
        request.expected_status = {200};

        protocol::DeviceCodeResponse response;
        try
        {
            response = parse_json_body(request_executor_.execute(request)).get<protocol::DeviceCodeResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid device code response: ") + ex.what());
        }
        catch (const ApiError &error)
        {
            throw ApiError::wrap(error, "starting device login");
        }

        PendingAuthState state;
        state.device_code = response.device_code;
        state.user_code = response.user_code;
        state.verification_uri = response.verification_uri;
        state.interval = response.interval;
        sessions_.save_auth_state(state);
        logger_.log("auth", "device login started, code expires in ", response.expires_in, "s");

        instructions.outcome = LoginStart::Started;
        instructions.user_code = response.user_code;
        instructions.verification_uri = response.verification_uri;
        instructions.expires_in = response.expires_in;
        instructions.message = response.message;
        return instructions;
    }

    LoginCheck DeviceAuthFlow::advance()
    {
        LoginCheck check;
        const auto pending = sessions_.load_auth_state();
        if (!pending)
        {
            check.state = LoginProgress::NoSession;
            return check;
        }
        check.pending = *pending;

        auto request = make_form_post(settings_.token_url, {
                                                               {"grant_type", kDeviceCodeGrant},
                                                               {"client_id", settings_.client_id},
                                                               {"device_code", pending->device_code},
                                                           });
        request.expected_status = {200};

        HttpResponse response;
        try
        {
            response = poll_executor_.execute(request);
        }
        catch (const ApiError &error)
        {
            if (error.code() == ErrorCode::AuthorizationPending)
            {
                check.state = LoginProgress::Pending;
                return check;
            }
            if (!is_terminal(error.code()))
            {
                throw;
            }
            logger_.log("auth", "device login failed: ", to_string(error.code()));
            sessions_.remove_auth_state();
            check.state = LoginProgress::Failed;
            check.failure = error.code();
            check.reason = error.what();
            return check;
        }

        protocol::TokenResponse token;
        try
        {
            token = parse_json_body(response).get<protocol::TokenResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid token response: ") + ex.what());
        }

        Credential credential;
        credential.access_token = token.access_token;
        credential.refresh_token = token.refresh_token;
        if (token.expires_in > 0)
        {
            credential.expiry = now_() + std::chrono::seconds(token.expires_in);
        }
        credentials_.persist(credential);
        sessions_.remove_auth_state();
        logger_.log("auth", "device login completed");
        check.state = LoginProgress::Authenticated;
        return check;
    }

    void DeviceAuthFlow::logout()
    {
        credentials_.clear();
        sessions_.remove_auth_state();
        logger_.log("auth", "logged out");
    }

} // namespace clouddrive::client
