#include "clouddrive/client/authenticated_transport.hpp"

#include <utility>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    AuthenticatedTransport::AuthenticatedTransport(HttpTransport &inner, std::optional<Credential> initial,
                                                   RefreshSettings settings, PersistCallback on_new_credential,
                                                   Logger logger, NowFunction now)
        : inner_(inner),
          settings_(std::move(settings)),
          on_new_credential_(std::move(on_new_credential)),
          logger_(std::move(logger)),
          now_(std::move(now)),
          current_(std::move(initial))
    {
        if (current_)
        {
            last_seen_access_token_ = current_->access_token;
        }
    }

    bool AuthenticatedTransport::needs_refresh(const Credential &credential) const
    {
        if (invalidated_ || credential.access_token.empty())
        {
            return true;
        }
        if (!credential.expiry)
        {
            return false;
        }
        return *credential.expiry - settings_.expiry_skew <= now_();
    }

    Credential AuthenticatedTransport::obtain_credential(std::optional<Deadline> deadline)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->empty())
        {
            throw ApiError(ErrorCode::ReauthRequired, "not logged in");
        }
        if (needs_refresh(*current_))
        {
            current_ = refresh(*current_, deadline);
            invalidated_ = false;
        }
        if (current_->access_token != last_seen_access_token_)
        {
            if (on_new_credential_)
            {
                try
                {
                    on_new_credential_(*current_);
                }
                catch (const std::exception &ex)
                {
                    logger_.warn("auth", "persisting refreshed credential failed: ", ex.what());
                    throw ApiError(ErrorCode::OperationFailed,
                                   std::string("failed to persist refreshed credential: ") + ex.what());
                }
            }
            last_seen_access_token_ = current_->access_token;
        }
        return *current_;
    }

    Credential AuthenticatedTransport::refresh(const Credential &current, std::optional<Deadline> deadline)
    {
        if (current.refresh_token.empty())
        {
            throw ApiError(ErrorCode::ReauthRequired, "access token expired and no refresh token is available");
        }
        logger_.log("auth", "refreshing access token");

        auto request = make_form_post(settings_.token_url, {
                                                               {"grant_type", "refresh_token"},
                                                               {"refresh_token", current.refresh_token},
                                                               {"client_id", settings_.client_id},
                                                               {"scope", settings_.scopes},
                                                           });
        request.deadline = deadline;
        const auto response = inner_.perform(request);
        if (response.status == 429 || response.status >= 500)
        {
            throw ApiError(ErrorCode::RetryLater,
                           "token endpoint answered " + std::to_string(response.status));
        }
        if (response.status != 200)
        {
            std::string detail = "HTTP " + std::to_string(response.status);
            if (const auto error = protocol::parse_service_error(response.body))
            {
                detail = error->code;
            }
            logger_.warn("auth", "token refresh rejected: ", detail);
            throw ApiError(ErrorCode::ReauthRequired, "token refresh rejected (" + detail + ")");
        }

        protocol::TokenResponse token;
        try
        {
            token = nlohmann::json::parse(response.body).get<protocol::TokenResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid token response: ") + ex.what());
        }

        Credential refreshed;
        refreshed.access_token = token.access_token;
        refreshed.refresh_token = token.refresh_token.empty() ? current.refresh_token : token.refresh_token;
        if (token.expires_in > 0)
        {
            refreshed.expiry = now_() + std::chrono::seconds(token.expires_in);
        }
        return refreshed;
    }

    void AuthenticatedTransport::invalidate(const std::string &access_token)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && current_->access_token == access_token)
        {
            invalidated_ = true;
        }
    }

    HttpResponse AuthenticatedTransport::perform(HttpRequest &request)
    {
        const auto credential = obtain_credential(request.deadline);
        request.set_header("Authorization", "Bearer " + credential.access_token);
        auto response = inner_.perform(request);
        if (response.status == 401)
        {
            logger_.log("auth", "server rejected access token, refreshing before the next attempt");
            invalidate(credential.access_token);
        }
        return response;
    }

} // namespace clouddrive::client
