#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "clouddrive/client/credential_store.hpp"
#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"

namespace clouddrive::client
{

    // Called with every access token value not seen before.
    using PersistCallback = std::function<void(const Credential &)>;

    struct RefreshSettings
    {
        std::string token_url;
        std::string client_id;
        std::string scopes;
        std::chrono::seconds expiry_skew{10};
    };

    // Decorates a transport with bearer authentication and transparent token refresh.
    //
    // The refresh and the persist-on-change bookkeeping run under one mutex, so concurrent
    // callers observe a single refresh and a single persist per token transition. When the
    // callback throws, the call fails with OperationFailed and the next call persists again.
    class AuthenticatedTransport : public HttpTransport
    {
    public:
        using NowFunction = std::function<protocol::TimePoint()>;

        AuthenticatedTransport(HttpTransport &inner, std::optional<Credential> initial, RefreshSettings settings,
                               PersistCallback on_new_credential, Logger logger,
                               NowFunction now = [] { return protocol::Clock::now(); });

        // A refresh made on the way runs under the given deadline.
        Credential obtain_credential(std::optional<Deadline> deadline = std::nullopt);

        HttpResponse perform(HttpRequest &request) override;

        // Forces a refresh on the next call if token is still the current one.
        void invalidate(const std::string &access_token);

    private:
        bool needs_refresh(const Credential &credential) const;
        Credential refresh(const Credential &current, std::optional<Deadline> deadline);

        HttpTransport &inner_;
        RefreshSettings settings_;
        PersistCallback on_new_credential_;
        Logger logger_;
        NowFunction now_;

        std::mutex mutex_;
        std::optional<Credential> current_;
        std::string last_seen_access_token_;
        bool invalidated_{false};
    };

} // namespace clouddrive::client
