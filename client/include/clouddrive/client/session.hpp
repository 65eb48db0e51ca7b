#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "clouddrive/client/authenticated_transport.hpp"
#include "clouddrive/client/config.hpp"
#include "clouddrive/client/credential_store.hpp"
#include "clouddrive/client/device_auth.hpp"
#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/request_executor.hpp"
#include "clouddrive/client/session_store.hpp"
#include "clouddrive/client/transfer_engine.hpp"

namespace clouddrive::client
{

    class ClientSession
    {
    public:
        // Talks to the service through libcurl.
        ClientSession(ClientConfig config, Logger logger);
        // Uses the given transport; it must outlive the session.
        ClientSession(ClientConfig config, Logger logger, HttpTransport &transport, SleepFunction sleep = {});

        // Executes config.command; returns the process exit status.
        int run();

        TransferResult start_or_resume_upload(const std::filesystem::path &local_path, const std::string &remote_path,
                                              const TransferHooks &hooks = {});
        TransferResult start_or_resume_download(const std::string &remote_path,
                                                const std::filesystem::path &local_path,
                                                const TransferHooks &hooks = {});
        std::optional<protocol::UploadSessionInfo> upload_status(const std::filesystem::path &local_path,
                                                                 const std::string &remote_path);
        bool cancel_upload(const std::filesystem::path &local_path, const std::string &remote_path);

        LoginInstructions initiate_login();
        LoginCheck advance_login();
        void logout();

    private:
        void ensure_authenticated();

        int dispatch();
        int handle_login();
        int handle_logout();
        int handle_status();
        int handle_upload();
        int handle_download();
        int handle_upload_status();
        int handle_cancel_upload();
        int report_transfer(const TransferResult &result, const std::string &verb);
        std::string resolve_upload_target(const std::filesystem::path &local_path) const;
        void print_help() const;

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<HttpTransport> owned_transport_;
        HttpTransport &transport_;
        SleepFunction sleep_;
        FileCredentialStore credentials_;
        SessionStore sessions_;
        DeviceAuthFlow auth_flow_;
        std::unique_ptr<AuthenticatedTransport> authenticated_;
        std::unique_ptr<RequestExecutor> api_;
        std::unique_ptr<RequestExecutor> storage_;
        std::unique_ptr<TransferEngine> engine_;
    };

} // namespace clouddrive::client
