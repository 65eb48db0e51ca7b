#include "clouddrive/client/session.hpp"

#include <iostream>
#include <utility>

#include "clouddrive/client/curl_transport.hpp"
#include "clouddrive/error_codes.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    namespace
    {

        // config.json may override the HTTP timeout and retry policy.
        ClientConfig with_stored_settings(ClientConfig config, const Logger &logger)
        {
            FileCredentialStore store(config.config_dir, logger);
            config.http = store.load_http_settings(config.http);
            return config;
        }

        DeviceAuthSettings device_auth_settings(const ClientConfig &config)
        {
            return DeviceAuthSettings{
                .device_code_url = config.endpoints.device_code_url,
                .token_url = config.endpoints.token_url,
                .client_id = config.client_id,
                .scopes = config.scopes,
            };
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(with_stored_settings(std::move(config), logger)),
          logger_(std::move(logger)),
          owned_transport_(std::make_unique<CurlTransport>(config_.http.timeout, logger_)),
          transport_(*owned_transport_),
          credentials_(config_.config_dir, logger_),
          sessions_(config_.config_dir, logger_),
          auth_flow_(transport_, config_.http.retry, sessions_, credentials_, device_auth_settings(config_), logger_) {}

    ClientSession::ClientSession(ClientConfig config, Logger logger, HttpTransport &transport, SleepFunction sleep)
        : config_(with_stored_settings(std::move(config), logger)),
          logger_(std::move(logger)),
          transport_(transport),
          sleep_(std::move(sleep)),
          credentials_(config_.config_dir, logger_),
          sessions_(config_.config_dir, logger_),
          auth_flow_(transport_, config_.http.retry, sessions_, credentials_, device_auth_settings(config_), logger_,
                     sleep_) {}

    int ClientSession::run()
    {
        try
        {
            return dispatch();
        }
        catch (const ApiError &error)
        {
            std::cout << "ERROR: " << to_string(error.code()) << std::endl;
            std::cout << error.what() << std::endl;
            logger_.log("error", to_string(config_.command), " failed: ", to_string(error.code()), ": ", error.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cout << "ERROR: " << to_string(ErrorCode::Internal) << std::endl;
            std::cout << ex.what() << std::endl;
            logger_.log("error", to_string(config_.command), " failed: ", ex.what());
            return 1;
        }
    }

    void ClientSession::ensure_authenticated()
    {
        if (engine_)
        {
            return;
        }

        auto credential = credentials_.load();
        if (!credential)
        {
            // One token poll per invocation completes a login started earlier.
            const auto check = auth_flow_.advance();
            switch (check.state)
            {
            case LoginProgress::NoSession:
                throw ApiError(ErrorCode::ReauthRequired, "not logged in, run 'clouddrive login' first");
            case LoginProgress::Pending:
                throw ApiError(ErrorCode::AuthorizationPending,
                               "login is still pending. Please go to " + check.pending.verification_uri +
                                   " and enter code " + check.pending.user_code);
            case LoginProgress::Failed:
                throw ApiError(check.failure,
                               "login failed (" + check.reason + "), run 'clouddrive login' again");
            case LoginProgress::Authenticated:
                std::cout << "Login completed." << std::endl;
                credential = credentials_.load();
                break;
            }
            if (!credential)
            {
                throw ApiError(ErrorCode::Internal, "credential missing after login completed");
            }
        }

        authenticated_ = std::make_unique<AuthenticatedTransport>(
            transport_, std::move(credential),
            RefreshSettings{
                .token_url = config_.endpoints.token_url,
                .client_id = config_.client_id,
                .scopes = config_.scopes,
            },
            [this](const Credential &updated)
            { credentials_.persist(updated); },
            logger_);
        api_ = std::make_unique<RequestExecutor>(*authenticated_, config_.http.retry, logger_, sleep_);
        storage_ = std::make_unique<RequestExecutor>(transport_, config_.http.retry, logger_, sleep_);
        engine_ = std::make_unique<TransferEngine>(*api_, *storage_, sessions_, config_.endpoints.graph_root,
                                                   TransferOptions{
                                                       .chunk_size = config_.chunk_size,
                                                       .granularity = config_.chunk_granularity,
                                                       .time_limit = config_.time_limit,
                                                   },
                                                   logger_);
    }

    TransferResult ClientSession::start_or_resume_upload(const std::filesystem::path &local_path,
                                                         const std::string &remote_path, const TransferHooks &hooks)
    {
        ensure_authenticated();
        return engine_->upload(local_path, remote_path, hooks);
    }

    TransferResult ClientSession::start_or_resume_download(const std::string &remote_path,
                                                           const std::filesystem::path &local_path,
                                                           const TransferHooks &hooks)
    {
        ensure_authenticated();
        return engine_->download(remote_path, local_path, hooks);
    }

    std::optional<protocol::UploadSessionInfo> ClientSession::upload_status(const std::filesystem::path &local_path,
                                                                            const std::string &remote_path)
    {
        ensure_authenticated();
        return engine_->upload_status(local_path, remote_path);
    }

    bool ClientSession::cancel_upload(const std::filesystem::path &local_path, const std::string &remote_path)
    {
        ensure_authenticated();
        return engine_->cancel_upload(local_path, remote_path);
    }

    LoginInstructions ClientSession::initiate_login()
    {
        return auth_flow_.initiate();
    }

    LoginCheck ClientSession::advance_login()
    {
        return auth_flow_.advance();
    }

    void ClientSession::logout()
    {
        auth_flow_.logout();
        engine_.reset();
        storage_.reset();
        api_.reset();
        authenticated_.reset();
    }

    int ClientSession::dispatch()
    {
        logger_.log("cmd", to_string(config_.command), " (", config_.arguments.size(), " arguments)");
        switch (config_.command)
        {
        case Command::Help:
            print_help();
            return 0;
        case Command::Login:
            return handle_login();
        case Command::Logout:
            return handle_logout();
        case Command::Status:
            return handle_status();
        case Command::Upload:
            return handle_upload();
        case Command::Download:
            return handle_download();
        case Command::UploadStatus:
            return handle_upload_status();
        case Command::CancelUpload:
            return handle_cancel_upload();
        }
        std::cout << "ERROR: unsupported_command" << std::endl;
        return 1;
    }

    std::string ClientSession::resolve_upload_target(const std::filesystem::path &local_path) const
    {
        const std::string folder = config_.arguments.size() > 1 ? config_.arguments[1] : "/";
        return protocol::join_remote_path(folder, local_path.filename().string());
    }

    void ClientSession::print_help() const
    {
        std::cout << "Usage: clouddrive [flags] <command> [args]" << std::endl;
        std::cout << "\nCommands:" << std::endl;
        std::cout << "  help                                 Show this help" << std::endl;
        std::cout << "  login                                Start or complete a device code login" << std::endl;
        std::cout << "  logout                               Forget credentials and pending login" << std::endl;
        std::cout << "  status                               Show the login state" << std::endl;
        std::cout << "  upload <local> [remote-folder]       Upload or resume uploading a file" << std::endl;
        std::cout << "  download <remote> [local]            Download or resume downloading a file" << std::endl;
        std::cout << "  upload-status <local> [remote-folder] Show the server state of a recorded upload"
                  << std::endl;
        std::cout << "  cancel-upload <local> [remote-folder] Abandon a recorded upload" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --config-dir <dir>      Configuration and session directory\n";
        std::cout << "  --log <file>            Append logs to file\n";
        std::cout << "  --debug                 Verbose logging on stderr\n";
        std::cout << "  --chunk-size <bytes>    Chunk size, a multiple of " << kChunkGranularity << "\n";
        std::cout << "  --time-limit <seconds>  Give up a transfer after this long\n";
    }

} // namespace clouddrive::client
