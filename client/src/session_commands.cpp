#include "clouddrive/client/session.hpp"

#include <filesystem>
#include <iostream>

#include "clouddrive/client/interrupt_guard.hpp"
#include "clouddrive/error_codes.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr int kExitInterrupted = 130;

        void print_login_prompt(const std::string &verification_uri, const std::string &user_code)
        {
            std::cout << "Please go to " << verification_uri << " and enter code " << user_code << std::endl;
        }

        TransferHooks console_hooks(const InterruptGuard &guard, const std::string &verb)
        {
            TransferHooks hooks;
            hooks.on_progress = [verb](std::uint64_t transferred, std::uint64_t total)
            {
                std::cout << '\r' << verb << ' ' << transferred << " / " << total << " bytes" << std::flush;
            };
            hooks.should_stop = [&guard]
            { return guard.interrupted(); };
            return hooks;
        }

    } // namespace

    int ClientSession::handle_login()
    {
        const auto instructions = initiate_login();
        switch (instructions.outcome)
        {
        case LoginStart::AlreadyLoggedIn:
            std::cout << "OK" << std::endl;
            std::cout << "Already logged in. Run 'clouddrive logout' to switch accounts." << std::endl;
            return 0;
        case LoginStart::Started:
            std::cout << "OK" << std::endl;
            if (!instructions.message.empty())
            {
                std::cout << instructions.message << std::endl;
            }
            else
            {
                print_login_prompt(instructions.verification_uri, instructions.user_code);
            }
            std::cout << "The code expires in " << instructions.expires_in / 60
                      << " minutes. Run any command after approving to finish the login." << std::endl;
            return 0;
        case LoginStart::AlreadyPending:
            break;
        }

        const auto check = advance_login();
        switch (check.state)
        {
        case LoginProgress::Authenticated:
            std::cout << "OK" << std::endl;
            std::cout << "Logged in." << std::endl;
            return 0;
        case LoginProgress::Pending:
            std::cout << "OK" << std::endl;
            std::cout << "Login is still pending." << std::endl;
            print_login_prompt(check.pending.verification_uri, check.pending.user_code);
            return 0;
        case LoginProgress::Failed:
            std::cout << "ERROR: " << to_string(check.failure) << std::endl;
            std::cout << "Login failed: " << check.reason << std::endl;
            std::cout << "Run 'clouddrive login' again to start over." << std::endl;
            return 1;
        case LoginProgress::NoSession:
            break;
        }
        std::cout << "ERROR: " << to_string(ErrorCode::ReauthRequired) << std::endl;
        std::cout << "The pending login disappeared, run 'clouddrive login' again." << std::endl;
        return 1;
    }

    int ClientSession::handle_logout()
    {
        logout();
        std::cout << "OK" << std::endl;
        return 0;
    }

    int ClientSession::handle_status()
    {
        std::cout << "OK" << std::endl;
        if (const auto credential = credentials_.load())
        {
            std::cout << "Logged in";
            if (credential->expiry)
            {
                std::cout << ", access token valid until " << protocol::format_timestamp(*credential->expiry);
            }
            std::cout << '.' << std::endl;
            return 0;
        }
        if (const auto pending = sessions_.load_auth_state())
        {
            std::cout << "Login pending." << std::endl;
            print_login_prompt(pending->verification_uri, pending->user_code);
            return 0;
        }
        std::cout << "Not logged in." << std::endl;
        return 0;
    }

    int ClientSession::handle_upload()
    {
        const std::filesystem::path local_path = config_.arguments.at(0);
        const auto remote_path = resolve_upload_target(local_path);
        logger_.log("upload", local_path.string(), " -> ", remote_path);

        InterruptGuard guard("re-run the same command to resume.", logger_);
        const auto result = start_or_resume_upload(local_path, remote_path, console_hooks(guard, "Uploaded"));
        return report_transfer(result, "Uploaded");
    }

    int ClientSession::handle_download()
    {
        const auto &remote_path = config_.arguments.at(0);
        std::filesystem::path local_path;
        if (config_.arguments.size() > 1)
        {
            local_path = config_.arguments[1];
        }
        const auto file_name = std::filesystem::path(remote_path).filename();
        if (local_path.empty() || std::filesystem::is_directory(local_path))
        {
            if (file_name.empty())
            {
                throw ApiError(ErrorCode::InvalidRequest, "cannot derive a local file name from '" + remote_path + "'");
            }
            local_path /= file_name;
        }
        logger_.log("download", remote_path, " -> ", local_path.string());

        InterruptGuard guard("re-run the same command to resume.", logger_);
        const auto result = start_or_resume_download(remote_path, local_path, console_hooks(guard, "Downloaded"));
        return report_transfer(result, "Downloaded");
    }

    int ClientSession::handle_upload_status()
    {
        const std::filesystem::path local_path = config_.arguments.at(0);
        const auto remote_path = resolve_upload_target(local_path);
        const auto info = upload_status(local_path, remote_path);
        std::cout << "OK" << std::endl;
        if (!info)
        {
            std::cout << "No upload recorded for " << local_path.string() << " -> " << remote_path << std::endl;
            return 0;
        }
        std::cout << "Remote: " << remote_path << std::endl;
        if (info->expiration)
        {
            std::cout << "Expires: " << protocol::format_timestamp(*info->expiration) << std::endl;
        }
        if (const auto offset = protocol::first_expected_offset(*info))
        {
            std::cout << "Server has: " << *offset << " bytes" << std::endl;
        }
        for (const auto &range : info->next_expected_ranges)
        {
            std::cout << "Expected range: " << range << std::endl;
        }
        return 0;
    }

    int ClientSession::handle_cancel_upload()
    {
        const std::filesystem::path local_path = config_.arguments.at(0);
        const auto remote_path = resolve_upload_target(local_path);
        if (!cancel_upload(local_path, remote_path))
        {
            std::cout << "OK" << std::endl;
            std::cout << "No upload recorded for " << local_path.string() << " -> " << remote_path << std::endl;
            return 0;
        }
        std::cout << "OK" << std::endl;
        std::cout << "Upload session cancelled." << std::endl;
        return 0;
    }

    int ClientSession::report_transfer(const TransferResult &result, const std::string &verb)
    {
        if (result.transferred_bytes > 0)
        {
            std::cout << std::endl;
        }
        if (result.status == TransferStatus::Interrupted)
        {
            std::cout << "ERROR: interrupted" << std::endl;
            std::cout << verb << ' ' << result.transferred_bytes << " of " << result.total_bytes
                      << " bytes; re-run the same command to resume." << std::endl;
            logger_.log("transfer", "interrupted at ", result.transferred_bytes, "/", result.total_bytes);
            return kExitInterrupted;
        }
        std::cout << "OK" << std::endl;
        std::cout << verb << ' ' << result.total_bytes << " bytes" << (result.resumed ? " (resumed)" : "")
                  << std::endl;
        return 0;
    }

} // namespace clouddrive::client
