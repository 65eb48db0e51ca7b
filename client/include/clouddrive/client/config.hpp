#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clouddrive::client
{

    inline constexpr std::string_view kDefaultClientId = "57caa7f2-c679-440c-8de2-f8ec86510722";
    inline constexpr std::string_view kDefaultScopes = "offline_access files.readwrite.all user.read email openid profile";

    // Upload chunks must be a multiple of 320 KiB.
    inline constexpr std::uint64_t kChunkGranularity = 320 * 1024;
    inline constexpr std::uint64_t kDefaultChunkSize = 5 * kChunkGranularity;

    // Service addresses are injected, never read from globals.
    struct Endpoints
    {
        std::string token_url{"https://login.microsoftonline.com/common/oauth2/v2.0/token"};
        std::string device_code_url{"https://login.microsoftonline.com/common/oauth2/v2.0/devicecode"};
        std::string graph_root{"https://graph.microsoft.com/v1.0/"};
    };

    struct RetryPolicy
    {
        int max_attempts{3};
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds max_delay{10000};
    };

    struct HttpSettings
    {
        std::chrono::milliseconds timeout{30000};
        RetryPolicy retry{};
    };

    enum class Command
    {
        Help,
        Login,
        Logout,
        Status,
        Upload,
        Download,
        UploadStatus,
        CancelUpload
    };

    std::string_view to_string(Command command) noexcept;

    struct ClientConfig
    {
        Command command{Command::Help};
        std::vector<std::string> arguments;
        std::filesystem::path config_dir;
        std::optional<std::filesystem::path> log_path;
        bool debug{};
        std::string client_id{kDefaultClientId};
        std::string scopes{kDefaultScopes};
        Endpoints endpoints{};
        HttpSettings http{};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::uint64_t chunk_granularity{kChunkGranularity};
        // Upper bound for a whole transfer invocation.
        std::optional<std::chrono::seconds> time_limit;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    // CLOUDDRIVE_CONFIG_DIR, then $XDG_CONFIG_HOME/clouddrive, then $HOME/.config/clouddrive.
    std::filesystem::path default_config_dir();

} // namespace clouddrive::client
