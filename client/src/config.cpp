#include "clouddrive/client/config.hpp"

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace clouddrive::client
{

    namespace
    {

        constexpr std::array<std::pair<Command, std::string_view>, 8> kCommandNames{{
            {Command::Help, "help"},
            {Command::Login, "login"},
            {Command::Logout, "logout"},
            {Command::Status, "status"},
            {Command::Upload, "upload"},
            {Command::Download, "download"},
            {Command::UploadStatus, "upload-status"},
            {Command::CancelUpload, "cancel-upload"},
        }};

        std::optional<Command> command_from_string(std::string_view value) noexcept
        {
            for (const auto &[command, name] : kCommandNames)
            {
                if (name == value)
                {
                    return command;
                }
            }
            return std::nullopt;
        }

        std::string require_value(int argc, char *argv[], int &index, const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &[value, name] : kCommandNames)
        {
            if (value == command)
            {
                return name;
            }
        }
        return "unknown";
    }

    std::filesystem::path default_config_dir()
    {
        if (const char *explicit_dir = std::getenv("CLOUDDRIVE_CONFIG_DIR"); explicit_dir && *explicit_dir)
        {
            return std::filesystem::path(explicit_dir);
        }
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "clouddrive";
        }
#else
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        {
            return std::filesystem::path(xdg) / "clouddrive";
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".config" / "clouddrive";
        }
#endif
        return std::filesystem::current_path() / ".clouddrive";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        config.config_dir = default_config_dir();
        if (const char *client_id = std::getenv("CLOUDDRIVE_CLIENT_ID"); client_id && *client_id)
        {
            config.client_id = client_id;
        }

        bool have_command = false;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config-dir")
            {
                config.config_dir = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--debug")
            {
                config.debug = true;
            }
            else if (arg == "--chunk-size")
            {
                const auto value = std::stoull(require_value(argc, argv, index, arg));
                if (value == 0 || value % config.chunk_granularity != 0)
                {
                    throw std::runtime_error("--chunk-size must be a positive multiple of " +
                                             std::to_string(config.chunk_granularity));
                }
                config.chunk_size = value;
            }
            else if (arg == "--time-limit")
            {
                const auto seconds = std::stoll(require_value(argc, argv, index, arg));
                if (seconds <= 0)
                {
                    throw std::runtime_error("--time-limit must be a positive number of seconds");
                }
                config.time_limit = std::chrono::seconds(seconds);
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
                have_command = true;
            }
            else if (!have_command)
            {
                const auto command = command_from_string(arg);
                if (!command)
                {
                    throw std::runtime_error("Unknown command: " + arg);
                }
                config.command = *command;
                have_command = true;
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        switch (config.command)
        {
        case Command::Upload:
        case Command::UploadStatus:
        case Command::CancelUpload:
        case Command::Download:
            if (config.arguments.empty() || config.arguments.size() > 2)
            {
                throw std::runtime_error("Usage: clouddrive " + std::string(to_string(config.command)) +
                                         " <source> [destination]");
            }
            break;
        default:
            if (!config.arguments.empty())
            {
                throw std::runtime_error("Command " + std::string(to_string(config.command)) +
                                         " takes no arguments");
            }
            break;
        }

        return config;
    }

} // namespace clouddrive::client
