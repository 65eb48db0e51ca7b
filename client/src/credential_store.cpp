#include "clouddrive/client/credential_store.hpp"

#include "clouddrive/client/atomic_file.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {
        constexpr const char *kConfigFileName = "config.json";

        // Zero instant written by tools that do not know the expiry.
        bool is_zero_timestamp(const std::string &text)
        {
            return text.empty() || text.rfind("0001-01-01", 0) == 0;
        }

        std::chrono::milliseconds read_millis(const nlohmann::json &section, const char *key,
                                              std::chrono::milliseconds fallback)
        {
            if (auto it = section.find(key); it != section.end() && it->is_number_integer())
            {
                const auto value = it->get<std::int64_t>();
                if (value > 0)
                {
                    return std::chrono::milliseconds(value);
                }
            }
            return fallback;
        }
    } // namespace

    void to_json(nlohmann::json &json, const Credential &credential)
    {
        json = {
            {"access_token", credential.access_token},
            {"token_type", "Bearer"},
            {"refresh_token", credential.refresh_token},
        };
        if (credential.expiry)
        {
            json["expiry"] = protocol::format_timestamp(*credential.expiry);
        }
    }

    void from_json(const nlohmann::json &json, Credential &credential)
    {
        credential.access_token = json.value("access_token", std::string{});
        credential.refresh_token = json.value("refresh_token", std::string{});
        credential.expiry.reset();
        const auto expiry = json.value("expiry", std::string{});
        if (!is_zero_timestamp(expiry))
        {
            credential.expiry = protocol::parse_timestamp(expiry);
            if (!credential.expiry)
            {
                throw ApiError(ErrorCode::DecodingFailed, "invalid token expiry '" + expiry + "'");
            }
        }
    }

    FileCredentialStore::FileCredentialStore(std::filesystem::path config_dir, Logger logger)
        : config_dir_(std::move(config_dir)),
          path_(config_dir_ / kConfigFileName),
          logger_(std::move(logger)) {}

    nlohmann::json FileCredentialStore::read_document() const
    {
        const auto content = read_file_if_exists(path_);
        if (!content || content->empty())
        {
            return nlohmann::json::object();
        }
        auto document = nlohmann::json::parse(*content, nullptr, false);
        if (document.is_discarded() || !document.is_object())
        {
            throw ApiError(ErrorCode::DecodingFailed, "configuration file " + path_.string() + " is not valid JSON");
        }
        return document;
    }

    void FileCredentialStore::write_document(const nlohmann::json &document)
    {
        ensure_directory(config_dir_);
        write_private_file(path_, document.dump(2));
    }

    std::optional<Credential> FileCredentialStore::load()
    {
        const auto document = read_document();
        const auto it = document.find("token");
        if (it == document.end() || !it->is_object())
        {
            return std::nullopt;
        }
        auto credential = it->get<Credential>();
        if (credential.empty())
        {
            return std::nullopt;
        }
        return credential;
    }

    FileLock FileCredentialStore::lock_document()
    {
        ensure_directory(config_dir_);
        auto lock_file = path_;
        lock_file += ".lock";
        FileLock lock;
        lock.lock(lock_file);
        return lock;
    }

    void FileCredentialStore::persist(const Credential &credential)
    {
        // Read-modify-write of config.json is serialized across processes.
        const auto lock = lock_document();
        auto document = read_document();
        document["token"] = credential;
        write_document(document);
        logger_.log("credentials", "stored refreshed credential in ", path_.string());
    }

    void FileCredentialStore::clear()
    {
        const auto lock = lock_document();
        auto document = read_document();
        if (!document.contains("token"))
        {
            return;
        }
        document.erase("token");
        write_document(document);
        logger_.log("credentials", "cleared stored credential");
    }

    HttpSettings FileCredentialStore::load_http_settings(HttpSettings defaults) const
    {
        const auto document = read_document();
        const auto it = document.find("http");
        if (it == document.end() || !it->is_object())
        {
            return defaults;
        }
        const auto &section = *it;
        defaults.timeout = read_millis(section, "timeout_ms", defaults.timeout);
        defaults.retry.base_delay = read_millis(section, "retry_delay_ms", defaults.retry.base_delay);
        defaults.retry.max_delay = read_millis(section, "max_retry_delay_ms", defaults.retry.max_delay);
        if (auto attempts = section.find("retry_attempts"); attempts != section.end() && attempts->is_number_integer())
        {
            const auto value = attempts->get<int>();
            if (value > 0)
            {
                defaults.retry.max_attempts = value;
            }
        }
        return defaults;
    }

} // namespace clouddrive::client
