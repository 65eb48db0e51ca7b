#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/file_lock.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    struct Credential
    {
        std::string access_token{};
        std::string refresh_token{};
        // nullopt never expires.
        std::optional<protocol::TimePoint> expiry{};

        bool empty() const noexcept { return access_token.empty() && refresh_token.empty(); }
    };

    void to_json(nlohmann::json &json, const Credential &credential);
    void from_json(const nlohmann::json &json, Credential &credential);

    class CredentialStore
    {
    public:
        virtual ~CredentialStore() = default;

        virtual std::optional<Credential> load() = 0;

        // Invoked whenever a new access token has been obtained.
        virtual void persist(const Credential &credential) = 0;

        virtual void clear() = 0;
    };

    // Keeps the credential inside <config_dir>/config.json next to the HTTP settings.
    class FileCredentialStore : public CredentialStore
    {
    public:
        FileCredentialStore(std::filesystem::path config_dir, Logger logger);

        std::optional<Credential> load() override;
        void persist(const Credential &credential) override;
        void clear() override;

        // Applies the optional "http" section of config.json over defaults.
        HttpSettings load_http_settings(HttpSettings defaults) const;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        nlohmann::json read_document() const;
        void write_document(const nlohmann::json &document);
        FileLock lock_document();

        std::filesystem::path config_dir_;
        std::filesystem::path path_;
        Logger logger_;
    };

} // namespace clouddrive::client
