#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "clouddrive/client/file_lock.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    // Resumable transfer record, keyed by (local_path, remote_path).
    struct TransferSession
    {
        std::string local_path{};
        std::string remote_path{};
        std::string upload_url{};
        std::string download_url{};
        std::optional<protocol::TimePoint> expiration{};
        // Last checkpoint, informational only. The server (uploads) or the partial
        // file (downloads) decides where a resumed transfer continues.
        std::uint64_t completed_bytes{};
        std::uint64_t total_bytes{};
    };

    void to_json(nlohmann::json &json, const TransferSession &session);
    void from_json(const nlohmann::json &json, TransferSession &session);

    struct PendingAuthState
    {
        std::string device_code{};
        std::string verification_uri{};
        std::string user_code{};
        std::int64_t interval{5};
    };

    void to_json(nlohmann::json &json, const PendingAuthState &state);
    void from_json(const nlohmann::json &json, PendingAuthState &state);

    // Every read, write and delete of a record holds a non-blocking lock on "<record>.lock".
    // Contention raises ApiError(Locked) immediately.
    class SessionStore
    {
    public:
        using NowFunction = std::function<protocol::TimePoint()>;

        SessionStore(std::filesystem::path config_dir, Logger logger,
                     NowFunction now = [] { return protocol::Clock::now(); });

        std::filesystem::path path(std::string_view local_path, std::string_view remote_path) const;

        void save(const TransferSession &session);

        // nullopt when absent; an expired record is deleted and reported as absent.
        std::optional<TransferSession> load(std::string_view local_path, std::string_view remote_path);

        // Absent records are not an error.
        void remove(std::string_view local_path, std::string_view remote_path);

        std::filesystem::path auth_state_path() const;
        void save_auth_state(const PendingAuthState &state);
        std::optional<PendingAuthState> load_auth_state();
        // Removes the record and its lock file.
        void remove_auth_state();

        const std::filesystem::path &directory() const noexcept { return directory_; }

        static std::filesystem::path lock_path(const std::filesystem::path &record);

    private:
        FileLock acquire(const std::filesystem::path &record) const;
        void write_record(const std::filesystem::path &record, const nlohmann::json &document);
        static bool record_exists(const std::filesystem::path &record);
        std::optional<nlohmann::json> read_locked(const std::filesystem::path &record) const;
        void delete_locked(const std::filesystem::path &record) const;
        void remove_record(const std::filesystem::path &record) const;

        std::filesystem::path directory_;
        Logger logger_;
        NowFunction now_;
    };

} // namespace clouddrive::client
