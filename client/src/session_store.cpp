#include "clouddrive/client/session_store.hpp"

#include <system_error>

#include "clouddrive/client/atomic_file.hpp"
#include "clouddrive/crypto.hpp"
#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {
        constexpr const char *kSessionsDirectory = "sessions";
        constexpr const char *kAuthStateFile = "auth_session.json";

        std::optional<protocol::TimePoint> optional_timestamp(const nlohmann::json &json, const char *key)
        {
            const auto text = json.value(key, std::string{});
            if (text.empty() || text.rfind("0001-01-01", 0) == 0)
            {
                return std::nullopt;
            }
            auto parsed = protocol::parse_timestamp(text);
            if (!parsed)
            {
                throw ApiError(ErrorCode::DecodingFailed, std::string("invalid timestamp in ") + key + ": " + text);
            }
            return parsed;
        }
    } // namespace

    void to_json(nlohmann::json &json, const TransferSession &session)
    {
        json = {
            {"localPath", session.local_path},
            {"remotePath", session.remote_path},
            {"completedBytes", session.completed_bytes},
            {"totalBytes", session.total_bytes},
        };
        if (!session.upload_url.empty())
        {
            json["uploadUrl"] = session.upload_url;
        }
        if (!session.download_url.empty())
        {
            json["downloadUrl"] = session.download_url;
        }
        if (session.expiration)
        {
            json["expirationDateTime"] = protocol::format_timestamp(*session.expiration);
        }
    }

    void from_json(const nlohmann::json &json, TransferSession &session)
    {
        session.local_path = json.at("localPath").get<std::string>();
        session.remote_path = json.at("remotePath").get<std::string>();
        session.upload_url = json.value("uploadUrl", std::string{});
        session.download_url = json.value("downloadUrl", std::string{});
        session.expiration = optional_timestamp(json, "expirationDateTime");
        session.completed_bytes = json.value("completedBytes", std::uint64_t{0});
        session.total_bytes = json.value("totalBytes", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const PendingAuthState &state)
    {
        json = {
            {"device_code", state.device_code},
            {"verification_uri", state.verification_uri},
            {"user_code", state.user_code},
            {"interval", state.interval},
        };
    }

    void from_json(const nlohmann::json &json, PendingAuthState &state)
    {
        state.device_code = json.at("device_code").get<std::string>();
        state.verification_uri = json.value("verification_uri", std::string{});
        state.user_code = json.value("user_code", std::string{});
        state.interval = json.value("interval", std::int64_t{5});
    }

    SessionStore::SessionStore(std::filesystem::path config_dir, Logger logger, NowFunction now)
        : directory_(std::move(config_dir) / kSessionsDirectory),
          logger_(std::move(logger)),
          now_(std::move(now)) {}

    std::filesystem::path SessionStore::path(std::string_view local_path, std::string_view remote_path) const
    {
        std::string identity(local_path);
        identity.push_back(':');
        identity.append(remote_path);
        return directory_ / (crypto::sha256_hex(identity) + ".json");
    }

    std::filesystem::path SessionStore::lock_path(const std::filesystem::path &record)
    {
        auto lock = record;
        lock += ".lock";
        return lock;
    }

    std::filesystem::path SessionStore::auth_state_path() const
    {
        return directory_ / kAuthStateFile;
    }

    FileLock SessionStore::acquire(const std::filesystem::path &record) const
    {
        ensure_directory(directory_);
        FileLock lock;
        if (!lock.try_lock(lock_path(record)))
        {
            throw ApiError(ErrorCode::Locked, "could not acquire file lock for session '" + record.string() +
                                                  "', another instance may be active");
        }
        return lock;
    }

    void SessionStore::write_record(const std::filesystem::path &record, const nlohmann::json &document)
    {
        const auto lock = acquire(record);
        write_private_file(record, document.dump(2));
    }

    bool SessionStore::record_exists(const std::filesystem::path &record)
    {
        std::error_code ec;
        const bool exists = std::filesystem::exists(record, ec);
        if (ec)
        {
            throw ApiError(ErrorCode::Internal, "cannot stat " + record.string() + ": " + ec.message());
        }
        return exists;
    }

    // Caller holds the record lock.
    std::optional<nlohmann::json> SessionStore::read_locked(const std::filesystem::path &record) const
    {
        const auto content = read_file_if_exists(record);
        if (!content)
        {
            return std::nullopt;
        }
        auto document = nlohmann::json::parse(*content, nullptr, false);
        if (document.is_discarded() || !document.is_object())
        {
            throw ApiError(ErrorCode::DecodingFailed, "session file " + record.string() + " is corrupted");
        }
        return document;
    }

    // Caller holds the record lock.
    void SessionStore::delete_locked(const std::filesystem::path &record) const
    {
        std::error_code ec;
        std::filesystem::remove(record, ec);
        if (ec)
        {
            throw ApiError(ErrorCode::Internal, "cannot delete " + record.string() + ": " + ec.message());
        }
    }

    void SessionStore::remove_record(const std::filesystem::path &record) const
    {
        if (!record_exists(record))
        {
            return;
        }
        const auto lock = acquire(record);
        delete_locked(record);
    }

    void SessionStore::save(const TransferSession &session)
    {
        const auto record = path(session.local_path, session.remote_path);
        write_record(record, nlohmann::json(session));
        logger_.debug("session", "checkpoint ", record.filename().string(), " at ", session.completed_bytes, " bytes");
    }

    std::optional<TransferSession> SessionStore::load(std::string_view local_path, std::string_view remote_path)
    {
        const auto record = path(local_path, remote_path);
        if (!record_exists(record))
        {
            return std::nullopt;
        }

        // Read, expiry check and cleanup share one lock scope.
        const auto lock = acquire(record);
        const auto document = read_locked(record);
        if (!document)
        {
            return std::nullopt;
        }

        TransferSession session;
        try
        {
            session = document->get<TransferSession>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed,
                           "session file " + record.string() + " is corrupted: " + ex.what());
        }

        if (session.expiration && *session.expiration <= now_())
        {
            logger_.log("session", "discarding expired session ", record.filename().string());
            delete_locked(record);
            return std::nullopt;
        }
        return session;
    }

    void SessionStore::remove(std::string_view local_path, std::string_view remote_path)
    {
        remove_record(path(local_path, remote_path));
    }

    void SessionStore::save_auth_state(const PendingAuthState &state)
    {
        write_record(auth_state_path(), nlohmann::json(state));
    }

    std::optional<PendingAuthState> SessionStore::load_auth_state()
    {
        const auto record = auth_state_path();
        if (!record_exists(record))
        {
            return std::nullopt;
        }
        const auto lock = acquire(record);
        const auto document = read_locked(record);
        if (!document)
        {
            return std::nullopt;
        }
        try
        {
            return document->get<PendingAuthState>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("pending login state is corrupted: ") + ex.what());
        }
    }

    void SessionStore::remove_auth_state()
    {
        const auto record = auth_state_path();
        const auto lock_file = lock_path(record);
        if (!record_exists(record) && !record_exists(lock_file))
        {
            return;
        }
        // The lock file is unlinked while its lock is still held.
        const auto lock = acquire(record);
        delete_locked(record);
        delete_locked(lock_file);
    }

} // namespace clouddrive::client
