/**
 * CloudDrive - Resumable chunked upload and download.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/http.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/request_executor.hpp"
#include "clouddrive/client/session_store.hpp"
#include "clouddrive/protocol.hpp"

namespace clouddrive::client
{

    enum class TransferStatus
    {
        Completed,
        Interrupted
    };

    struct TransferResult
    {
        TransferStatus status{TransferStatus::Completed};
        std::uint64_t transferred_bytes{};
        std::uint64_t total_bytes{};
        bool resumed{};
    };

    // Inclusive byte range [start, end].
    struct ChunkRange
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t length() const noexcept { return end - start + 1; }
        bool operator==(const ChunkRange &) const = default;
    };

    // Contiguous chunks covering [offset, total).
    std::vector<ChunkRange> plan_chunks(std::uint64_t offset, std::uint64_t total, std::uint64_t chunk_size);

    using ProgressCallback = std::function<void(std::uint64_t transferred, std::uint64_t total)>;
    using CancelCheck = std::function<bool()>;

    struct TransferOptions
    {
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::uint64_t granularity{kChunkGranularity};
        std::optional<std::chrono::seconds> time_limit{};
    };

    struct TransferHooks
    {
        ProgressCallback on_progress{};
        // Polled before every chunk; true stops the transfer with the session kept.
        CancelCheck should_stop{};
    };

    class TransferEngine
    {
    public:
        // `api` talks to the REST API with credentials; `storage` sends to pre-authorized
        // session URLs without an Authorization header.
        TransferEngine(RequestExecutor &api, RequestExecutor &storage, SessionStore &sessions, std::string graph_root,
                       TransferOptions options, Logger logger);

        TransferResult upload(const std::filesystem::path &local_path, const std::string &remote_path,
                              const TransferHooks &hooks = {});

        TransferResult download(const std::string &remote_path, const std::filesystem::path &local_path,
                                const TransferHooks &hooks = {});

        // Server-side state of a recorded upload; nullopt when nothing is recorded.
        std::optional<protocol::UploadSessionInfo> upload_status(const std::filesystem::path &local_path,
                                                                 const std::string &remote_path);

        // Deletes the server session and the local record. False when nothing is recorded.
        bool cancel_upload(const std::filesystem::path &local_path, const std::string &remote_path);

        static std::string session_key(const std::filesystem::path &local_path);

    private:
        struct Invocation
        {
            std::optional<Deadline> deadline;
        };

        Invocation begin_invocation() const;
        std::string item_url(const std::string &remote_path) const;
        void checkpoint(TransferSession &session, std::uint64_t offset);
        // Keeps the original failure visible when the checkpoint itself fails.
        void checkpoint_after_failure(TransferSession &session, std::uint64_t offset);

        // Upload steps (transfer_upload.cpp).
        TransferSession create_upload_session(const std::string &key, const std::string &remote_path,
                                              std::uint64_t total, const Invocation &invocation);
        std::optional<protocol::UploadSessionInfo> query_upload_session(const std::string &upload_url,
                                                                        const Invocation &invocation);
        TransferResult upload_empty_file(const std::string &key, const std::string &remote_path,
                                         const Invocation &invocation);
        TransferResult send_chunks(const std::filesystem::path &local_path, TransferSession &session,
                                   std::uint64_t offset, bool resumed, const TransferHooks &hooks,
                                   const Invocation &invocation);

        // Download steps (transfer_download.cpp).
        protocol::DriveItem fetch_item(const std::string &remote_path, const Invocation &invocation);
        TransferResult receive_chunks(const std::filesystem::path &local_path, const std::filesystem::path &part_path,
                                      TransferSession &session, bool resumed, const TransferHooks &hooks,
                                      const Invocation &invocation);

        RequestExecutor &api_;
        RequestExecutor &storage_;
        SessionStore &sessions_;
        std::string graph_root_;
        TransferOptions options_;
        Logger logger_;
    };

} // namespace clouddrive::client
