#include "clouddrive/client/transfer_engine.hpp"

#include <system_error>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr const char *kResumeHint = "re-run the same command to resume";

        bool session_is_gone(ErrorCode code) noexcept
        {
            return code == ErrorCode::ResourceNotFound || code == ErrorCode::AccessDenied ||
                   code == ErrorCode::ReauthRequired || code == ErrorCode::InvalidRequest;
        }

        std::string content_range(const ChunkRange &chunk, std::uint64_t total)
        {
            return "bytes " + std::to_string(chunk.start) + "-" + std::to_string(chunk.end) + "/" +
                   std::to_string(total);
        }

    } // namespace

    TransferSession TransferEngine::create_upload_session(const std::string &key, const std::string &remote_path,
                                                          std::uint64_t total, const Invocation &invocation)
    {
        HttpRequest request;
        request.method = HttpMethod::Post;
        request.url = item_url(remote_path) + ":/createUploadSession";
        request.set_header("Content-Type", "application/json");
        request.body = std::make_shared<BufferBody>(std::string{});
        request.expected_status = {200};
        request.deadline = invocation.deadline;

        protocol::UploadSessionInfo info;
        try
        {
            info = parse_json_body(api_.execute(request)).get<protocol::UploadSessionInfo>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid upload session response: ") + ex.what());
        }
        catch (const ApiError &error)
        {
            throw ApiError::wrap(error, "creating upload session for '" + remote_path + "'");
        }
        if (info.upload_url.empty())
        {
            throw ApiError(ErrorCode::DecodingFailed, "upload session response has no uploadUrl");
        }

        TransferSession session;
        session.local_path = key;
        session.remote_path = remote_path;
        session.upload_url = info.upload_url;
        session.expiration = info.expiration;
        session.total_bytes = total;
        sessions_.save(session);
        logger_.log("upload", "created upload session for ", key, " -> ", remote_path);
        return session;
    }

    std::optional<protocol::UploadSessionInfo> TransferEngine::query_upload_session(const std::string &upload_url,
                                                                                    const Invocation &invocation)
    {
        HttpRequest request;
        request.method = HttpMethod::Get;
        request.url = upload_url;
        request.expected_status = {200};
        request.deadline = invocation.deadline;
        try
        {
            return parse_json_body(storage_.execute(request)).get<protocol::UploadSessionInfo>();
        }
        catch (const ApiError &error)
        {
            if (session_is_gone(error.code()))
            {
                logger_.log("upload", "recorded upload session is no longer valid: ", error.what());
                return std::nullopt;
            }
            throw;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid upload session status: ") + ex.what());
        }
    }

    TransferResult TransferEngine::upload_empty_file(const std::string &key, const std::string &remote_path,
                                                     const Invocation &invocation)
    {
        // Upload sessions reject zero-length content.
        HttpRequest request;
        request.method = HttpMethod::Put;
        request.url = item_url(remote_path) + ":/content";
        request.set_header("Content-Type", "application/octet-stream");
        request.body = std::make_shared<BufferBody>(std::string{});
        request.expected_status = {200, 201};
        request.deadline = invocation.deadline;
        try
        {
            api_.execute(request);
        }
        catch (const ApiError &error)
        {
            throw ApiError::wrap(error, "uploading empty file '" + key + "'");
        }
        sessions_.remove(key, remote_path);
        logger_.log("upload", "uploaded empty file ", key, " -> ", remote_path);
        return TransferResult{.status = TransferStatus::Completed, .transferred_bytes = 0, .total_bytes = 0};
    }

    TransferResult TransferEngine::upload(const std::filesystem::path &local_path, const std::string &remote_path,
                                          const TransferHooks &hooks)
    {
        const auto key = session_key(local_path);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            throw ApiError(ErrorCode::InvalidRequest, "local file '" + local_path.string() + "' does not exist");
        }
        const auto total = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            throw ApiError(ErrorCode::Internal, "cannot stat '" + local_path.string() + "': " + ec.message());
        }

        const auto invocation = begin_invocation();
        if (total == 0)
        {
            return upload_empty_file(key, remote_path, invocation);
        }

        auto session = sessions_.load(key, remote_path);
        std::uint64_t offset = 0;
        bool resumed = false;
        if (session && (session->upload_url.empty() || (session->total_bytes != 0 && session->total_bytes != total)))
        {
            logger_.log("upload", "recorded session for ", key, " does not match the local file, starting over");
            sessions_.remove(key, remote_path);
            session.reset();
        }
        if (session)
        {
            // The server decides which bytes it still needs.
            const auto status = query_upload_session(session->upload_url, invocation);
            const auto next = status ? protocol::first_expected_offset(*status) : std::nullopt;
            if (next && *next < total)
            {
                offset = *next;
                resumed = true;
                if (status->expiration)
                {
                    session->expiration = status->expiration;
                }
                session->total_bytes = total;
                logger_.log("upload", "resuming ", key, " at byte ", offset, " (last checkpoint ",
                            session->completed_bytes, ")");
            }
            else
            {
                sessions_.remove(key, remote_path);
                session.reset();
            }
        }
        if (!session)
        {
            session = create_upload_session(key, remote_path, total, invocation);
        }

        return send_chunks(local_path, *session, offset, resumed, hooks, invocation);
    }

    TransferResult TransferEngine::send_chunks(const std::filesystem::path &local_path, TransferSession &session,
                                               std::uint64_t offset, bool resumed, const TransferHooks &hooks,
                                               const Invocation &invocation)
    {
        const auto total = session.total_bytes;
        if (hooks.on_progress)
        {
            hooks.on_progress(offset, total);
        }

        for (const auto &chunk : plan_chunks(offset, total, options_.chunk_size))
        {
            if (hooks.should_stop && hooks.should_stop())
            {
                checkpoint(session, chunk.start);
                logger_.log("upload", "interrupted ", session.local_path, " at byte ", chunk.start);
                return TransferResult{.status = TransferStatus::Interrupted,
                                      .transferred_bytes = chunk.start,
                                      .total_bytes = total,
                                      .resumed = resumed};
            }

            HttpRequest request;
            request.method = HttpMethod::Put;
            request.url = session.upload_url;
            request.set_header("Content-Length", std::to_string(chunk.length()));
            request.set_header("Content-Range", content_range(chunk, total));
            request.body = std::make_shared<FileRangeBody>(local_path, chunk.start, chunk.length());
            request.expected_status = {200, 201, 202};
            request.deadline = invocation.deadline;

            HttpResponse response;
            try
            {
                response = storage_.execute(request);
            }
            catch (const ApiError &error)
            {
                checkpoint_after_failure(session, chunk.start);
                throw ApiError::wrap(error, "uploading bytes " + std::to_string(chunk.start) + "-" +
                                                std::to_string(chunk.end) + " of '" + session.local_path +
                                                "' failed, " + kResumeHint);
            }

            if (response.status == 200 || response.status == 201)
            {
                sessions_.remove(session.local_path, session.remote_path);
                if (hooks.on_progress)
                {
                    hooks.on_progress(total, total);
                }
                logger_.log("upload", "completed ", session.local_path, " -> ", session.remote_path);
                return TransferResult{.status = TransferStatus::Completed,
                                      .transferred_bytes = total,
                                      .total_bytes = total,
                                      .resumed = resumed};
            }

            checkpoint(session, chunk.end + 1);
            if (hooks.on_progress)
            {
                hooks.on_progress(chunk.end + 1, total);
            }
        }

        throw ApiError(ErrorCode::OperationFailed, "server accepted every byte of '" + session.local_path +
                                                       "' but did not confirm completion, " + kResumeHint);
    }

} // namespace clouddrive::client
