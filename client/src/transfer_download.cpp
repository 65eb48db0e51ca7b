#include "clouddrive/client/transfer_engine.hpp"

#include <fstream>
#include <system_error>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {

        constexpr const char *kResumeHint = "re-run the same command to resume";

        // Pre-authorized download URLs expire; the API hands out a fresh one.
        bool download_url_expired(ErrorCode code) noexcept
        {
            return code == ErrorCode::ResourceNotFound || code == ErrorCode::AccessDenied ||
                   code == ErrorCode::ReauthRequired;
        }

        std::uint64_t partial_size(const std::filesystem::path &part_path)
        {
            std::error_code ec;
            if (!std::filesystem::exists(part_path, ec))
            {
                return 0;
            }
            const auto size = std::filesystem::file_size(part_path, ec);
            if (ec)
            {
                throw ApiError(ErrorCode::Internal, "cannot stat '" + part_path.string() + "': " + ec.message());
            }
            return size;
        }

        void truncate_partial(const std::filesystem::path &part_path)
        {
            std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ApiError(ErrorCode::Internal, "cannot create '" + part_path.string() + "'");
            }
        }

        std::filesystem::path part_path_for(const std::filesystem::path &local_path)
        {
            auto part = local_path;
            part += ".part";
            return part;
        }

    } // namespace

    protocol::DriveItem TransferEngine::fetch_item(const std::string &remote_path, const Invocation &invocation)
    {
        HttpRequest request;
        request.method = HttpMethod::Get;
        request.url = item_url(remote_path);
        request.expected_status = {200};
        request.deadline = invocation.deadline;
        try
        {
            auto item = parse_json_body(api_.execute(request)).get<protocol::DriveItem>();
            if (item.is_folder)
            {
                throw ApiError(ErrorCode::InvalidRequest, "'" + remote_path + "' is a folder");
            }
            if (!item.download_url || item.download_url->empty())
            {
                throw ApiError(ErrorCode::OperationFailed, "no download URL available for '" + remote_path + "'");
            }
            return item;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid item metadata: ") + ex.what());
        }
        catch (const ApiError &error)
        {
            throw ApiError::wrap(error, "looking up '" + remote_path + "'");
        }
    }

    TransferResult TransferEngine::download(const std::string &remote_path, const std::filesystem::path &local_path,
                                            const TransferHooks &hooks)
    {
        const auto key = session_key(local_path);
        const auto part_path = part_path_for(local_path);
        const auto invocation = begin_invocation();

        auto session = sessions_.load(key, remote_path);
        bool resumed = false;
        if (session && session->download_url.empty())
        {
            sessions_.remove(key, remote_path);
            session.reset();
        }
        if (session)
        {
            resumed = partial_size(part_path) > 0;
            logger_.log("download", "resuming ", remote_path, " into ", key, " (last checkpoint ",
                        session->completed_bytes, ")");
        }
        else
        {
            const auto item = fetch_item(remote_path, invocation);
            TransferSession fresh;
            fresh.local_path = key;
            fresh.remote_path = remote_path;
            fresh.download_url = *item.download_url;
            fresh.total_bytes = item.size;
            truncate_partial(part_path);
            sessions_.save(fresh);
            session = std::move(fresh);
            logger_.log("download", "starting ", remote_path, " (", item.size, " bytes) into ", key);
        }

        return receive_chunks(local_path, part_path, *session, resumed, hooks, invocation);
    }

    TransferResult TransferEngine::receive_chunks(const std::filesystem::path &local_path,
                                                  const std::filesystem::path &part_path, TransferSession &session,
                                                  bool resumed, const TransferHooks &hooks,
                                                  const Invocation &invocation)
    {
        // The partial file, not the checkpoint, is the resume offset.
        auto offset = partial_size(part_path);
        if (offset > session.total_bytes)
        {
            logger_.warn("download", "partial file is larger than the remote file, starting over");
            truncate_partial(part_path);
            offset = 0;
        }
        if (offset == 0 && !std::filesystem::exists(part_path))
        {
            truncate_partial(part_path);
        }
        if (hooks.on_progress)
        {
            hooks.on_progress(offset, session.total_bytes);
        }

        bool url_refreshed = false;
        while (offset < session.total_bytes)
        {
            if (hooks.should_stop && hooks.should_stop())
            {
                checkpoint(session, offset);
                logger_.log("download", "interrupted ", session.remote_path, " at byte ", offset);
                return TransferResult{.status = TransferStatus::Interrupted,
                                      .transferred_bytes = offset,
                                      .total_bytes = session.total_bytes,
                                      .resumed = resumed};
            }

            const auto chunk = plan_chunks(offset, session.total_bytes, options_.chunk_size).front();
            HttpRequest request;
            request.method = HttpMethod::Get;
            request.url = session.download_url;
            request.set_header("Range", "bytes=" + std::to_string(chunk.start) + "-" + std::to_string(chunk.end));
            request.expected_status = {206, 200};
            request.deadline = invocation.deadline;

            HttpResponse response;
            try
            {
                response = storage_.execute(request);
            }
            catch (const ApiError &error)
            {
                if (!url_refreshed && download_url_expired(error.code()))
                {
                    url_refreshed = true;
                    logger_.log("download", "download URL rejected, requesting a fresh one");
                    const auto item = fetch_item(session.remote_path, invocation);
                    session.download_url = *item.download_url;
                    if (item.size != session.total_bytes)
                    {
                        logger_.log("download", "remote file changed size, starting over");
                        session.total_bytes = item.size;
                        truncate_partial(part_path);
                        offset = 0;
                    }
                    checkpoint(session, offset);
                    continue;
                }
                checkpoint_after_failure(session, offset);
                throw ApiError::wrap(error, "downloading bytes " + std::to_string(chunk.start) + "-" +
                                                std::to_string(chunk.end) + " of '" + session.remote_path +
                                                "' failed, " + kResumeHint);
            }

            std::string_view payload(response.body);
            if (response.status == 200)
            {
                // Range ignored: only usable when the whole file came back from the start.
                if (offset != 0 || payload.size() != session.total_bytes)
                {
                    checkpoint_after_failure(session, offset);
                    throw ApiError(ErrorCode::OperationFailed, "server ignored the byte range for '" +
                                                                   session.remote_path + "', " + kResumeHint);
                }
            }
            else if (payload.size() != chunk.length())
            {
                checkpoint_after_failure(session, offset);
                throw ApiError(ErrorCode::NetworkFailed, "short read of bytes " + std::to_string(chunk.start) + "-" +
                                                             std::to_string(chunk.end) + " of '" +
                                                             session.remote_path + "', " + kResumeHint);
            }

            {
                std::ofstream out(part_path, std::ios::binary | std::ios::app);
                out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
                out.flush();
                if (!out)
                {
                    throw ApiError(ErrorCode::Internal, "failed writing '" + part_path.string() + "'");
                }
            }
            offset += payload.size();
            checkpoint(session, offset);
            if (hooks.on_progress)
            {
                hooks.on_progress(offset, session.total_bytes);
            }
        }

        std::error_code ec;
        std::filesystem::rename(part_path, local_path, ec);
        if (ec)
        {
            throw ApiError(ErrorCode::Internal, "cannot move '" + part_path.string() + "' to '" +
                                                    local_path.string() + "': " + ec.message());
        }
        sessions_.remove(session.local_path, session.remote_path);
        logger_.log("download", "completed ", session.remote_path, " -> ", session.local_path);
        return TransferResult{.status = TransferStatus::Completed,
                              .transferred_bytes = session.total_bytes,
                              .total_bytes = session.total_bytes,
                              .resumed = resumed};
    }

} // namespace clouddrive::client
