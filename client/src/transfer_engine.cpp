#include "clouddrive/client/transfer_engine.hpp"

#include <algorithm>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    std::vector<ChunkRange> plan_chunks(std::uint64_t offset, std::uint64_t total, std::uint64_t chunk_size)
    {
        std::vector<ChunkRange> chunks;
        if (chunk_size == 0)
        {
            return chunks;
        }
        for (auto start = offset; start < total; start += chunk_size)
        {
            chunks.push_back(ChunkRange{.start = start, .end = std::min(start + chunk_size, total) - 1});
        }
        return chunks;
    }

    TransferEngine::TransferEngine(RequestExecutor &api, RequestExecutor &storage, SessionStore &sessions,
                                   std::string graph_root, TransferOptions options, Logger logger)
        : api_(api),
          storage_(storage),
          sessions_(sessions),
          graph_root_(std::move(graph_root)),
          options_(options),
          logger_(std::move(logger))
    {
        if (options_.granularity == 0 || options_.chunk_size == 0 || options_.chunk_size % options_.granularity != 0)
        {
            throw ApiError(ErrorCode::InvalidRequest, "chunk size " + std::to_string(options_.chunk_size) +
                                                          " is not a multiple of " +
                                                          std::to_string(options_.granularity));
        }
        if (!graph_root_.empty() && graph_root_.back() != '/')
        {
            graph_root_.push_back('/');
        }
    }

    std::string TransferEngine::session_key(const std::filesystem::path &local_path)
    {
        return std::filesystem::absolute(local_path).lexically_normal().string();
    }

    TransferEngine::Invocation TransferEngine::begin_invocation() const
    {
        Invocation invocation;
        if (options_.time_limit)
        {
            invocation.deadline = std::chrono::steady_clock::now() + *options_.time_limit;
        }
        return invocation;
    }

    std::string TransferEngine::item_url(const std::string &remote_path) const
    {
        return graph_root_ + protocol::build_path_url(remote_path);
    }

    void TransferEngine::checkpoint(TransferSession &session, std::uint64_t offset)
    {
        session.completed_bytes = offset;
        sessions_.save(session);
    }

    void TransferEngine::checkpoint_after_failure(TransferSession &session, std::uint64_t offset)
    {
        try
        {
            checkpoint(session, offset);
        }
        catch (const ApiError &error)
        {
            logger_.warn("session", "checkpoint at byte ", offset, " not written: ", error.what());
        }
    }

    std::optional<protocol::UploadSessionInfo> TransferEngine::upload_status(const std::filesystem::path &local_path,
                                                                             const std::string &remote_path)
    {
        const auto key = session_key(local_path);
        const auto session = sessions_.load(key, remote_path);
        if (!session || session->upload_url.empty())
        {
            return std::nullopt;
        }

        HttpRequest request;
        request.method = HttpMethod::Get;
        request.url = session->upload_url;
        request.expected_status = {200};
        request.deadline = begin_invocation().deadline;
        const auto response = storage_.execute(request);
        try
        {
            return parse_json_body(response).get<protocol::UploadSessionInfo>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ApiError(ErrorCode::DecodingFailed, std::string("invalid upload session status: ") + ex.what());
        }
    }

    bool TransferEngine::cancel_upload(const std::filesystem::path &local_path, const std::string &remote_path)
    {
        const auto key = session_key(local_path);
        const auto session = sessions_.load(key, remote_path);
        if (!session || session->upload_url.empty())
        {
            return false;
        }

        HttpRequest request;
        request.method = HttpMethod::Delete;
        request.url = session->upload_url;
        request.expected_status = {204};
        request.deadline = begin_invocation().deadline;
        try
        {
            storage_.execute(request);
        }
        catch (const ApiError &error)
        {
            if (error.code() != ErrorCode::ResourceNotFound)
            {
                throw ApiError::wrap(error, "cancelling upload of '" + key + "'");
            }
            logger_.log("upload", "server no longer knows the session for ", key);
        }
        sessions_.remove(key, remote_path);
        logger_.log("upload", "cancelled upload session for ", key, " -> ", remote_path);
        return true;
    }

} // namespace clouddrive::client
