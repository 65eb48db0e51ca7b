#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "clouddrive/client/request_executor.hpp"
#include "clouddrive/client/session_store.hpp"
#include "clouddrive/client/transfer_engine.hpp"
#include "clouddrive/error_codes.hpp"
#include "fake_transport.hpp"

using namespace clouddrive;
using namespace clouddrive::client;
using clouddrive::testing::FakeTransport;
using clouddrive::testing::RecordedRequest;
using clouddrive::testing::RecordingSleep;
using clouddrive::testing::TempDir;

namespace
{

    constexpr const char *kGraphRoot = "https://graph.example.com/v1.0";
    constexpr const char *kUploadUrl = "https://upload.example.com/session/s1?sig=abc";
    constexpr std::uint64_t kChunk = 320000;
    constexpr std::uint64_t kFileSize = 800000;

    RetryPolicy fast_policy()
    {
        return RetryPolicy{.max_attempts = 3,
                           .base_delay = std::chrono::milliseconds(10),
                           .max_delay = std::chrono::milliseconds(100)};
    }

    std::string future_timestamp()
    {
        return protocol::format_timestamp(protocol::Clock::now() + std::chrono::hours(24));
    }

    // Engine with separate scripted transports for the API and the pre-authorized URLs.
    struct Harness
    {
        explicit Harness(const std::string &name, std::uint64_t chunk_size = kChunk)
            : dir(name),
              sessions(dir.path() / "config", Logger{}),
              api(api_transport, fast_policy(), Logger{}, RecordingSleep{}),
              storage(storage_transport, fast_policy(), Logger{}, RecordingSleep{}),
              engine(api, storage, sessions, kGraphRoot,
                     TransferOptions{.chunk_size = chunk_size, .granularity = 64000}, Logger{})
        {
        }

        std::filesystem::path local(const std::string &file_name) const { return dir.path() / file_name; }

        TransferSession seed_upload(const std::filesystem::path &local_path, const std::string &remote_path,
                                    std::uint64_t completed)
        {
            TransferSession session;
            session.local_path = TransferEngine::session_key(local_path);
            session.remote_path = remote_path;
            session.upload_url = kUploadUrl;
            session.expiration = protocol::Clock::now() + std::chrono::hours(24);
            session.completed_bytes = completed;
            session.total_bytes = kFileSize;
            sessions.save(session);
            return session;
        }

        TempDir dir;
        FakeTransport api_transport;
        FakeTransport storage_transport;
        SessionStore sessions;
        RequestExecutor api;
        RequestExecutor storage;
        TransferEngine engine;
    };

    template <typename Fn>
    std::optional<ApiError> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const ApiError &error)
        {
            return error;
        }
        return std::nullopt;
    }

    // Serves "Range: bytes=s-e" requests out of content.
    FakeTransport::Handler range_server(const std::string &content, std::string expected_url)
    {
        return [content, expected_url](const RecordedRequest &request)
        {
            if (request.url != expected_url)
            {
                return client::HttpResponse{.status = 403};
            }
            const auto range = request.header("Range");
            assert(range && range->rfind("bytes=", 0) == 0);
            const auto dash = range->find('-');
            const auto start = std::stoull(range->substr(6, dash - 6));
            const auto end = std::min<std::uint64_t>(std::stoull(range->substr(dash + 1)), content.size() - 1);
            return client::HttpResponse{.status = 206, .body = content.substr(start, end - start + 1)};
        };
    }

    void test_plan_chunks()
    {
        const auto chunks = plan_chunks(0, kFileSize, kChunk);
        assert(chunks.size() == 3);
        assert((chunks[0] == ChunkRange{0, 319999}));
        assert((chunks[1] == ChunkRange{320000, 639999}));
        assert((chunks[2] == ChunkRange{640000, 799999}));
        assert(chunks[2].length() == 160000);

        const auto tail = plan_chunks(640000, kFileSize, kChunk);
        assert(tail.size() == 1 && tail[0].start == 640000 && tail[0].end == 799999);
        assert(plan_chunks(kFileSize, kFileSize, kChunk).empty());
    }

    void test_chunk_size_must_match_granularity()
    {
        FakeTransport transport;
        RequestExecutor executor(transport, fast_policy(), Logger{}, RecordingSleep{});
        TempDir dir("clouddrive_engine_granularity");
        SessionStore sessions(dir.path(), Logger{});
        const auto error = error_of([&]
                                    { TransferEngine engine(executor, executor, sessions, kGraphRoot,
                                                            TransferOptions{.chunk_size = 100000, .granularity = 64000},
                                                            Logger{}); });
        assert(error && error->code() == ErrorCode::InvalidRequest);
    }

    void test_fresh_upload_sends_three_chunks()
    {
        Harness h("clouddrive_engine_upload");
        const auto content = testing::pattern_bytes(kFileSize);
        const auto file = h.local("big.bin");
        testing::write_file(file, content);

        h.api_transport.push(200, R"({"uploadUrl":")" + std::string(kUploadUrl) + R"(","expirationDateTime":")" +
                                      future_timestamp() + R"(","nextExpectedRanges":["0-"]})");
        h.storage_transport.push(202, R"({"nextExpectedRanges":["320000-"]})");
        h.storage_transport.push(202, R"({"nextExpectedRanges":["640000-"]})");
        h.storage_transport.push(201, R"({"id":"item-1","size":800000})");

        std::vector<std::uint64_t> progress;
        TransferHooks hooks;
        hooks.on_progress = [&progress](std::uint64_t done, std::uint64_t total)
        {
            assert(total == kFileSize);
            progress.push_back(done);
        };
        const auto result = h.engine.upload(file, "/Documents/big.bin", hooks);

        assert(result.status == TransferStatus::Completed);
        assert(result.total_bytes == kFileSize);
        assert(!result.resumed);

        const auto api_requests = h.api_transport.requests();
        assert(api_requests.size() == 1);
        assert(api_requests[0].method == HttpMethod::Post);
        assert(api_requests[0].url ==
               "https://graph.example.com/v1.0/me/drive/root:/Documents/big.bin:/createUploadSession");

        const auto puts = h.storage_transport.requests();
        assert(puts.size() == 3);
        const std::vector<std::string> ranges{"bytes 0-319999/800000", "bytes 320000-639999/800000",
                                              "bytes 640000-799999/800000"};
        const std::vector<std::uint64_t> starts{0, 320000, 640000};
        for (std::size_t i = 0; i < puts.size(); ++i)
        {
            assert(puts[i].method == HttpMethod::Put);
            assert(puts[i].url == kUploadUrl);
            assert(puts[i].header("Content-Range") == ranges[i]);
            assert(!puts[i].header("Authorization"));
            assert(puts[i].body == content.substr(starts[i], puts[i].body.size()));
            assert(puts[i].header("Content-Length") == std::to_string(puts[i].body.size()));
        }
        assert(puts[2].body.size() == 160000);
        assert((progress == std::vector<std::uint64_t>{0, 320000, 640000, kFileSize}));
        assert(!h.sessions.load(TransferEngine::session_key(file), "/Documents/big.bin"));
    }

    void test_resume_asks_server_first()
    {
        Harness h("clouddrive_engine_resume");
        const auto content = testing::pattern_bytes(kFileSize);
        const auto file = h.local("big.bin");
        testing::write_file(file, content);
        // The checkpoint lags behind the server, which already holds two chunks.
        h.seed_upload(file, "/Documents/big.bin", 320000);

        h.storage_transport.push(200, R"({"expirationDateTime":")" + future_timestamp() +
                                          R"(","nextExpectedRanges":["640000-799999"]})");
        h.storage_transport.push(201, R"({"id":"item-1"})");

        const auto result = h.engine.upload(file, "/Documents/big.bin");
        assert(result.status == TransferStatus::Completed);
        assert(result.resumed);
        assert(h.api_transport.count() == 0);

        const auto requests = h.storage_transport.requests();
        assert(requests.size() == 2);
        assert(requests[0].method == HttpMethod::Get);
        assert(requests[0].url == kUploadUrl);
        assert(requests[1].method == HttpMethod::Put);
        assert(requests[1].header("Content-Range") == "bytes 640000-799999/800000");
        assert(requests[1].body == content.substr(640000));
    }

    void test_stale_session_starts_over()
    {
        Harness h("clouddrive_engine_stale");
        const auto file = h.local("big.bin");
        testing::write_file(file, testing::pattern_bytes(kFileSize));
        h.seed_upload(file, "/big.bin", 320000);

        h.storage_transport.push(404, R"({"error":{"code":"itemNotFound"}})");
        h.api_transport.push(200, R"({"uploadUrl":"https://upload.example.com/session/s2"})");
        h.storage_transport.push(202);
        h.storage_transport.push(202);
        h.storage_transport.push(200);

        const auto result = h.engine.upload(file, "/big.bin");
        assert(result.status == TransferStatus::Completed);
        assert(!result.resumed);
        const auto requests = h.storage_transport.requests();
        assert(requests.size() == 4);
        assert(requests[1].url == "https://upload.example.com/session/s2");
        assert(requests[1].header("Content-Range") == "bytes 0-319999/800000");
    }

    void test_interrupted_upload_keeps_session()
    {
        Harness h("clouddrive_engine_interrupt");
        const auto file = h.local("big.bin");
        testing::write_file(file, testing::pattern_bytes(kFileSize));

        h.api_transport.push(200, R"({"uploadUrl":")" + std::string(kUploadUrl) + R"("})");
        h.storage_transport.push(202);

        TransferHooks hooks;
        hooks.should_stop = [&h]
        { return h.storage_transport.count() >= 1; };
        const auto result = h.engine.upload(file, "/big.bin", hooks);

        assert(result.status == TransferStatus::Interrupted);
        assert(result.transferred_bytes == 320000);
        assert(h.storage_transport.count() == 1);
        const auto record = h.sessions.load(TransferEngine::session_key(file), "/big.bin");
        assert(record);
        assert(record->upload_url == kUploadUrl);
        assert(record->completed_bytes == 320000);
        assert(record->total_bytes == kFileSize);
    }

    void test_failed_chunk_is_resumable()
    {
        Harness h("clouddrive_engine_failure");
        const auto file = h.local("big.bin");
        testing::write_file(file, testing::pattern_bytes(kFileSize));

        h.api_transport.push(200, R"({"uploadUrl":")" + std::string(kUploadUrl) + R"("})");
        h.storage_transport.push(202);
        h.storage_transport.push(503);
        h.storage_transport.push(503);
        h.storage_transport.push(503);

        const auto error = error_of([&]
                                    { h.engine.upload(file, "/big.bin"); });
        assert(error && error->code() == ErrorCode::RetryLater);
        assert(std::string(error->what()).find("re-run the same command to resume") != std::string::npos);
        assert(h.storage_transport.count() == 4);

        const auto record = h.sessions.load(TransferEngine::session_key(file), "/big.bin");
        assert(record && record->completed_bytes == 320000);
    }

    void test_empty_file_uses_simple_upload()
    {
        Harness h("clouddrive_engine_empty");
        const auto file = h.local("empty.txt");
        testing::write_file(file, "");
        h.api_transport.push(201, R"({"id":"item-0","size":0})");

        const auto result = h.engine.upload(file, "/notes/empty.txt");
        assert(result.status == TransferStatus::Completed);
        assert(result.total_bytes == 0);
        const auto requests = h.api_transport.requests();
        assert(requests.size() == 1);
        assert(requests[0].method == HttpMethod::Put);
        assert(requests[0].url == "https://graph.example.com/v1.0/me/drive/root:/notes/empty.txt:/content");
        assert(h.storage_transport.count() == 0);
    }

    void test_missing_local_file()
    {
        Harness h("clouddrive_engine_missing");
        const auto error = error_of([&]
                                    { h.engine.upload(h.local("nope.bin"), "/nope.bin"); });
        assert(error && error->code() == ErrorCode::InvalidRequest);
        assert(h.api_transport.count() == 0);
    }

    void test_status_and_cancel()
    {
        Harness h("clouddrive_engine_cancel");
        const auto file = h.local("big.bin");
        testing::write_file(file, testing::pattern_bytes(kFileSize));
        assert(!h.engine.upload_status(file, "/big.bin"));
        assert(!h.engine.cancel_upload(file, "/big.bin"));

        h.seed_upload(file, "/big.bin", 320000);
        h.storage_transport.push(200, R"({"nextExpectedRanges":["320000-"]})");
        const auto status = h.engine.upload_status(file, "/big.bin");
        assert(status && protocol::first_expected_offset(*status) == 320000u);

        h.storage_transport.push(204);
        assert(h.engine.cancel_upload(file, "/big.bin"));
        const auto requests = h.storage_transport.requests();
        assert(requests.back().method == HttpMethod::Delete);
        assert(requests.back().url == kUploadUrl);
        assert(!h.sessions.load(TransferEngine::session_key(file), "/big.bin"));

        // A session the server already forgot still clears the local record.
        h.seed_upload(file, "/big.bin", 0);
        h.storage_transport.push(404);
        assert(h.engine.cancel_upload(file, "/big.bin"));
        assert(!h.sessions.load(TransferEngine::session_key(file), "/big.bin"));
    }

    std::string item_json(std::uint64_t size, const std::string &download_url)
    {
        return R"({"id":"item-9","name":"movie.bin","size":)" + std::to_string(size) +
               R"(,"file":{},"@microsoft.graph.downloadUrl":")" + download_url + R"("})";
    }

    void test_fresh_download()
    {
        Harness h("clouddrive_engine_download");
        const auto content = testing::pattern_bytes(kFileSize);
        const std::string url = "https://download.example.com/f/1?tempauth=x";
        h.api_transport.push(200, item_json(kFileSize, url));
        h.storage_transport.set_fallback(range_server(content, url));

        const auto target = h.local("movie.bin");
        const auto result = h.engine.download("/Videos/movie.bin", target);
        assert(result.status == TransferStatus::Completed);
        assert(!result.resumed);
        assert(testing::read_file(target) == content);
        assert(!std::filesystem::exists(h.local("movie.bin.part")));
        assert(!h.sessions.load(TransferEngine::session_key(target), "/Videos/movie.bin"));

        const auto requests = h.storage_transport.requests();
        assert(requests.size() == 3);
        assert(requests[0].header("Range") == "bytes=0-319999");
        assert(requests[2].header("Range") == "bytes=640000-799999");
        assert(h.api_transport.requests()[0].url == "https://graph.example.com/v1.0/me/drive/root:/Videos/movie.bin");
    }

    void test_download_resumes_from_partial_file()
    {
        Harness h("clouddrive_engine_download_resume");
        const auto content = testing::pattern_bytes(kFileSize);
        const std::string url = "https://download.example.com/f/1?tempauth=x";
        const auto target = h.local("movie.bin");
        testing::write_file(h.local("movie.bin.part"), content.substr(0, 320000));

        TransferSession session;
        session.local_path = TransferEngine::session_key(target);
        session.remote_path = "/Videos/movie.bin";
        session.download_url = url;
        session.completed_bytes = 0;
        session.total_bytes = kFileSize;
        h.sessions.save(session);

        h.storage_transport.set_fallback(range_server(content, url));
        const auto result = h.engine.download("/Videos/movie.bin", target);
        assert(result.status == TransferStatus::Completed);
        assert(result.resumed);
        assert(h.api_transport.count() == 0);
        assert(h.storage_transport.requests().front().header("Range") == "bytes=320000-639999");
        assert(testing::read_file(target) == content);
    }

    void test_download_refreshes_expired_url()
    {
        Harness h("clouddrive_engine_download_refresh");
        const auto content = testing::pattern_bytes(kFileSize);
        const auto target = h.local("movie.bin");
        testing::write_file(h.local("movie.bin.part"), content.substr(0, 640000));

        TransferSession session;
        session.local_path = TransferEngine::session_key(target);
        session.remote_path = "/Videos/movie.bin";
        session.download_url = "https://download.example.com/old";
        session.total_bytes = kFileSize;
        h.sessions.save(session);

        const std::string fresh_url = "https://download.example.com/new";
        h.api_transport.push(200, item_json(kFileSize, fresh_url));
        h.storage_transport.set_fallback(range_server(content, fresh_url));

        const auto result = h.engine.download("/Videos/movie.bin", target);
        assert(result.status == TransferStatus::Completed);
        const auto requests = h.storage_transport.requests();
        assert(requests.size() == 2);
        assert(requests[0].url == "https://download.example.com/old");
        assert(requests[1].url == fresh_url);
        assert(requests[1].header("Range") == "bytes=640000-799999");
        assert(testing::read_file(target) == content);
    }

    void test_download_rejects_folder()
    {
        Harness h("clouddrive_engine_download_folder");
        h.api_transport.push(200, R"({"id":"dir","name":"Videos","folder":{"childCount":3}})");
        const auto error = error_of([&]
                                    { h.engine.download("/Videos", h.local("Videos")); });
        assert(error && error->code() == ErrorCode::InvalidRequest);
        assert(h.storage_transport.count() == 0);
    }

} // namespace

void run_transfer_engine_tests()
{
    test_plan_chunks();
    test_chunk_size_must_match_granularity();
    test_fresh_upload_sends_three_chunks();
    test_resume_asks_server_first();
    test_stale_session_starts_over();
    test_interrupted_upload_keeps_session();
    test_failed_chunk_is_resumable();
    test_empty_file_uses_simple_upload();
    test_missing_local_file();
    test_status_and_cancel();
    test_fresh_download();
    test_download_resumes_from_partial_file();
    test_download_refreshes_expired_url();
    test_download_rejects_folder();
}
