#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>

#include "clouddrive/client/file_lock.hpp"
#include "clouddrive/client/session_store.hpp"
#include "clouddrive/error_codes.hpp"
#include "fake_transport.hpp"

using namespace clouddrive;
using namespace clouddrive::client;
using clouddrive::testing::TempDir;

namespace
{

    TransferSession sample_session(protocol::TimePoint expiration)
    {
        TransferSession session;
        session.local_path = "/home/user/report.pdf";
        session.remote_path = "/Documents/report.pdf";
        session.upload_url = "https://upload.example.com/session/abc?sig=secret";
        session.expiration = expiration;
        session.completed_bytes = 640000;
        session.total_bytes = 800000;
        return session;
    }

    void test_round_trip()
    {
        TempDir dir("clouddrive_store_roundtrip");
        const auto now = protocol::Clock::now();
        SessionStore store(dir.path(), Logger{}, [now]
                           { return now; });

        const auto session = sample_session(now + std::chrono::hours(24));
        store.save(session);

        const auto record = store.path(session.local_path, session.remote_path);
        assert(record.parent_path() == dir.path() / "sessions");
        assert(record.extension() == ".json");
        assert(record.stem().string().size() == 64);
        assert(std::filesystem::exists(record));

        const auto loaded = store.load(session.local_path, session.remote_path);
        assert(loaded);
        assert(loaded->local_path == session.local_path);
        assert(loaded->remote_path == session.remote_path);
        assert(loaded->upload_url == session.upload_url);
        assert(loaded->completed_bytes == 640000);
        assert(loaded->total_bytes == 800000);
        assert(loaded->expiration);
        // Persisted with second precision.
        const auto drift = *loaded->expiration - *session.expiration;
        assert(drift < std::chrono::seconds(1) && drift > -std::chrono::seconds(1));

        // A different remote path is a different session.
        assert(!store.load(session.local_path, "/Other/report.pdf"));
    }

    void test_expired_session_is_removed()
    {
        TempDir dir("clouddrive_store_expiry");
        auto now = protocol::Clock::now();
        SessionStore store(dir.path(), Logger{}, [&now]
                           { return now; });

        const auto session = sample_session(now + std::chrono::minutes(5));
        store.save(session);
        const auto record = store.path(session.local_path, session.remote_path);

        now += std::chrono::minutes(10);
        assert(!store.load(session.local_path, session.remote_path));
        assert(!std::filesystem::exists(record));
    }

    void test_expiry_cleanup_holds_lock()
    {
        TempDir dir("clouddrive_store_expiry_lock");
        const auto now = protocol::Clock::now();
        SessionStore other(dir.path(), Logger{});
        const auto fresh = sample_session(now + std::chrono::hours(2));

        // The second instance tries to write while the first is deciding the record expired.
        bool other_locked_out = false;
        SessionStore store(dir.path(), Logger{}, [&]
                           {
            try
            {
                other.save(fresh);
            }
            catch (const ApiError &error)
            {
                other_locked_out = error.code() == ErrorCode::Locked;
            }
            return now; });

        const auto expired = sample_session(now - std::chrono::minutes(1));
        other.save(expired);
        assert(!store.load(expired.local_path, expired.remote_path));
        assert(other_locked_out);
        assert(!std::filesystem::exists(store.path(expired.local_path, expired.remote_path)));

        other.save(fresh);
        const auto loaded = other.load(fresh.local_path, fresh.remote_path);
        assert(loaded);
        assert(loaded->expiration > now);
    }

    void test_remove_is_idempotent()
    {
        TempDir dir("clouddrive_store_remove");
        SessionStore store(dir.path(), Logger{});

        const auto session = sample_session(protocol::Clock::now() + std::chrono::hours(1));
        store.remove(session.local_path, session.remote_path);
        store.save(session);
        store.remove(session.local_path, session.remote_path);
        store.remove(session.local_path, session.remote_path);
        assert(!std::filesystem::exists(store.path(session.local_path, session.remote_path)));
        assert(!store.load(session.local_path, session.remote_path));
    }

    void test_lock_contention()
    {
        TempDir dir("clouddrive_store_lock");
        SessionStore store(dir.path(), Logger{});

        const auto session = sample_session(protocol::Clock::now() + std::chrono::hours(1));
        store.save(session);
        const auto record = store.path(session.local_path, session.remote_path);
        const auto before = testing::read_file(record);

        FileLock other;
        assert(other.try_lock(SessionStore::lock_path(record)));

        auto changed = session;
        changed.completed_bytes = 800000;
        bool locked = false;
        try
        {
            store.save(changed);
        }
        catch (const ApiError &error)
        {
            locked = error.code() == ErrorCode::Locked;
            assert(std::string(error.what()).find("another instance may be active") != std::string::npos);
        }
        assert(locked);
        assert(testing::read_file(record) == before);

        locked = false;
        try
        {
            static_cast<void>(store.load(session.local_path, session.remote_path));
        }
        catch (const ApiError &error)
        {
            locked = error.code() == ErrorCode::Locked;
        }
        assert(locked);

        other.unlock();
        store.save(changed);
        assert(store.load(session.local_path, session.remote_path)->completed_bytes == 800000);
    }

    void test_corrupted_record()
    {
        TempDir dir("clouddrive_store_corrupt");
        SessionStore store(dir.path(), Logger{});
        const auto record = store.path("/a", "/b");
        testing::write_file(record, "{not json");

        bool decoding_failed = false;
        try
        {
            static_cast<void>(store.load("/a", "/b"));
        }
        catch (const ApiError &error)
        {
            decoding_failed = error.code() == ErrorCode::DecodingFailed;
        }
        assert(decoding_failed);
    }

    void test_auth_state_lifecycle()
    {
        TempDir dir("clouddrive_store_auth");
        SessionStore store(dir.path(), Logger{});
        assert(!store.load_auth_state());

        PendingAuthState state;
        state.device_code = "device-123";
        state.user_code = "ABCD-EFGH";
        state.verification_uri = "https://microsoft.com/devicelogin";
        state.interval = 5;
        store.save_auth_state(state);

        assert(store.auth_state_path() == dir.path() / "sessions" / "auth_session.json");
        const auto loaded = store.load_auth_state();
        assert(loaded);
        assert(loaded->device_code == "device-123");
        assert(loaded->user_code == "ABCD-EFGH");
        assert(std::filesystem::exists(SessionStore::lock_path(store.auth_state_path())));

        {
            FileLock other;
            assert(other.try_lock(SessionStore::lock_path(store.auth_state_path())));
            bool locked = false;
            try
            {
                store.remove_auth_state();
            }
            catch (const ApiError &error)
            {
                locked = error.code() == ErrorCode::Locked;
            }
            assert(locked);
            assert(std::filesystem::exists(store.auth_state_path()));
            assert(std::filesystem::exists(SessionStore::lock_path(store.auth_state_path())));
        }

        store.remove_auth_state();
        assert(!std::filesystem::exists(store.auth_state_path()));
        assert(!std::filesystem::exists(SessionStore::lock_path(store.auth_state_path())));
        store.remove_auth_state();
    }

    void test_lock_file_replaced_after_unlink()
    {
        TempDir dir("clouddrive_store_relink");
        const auto lock_file = dir.path() / "record.json.lock";

        FileLock holder;
        assert(holder.try_lock(lock_file));
        std::filesystem::remove(lock_file);

        // A new lock file is a new lock.
        FileLock next;
        assert(next.try_lock(lock_file));
        assert(std::filesystem::exists(lock_file));

        FileLock third;
        assert(!third.try_lock(lock_file));
    }

} // namespace

void run_session_store_tests()
{
    test_round_trip();
    test_expired_session_is_removed();
    test_expiry_cleanup_holds_lock();
    test_remove_is_idempotent();
    test_lock_contention();
    test_corrupted_record();
    test_auth_state_lifecycle();
    test_lock_file_replaced_after_unlink();
}
