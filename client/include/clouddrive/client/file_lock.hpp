#pragma once

#include <filesystem>

namespace clouddrive::client
{

    // Non-blocking exclusive advisory lock on a companion file (flock). Released on destruction.
    class FileLock
    {
    public:
        FileLock() = default;
        ~FileLock();

        FileLock(const FileLock &) = delete;
        FileLock &operator=(const FileLock &) = delete;
        FileLock(FileLock &&other) noexcept;
        FileLock &operator=(FileLock &&other) noexcept;

        // Creates the lock file if needed. Returns false when another holder has it;
        // throws ApiError(Internal) on any other failure.
        bool try_lock(const std::filesystem::path &path);

        // Waits until the lock is free.
        void lock(const std::filesystem::path &path);

        void unlock() noexcept;

        bool locked() const noexcept { return fd_ >= 0; }

    private:
        bool acquire(const std::filesystem::path &path, int operation);

        int fd_{-1};
    };

} // namespace clouddrive::client
