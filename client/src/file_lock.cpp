#include "clouddrive/client/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::client
{

    namespace
    {
        bool is_linked(int fd, const std::filesystem::path &path)
        {
            struct stat opened{};
            struct stat current{};
            if (::fstat(fd, &opened) != 0 || ::stat(path.c_str(), &current) != 0)
            {
                return false;
            }
            return opened.st_dev == current.st_dev && opened.st_ino == current.st_ino;
        }
    } // namespace

    FileLock::~FileLock()
    {
        unlock();
    }

    FileLock::FileLock(FileLock &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileLock &FileLock::operator=(FileLock &&other) noexcept
    {
        if (this != &other)
        {
            unlock();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    bool FileLock::try_lock(const std::filesystem::path &path)
    {
        return acquire(path, LOCK_EX | LOCK_NB);
    }

    void FileLock::lock(const std::filesystem::path &path)
    {
        static_cast<void>(acquire(path, LOCK_EX));
    }

    bool FileLock::acquire(const std::filesystem::path &path, int operation)
    {
        unlock();
        for (;;)
        {
            const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
            if (fd < 0)
            {
                throw ApiError(ErrorCode::Internal,
                               "cannot open lock file " + path.string() + ": " + std::strerror(errno));
            }
            if (::flock(fd, operation) != 0)
            {
                const int error = errno;
                ::close(fd);
                if (error == EWOULDBLOCK)
                {
                    return false;
                }
                if (error == EINTR)
                {
                    continue;
                }
                throw ApiError(ErrorCode::Internal, "cannot lock " + path.string() + ": " + std::strerror(error));
            }
            // The previous holder may have unlinked the file; the lock only counts on the linked inode.
            if (is_linked(fd, path))
            {
                fd_ = fd;
                return true;
            }
            ::close(fd);
        }
    }

    void FileLock::unlock() noexcept
    {
        if (fd_ >= 0)
        {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }
    }

} // namespace clouddrive::client
