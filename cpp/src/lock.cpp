#include "internal.h"
#include "upsync/error.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

#ifdef UPSYNC_POSIX_LOCK
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>
#endif

namespace upsync {
namespace lock {

#ifdef UPSYNC_POSIX_LOCK

namespace {

/// RAII POSIX flock guard.
struct FlockGuard {
    int fd;
    explicit FlockGuard(int f) : fd(f) {}
    ~FlockGuard() {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }
    FlockGuard(const FlockGuard&) = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;
};

void record_pid(int fd) {
    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 ||
        ::pwrite(fd, pid.data(), pid.size(), 0) !=
            static_cast<ssize_t>(pid.size())) {
        throw IoError(std::string("cannot record pid in lock file: ") +
                      std::strerror(errno));
    }
}

} // anonymous namespace

void with_sync_lock(const std::filesystem::path& gitdir,
                    std::chrono::milliseconds wait,
                    const std::function<void()>& fn) {
    auto lock_path = gitdir / kLockFile;
    auto lock_str  = lock_path.string();

    int fd = ::open(lock_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw IoError("cannot open lock file: " + lock_str +
                      ": " + std::strerror(errno));
    }

    using namespace std::chrono;
    auto deadline = steady_clock::now() + wait;
    while (true) {
        int rc = ::flock(fd, LOCK_EX | LOCK_NB);
        if (rc == 0) break; // acquired

        if (errno != EWOULDBLOCK) {
            int err = errno;
            ::close(fd);
            throw IoError(std::string("flock failed: ") + std::strerror(err));
        }

        if (steady_clock::now() >= deadline) {
            ::close(fd);
            throw LockError("another sync holds " + lock_str);
        }

        std::this_thread::sleep_for(milliseconds(50));
    }

    FlockGuard guard(fd);
    record_pid(fd);
    fn();
    // guard destructor releases lock + closes fd
}

#else
// Fallback: no-op (single-process only)
void with_sync_lock(const std::filesystem::path& /*gitdir*/,
                    std::chrono::milliseconds /*wait*/,
                    const std::function<void()>& fn) {
    fn();
}
#endif

} // namespace lock
} // namespace upsync
