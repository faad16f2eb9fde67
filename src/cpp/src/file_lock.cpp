/**
 * @file file_lock.cpp
 * @brief Advisory cross-process lock on a lock file
 */

#include "tokenward/file_lock.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tokenward {

static constexpr std::chrono::milliseconds INITIAL_POLL_INTERVAL{5};
static constexpr std::chrono::milliseconds MAX_POLL_INTERVAL{50};

static std::string errno_message(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

FileLock::FileLock(int fd, const std::string& path, const std::string& key)
    : fd_(fd), path_(path), key_(key) {}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

int FileLock::open_lock_file(const std::string& path, const std::string& key) {
    int fd;
    do {
        fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        throw StorageError(errno_message("Cannot open lock file " + path, errno), key);
    }
    return fd;
}

// true if locked, false if another holder has it; closes fd on hard failure
static bool lock_nonblocking(int fd, const std::string& path, const std::string& key) {
    while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        if (error == EINTR) continue;
        if (error == EWOULDBLOCK) return false;

        close(fd);
        throw StorageError(errno_message("Cannot lock " + path, error), key);
    }
    return true;
}

std::unique_ptr<FileLock> FileLock::try_acquire(const std::string& path, const std::string& key) {
    int fd = open_lock_file(path, key);
    if (!lock_nonblocking(fd, path, key)) {
        close(fd);
        return nullptr;
    }
    return std::unique_ptr<FileLock>(new FileLock(fd, path, key));
}

std::unique_ptr<FileLock> FileLock::acquire(
    const std::string& path,
    const std::string& key,
    std::chrono::milliseconds timeout
) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    auto interval = INITIAL_POLL_INTERVAL;
    bool logged_wait = false;

    int fd = open_lock_file(path, key);

    while (!lock_nonblocking(fd, path, key)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            close(fd);
            logger()->warn("Timed out waiting for refresh lock for '{}'", key);
            throw LockTimeoutError(key, static_cast<long long>(timeout.count()));
        }
        if (!logged_wait) {
            logger()->debug("Refresh lock for '{}' is held elsewhere, waiting", key);
            logged_wait = true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::max(std::chrono::milliseconds(1), std::min(interval, remaining)));
        interval = std::min(interval * 2, MAX_POLL_INTERVAL);
    }

    if (logged_wait) {
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        logger()->debug("Acquired refresh lock for '{}' after {}ms", key, waited.count());
    }
    return std::unique_ptr<FileLock>(new FileLock(fd, path, key));
}

} // namespace tokenward
