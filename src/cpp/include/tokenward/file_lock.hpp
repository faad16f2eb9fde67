/**
 * @file file_lock.hpp
 * @brief Advisory cross-process lock on a lock file
 */

#ifndef TOKENWARD_FILE_LOCK_HPP
#define TOKENWARD_FILE_LOCK_HPP

#include "storage.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace tokenward {

/**
 * Exclusive flock() held on an open lock file
 *
 * Each FileLock owns its own open file description, so two FileLocks on the
 * same path exclude each other across threads as well as processes. The
 * kernel drops the lock if the holding process dies.
 */
class FileLock : public RefreshLock {
public:
    /**
     * Block until the lock is held or the timeout passes
     * @param path Lock file, created with mode 0600 if missing
     * @param key Token key, reported by key()
     * @param timeout Upper bound on the wait
     * @throws LockTimeoutError if still contended at the deadline
     * @throws StorageError if the lock file cannot be opened or locked
     */
    static std::unique_ptr<FileLock> acquire(
        const std::string& path,
        const std::string& key,
        std::chrono::milliseconds timeout
    );

    /**
     * Single non-blocking attempt
     * @return Held lock, or nullptr if another holder has it
     */
    static std::unique_ptr<FileLock> try_acquire(const std::string& path, const std::string& key);

    ~FileLock() override;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& key() const override { return key_; }
    const std::string& path() const { return path_; }

private:
    FileLock(int fd, const std::string& path, const std::string& key);

    static int open_lock_file(const std::string& path, const std::string& key);

    int fd_;
    std::string path_;
    std::string key_;
};

} // namespace tokenward

#endif // TOKENWARD_FILE_LOCK_HPP
