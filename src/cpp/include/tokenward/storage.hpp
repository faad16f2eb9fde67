/**
 * @file storage.hpp
 * @brief Storage abstraction for sessions and tokens
 */

#ifndef TOKENWARD_STORAGE_HPP
#define TOKENWARD_STORAGE_HPP

#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tokenward {

/**
 * Exclusive per-key refresh lock, released on destruction
 */
class RefreshLock {
public:
    virtual ~RefreshLock() = default;

    virtual const std::string& key() const = 0;
};

/**
 * Key/value persistence for sessions and tokens
 *
 * Sessions and tokens live in separate key spaces. Implementations must be
 * safe to call from multiple threads. get_* returns nullopt for an absent key
 * and throws StorageError only when the medium or a record is broken.
 * delete_* is idempotent.
 */
class Storage {
public:
    virtual ~Storage() = default;

    virtual void save_session(const std::string& state, const Session& session) = 0;
    virtual std::optional<Session> get_session(const std::string& state) const = 0;
    virtual void delete_session(const std::string& state) = 0;

    /**
     * Remove and return a session in one step
     *
     * Of any number of concurrent callers for one state, at most one
     * receives the session.
     * @return The session, or nullopt if absent or already taken
     */
    virtual std::optional<Session> take_session(const std::string& state) = 0;

    virtual void save_token(const std::string& key, const Token& token) = 0;
    virtual std::optional<Token> get_token(const std::string& key) const = 0;
    virtual void delete_token(const std::string& key) = 0;

    /**
     * Acquire the cross-process refresh lock for a token key
     * @param key Token key
     * @param timeout Upper bound on the wait
     * @return Held lock, or nullptr if this backend has no cross-process lock
     * @throws LockTimeoutError if the lock is not acquired within timeout
     */
    virtual std::unique_ptr<RefreshLock> acquire_refresh_lock(
        const std::string& key,
        std::chrono::milliseconds timeout
    ) {
        (void)key;
        (void)timeout;
        return nullptr;
    }

    /**
     * Non-blocking variant of acquire_refresh_lock
     * @return Held lock, or nullptr if contended or unsupported
     */
    virtual std::unique_ptr<RefreshLock> try_acquire_refresh_lock(const std::string& key) {
        (void)key;
        return nullptr;
    }
};

} // namespace tokenward

#endif // TOKENWARD_STORAGE_HPP
