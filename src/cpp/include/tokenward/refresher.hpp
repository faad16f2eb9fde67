/**
 * @file refresher.hpp
 * @brief Coordinated token refresh
 */

#ifndef TOKENWARD_REFRESHER_HPP
#define TOKENWARD_REFRESHER_HPP

#include "oauth.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace tokenward {

struct RefresherOptions {
    /// Bound on waiting for another process's refresh lock
    std::chrono::milliseconds lock_timeout{DEFAULT_LOCK_TIMEOUT_MS};

    /// Bound on waiting for another thread's refresh; unbounded if unset
    std::optional<std::chrono::milliseconds> wait_timeout;
};

/**
 * Hands out valid tokens with at most one refresh in flight per key
 *
 * Threads of one process share a refresh through a per-key leader/waiter
 * handoff. Processes sharing a FileStorage serialize on the storage refresh
 * lock and re-read the token after acquiring it, so a refresh completed
 * elsewhere is reused instead of repeated.
 */
class TokenRefresher {
public:
    /**
     * Create a refresher
     * @param client Flow client used for refresh requests and storage access
     * @param options Lock and wait timeouts
     */
    explicit TokenRefresher(
        std::shared_ptr<OAuthClient> client,
        const RefresherOptions& options = RefresherOptions()
    );

    ~TokenRefresher();

    TokenRefresher(const TokenRefresher&) = delete;
    TokenRefresher& operator=(const TokenRefresher&) = delete;

    /**
     * Return the stored token, refreshing it first if expired
     * @param key Token key
     * @return Valid token
     * @throws TokenNotFoundError if nothing is stored under key
     */
    Token get_valid_token(const std::string& key);

    /**
     * get_valid_token with its own bound on waiting for another thread's
     * refresh, overriding RefresherOptions::wait_timeout
     * @throws TimeoutError if the in-flight refresh outlasts wait_timeout
     */
    Token get_valid_token(const std::string& key, std::chrono::milliseconds wait_timeout);

    /**
     * Return the stored token, refreshing it once the elapsed share of its
     * lifetime reaches threshold
     * @param key Token key
     * @param threshold Fraction in [0, 1]; 0.8 refreshes at 80% of lifetime
     * @return Valid token
     * @throws ValidationError if threshold is outside [0, 1]
     */
    Token get_valid_token_with_threshold(const std::string& key, double threshold);
    Token get_valid_token_with_threshold(
        const std::string& key,
        double threshold,
        std::chrono::milliseconds wait_timeout
    );

    /**
     * Refresh the stored token regardless of its expiration
     * @param key Token key
     * @return Refreshed token, or the token another holder just refreshed
     */
    Token refresh_token_for_key(const std::string& key);
    Token refresh_token_for_key(const std::string& key, std::chrono::milliseconds wait_timeout);

    /**
     * Block until no refresh for key is in flight in this or another process
     */
    void wait_for_refresh(const std::string& key);

    /**
     * Bounded wait_for_refresh
     * @return false if the timeout passed first
     */
    bool wait_for_refresh_for(const std::string& key, std::chrono::milliseconds timeout);

    /**
     * Number of keys with in-process refresh state
     *
     * An entry lives only while a refresh or wait for its key is running.
     */
    size_t tracked_key_count() const;

    std::shared_ptr<OAuthClient> client() const { return client_; }
    const RefresherOptions& options() const { return options_; }

private:
    struct KeyState;
    using RefreshCheck = std::function<bool(const Token&)>;
    using WaitTimeout = std::optional<std::chrono::milliseconds>;

    std::shared_ptr<KeyState> key_state(const std::string& key);
    std::shared_ptr<KeyState> find_key_state(const std::string& key) const;
    void release_key_state(const std::string& key, std::shared_ptr<KeyState>& state);

    Token load_token(const std::string& key) const;
    Token valid_token(const std::string& key, double threshold, const WaitTimeout& wait_timeout);
    Token forced_refresh(const std::string& key, const WaitTimeout& wait_timeout);
    Token coordinated_refresh(const std::string& key, const RefreshCheck& still_needed,
                              const WaitTimeout& wait_timeout);
    Token lead_or_join(const std::string& key, KeyState& state, const RefreshCheck& still_needed,
                       const WaitTimeout& wait_timeout);
    Token refresh_under_lock(const std::string& key, const RefreshCheck& still_needed);

    std::shared_ptr<OAuthClient> client_;
    RefresherOptions options_;
    std::map<std::string, std::shared_ptr<KeyState>> key_states_;
    mutable std::mutex mutex_;
};

} // namespace tokenward

#endif // TOKENWARD_REFRESHER_HPP
