/**
 * @file refresher.cpp
 * @brief Coordinated token refresh
 */

#include "tokenward/refresher.hpp"
#include "tokenward/encoding.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"
#include <condition_variable>
#include <exception>

namespace tokenward {

/**
 * In-process refresh state for one key
 *
 * generation advances each time a refresh settles; waiters compare it to the
 * value they saw on arrival.
 */
struct TokenRefresher::KeyState {
    std::mutex mutex;
    std::condition_variable settled;
    bool refreshing = false;
    uint64_t generation = 0;
    std::optional<Token> result;
    std::exception_ptr error;
};

TokenRefresher::TokenRefresher(std::shared_ptr<OAuthClient> client, const RefresherOptions& options)
    : client_(std::move(client)), options_(options) {
    if (!client_) {
        throw ValidationError("OAuth client is required", "client");
    }
}

TokenRefresher::~TokenRefresher() = default;

std::shared_ptr<TokenRefresher::KeyState> TokenRefresher::key_state(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = key_states_[key];
    if (!state) {
        state = std::make_shared<KeyState>();
    }
    return state;
}

std::shared_ptr<TokenRefresher::KeyState> TokenRefresher::find_key_state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = key_states_.find(key);
    if (it == key_states_.end()) {
        return nullptr;
    }
    return it->second;
}

void TokenRefresher::release_key_state(const std::string& key, std::shared_ptr<KeyState>& state) {
    // Registry mutex before state mutex, the same order as everywhere else
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = key_states_.find(key);
    if (it != key_states_.end() && it->second == state) {
        bool refreshing;
        {
            std::lock_guard<std::mutex> state_lock(state->mutex);
            refreshing = state->refreshing;
        }
        // New references are only handed out under mutex_, so a count of
        // two (registry and caller) cannot grow while it is held
        if (!refreshing && state.use_count() == 2) {
            key_states_.erase(it);
        }
    }
    state.reset();
}

size_t TokenRefresher::tracked_key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_states_.size();
}

Token TokenRefresher::load_token(const std::string& key) const {
    auto token = client_->get_token(key);
    if (!token) {
        throw TokenNotFoundError(key);
    }
    return *token;
}

Token TokenRefresher::get_valid_token(const std::string& key) {
    return valid_token(key, 1.0, options_.wait_timeout);
}

Token TokenRefresher::get_valid_token(const std::string& key, std::chrono::milliseconds wait_timeout) {
    return valid_token(key, 1.0, wait_timeout);
}

Token TokenRefresher::get_valid_token_with_threshold(const std::string& key, double threshold) {
    return valid_token(key, threshold, options_.wait_timeout);
}

Token TokenRefresher::get_valid_token_with_threshold(
    const std::string& key,
    double threshold,
    std::chrono::milliseconds wait_timeout
) {
    return valid_token(key, threshold, wait_timeout);
}

Token TokenRefresher::refresh_token_for_key(const std::string& key) {
    return forced_refresh(key, options_.wait_timeout);
}

Token TokenRefresher::refresh_token_for_key(const std::string& key, std::chrono::milliseconds wait_timeout) {
    return forced_refresh(key, wait_timeout);
}

Token TokenRefresher::valid_token(const std::string& key, double threshold, const WaitTimeout& wait_timeout) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw ValidationError("Refresh threshold must be within [0, 1]", "threshold",
                              std::to_string(threshold));
    }

    Token token = load_token(key);
    if (!token.expires_at || !token.needs_refresh(threshold)) {
        return token;
    }

    logger()->debug("Token for '{}' needs refresh (threshold {})", key, threshold);
    return coordinated_refresh(key, [threshold](const Token& current) {
        return current.expires_at.has_value() && current.needs_refresh(threshold);
    }, wait_timeout);
}

Token TokenRefresher::forced_refresh(const std::string& key, const WaitTimeout& wait_timeout) {
    // Whatever replaces this access token has already been refreshed
    const std::string observed = load_token(key).access_token;

    return coordinated_refresh(key, [observed](const Token& current) {
        return current.access_token == observed;
    }, wait_timeout);
}

Token TokenRefresher::coordinated_refresh(
    const std::string& key,
    const RefreshCheck& still_needed,
    const WaitTimeout& wait_timeout
) {
    auto state = key_state(key);
    try {
        Token token = lead_or_join(key, *state, still_needed, wait_timeout);
        release_key_state(key, state);
        return token;
    } catch (...) {
        release_key_state(key, state);
        throw;
    }
}

Token TokenRefresher::lead_or_join(
    const std::string& key,
    KeyState& state,
    const RefreshCheck& still_needed,
    const WaitTimeout& wait_timeout
) {
    std::unique_lock<std::mutex> lock(state.mutex);

    if (state.refreshing) {
        const uint64_t arrived = state.generation;
        auto done = [&state, arrived] { return state.generation != arrived; };

        logger()->debug("Waiting for in-flight refresh of '{}'", key);
        if (wait_timeout) {
            if (!state.settled.wait_for(lock, *wait_timeout, done)) {
                throw TimeoutError(wait_timeout->count() / 1000.0);
            }
        } else {
            state.settled.wait(lock, done);
        }

        if (state.error) {
            std::rethrow_exception(state.error);
        }
        return *state.result;
    }

    state.refreshing = true;
    lock.unlock();

    std::optional<Token> refreshed;
    std::exception_ptr error;
    try {
        refreshed = refresh_under_lock(key, still_needed);
    } catch (...) {
        // Handed to every waiter below and rethrown to this caller
        error = std::current_exception();
    }

    lock.lock();
    state.refreshing = false;
    state.result = refreshed;
    state.error = error;
    ++state.generation;
    lock.unlock();
    state.settled.notify_all();

    if (error) {
        std::rethrow_exception(error);
    }
    return *refreshed;
}

Token TokenRefresher::refresh_under_lock(const std::string& key, const RefreshCheck& still_needed) {
    auto storage = client_->storage();

    // Held across the read-modify-write; nullptr for storages without one
    std::unique_ptr<RefreshLock> refresh_lock = storage->acquire_refresh_lock(key, options_.lock_timeout);

    Token current = load_token(key);
    if (!still_needed(current)) {
        logger()->debug("Token for '{}' was refreshed elsewhere", key);
        return current;
    }

    Token refreshed;
    try {
        refreshed = client_->refresh(current);
    } catch (const NoRefreshTokenError&) {
        throw NoRefreshTokenError(key);
    }
    client_->save_token(key, refreshed);

    logger()->info("Refreshed token for '{}' ({})", key, mask_secret(refreshed.access_token));
    return refreshed;
}

void TokenRefresher::wait_for_refresh(const std::string& key) {
    if (auto state = find_key_state(key)) {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->refreshing) {
                const uint64_t arrived = state->generation;
                state->settled.wait(lock, [&state, arrived] { return state->generation != arrived; });
            }
        }
        release_key_state(key, state);
    }

    // Blocks while another process holds the refresh lock
    auto refresh_lock = client_->storage()->acquire_refresh_lock(key, options_.lock_timeout);
}

bool TokenRefresher::wait_for_refresh_for(const std::string& key, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    if (auto state = find_key_state(key)) {
        bool settled = true;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->refreshing) {
                const uint64_t arrived = state->generation;
                settled = state->settled.wait_until(lock, deadline,
                                                    [&state, arrived] { return state->generation != arrived; });
            }
        }
        release_key_state(key, state);
        if (!settled) {
            return false;
        }
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }

    try {
        auto refresh_lock = client_->storage()->acquire_refresh_lock(key, remaining);
    } catch (const LockTimeoutError&) {
        return false;
    }
    return true;
}

} // namespace tokenward
