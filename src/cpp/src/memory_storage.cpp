/**
 * @file memory_storage.cpp
 * @brief In-process storage backend
 */

#include "tokenward/memory_storage.hpp"
#include <mutex>

namespace tokenward {

void MemoryStorage::save_session(const std::string& state, const Session& session) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_[state] = session;
}

std::optional<Session> MemoryStorage::get_session(const std::string& state) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(state);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::delete_session(const std::string& state) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_.erase(state);
}

std::optional<Session> MemoryStorage::take_session(const std::string& state) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(state);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    Session session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

void MemoryStorage::save_token(const std::string& key, const Token& token) {
    std::unique_lock<std::shared_mutex> lock(tokens_mutex_);
    tokens_[key] = token;
}

std::optional<Token> MemoryStorage::get_token(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
    auto it = tokens_.find(key);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::delete_token(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(tokens_mutex_);
    tokens_.erase(key);
}

size_t MemoryStorage::session_count() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.size();
}

size_t MemoryStorage::token_count() const {
    std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
    return tokens_.size();
}

} // namespace tokenward
