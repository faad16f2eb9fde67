/**
 * @file memory_storage.hpp
 * @brief In-process storage backend
 */

#ifndef TOKENWARD_MEMORY_STORAGE_HPP
#define TOKENWARD_MEMORY_STORAGE_HPP

#include "storage.hpp"
#include <shared_mutex>
#include <unordered_map>

namespace tokenward {

/**
 * Thread-safe in-memory storage for a single process
 *
 * Sessions and tokens are guarded by separate locks. No refresh lock is
 * offered; TokenRefresher still coordinates threads of this process.
 */
class MemoryStorage : public Storage {
public:
    MemoryStorage() = default;
    ~MemoryStorage() override = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    void save_session(const std::string& state, const Session& session) override;
    std::optional<Session> get_session(const std::string& state) const override;
    void delete_session(const std::string& state) override;
    std::optional<Session> take_session(const std::string& state) override;

    void save_token(const std::string& key, const Token& token) override;
    std::optional<Token> get_token(const std::string& key) const override;
    void delete_token(const std::string& key) override;

    size_t session_count() const;
    size_t token_count() const;

private:
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, Token> tokens_;
    mutable std::shared_mutex sessions_mutex_;
    mutable std::shared_mutex tokens_mutex_;
};

} // namespace tokenward

#endif // TOKENWARD_MEMORY_STORAGE_HPP
