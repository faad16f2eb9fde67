/**
 * @file file_storage.hpp
 * @brief Directory-backed storage shared between processes
 */

#ifndef TOKENWARD_FILE_STORAGE_HPP
#define TOKENWARD_FILE_STORAGE_HPP

#include "storage.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tokenward {

/**
 * One JSON file per record under a root directory
 *
 * Layout:
 *   <root>/sessions/<encoded state>.json
 *   <root>/tokens/<encoded key>.json
 *   <root>/locks/<encoded key>.lock
 *
 * Directories are created 0700 and records 0600. Records are replaced with
 * an atomic rename, so concurrent readers see the old or the new record,
 * never a partial one.
 */
class FileStorage : public Storage {
public:
    /**
     * @param root_path Root directory, created if missing
     * @throws StorageError if the directories cannot be created
     */
    explicit FileStorage(const std::string& root_path);
    ~FileStorage() override = default;

    /**
     * Storage rooted at default_storage_path(app_name)
     */
    static std::shared_ptr<FileStorage> for_application(const std::string& app_name);

    void save_session(const std::string& state, const Session& session) override;
    std::optional<Session> get_session(const std::string& state) const override;
    void delete_session(const std::string& state) override;
    std::optional<Session> take_session(const std::string& state) override;

    void save_token(const std::string& key, const Token& token) override;
    std::optional<Token> get_token(const std::string& key) const override;
    void delete_token(const std::string& key) override;

    std::unique_ptr<RefreshLock> acquire_refresh_lock(
        const std::string& key,
        std::chrono::milliseconds timeout
    ) override;
    std::unique_ptr<RefreshLock> try_acquire_refresh_lock(const std::string& key) override;

    const std::string& root_path() const { return root_path_; }

    /// Absolute path of the token record for key
    std::string token_path(const std::string& key) const;

    /// Absolute path of the lock file for key
    std::string lock_path(const std::string& key) const;

    /**
     * Injective file name encoding for keys
     *
     * Keeps A-Z a-z 0-9 - _ and escapes every other byte as %XX, so no key
     * can produce '/', '.' or '..'. Keys whose escaped form would exceed 200
     * bytes are named "sha256.<hex digest>" instead.
     */
    static std::string encode_key(const std::string& key);

private:
    std::string record_path(const std::string& directory, const std::string& key) const;
    void write_record(const std::string& path, const std::string& key, const json& record);
    std::optional<json> read_record(const std::string& path, const std::string& key) const;
    void remove_record(const std::string& path, const std::string& key);

    std::string root_path_;
    std::string sessions_dir_;
    std::string tokens_dir_;
    std::string locks_dir_;
};

} // namespace tokenward

#endif // TOKENWARD_FILE_STORAGE_HPP
