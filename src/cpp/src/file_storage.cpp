/**
 * @file file_storage.cpp
 * @brief Directory-backed storage shared between processes
 */

#include "tokenward/file_storage.hpp"
#include "tokenward/config.hpp"
#include "tokenward/encoding.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/file_lock.hpp"
#include "tokenward/logging.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tokenward {

static constexpr const char* RECORD_SUFFIX = ".json";
static constexpr const char* LOCK_SUFFIX = ".lock";
// Leaves room for the suffix and temp-file decorations within NAME_MAX
static constexpr size_t MAX_ENCODED_KEY_LENGTH = 200;
// '.' never appears in an escaped name, so hashed names cannot collide with one
static constexpr const char* HASHED_KEY_PREFIX = "sha256.";

static std::atomic<unsigned long> temp_counter{0};

static std::string errno_message(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

static void ensure_private_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw StorageError("Cannot create directory " + path + ": " + ec.message());
    }

    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        throw StorageError("Cannot restrict permissions on " + path + ": " + ec.message());
    }
}

static void write_all(int fd, const std::string& data, const std::string& path, const std::string& key) {
    const char* cursor = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw StorageError(errno_message("Cannot write " + path, errno), key);
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }
}

FileStorage::FileStorage(const std::string& root_path)
    : root_path_(root_path),
      sessions_dir_(root_path + "/sessions"),
      tokens_dir_(root_path + "/tokens"),
      locks_dir_(root_path + "/locks") {
    if (root_path_.empty()) {
        throw ValidationError("Storage root path must not be empty", "root_path");
    }

    ensure_private_directory(root_path_);
    ensure_private_directory(sessions_dir_);
    ensure_private_directory(tokens_dir_);
    ensure_private_directory(locks_dir_);

    logger()->debug("File storage at {}", root_path_);
}

std::shared_ptr<FileStorage> FileStorage::for_application(const std::string& app_name) {
    return std::make_shared<FileStorage>(default_storage_path(app_name));
}

std::string FileStorage::encode_key(const std::string& key) {
    static const char hex[] = "0123456789ABCDEF";

    if (key.empty()) {
        throw ValidationError("Storage key must not be empty", "key");
    }

    std::string encoded;
    encoded.reserve(key.size() * 3);
    for (unsigned char c : key) {
        bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (keep) {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }

    if (encoded.size() > MAX_ENCODED_KEY_LENGTH) {
        return HASHED_KEY_PREFIX + sha256_hex(key);
    }
    return encoded;
}

std::string FileStorage::record_path(const std::string& directory, const std::string& key) const {
    return directory + "/" + encode_key(key) + RECORD_SUFFIX;
}

std::string FileStorage::token_path(const std::string& key) const {
    return record_path(tokens_dir_, key);
}

std::string FileStorage::lock_path(const std::string& key) const {
    return locks_dir_ + "/" + encode_key(key) + LOCK_SUFFIX;
}

void FileStorage::write_record(const std::string& path, const std::string& key, const json& record) {
    const std::string content = record.dump(2);
    const std::string temp_path = path + ".tmp." + std::to_string(getpid()) + "." +
                                  std::to_string(temp_counter.fetch_add(1));

    int fd;
    do {
        fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC | O_CLOEXEC, 0600);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw StorageError(errno_message("Cannot create " + temp_path, errno), key);
    }

    try {
        write_all(fd, content, temp_path, key);
        if (fsync(fd) != 0) {
            throw StorageError(errno_message("Cannot sync " + temp_path, errno), key);
        }
    } catch (const StorageError&) {
        close(fd);
        unlink(temp_path.c_str());
        throw;
    }

    if (close(fd) != 0) {
        int error = errno;
        unlink(temp_path.c_str());
        throw StorageError(errno_message("Cannot close " + temp_path, error), key);
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        int error = errno;
        unlink(temp_path.c_str());
        throw StorageError(errno_message("Cannot replace " + path, error), key);
    }
}

std::optional<json> FileStorage::read_record(const std::string& path, const std::string& key) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        if (ec) {
            throw StorageError("Cannot access " + path + ": " + ec.message(), key);
        }
        if (!exists) {
            return std::nullopt;
        }
        throw StorageError("Cannot read " + path, key);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw StorageError("Corrupt record " + path + ": " + e.what(), key);
    }
}

void FileStorage::remove_record(const std::string& path, const std::string& key) {
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw StorageError(errno_message("Cannot delete " + path, errno), key);
    }
}

// =============================================================================
// Sessions
// =============================================================================

void FileStorage::save_session(const std::string& state, const Session& session) {
    write_record(record_path(sessions_dir_, state), state, session.to_json());
}

std::optional<Session> FileStorage::get_session(const std::string& state) const {
    auto record = read_record(record_path(sessions_dir_, state), state);
    if (!record) {
        return std::nullopt;
    }

    try {
        return Session::from_json(*record);
    } catch (const json::exception& e) {
        throw StorageError(std::string("Malformed session record: ") + e.what(), state);
    }
}

void FileStorage::delete_session(const std::string& state) {
    remove_record(record_path(sessions_dir_, state), state);
}

std::optional<Session> FileStorage::take_session(const std::string& state) {
    const std::string path = record_path(sessions_dir_, state);
    const std::string claimed_path = path + ".taken." + std::to_string(getpid()) + "." +
                                     std::to_string(temp_counter.fetch_add(1));

    // rename() succeeds for exactly one claimant; the rest see ENOENT
    if (rename(path.c_str(), claimed_path.c_str()) != 0) {
        int error = errno;
        if (error == ENOENT) {
            return std::nullopt;
        }
        throw StorageError(errno_message("Cannot claim " + path, error), state);
    }

    std::optional<json> record;
    try {
        record = read_record(claimed_path, state);
    } catch (const StorageError&) {
        unlink(claimed_path.c_str());
        throw;
    }
    remove_record(claimed_path, state);

    if (!record) {
        throw StorageError("Claimed session record vanished: " + claimed_path, state);
    }
    try {
        return Session::from_json(*record);
    } catch (const json::exception& e) {
        throw StorageError(std::string("Malformed session record: ") + e.what(), state);
    }
}

// =============================================================================
// Tokens
// =============================================================================

void FileStorage::save_token(const std::string& key, const Token& token) {
    write_record(token_path(key), key, token.to_json());
}

std::optional<Token> FileStorage::get_token(const std::string& key) const {
    auto record = read_record(token_path(key), key);
    if (!record) {
        return std::nullopt;
    }

    try {
        return Token::from_json(*record);
    } catch (const json::exception& e) {
        throw StorageError(std::string("Malformed token record: ") + e.what(), key);
    }
}

void FileStorage::delete_token(const std::string& key) {
    remove_record(token_path(key), key);
}

// =============================================================================
// Refresh lock
// =============================================================================

std::unique_ptr<RefreshLock> FileStorage::acquire_refresh_lock(
    const std::string& key,
    std::chrono::milliseconds timeout
) {
    return FileLock::acquire(lock_path(key), key, timeout);
}

std::unique_ptr<RefreshLock> FileStorage::try_acquire_refresh_lock(const std::string& key) {
    return FileLock::try_acquire(lock_path(key), key);
}

} // namespace tokenward
