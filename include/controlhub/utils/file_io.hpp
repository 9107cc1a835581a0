#pragma once

#include "controlhub/utils/error.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace scoreboard::controlhub::utils {

/**
 * @brief Small POSIX file helpers shared by the stores.
 *
 * atomic_write_file() follows the write-temp / fsync / rename / fsync-dir
 * discipline: readers of `path` observe either the old or the new contents,
 * never a partial file.
 */
Result<std::string> read_file(const std::filesystem::path& path);

Result<void> write_file_synced(const std::filesystem::path& path, const std::string& contents);

Result<void> atomic_write_file(const std::filesystem::path& path, const std::string& contents);

using DirectorySync = std::function<Result<void>(const std::filesystem::path&)>;

// Atomically moves `from` over `to` and syncs the destination directory.
// Once the rename has happened the replace counts as done: a failed
// directory sync is logged, not returned.
Result<void> atomic_replace(const std::filesystem::path& from, const std::filesystem::path& to);
Result<void> atomic_replace(const std::filesystem::path& from, const std::filesystem::path& to,
                            const DirectorySync& sync);

Result<void> sync_directory(const std::filesystem::path& directory);

Result<void> ensure_directory(const std::filesystem::path& directory);

// Unique sibling name used for temporaries, e.g. "config.json.tmp.4711.3".
std::filesystem::path temp_path_for(const std::filesystem::path& path);

// Best-effort removal; failures are logged by the caller's component.
bool remove_quietly(const std::filesystem::path& path, std::string* reason = nullptr);

/**
 * @brief Exclusive advisory lock (flock) on a file, released on destruction.
 *
 * Locks are per open file, so two holders in the same process exclude each
 * other just like two processes do.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // LOCK_HELD when another holder has the lock. Creates the file if needed.
    static Result<FileLock> try_acquire(const std::filesystem::path& path);

    // True while some other holder has the lock.
    static bool is_held(const std::filesystem::path& path);

    bool owns_lock() const { return fd_ >= 0; }
    void release() noexcept;

private:
    explicit FileLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};

// Timestamp suffix used for backups: YYYYmmddHHMMSS in local time.
std::string backup_timestamp();

}  // namespace scoreboard::controlhub::utils
