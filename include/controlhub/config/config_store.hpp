#pragma once

#include "controlhub/config/config_document.hpp"
#include "controlhub/config/config_schema.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

struct ConfigStorePaths {
    std::filesystem::path canonical;    // hub-owned document with metadata
    std::filesystem::path staging_dir;  // staged candidates, never read by the target
    std::filesystem::path live;         // file the scoreboard reads at start-up
    size_t max_backups = 5;
};

/**
 * @brief A staged candidate document awaiting commit or discard.
 *
 * Snapshot handles carry the exact bytes of an earlier canonical document and
 * are committed without re-serialization.
 */
class StagedHandle {
public:
    enum class Kind { Candidate, Snapshot };

    StagedHandle() = default;

    u64 id() const { return id_; }
    Kind kind() const { return kind_; }
    const std::filesystem::path& path() const { return path_; }
    // Canonical version the candidate was derived from.
    DocumentVersion base_version() const { return base_version_; }
    // Version the canonical file will carry once committed.
    DocumentVersion staged_version() const { return staged_version_; }
    bool active() const { return active_; }

private:
    friend class ConfigStore;

    u64 id_ = 0;
    Kind kind_ = Kind::Candidate;
    std::filesystem::path path_;
    DocumentVersion base_version_ = 0;
    DocumentVersion staged_version_ = 0;
    bool active_ = false;
};

/**
 * @brief Owner of the canonical configuration file.
 *
 * Every commit goes through write-temp, fsync, rename and directory fsync, so the
 * canonical file is always either the previous or the new version. Staged
 * candidates live in their own directory and never affect read().
 */
class ConfigStore {
public:
    explicit ConfigStore(ConfigStorePaths paths);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // STORE_UNAVAILABLE when the canonical file is missing or corrupt.
    Result<ConfigDocument> read() const;
    Result<std::string> read_raw() const;
    bool exists() const;

    static Result<void> validate(const ConfigDocument& candidate, const ConfigSchema& schema);

    Result<StagedHandle> stage(const ConfigDocument& candidate);
    Result<StagedHandle> stage_snapshot(const std::string& raw);

    // STALE_STAGE when the canonical version moved since the handle was staged,
    // COMMIT_FAILED when the replace did not happen. Canonical is unchanged on error.
    Result<void> commit(StagedHandle& handle);

    // Removal failures are logged, never reported.
    void discard(StagedHandle& handle) noexcept;

    // Writes the staged or canonical document, minus metadata, to the live path.
    Result<void> publish(const StagedHandle& handle) const;
    Result<void> publish_canonical() const;
    // False when the live file is missing or differs from what publish_canonical() writes.
    Result<bool> live_matches_canonical() const;

    // Drops staged copies left behind by an interrupted transaction.
    void clear_staging() const noexcept;

    // Commits `initial` as version 1 when no readable canonical file exists.
    // An unreadable file is backed up first.
    Result<ConfigDocument> seed(const ConfigDocument& initial);

    std::vector<std::filesystem::path> backups() const;

    const ConfigStorePaths& paths() const { return paths_; }

private:
    Result<void> backup_canonical(const std::string& raw);
    void prune_backups() const;
    std::filesystem::path staged_path_for(u64 id) const;
    static Result<DocumentVersion> version_of(const std::string& raw);

    ConfigStorePaths paths_;
    std::atomic<u64> next_stage_id_{1};
    std::mutex commit_mutex_;
};

}  // namespace scoreboard::controlhub
