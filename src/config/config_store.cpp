#include "controlhub/config/config_store.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>

namespace scoreboard::controlhub {

namespace fs = std::filesystem;

DECLARE_LOGGER("ConfigStore");

namespace {

Error unavailable(const std::string& message, const Error& cause) {
    Error error(ErrorCode::STORE_UNAVAILABLE, message);
    error.with_cause(std::make_shared<Error>(cause));
    return error;
}

}  // namespace

ConfigStore::ConfigStore(ConfigStorePaths paths) : paths_(std::move(paths)) {}

bool ConfigStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(paths_.canonical, ec);
}

Result<std::string> ConfigStore::read_raw() const {
    auto raw = utils::read_file(paths_.canonical);
    if (!raw) {
        return unexpected(unavailable("Canonical configuration is not readable: " +
                                      paths_.canonical.string(), raw.error()));
    }
    return raw;
}

Result<ConfigDocument> ConfigStore::read() const {
    std::string raw;
    ASSIGN_OR_RETURN(raw, read_raw());

    auto document = ConfigDocument::parse(raw);
    if (!document) {
        return unexpected(unavailable("Canonical configuration is corrupt: " +
                                      paths_.canonical.string(), document.error()));
    }
    return document;
}

Result<void> ConfigStore::validate(const ConfigDocument& candidate, const ConfigSchema& schema) {
    return schema.validate(candidate);
}

Result<DocumentVersion> ConfigStore::version_of(const std::string& raw) {
    ConfigDocument document;
    ASSIGN_OR_RETURN(document, ConfigDocument::parse(raw));
    return document.version();
}

fs::path ConfigStore::staged_path_for(u64 id) const {
    return paths_.staging_dir / ("config." + std::to_string(id) + ".staged.json");
}

Result<StagedHandle> ConfigStore::stage(const ConfigDocument& candidate) {
    auto prepared = utils::ensure_directory(paths_.staging_dir);
    if (!prepared) {
        return unexpected(MAKE_ERROR(STAGE_FAILED, prepared.error().message()));
    }

    StagedHandle handle;
    handle.id_ = next_stage_id_.fetch_add(1);
    handle.kind_ = StagedHandle::Kind::Candidate;
    handle.path_ = staged_path_for(handle.id_);
    handle.base_version_ = candidate.version();
    handle.staged_version_ = handle.base_version_ + 1;

    ConfigDocument staged = candidate;
    staged.set_version(handle.staged_version_);

    auto written = utils::write_file_synced(handle.path_, staged.serialize());
    if (!written) {
        utils::remove_quietly(handle.path_);
        return unexpected(MAKE_ERROR(STAGE_FAILED, written.error().message()));
    }

    handle.active_ = true;
    COMPONENT_LOG_DEBUG("Staged candidate {} (version {} -> {}) at {}",
                        handle.id_, handle.base_version_, handle.staged_version_, handle.path_.string());
    return handle;
}

Result<StagedHandle> ConfigStore::stage_snapshot(const std::string& raw) {
    auto version = version_of(raw);
    if (!version) {
        return unexpected(MAKE_ERROR(STAGE_FAILED,
            "Snapshot is not a configuration document: " + version.error().message()));
    }

    auto prepared = utils::ensure_directory(paths_.staging_dir);
    if (!prepared) {
        return unexpected(MAKE_ERROR(STAGE_FAILED, prepared.error().message()));
    }

    StagedHandle handle;
    handle.id_ = next_stage_id_.fetch_add(1);
    handle.kind_ = StagedHandle::Kind::Snapshot;
    handle.path_ = staged_path_for(handle.id_);
    handle.base_version_ = *version;
    handle.staged_version_ = *version;

    auto written = utils::write_file_synced(handle.path_, raw);
    if (!written) {
        utils::remove_quietly(handle.path_);
        return unexpected(MAKE_ERROR(STAGE_FAILED, written.error().message()));
    }

    handle.active_ = true;
    COMPONENT_LOG_DEBUG("Staged snapshot {} of version {}", handle.id_, handle.base_version_);
    return handle;
}

Result<void> ConfigStore::commit(StagedHandle& handle) {
    if (!handle.active_) {
        return unexpected(MAKE_ERROR(INVALID_STATE, "Staged handle was already committed or discarded"));
    }

    std::lock_guard<std::mutex> lock(commit_mutex_);

    std::string current_raw;
    DocumentVersion current_version = 0;
    const bool canonical_exists = exists();
    if (canonical_exists) {
        auto raw = utils::read_file(paths_.canonical);
        if (!raw) {
            return unexpected(Error(ErrorCode::COMMIT_FAILED, "Cannot read canonical configuration")
                                  .with_cause(std::make_shared<Error>(raw.error())));
        }
        current_raw = std::move(*raw);
        auto version = version_of(current_raw);
        if (!version) {
            return unexpected(Error(ErrorCode::COMMIT_FAILED, "Canonical configuration is corrupt")
                                  .with_cause(std::make_shared<Error>(version.error())));
        }
        current_version = *version;
    }

    if (current_version != handle.base_version_) {
        return unexpected(MAKE_ERROR(STALE_STAGE,
            "Staged copy is based on version " + std::to_string(handle.base_version_) +
            " but canonical is at version " + std::to_string(current_version)));
    }

    if (canonical_exists && handle.kind_ == StagedHandle::Kind::Candidate) {
        auto backed_up = backup_canonical(current_raw);
        if (!backed_up) {
            return unexpected(Error(ErrorCode::COMMIT_FAILED, "Backup of canonical configuration failed")
                                  .with_cause(std::make_shared<Error>(backed_up.error())));
        }
    }

    auto directory = utils::ensure_directory(paths_.canonical.parent_path());
    if (!directory) {
        return unexpected(MAKE_ERROR(COMMIT_FAILED, directory.error().message()));
    }

    auto replaced = utils::atomic_replace(handle.path_, paths_.canonical);
    if (!replaced) {
        return unexpected(MAKE_ERROR(COMMIT_FAILED, replaced.error().message()));
    }

    handle.active_ = false;
    COMPONENT_LOG_INFO("Committed configuration version {}", handle.staged_version_);
    prune_backups();
    return {};
}

void ConfigStore::discard(StagedHandle& handle) noexcept {
    if (!handle.active_) {
        return;
    }
    handle.active_ = false;

    std::string reason;
    if (!utils::remove_quietly(handle.path_, &reason)) {
        COMPONENT_LOG_WARN("Could not remove staged copy {}: {}", handle.path_.string(), reason);
        return;
    }
    COMPONENT_LOG_DEBUG("Discarded staged copy {}", handle.id_);
}

Result<void> ConfigStore::publish(const StagedHandle& handle) const {
    if (!handle.active_) {
        return unexpected(MAKE_ERROR(INVALID_STATE, "Cannot publish an inactive staged handle"));
    }

    std::string raw;
    ASSIGN_OR_RETURN(raw, utils::read_file(handle.path_));
    ConfigDocument document;
    ASSIGN_OR_RETURN(document, ConfigDocument::parse(raw));

    auto written = utils::atomic_write_file(paths_.live, document.serialize_live());
    if (!written) {
        return unexpected(Error(ErrorCode::PUBLISH_FAILED, "Cannot write live configuration")
                              .with_cause(std::make_shared<Error>(written.error())));
    }
    COMPONENT_LOG_DEBUG("Published staged version {} to {}", handle.staged_version_, paths_.live.string());
    return {};
}

Result<void> ConfigStore::publish_canonical() const {
    ConfigDocument document;
    ASSIGN_OR_RETURN(document, read());

    auto written = utils::atomic_write_file(paths_.live, document.serialize_live());
    if (!written) {
        return unexpected(Error(ErrorCode::PUBLISH_FAILED, "Cannot write live configuration")
                              .with_cause(std::make_shared<Error>(written.error())));
    }
    COMPONENT_LOG_DEBUG("Published canonical version {} to {}", document.version(), paths_.live.string());
    return {};
}

Result<bool> ConfigStore::live_matches_canonical() const {
    ConfigDocument document;
    ASSIGN_OR_RETURN(document, read());

    auto live = utils::read_file(paths_.live);
    if (!live) {
        return false;
    }
    return live.value() == document.serialize_live();
}

void ConfigStore::clear_staging() const noexcept {
    std::error_code ec;
    if (!fs::is_directory(paths_.staging_dir, ec)) {
        return;
    }
    std::vector<fs::path> leftovers;
    for (fs::directory_iterator it(paths_.staging_dir, ec), end; !ec && it != end; it.increment(ec)) {
        leftovers.push_back(it->path());
    }

    size_t cleared = 0;
    for (const auto& path : leftovers) {
        std::string reason;
        if (!utils::remove_quietly(path, &reason)) {
            COMPONENT_LOG_WARN("Could not remove stale staged copy {}: {}", path.string(), reason);
            continue;
        }
        ++cleared;
    }
    if (cleared > 0) {
        COMPONENT_LOG_INFO("Cleared {} stale staged cop{} from {}", cleared, cleared == 1 ? "y" : "ies",
                           paths_.staging_dir.string());
    }
}

Result<ConfigDocument> ConfigStore::seed(const ConfigDocument& initial) {
    if (auto current = read()) {
        return current;
    }

    if (exists()) {
        // Keep the unreadable file for the operator and clear the way for the seed.
        const fs::path aside = paths_.canonical.string() + "." + utils::backup_timestamp() + ".corrupt.bak";
        auto moved = utils::atomic_replace(paths_.canonical, aside);
        if (!moved) {
            return unexpected(Error(ErrorCode::STORE_UNAVAILABLE, "Cannot move corrupt configuration aside")
                                  .with_cause(std::make_shared<Error>(moved.error())));
        }
        COMPONENT_LOG_WARN("Corrupt canonical configuration moved to {}", aside.string());
    }

    ConfigDocument document = initial;
    document.set_version(0);

    StagedHandle handle;
    ASSIGN_OR_RETURN(handle, stage(document));
    auto committed = commit(handle);
    if (!committed) {
        discard(handle);
        return unexpected(std::move(committed).error());
    }

    COMPONENT_LOG_INFO("Seeded canonical configuration at {}", paths_.canonical.string());
    return read();
}

Result<void> ConfigStore::backup_canonical(const std::string& raw) {
    const std::string base = paths_.canonical.string() + "." + utils::backup_timestamp();
    fs::path target = base + ".bak";
    std::error_code ec;
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = base + "-" + std::to_string(n) + ".bak";
    }
    RETURN_IF_ERROR(utils::atomic_write_file(target, raw));
    COMPONENT_LOG_DEBUG("Backed up canonical configuration to {}", target.string());
    return {};
}

std::vector<fs::path> ConfigStore::backups() const {
    std::vector<std::pair<fs::file_time_type, fs::path>> found;
    const std::string prefix = paths_.canonical.filename().string() + ".";

    std::error_code ec;
    for (fs::directory_iterator it(paths_.canonical.parent_path(), ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0 || name.size() < 4 || name.compare(name.size() - 4, 4, ".bak") != 0) {
            continue;
        }
        if (name.find(".corrupt.") != std::string::npos) {
            continue;
        }
        std::error_code time_ec;
        auto written = fs::last_write_time(it->path(), time_ec);
        found.emplace_back(written, it->path());
    }

    std::sort(found.begin(), found.end());
    std::vector<fs::path> paths;
    paths.reserve(found.size());
    for (auto& entry : found) {
        paths.push_back(std::move(entry.second));
    }
    return paths;
}

void ConfigStore::prune_backups() const {
    auto existing = backups();
    if (existing.size() <= paths_.max_backups) {
        return;
    }

    const size_t excess = existing.size() - paths_.max_backups;
    for (size_t i = 0; i < excess; ++i) {
        std::string reason;
        if (!utils::remove_quietly(existing[i], &reason)) {
            COMPONENT_LOG_WARN("Could not prune backup {}: {}", existing[i].string(), reason);
        }
    }
}

}  // namespace scoreboard::controlhub
