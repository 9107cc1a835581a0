#include "controlhub/plugin/plugin_tree.hpp"
#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>

namespace scoreboard::controlhub {

namespace fs = std::filesystem;

DECLARE_LOGGER("PluginTree");

namespace {

constexpr const char* kBackupSuffix = ".previous";
constexpr const char* kRemovedSuffix = ".removed";

bool ends_with(const std::string& name, const std::string& suffix) {
    return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

PluginTreeStore::PluginTreeStore(fs::path plugin_root, fs::path staging_root)
    : plugin_root_(std::move(plugin_root)), staging_root_(std::move(staging_root)) {}

bool PluginTreeStore::tree_exists(const std::string& id) const {
    std::error_code ec;
    return fs::exists(tree_path(id), ec);
}

fs::path PluginTreeStore::staging_dir(TransactionId transaction) const {
    return staging_root_ / ("tx-" + std::to_string(transaction));
}

Result<fs::path> PluginTreeStore::stage_tree(TransactionId transaction, const std::string& id,
                                             const PackageFiles& files) const {
    if (!PluginManifest::is_valid_id(id)) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Invalid plugin id '" + id + "'"));
    }

    const fs::path target = staging_dir(transaction) / id;
    std::string reason;
    if (!utils::remove_quietly(target, &reason)) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot clear leftover staging tree " + target.string() +
                                                 ": " + reason));
    }
    RETURN_IF_ERROR(utils::ensure_directory(target));

    for (const auto& [relative, contents] : files) {
        if (!PluginManifest::is_safe_relative_path(relative)) {
            return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
                "Unsafe path in package: '" + relative + "'").with_field(relative));
        }
        const fs::path destination = target / fs::path(relative);
        RETURN_IF_ERROR(utils::ensure_directory(destination.parent_path()));
        RETURN_IF_ERROR(utils::write_file_synced(destination, contents));
    }

    COMPONENT_LOG_DEBUG("Staged {} files for {} in transaction {}", files.size(), id, transaction);
    return target;
}

Result<void> PluginTreeStore::finalize_install(TransactionId transaction, const std::string& id) const {
    const fs::path source = staging_dir(transaction) / id;
    const fs::path target = tree_path(id);

    if (tree_exists(id)) {
        return unexpected(Error(ErrorCode::PLUGIN_FILE_COLLISION,
            "Plugin tree already exists: " + target.string()).with_related({id}));
    }

    RETURN_IF_ERROR(utils::ensure_directory(plugin_root_));
    RETURN_IF_ERROR(utils::atomic_replace(source, target));
    COMPONENT_LOG_INFO("Installed plugin tree {}", target.string());
    return {};
}

fs::path PluginTreeStore::backup_path(const std::string& id) const {
    return plugin_root_ / ("." + id + kBackupSuffix);
}

bool PluginTreeStore::has_backup(const std::string& id) const {
    std::error_code ec;
    return fs::exists(backup_path(id), ec);
}

Result<void> PluginTreeStore::replace_tree(TransactionId transaction, const std::string& id) const {
    const fs::path source = staging_dir(transaction) / id;
    const fs::path target = tree_path(id);
    const fs::path backup = backup_path(id);

    std::string reason;
    if (!utils::remove_quietly(backup, &reason)) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot clear " + backup.string() + ": " + reason));
    }
    if (tree_exists(id)) {
        RETURN_IF_ERROR(utils::atomic_replace(target, backup));
    }

    if (auto placed = utils::atomic_replace(source, target); !placed) {
        if (auto restored = restore_tree(id); !restored) {
            COMPONENT_LOG_ERROR("Plugin {} left without a tree, backup at {}: {}", id, backup.string(),
                                restored.error().message());
        }
        return placed;
    }
    COMPONENT_LOG_INFO("Replaced plugin tree {}", target.string());
    return {};
}

Result<void> PluginTreeStore::restore_tree(const std::string& id) const {
    if (!has_backup(id)) {
        return {};
    }

    const fs::path target = tree_path(id);
    std::string reason;
    if (!utils::remove_quietly(target, &reason)) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot clear " + target.string() + ": " + reason));
    }
    RETURN_IF_ERROR(utils::atomic_replace(backup_path(id), target));
    COMPONENT_LOG_INFO("Restored previous plugin tree {}", target.string());
    return {};
}

void PluginTreeStore::drop_backup(const std::string& id) const {
    std::string reason;
    if (!utils::remove_quietly(backup_path(id), &reason)) {
        COMPONENT_LOG_WARN("Could not delete previous tree of {}: {}", id, reason);
    }
}

Result<void> PluginTreeStore::remove_tree(const std::string& id) const {
    const fs::path target = tree_path(id);
    if (!tree_exists(id)) {
        return {};
    }

    const fs::path doomed = plugin_root_ / ("." + id + kRemovedSuffix);
    std::string reason;
    if (!utils::remove_quietly(doomed, &reason)) {
        return unexpected(MAKE_ERROR(FILE_ERROR, "Cannot clear " + doomed.string() + ": " + reason));
    }
    RETURN_IF_ERROR(utils::atomic_replace(target, doomed));

    if (!utils::remove_quietly(doomed, &reason)) {
        COMPONENT_LOG_WARN("Plugin {} unlinked but {} could not be deleted: {}", id, doomed.string(), reason);
    }
    COMPONENT_LOG_INFO("Removed plugin tree {}", target.string());
    return {};
}

void PluginTreeStore::discard_staging(TransactionId transaction) const {
    const fs::path directory = staging_dir(transaction);
    std::string reason;
    if (!utils::remove_quietly(directory, &reason)) {
        COMPONENT_LOG_WARN("Could not remove staging directory {}: {}", directory.string(), reason);
    }
}

void PluginTreeStore::clear_staging() const {
    std::string reason;
    if (!utils::remove_quietly(staging_root_, &reason)) {
        COMPONENT_LOG_WARN("Could not clear plugin staging {}: {}", staging_root_.string(), reason);
    }
}

std::vector<std::string> PluginTreeStore::tree_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(plugin_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.empty() || name.front() == '.' || !it->is_directory(ec)) {
            continue;
        }
        ids.push_back(name);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> PluginTreeStore::backup_ids() const {
    std::vector<std::string> ids;
    const std::string suffix = kBackupSuffix;
    std::error_code ec;
    for (fs::directory_iterator it(plugin_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() > 1 && name.front() == '.' && ends_with(name, suffix)) {
            ids.push_back(name.substr(1, name.size() - 1 - suffix.size()));
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void PluginTreeStore::sweep_removed() const {
    std::vector<fs::path> leftovers;
    std::error_code ec;
    for (fs::directory_iterator it(plugin_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() > 1 && name.front() == '.' && ends_with(name, kRemovedSuffix)) {
            leftovers.push_back(it->path());
        }
    }
    for (const auto& path : leftovers) {
        std::string reason;
        if (!utils::remove_quietly(path, &reason)) {
            COMPONENT_LOG_WARN("Could not delete {}: {}", path.string(), reason);
        }
    }
}

Result<fs::path> PluginTreeStore::quarantine_tree(const std::string& id) const {
    if (!PluginManifest::is_valid_id(id)) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Invalid plugin id '" + id + "'"));
    }
    const fs::path directory = plugin_root_ / ".orphaned";
    RETURN_IF_ERROR(utils::ensure_directory(directory));

    const std::string base = id + "." + utils::backup_timestamp();
    fs::path target = directory / base;
    std::error_code ec;
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = directory / (base + "-" + std::to_string(n));
    }
    RETURN_IF_ERROR(utils::atomic_replace(tree_path(id), target));
    COMPONENT_LOG_WARN("Moved unowned plugin tree {} to {}", tree_path(id).string(), target.string());
    return target;
}

}  // namespace scoreboard::controlhub
