#pragma once

#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

/**
 * @brief Installed plugin file trees under <plugin_root>/<id>/.
 *
 * Installs are written to a per-transaction staging directory first and
 * moved into place only when the transaction commits. Removals are renamed
 * out of the way before deletion so a crash never leaves a half-deleted tree
 * under a live plugin name.
 */
class PluginTreeStore {
public:
    PluginTreeStore(std::filesystem::path plugin_root, std::filesystem::path staging_root);

    std::filesystem::path tree_path(const std::string& id) const { return plugin_root_ / id; }
    bool tree_exists(const std::string& id) const;

    // Writes `files` to <staging_root>/<transaction>/<id>/.
    Result<std::filesystem::path> stage_tree(TransactionId transaction, const std::string& id,
                                             const PackageFiles& files) const;

    // Moves a staged tree to <plugin_root>/<id>. FILE_COLLISION when a tree is already there.
    Result<void> finalize_install(TransactionId transaction, const std::string& id) const;

    // Swaps a staged tree in for the installed one, keeping the old tree as
    // <plugin_root>/.<id>.previous until drop_backup() or restore_tree().
    Result<void> replace_tree(TransactionId transaction, const std::string& id) const;
    // Puts the .previous tree back under <plugin_root>/<id>. No-op without a backup.
    Result<void> restore_tree(const std::string& id) const;
    void drop_backup(const std::string& id) const;
    bool has_backup(const std::string& id) const;
    std::filesystem::path backup_path(const std::string& id) const;

    Result<void> remove_tree(const std::string& id) const;

    // Drops everything staged for `transaction`. Failures are logged.
    void discard_staging(TransactionId transaction) const;
    // Drops the staging area of every transaction, finished or not.
    void clear_staging() const;

    // Plugin ids with a tree under the plugin root; hidden entries are skipped.
    std::vector<std::string> tree_ids() const;
    // Ids with a .previous backup left by an interrupted update.
    std::vector<std::string> backup_ids() const;
    // Deletes .<id>.removed leftovers of interrupted removals.
    void sweep_removed() const;
    // Moves a tree no record owns to <plugin_root>/.orphaned/<id>.<timestamp>.
    Result<std::filesystem::path> quarantine_tree(const std::string& id) const;

    const std::filesystem::path& plugin_root() const { return plugin_root_; }

private:
    std::filesystem::path staging_dir(TransactionId transaction) const;

    std::filesystem::path plugin_root_;
    std::filesystem::path staging_root_;
};

}  // namespace scoreboard::controlhub
