#pragma once

#include "controlhub/config/config_schema.hpp"
#include "controlhub/config/config_store.hpp"
#include "controlhub/core/transaction.hpp"
#include "controlhub/plugin/plugin_registry.hpp"
#include "controlhub/plugin/plugin_tree.hpp"
#include "controlhub/process/health_probe.hpp"
#include "controlhub/process/process_controller.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/types.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

struct OrchestratorOptions {
    std::string target_process = "scoreboard";
    Milliseconds restart_timeout{60000};
    HealthPolicy health;
    std::filesystem::path plugins_file;         // side file read by the scoreboard
    std::filesystem::path lock_file;            // defaults to transaction.lock beside the canonical file
    std::function<void(Milliseconds)> sleep;    // defaults to std::this_thread::sleep_for
    std::function<i64()> clock;                 // unix seconds, defaults to system_clock
};

// What recover() found and repaired at start-up.
struct RecoveryReport {
    std::vector<std::string> quarantined;  // trees no record owns, moved to .orphaned
    std::vector<std::string> restored;     // trees put back from an interrupted update
    bool republished = false;              // live files were rewritten from canonical
    bool restarted = false;
};

/**
 * @brief Applies configuration and plugin changes as restart-verified transactions.
 *
 * A change is validated against the effective schema, staged, published to
 * the live files, and made visible to the scoreboard by restarting it. The
 * canonical document only moves once the restarted process passes its health
 * probe. Any failure after the restart restores the pre-transaction canonical
 * bytes and restarts the scoreboard once more on the old state.
 *
 * At most one transaction runs at a time, across processes: the caller
 * holds an flock on the lock file from Open to the terminal state, and a
 * second caller gets TRANSACTION_BUSY instead of waiting. Every transaction
 * starts from the registry recorded in the canonical snapshot, so changes
 * committed by another process are never overwritten. Reads never wait on a
 * transaction.
 */
class Orchestrator {
public:
    Orchestrator(ConfigStore& store,
                 ConfigSchema base_schema,
                 PluginTreeStore& trees,
                 ProcessController& controller,
                 HealthProbe& probe,
                 OrchestratorOptions options);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Loads the canonical plugin registry. Must run once before apply_change.
    Result<void> load();

    Result<TransactionOutcome> apply_change(const Mutation& mutation);

    // Requests cancellation of the running transaction. Honoured only before
    // the restart has been issued; returns false otherwise.
    bool cancel();

    // True while this instance or another process holds the transaction lock.
    bool busy() const;

    // Start-up reconciliation: clears staging leftovers, finishes or reverts
    // interrupted tree swaps, quarantines unowned trees and republishes live
    // files that drifted from canonical. With `restart_on_drift` the target is
    // restarted after a republish.
    Result<RecoveryReport> recover(bool restart_on_drift);

    // Runs `action` under the transaction lock; TRANSACTION_BUSY when held.
    Result<void> run_exclusive(const std::function<Result<void>()>& action);

    std::vector<PluginRecord> list_plugins() const;
    Result<PluginRecord> plugin(const std::string& id) const;
    Result<ConfigDocument> read_config() const;
    std::vector<std::string> boards() const;
    ConfigSchema effective_schema() const;

    // Rewrites the live config and side file from canonical state.
    Result<void> republish() const;

    const OrchestratorOptions& options() const { return options_; }

private:
    Result<void> mutate(Transaction& tx, const Mutation& mutation);
    Result<void> mutate_config(Transaction& tx, const SetConfigValues& change);
    Result<void> mutate_enable(Transaction& tx, const EnablePlugin& change);
    Result<void> mutate_disable(Transaction& tx, const DisablePlugin& change);
    Result<void> mutate_install(Transaction& tx, const InstallPlugin& change);
    Result<void> mutate_update(Transaction& tx, const UpdatePlugin& change);
    Result<void> mutate_uninstall(Transaction& tx, const UninstallPlugin& change);

    // Failure before the restart: nothing was committed, live state is restored.
    Error abort_before_restart(Transaction& tx, Error reason);
    // Failure after the restart: canonical snapshot is re-committed and the
    // target restarted once more. Returns the error to surface.
    Error roll_back_after_restart(Transaction& tx, Error reason);

    // Takes the cross-process lock; TRANSACTION_BUSY when another holder has it.
    Result<utils::FileLock> lock_store() const;
    Result<void> merge_defaults(Transaction& tx, const std::string& id) const;
    Result<void> write_side_file(const PluginRegistry& registry) const;
    bool side_file_current(const PluginRegistry& registry) const;
    // Removes installed trees and puts replaced ones back.
    void revert_trees(Transaction& tx);
    bool cancel_requested() const { return cancel_requested_.load(); }
    // Marks the restart as issued unless a cancel already arrived.
    bool claim_restart();

    ConfigStore& store_;
    ConfigSchema base_schema_;
    PluginTreeStore& trees_;
    ProcessController& controller_;
    HealthProbe& probe_;
    OrchestratorOptions options_;

    std::mutex transaction_mutex_;
    mutable std::shared_mutex registry_mutex_;
    PluginRegistry registry_;

    std::mutex cancel_mutex_;
    std::atomic<bool> in_flight_{false};
    std::atomic<bool> cancel_requested_{false};
    bool restart_issued_ = false;
    std::atomic<TransactionId> next_id_{1};
};

}  // namespace scoreboard::controlhub
