#include "controlhub/core/orchestrator.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

#include <thread>

namespace scoreboard::controlhub {

DECLARE_LOGGER("Orchestrator");

namespace {

i64 unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(WallClock::now().time_since_epoch()).count();
}

// Clears the in-flight flags when apply_change returns, whatever the path.
class FlightGuard {
public:
    FlightGuard(std::atomic<bool>& in_flight, std::atomic<bool>& cancel_requested)
        : in_flight_(in_flight), cancel_requested_(cancel_requested) {}
    ~FlightGuard() {
        cancel_requested_ = false;
        in_flight_ = false;
    }
    FlightGuard(const FlightGuard&) = delete;
    FlightGuard& operator=(const FlightGuard&) = delete;

private:
    std::atomic<bool>& in_flight_;
    std::atomic<bool>& cancel_requested_;
};

}  // namespace

Orchestrator::Orchestrator(ConfigStore& store,
                           ConfigSchema base_schema,
                           PluginTreeStore& trees,
                           ProcessController& controller,
                           HealthProbe& probe,
                           OrchestratorOptions options)
    : store_(store),
      base_schema_(std::move(base_schema)),
      trees_(trees),
      controller_(controller),
      probe_(probe),
      options_(std::move(options)) {
    if (!options_.sleep) {
        options_.sleep = [](Milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (!options_.clock) {
        options_.clock = unix_now;
    }
    if (options_.lock_file.empty()) {
        options_.lock_file = store_.paths().canonical.parent_path() / "transaction.lock";
    }
}

bool Orchestrator::busy() const {
    return in_flight_.load() || utils::FileLock::is_held(options_.lock_file);
}

Result<utils::FileLock> Orchestrator::lock_store() const {
    auto lock = utils::FileLock::try_acquire(options_.lock_file);
    if (!lock) {
        if (lock.error().code() == ErrorCode::LOCK_HELD) {
            return unexpected(Error(ErrorCode::TRANSACTION_BUSY, "Another change is being applied")
                                  .with_cause(std::make_shared<Error>(lock.error())));
        }
        return unexpected(std::move(lock).error());
    }
    return lock;
}

Result<void> Orchestrator::run_exclusive(const std::function<Result<void>()>& action) {
    std::unique_lock transaction_lock(transaction_mutex_, std::try_to_lock);
    if (!transaction_lock.owns_lock()) {
        return unexpected(MAKE_ERROR(TRANSACTION_BUSY, "Another change is being applied"));
    }
    utils::FileLock store_lock;
    ASSIGN_OR_RETURN(store_lock, lock_store());
    return action();
}

Result<void> Orchestrator::load() {
    ConfigDocument document;
    ASSIGN_OR_RETURN(document, store_.read());

    PluginRegistry registry;
    ASSIGN_OR_RETURN(registry, PluginRegistry::from_document(document, trees_.plugin_root()));

    for (const auto& record : registry.list()) {
        if (record.state == PluginState::Failed) {
            COMPONENT_LOG_WARN("Plugin '{}' is installed but its files are missing; marked Failed",
                               record.id());
        }
    }

    std::unique_lock lock(registry_mutex_);
    registry_ = std::move(registry);
    COMPONENT_LOG_INFO("Loaded configuration version {} with {} plugin(s)", document.version(),
                       registry_.list().size());
    return {};
}

std::vector<PluginRecord> Orchestrator::list_plugins() const {
    std::shared_lock lock(registry_mutex_);
    return registry_.list();
}

Result<PluginRecord> Orchestrator::plugin(const std::string& id) const {
    std::shared_lock lock(registry_mutex_);
    const PluginRecord* record = registry_.find(id);
    if (!record) {
        return unexpected(MAKE_ERROR(PLUGIN_NOT_FOUND, "Plugin '" + id + "' is not installed"));
    }
    return *record;
}

Result<ConfigDocument> Orchestrator::read_config() const {
    return store_.read();
}

std::vector<std::string> Orchestrator::boards() const {
    std::shared_lock lock(registry_mutex_);
    return registry_.effective_schema(base_schema_).boards();
}

ConfigSchema Orchestrator::effective_schema() const {
    std::shared_lock lock(registry_mutex_);
    return registry_.effective_schema(base_schema_);
}

Result<void> Orchestrator::republish() const {
    RETURN_IF_ERROR(store_.publish_canonical());
    std::shared_lock lock(registry_mutex_);
    return write_side_file(registry_);
}

bool Orchestrator::cancel() {
    std::lock_guard lock(cancel_mutex_);
    if (!in_flight_ || restart_issued_) {
        return false;
    }
    cancel_requested_ = true;
    COMPONENT_LOG_INFO("Cancellation requested");
    return true;
}

bool Orchestrator::claim_restart() {
    std::lock_guard lock(cancel_mutex_);
    if (cancel_requested_) {
        return false;
    }
    restart_issued_ = true;
    return true;
}

Result<TransactionOutcome> Orchestrator::apply_change(const Mutation& mutation) {
    std::unique_lock transaction_lock(transaction_mutex_, std::try_to_lock);
    if (!transaction_lock.owns_lock()) {
        return unexpected(MAKE_ERROR(TRANSACTION_BUSY, "Another change is being applied"));
    }
    utils::FileLock store_lock;
    ASSIGN_OR_RETURN(store_lock, lock_store());

    {
        std::lock_guard lock(cancel_mutex_);
        in_flight_ = true;
        cancel_requested_ = false;
        restart_issued_ = false;
    }
    FlightGuard guard(in_flight_, cancel_requested_);

    // Open
    std::string snapshot;
    ASSIGN_OR_RETURN(snapshot, store_.read_raw());
    auto parsed = ConfigDocument::parse(snapshot);
    if (!parsed) {
        Error error(ErrorCode::STORE_UNAVAILABLE, "Canonical configuration is unreadable");
        error.with_cause(std::make_shared<Error>(parsed.error()));
        return unexpected(std::move(error));
    }

    // Another process may have committed since load(); the snapshot is the truth.
    auto rebuilt = PluginRegistry::from_document(parsed.value(), trees_.plugin_root());
    if (!rebuilt) {
        Error error(ErrorCode::STORE_UNAVAILABLE, "Plugin records in the canonical configuration are invalid");
        error.with_cause(std::make_shared<Error>(rebuilt.error()));
        return unexpected(std::move(error));
    }
    PluginRegistry registry = std::move(rebuilt).value();
    {
        std::unique_lock lock(registry_mutex_);
        registry_ = registry;
    }

    Transaction tx(next_id_++, std::move(parsed).value(), std::move(snapshot), std::move(registry));
    COMPONENT_LOG_INFO("Transaction {} opened: {}", tx.id(), describe_mutation(mutation));

    auto reject = [&](Error reason) -> Result<TransactionOutcome> {
        trees_.discard_staging(tx.id());
        tx.mark_rolled_back();
        COMPONENT_LOG_WARN("Transaction {} rejected: {}", tx.id(), reason.message());
        return unexpected(std::move(reason));
    };
    auto cancelled = [&]() {
        return MAKE_ERROR(TRANSACTION_CANCELLED,
                          "Transaction " + std::to_string(tx.id()) + " was cancelled");
    };

    if (auto mutated = mutate(tx, mutation); !mutated) {
        return reject(std::move(mutated).error());
    }
    if (cancel_requested()) {
        return reject(cancelled());
    }

    tx.registry().save_to(tx.document());
    const ConfigSchema schema = tx.registry().effective_schema(base_schema_);
    if (auto valid = ConfigStore::validate(tx.document(), schema); !valid) {
        return reject(std::move(valid).error());
    }
    RETURN_IF_ERROR(tx.advance(TransactionStatus::Validated));
    if (cancel_requested()) {
        return reject(cancelled());
    }

    // Applying
    auto staged = store_.stage(tx.document());
    if (!staged) {
        return reject(std::move(staged).error());
    }
    tx.staged() = std::move(staged).value();
    RETURN_IF_ERROR(tx.advance(TransactionStatus::Applying));
    COMPONENT_LOG_INFO("Transaction {} staged as version {}", tx.id(), tx.staged()->staged_version());

    for (const auto& id : tx.pending_installs()) {
        if (auto placed = trees_.finalize_install(tx.id(), id); !placed) {
            return unexpected(abort_before_restart(tx, std::move(placed).error()));
        }
        tx.placed_trees().push_back(id);
    }
    for (const auto& id : tx.pending_updates()) {
        if (auto replaced = trees_.replace_tree(tx.id(), id); !replaced) {
            return unexpected(abort_before_restart(tx, std::move(replaced).error()));
        }
        tx.replaced_trees().push_back(id);
    }
    if (auto written = write_side_file(tx.registry()); !written) {
        return unexpected(abort_before_restart(tx, std::move(written).error()));
    }
    if (auto published = store_.publish(*tx.staged()); !published) {
        return unexpected(abort_before_restart(tx, std::move(published).error()));
    }

    if (!claim_restart()) {
        return unexpected(abort_before_restart(tx, cancelled()));
    }

    COMPONENT_LOG_INFO("Transaction {} restarting '{}'", tx.id(), options_.target_process);
    if (auto restarted = controller_.restart(options_.target_process, options_.restart_timeout); !restarted) {
        Error error(ErrorCode::RESTART_FAILED, "Restart of '" + options_.target_process + "' failed");
        error.with_cause(std::make_shared<Error>(std::move(restarted).error()));
        return unexpected(abort_before_restart(tx, std::move(error)));
    }

    // Verifying
    RETURN_IF_ERROR(tx.advance(TransactionStatus::Verifying));
    if (auto healthy = wait_until_healthy(probe_, options_.health, options_.sleep); !healthy) {
        return unexpected(roll_back_after_restart(tx, std::move(healthy).error()));
    }

    if (auto committed = store_.commit(*tx.staged()); !committed) {
        return unexpected(roll_back_after_restart(tx, std::move(committed).error()));
    }

    for (const auto& id : tx.pending_removals()) {
        if (auto removed = trees_.remove_tree(id); !removed) {
            COMPONENT_LOG_WARN("Transaction {}: could not remove files of '{}': {}", tx.id(), id,
                               removed.error().message());
        }
    }
    for (const auto& id : tx.replaced_trees()) {
        trees_.drop_backup(id);
    }
    trees_.discard_staging(tx.id());

    {
        std::unique_lock lock(registry_mutex_);
        registry_ = tx.registry();
    }
    RETURN_IF_ERROR(tx.advance(TransactionStatus::Committed));

    TransactionOutcome outcome;
    outcome.id = tx.id();
    outcome.status = tx.status();
    outcome.affected_plugins = tx.affected();
    outcome.version = tx.staged()->staged_version();
    COMPONENT_LOG_INFO("Transaction {} committed version {}", outcome.id, outcome.version);
    return outcome;
}

Result<void> Orchestrator::mutate(Transaction& tx, const Mutation& mutation) {
    return std::visit([&](const auto& change) -> Result<void> {
        using T = std::decay_t<decltype(change)>;
        if constexpr (std::is_same_v<T, SetConfigValues>) {
            return mutate_config(tx, change);
        } else if constexpr (std::is_same_v<T, EnablePlugin>) {
            return mutate_enable(tx, change);
        } else if constexpr (std::is_same_v<T, DisablePlugin>) {
            return mutate_disable(tx, change);
        } else if constexpr (std::is_same_v<T, InstallPlugin>) {
            return mutate_install(tx, change);
        } else if constexpr (std::is_same_v<T, UpdatePlugin>) {
            return mutate_update(tx, change);
        } else {
            return mutate_uninstall(tx, change);
        }
    }, mutation);
}

Result<void> Orchestrator::mutate_config(Transaction& tx, const SetConfigValues& change) {
    if (change.values.empty()) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "No configuration values given"));
    }
    for (const auto& [key, value] : change.values) {
        RETURN_IF_ERROR(tx.document().set(key, value));
    }
    return {};
}

Result<void> Orchestrator::mutate_enable(Transaction& tx, const EnablePlugin& change) {
    EnablePlan plan;
    ASSIGN_OR_RETURN(plan, tx.registry().plan_enable(change.id));

    const i64 now = options_.clock();
    for (const auto& id : plan.order) {
        RETURN_IF_ERROR(tx.registry().set_state(id, PluginState::Enabled));
        tx.registry().touch(id, now);
        RETURN_IF_ERROR(merge_defaults(tx, id));
        tx.affected().push_back(id);
    }
    return {};
}

// Contributed keys start at their defaults unless the operator set them earlier.
Result<void> Orchestrator::merge_defaults(Transaction& tx, const std::string& id) const {
    const PluginRecord* record = tx.registry().find(id);
    if (!record) {
        return {};
    }
    for (const auto& rule : record->manifest.config_rules()) {
        if (rule.default_value && !tx.document().has(rule.key)) {
            RETURN_IF_ERROR(tx.document().set(rule.key, *rule.default_value));
        }
    }
    return {};
}

Result<void> Orchestrator::mutate_disable(Transaction& tx, const DisablePlugin& change) {
    const PluginRecord* record = tx.registry().find(change.id);
    if (record && record->state == PluginState::Failed) {
        return unexpected(MAKE_ERROR(PLUGIN_INVALID_STATE,
            "Plugin '" + change.id + "' is Failed; uninstall and reinstall it"));
    }

    DisablePlan plan;
    ASSIGN_OR_RETURN(plan, tx.registry().plan_disable(change.id));
    RETURN_IF_ERROR(tx.registry().set_state(plan.id, PluginState::Disabled));
    tx.registry().touch(plan.id, options_.clock());
    tx.affected().push_back(plan.id);
    return {};
}

Result<void> Orchestrator::mutate_install(Transaction& tx, const InstallPlugin& change) {
    const std::string& id = change.manifest.id();
    PluginRecord record;
    ASSIGN_OR_RETURN(record, tx.registry().install(change.manifest, change.files, base_schema_,
                                                   trees_.tree_exists(id)));

    RETURN_IF_ERROR(trees_.stage_tree(tx.id(), id, change.files));
    tx.registry().touch(id, options_.clock());
    tx.pending_installs().push_back(id);
    tx.affected().push_back(id);
    COMPONENT_LOG_DEBUG("Transaction {}: staged {} file(s) for '{}'", tx.id(), change.files.size(), id);
    return {};
}

Result<void> Orchestrator::mutate_update(Transaction& tx, const UpdatePlugin& change) {
    const std::string& id = change.manifest.id();
    PluginRecord record;
    ASSIGN_OR_RETURN(record, tx.registry().update(change.manifest, change.files, base_schema_));
    if (record.state == PluginState::Enabled) {
        RETURN_IF_ERROR(merge_defaults(tx, id));
    }

    RETURN_IF_ERROR(trees_.stage_tree(tx.id(), id, change.files));
    tx.registry().touch(id, options_.clock());
    tx.pending_updates().push_back(id);
    tx.affected().push_back(id);
    COMPONENT_LOG_DEBUG("Transaction {}: staged {} file(s) to update '{}'", tx.id(), change.files.size(), id);
    return {};
}

Result<void> Orchestrator::mutate_uninstall(Transaction& tx, const UninstallPlugin& change) {
    const PluginRecord* record = tx.registry().find(change.id);
    std::vector<std::string> contributed;
    if (record && !change.keep_config) {
        for (const auto& rule : record->manifest.config_rules()) {
            contributed.push_back(rule.key);
        }
    }

    RETURN_IF_ERROR(tx.registry().uninstall(change.id));
    for (const auto& key : contributed) {
        if (tx.document().erase(key)) {
            COMPONENT_LOG_DEBUG("Transaction {}: dropped '{}' with '{}'", tx.id(), key, change.id);
        }
    }
    tx.pending_removals().push_back(change.id);
    tx.affected().push_back(change.id);
    return {};
}

Result<void> Orchestrator::write_side_file(const PluginRegistry& registry) const {
    return utils::atomic_write_file(options_.plugins_file, registry.side_file().dump(2) + "\n");
}

bool Orchestrator::side_file_current(const PluginRegistry& registry) const {
    auto current = utils::read_file(options_.plugins_file);
    return current && current.value() == registry.side_file().dump(2) + "\n";
}

void Orchestrator::revert_trees(Transaction& tx) {
    for (const auto& id : tx.placed_trees()) {
        if (auto removed = trees_.remove_tree(id); !removed) {
            COMPONENT_LOG_WARN("Transaction {}: could not remove files of '{}': {}", tx.id(), id,
                               removed.error().message());
        }
    }
    tx.placed_trees().clear();
    for (const auto& id : tx.replaced_trees()) {
        if (auto restored = trees_.restore_tree(id); !restored) {
            COMPONENT_LOG_ERROR("Transaction {}: could not restore previous files of '{}': {}", tx.id(), id,
                                restored.error().message());
        }
    }
    tx.replaced_trees().clear();
    trees_.discard_staging(tx.id());
}

Error Orchestrator::abort_before_restart(Transaction& tx, Error reason) {
    COMPONENT_LOG_WARN("Transaction {} aborted before verification: {}", tx.id(), reason.message());

    if (tx.staged()) {
        store_.discard(*tx.staged());
    }
    revert_trees(tx);

    bool restored = true;
    if (auto republished = republish(); !republished) {
        restored = false;
        COMPONENT_LOG_ERROR("Transaction {}: could not restore live files: {}", tx.id(),
                            republished.error().message());
    }

    tx.mark_rolled_back();
    reason.with_related(tx.affected());
    if (reason.code() != ErrorCode::TRANSACTION_CANCELLED) {
        reason.with_rollback(restored);
    }
    return reason;
}

Error Orchestrator::roll_back_after_restart(Transaction& tx, Error reason) {
    COMPONENT_LOG_WARN("Transaction {} failed verification, rolling back: {}", tx.id(), reason.message());

    store_.discard(*tx.staged());

    bool restored = true;
    auto snapshot = store_.stage_snapshot(tx.snapshot());
    if (!snapshot) {
        restored = false;
        COMPONENT_LOG_ERROR("Transaction {}: could not stage snapshot: {}", tx.id(),
                            snapshot.error().message());
    } else if (auto committed = store_.commit(snapshot.value()); !committed) {
        restored = false;
        store_.discard(snapshot.value());
        COMPONENT_LOG_ERROR("Transaction {}: could not re-commit snapshot: {}", tx.id(),
                            committed.error().message());
    }

    revert_trees(tx);

    if (auto republished = republish(); !republished) {
        restored = false;
        COMPONENT_LOG_ERROR("Transaction {}: could not restore live files: {}", tx.id(),
                            republished.error().message());
    }

    COMPONENT_LOG_INFO("Transaction {} restarting '{}' on the previous state", tx.id(),
                       options_.target_process);
    auto restarted = controller_.restart(options_.target_process, options_.restart_timeout);
    tx.mark_rolled_back();

    if (!restarted) {
        COMPONENT_LOG_CRITICAL("Transaction {}: '{}' did not come back after rollback: {}. "
                               "Manual intervention required", tx.id(), options_.target_process,
                               restarted.error().message());
        Error error(ErrorCode::UNRECOVERABLE,
                    "Rollback restart of '" + options_.target_process + "' failed after: " + reason.message());
        error.with_cause(std::make_shared<Error>(std::move(restarted).error()));
        error.with_related(tx.affected());
        error.with_rollback(false);
        return error;
    }

    if (reason.code() != ErrorCode::HEALTH_CHECK_FAILED) {
        COMPONENT_LOG_WARN("Transaction {} rolled back after: {}", tx.id(), reason.message());
    }
    reason.with_related(tx.affected());
    reason.with_rollback(restored);
    return reason;
}

Result<RecoveryReport> Orchestrator::recover(bool restart_on_drift) {
    std::unique_lock transaction_lock(transaction_mutex_, std::try_to_lock);
    if (!transaction_lock.owns_lock()) {
        return unexpected(MAKE_ERROR(TRANSACTION_BUSY, "Another change is being applied"));
    }
    utils::FileLock store_lock;
    ASSIGN_OR_RETURN(store_lock, lock_store());

    RecoveryReport report;
    store_.clear_staging();
    trees_.clear_staging();
    trees_.sweep_removed();

    ConfigDocument document;
    ASSIGN_OR_RETURN(document, store_.read());
    PluginRegistry recorded;
    ASSIGN_OR_RETURN(recorded, PluginRegistry::from_document(document, {}));

    // An update swaps trees before the commit; the recorded version decides which side wins.
    for (const auto& id : trees_.backup_ids()) {
        const PluginRecord* record = recorded.find(id);
        bool keep_current = record == nullptr;
        if (record) {
            auto manifest_text = utils::read_file(trees_.tree_path(id) / PluginManifest::kFileName);
            if (manifest_text) {
                auto manifest = PluginManifest::parse(manifest_text.value());
                keep_current = manifest && manifest->version().to_string() == record->installed_version;
            }
        }
        if (keep_current) {
            trees_.drop_backup(id);
            continue;
        }
        if (auto restored = trees_.restore_tree(id); !restored) {
            COMPONENT_LOG_ERROR("Could not restore previous files of '{}': {}", id, restored.error().message());
            continue;
        }
        COMPONENT_LOG_WARN("Restored previous files of '{}' left by an interrupted update", id);
        report.restored.push_back(id);
    }

    for (const auto& id : trees_.tree_ids()) {
        if (recorded.find(id)) {
            continue;
        }
        if (auto moved = trees_.quarantine_tree(id); !moved) {
            COMPONENT_LOG_ERROR("Could not move unowned tree '{}' aside: {}", id, moved.error().message());
            continue;
        }
        report.quarantined.push_back(id);
    }

    PluginRegistry registry;
    ASSIGN_OR_RETURN(registry, PluginRegistry::from_document(document, trees_.plugin_root()));
    {
        std::unique_lock lock(registry_mutex_);
        registry_ = registry;
    }

    bool live_current = false;
    ASSIGN_OR_RETURN(live_current, store_.live_matches_canonical());
    if (live_current && side_file_current(registry) && report.restored.empty()) {
        COMPONENT_LOG_DEBUG("Live files match canonical version {}", document.version());
        return report;
    }

    COMPONENT_LOG_WARN("Live files drifted from canonical version {}, republishing", document.version());
    RETURN_IF_ERROR(store_.publish_canonical());
    RETURN_IF_ERROR(write_side_file(registry));
    report.republished = true;

    if (restart_on_drift) {
        auto restarted = controller_.restart(options_.target_process, options_.restart_timeout);
        if (!restarted) {
            COMPONENT_LOG_ERROR("Restart of '{}' after republish failed: {}", options_.target_process,
                                restarted.error().message());
        } else {
            report.restarted = true;
        }
    }
    return report;
}

}  // namespace scoreboard::controlhub
