#pragma once

#include "controlhub/config/config_document.hpp"
#include "controlhub/config/config_store.hpp"
#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/plugin/plugin_registry.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scoreboard::controlhub {

enum class TransactionStatus {
    Open,
    Validated,
    Applying,
    Verifying,
    Committed,
    RolledBack
};

const char* transaction_status_to_string(TransactionStatus status);

struct SetConfigValues {
    std::vector<std::pair<std::string, nlohmann::json>> values;
};

struct EnablePlugin {
    std::string id;
};

struct DisablePlugin {
    std::string id;
};

struct InstallPlugin {
    PluginManifest manifest;
    PackageFiles files;
};

// Replaces the files and manifest of an installed plugin, keeping its state.
struct UpdatePlugin {
    PluginManifest manifest;
    PackageFiles files;
};

struct UninstallPlugin {
    std::string id;
    bool keep_config = false;  // leave the plugin's contributed keys in the document
};

using Mutation =
    std::variant<SetConfigValues, EnablePlugin, DisablePlugin, InstallPlugin, UpdatePlugin, UninstallPlugin>;

std::string describe_mutation(const Mutation& mutation);

struct TransactionOutcome {
    TransactionId id = 0;
    TransactionStatus status = TransactionStatus::Open;
    std::vector<std::string> affected_plugins;
    DocumentVersion version = 0;  // committed canonical version
};

/**
 * @brief State of one in-flight change. Owned by the orchestrator for a
 * single applyChange call and never shared.
 */
class Transaction {
public:
    Transaction(TransactionId id, ConfigDocument document, std::string snapshot, PluginRegistry registry);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    TransactionId id() const { return id_; }
    TransactionStatus status() const { return status_; }
    bool terminal() const {
        return status_ == TransactionStatus::Committed || status_ == TransactionStatus::RolledBack;
    }

    // INVALID_STATE for transitions the state machine does not allow.
    Result<void> advance(TransactionStatus next);
    // Every non-terminal state may roll back; no-op once terminal.
    void mark_rolled_back();

    ConfigDocument& document() { return document_; }
    PluginRegistry& registry() { return registry_; }
    // Exact bytes of the canonical document when the transaction opened.
    const std::string& snapshot() const { return snapshot_; }

    std::optional<StagedHandle>& staged() { return staged_; }

    std::vector<std::string>& affected() { return affected_; }
    std::vector<std::string>& pending_installs() { return pending_installs_; }
    std::vector<std::string>& pending_removals() { return pending_removals_; }
    // Install trees already moved under the plugin root by this transaction.
    std::vector<std::string>& placed_trees() { return placed_trees_; }
    std::vector<std::string>& pending_updates() { return pending_updates_; }
    // Updated trees swapped in; the old tree waits as a backup until commit.
    std::vector<std::string>& replaced_trees() { return replaced_trees_; }

    static bool transition_allowed(TransactionStatus from, TransactionStatus to);

private:
    TransactionId id_;
    TransactionStatus status_ = TransactionStatus::Open;
    ConfigDocument document_;
    std::string snapshot_;
    PluginRegistry registry_;
    std::optional<StagedHandle> staged_;
    std::vector<std::string> affected_;
    std::vector<std::string> pending_installs_;
    std::vector<std::string> pending_removals_;
    std::vector<std::string> placed_trees_;
    std::vector<std::string> pending_updates_;
    std::vector<std::string> replaced_trees_;
};

}  // namespace scoreboard::controlhub
