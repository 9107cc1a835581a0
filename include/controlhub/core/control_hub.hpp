#pragma once

#include "controlhub/config/config_schema.hpp"
#include "controlhub/config/config_store.hpp"
#include "controlhub/config/hub_settings.hpp"
#include "controlhub/core/orchestrator.hpp"
#include "controlhub/core/transaction.hpp"
#include "controlhub/plugin/plugin_package.hpp"
#include "controlhub/plugin/plugin_tree.hpp"
#include "controlhub/process/health_probe.hpp"
#include "controlhub/process/process_controller.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

enum class HubState {
    UNINITIALIZED,
    READY,
    SHUTDOWN,
    ERROR
};

const char* hub_state_to_string(HubState state);

struct HubStatus {
    std::string hub_version;
    std::string scoreboard_version;
    std::string target_process;
    bool supervisor_available = false;
    ProcessStatus target_status = ProcessStatus::Unknown;
    DocumentVersion config_version = 0;
    size_t plugin_count = 0;
    size_t enabled_plugin_count = 0;
    bool transaction_in_flight = false;
};

/**
 * @brief Composition root for one scoreboard installation.
 *
 * Owns the config store, plugin trees, supervisor client, health probe and
 * orchestrator built from HubSettings. Callers hold a ControlHub explicitly;
 * nothing here is global.
 */
class ControlHub {
public:
    explicit ControlHub(const HubSettings& settings);
    // Uses the given controller and probe instead of the supervisor binding.
    ControlHub(const HubSettings& settings,
               std::unique_ptr<ProcessController> controller,
               std::unique_ptr<HealthProbe> probe);
    ~ControlHub();

    ControlHub(const ControlHub&) = delete;
    ControlHub& operator=(const ControlHub&) = delete;

    // Creates directories, seeds the canonical document when needed, then
    // reconciles the install with it and loads the plugin registry.
    Result<void> initialize();
    Result<void> shutdown();
    HubState get_state() const;

    Result<TransactionOutcome> apply_change(const Mutation& mutation);
    // `source` is a package directory or an identifier under the package dir.
    Result<TransactionOutcome> install_package(const std::string& source);
    // Same sources as install_package(); the plugin must already be installed.
    Result<TransactionOutcome> update_package(const std::string& source);
    bool cancel();

    std::vector<PluginRecord> list_plugins() const;
    Result<ConfigDocument> read_config() const;
    std::vector<std::string> boards() const;

    HubStatus status();
    Result<std::vector<ProcessInfo>> processes();
    // Start or stop a supervised process; refused while a change is being applied.
    Result<void> start_process(const std::string& name);
    Result<void> stop_process(const std::string& name);

    // Contents of the VERSION file prefixed with "V", "unknown" when absent.
    std::string scoreboard_version() const;

    // First seed candidate that validates: live config, sample config, schema defaults.
    static ConfigDocument seed_document(const HubSettings::Paths& paths, const ConfigSchema& schema);

    const HubSettings& settings() const { return settings_; }
    Orchestrator& orchestrator() { return *orchestrator_; }

private:
    Result<void> require_ready() const;
    Result<PluginPackage> resolve_package(const std::string& source) const;
    static HealthPolicy health_policy(const HubSettings::HealthCheckConfig& config);

    HubSettings settings_;
    HubSettings::Paths paths_;
    ConfigSchema schema_;

    std::unique_ptr<ConfigStore> store_;
    std::unique_ptr<PluginTreeStore> trees_;
    std::unique_ptr<ProcessController> controller_;
    std::unique_ptr<HealthProbe> probe_;
    std::unique_ptr<PackageSource> packages_;
    std::unique_ptr<Orchestrator> orchestrator_;

    mutable std::mutex state_mutex_;
    HubState state_ = HubState::UNINITIALIZED;
};

}  // namespace scoreboard::controlhub
