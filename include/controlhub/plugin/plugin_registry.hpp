#pragma once

#include "controlhub/config/config_document.hpp"
#include "controlhub/config/config_schema.hpp"
#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

enum class PluginState {
    Uninstalled,
    Disabled,  // installed, not enabled
    Enabled,
    Failed     // installed tree missing or broken; must be reinstalled
};

const char* plugin_state_to_string(PluginState state);
std::optional<PluginState> plugin_state_from_string(const std::string& name);

struct PluginRecord {
    PluginManifest manifest;
    PluginState state = PluginState::Uninstalled;
    std::string installed_version;
    i64 last_applied_at = 0;  // unix seconds, 0 when never applied

    const std::string& id() const { return manifest.id(); }
};

// Records to enable, dependencies before dependents, ending with the target.
struct EnablePlan {
    std::vector<std::string> order;
};

struct DisablePlan {
    std::string id;
};

/**
 * @brief Catalogue of installed plugins.
 *
 * A registry is a plain value: the orchestrator copies the canonical one,
 * mutates the copy inside a transaction and swaps it in on commit. Records are
 * persisted in the reserved section of the configuration document.
 */
class PluginRegistry {
public:
    PluginRegistry() = default;

    // Records whose tree is missing under `plugin_root` are loaded as Failed.
    static Result<PluginRegistry> from_document(const ConfigDocument& document,
                                                const std::filesystem::path& plugin_root);
    void save_to(ConfigDocument& document) const;

    std::vector<PluginRecord> list() const;
    const PluginRecord* find(const std::string& id) const;
    bool empty() const { return records_.empty(); }

    // Adds an Installed-Disabled record. Does not touch the file system;
    // `existing_tree` reports a tree already present under the plugin's name.
    Result<PluginRecord> install(const PluginManifest& manifest, const PackageFiles& files,
                                 const ConfigSchema& base_schema, bool existing_tree = false);
    // Swaps in a new manifest for an installed plugin. Enabled dependents must
    // still accept the new version; a Failed record comes back Disabled.
    Result<PluginRecord> update(const PluginManifest& manifest, const PackageFiles& files,
                                const ConfigSchema& base_schema);
    Result<void> uninstall(const std::string& id);

    Result<EnablePlan> plan_enable(const std::string& id) const;
    Result<DisablePlan> plan_disable(const std::string& id) const;

    Result<void> set_state(const std::string& id, PluginState state);
    void touch(const std::string& id, i64 applied_at);

    // Ids of Enabled plugins that directly depend on `id`, sorted.
    std::vector<std::string> enabled_dependents(const std::string& id) const;

    // Base rules plus the contributed rules of every Enabled plugin, with the board catalogue.
    ConfigSchema effective_schema(const ConfigSchema& base) const;
    std::vector<std::string> boards() const;

    // {"plugins": [{"name", "version", "entry_point", "enabled"}]}
    nlohmann::json side_file() const;

private:
    // Paths, entry point, key collisions with other records and installed dependencies.
    Result<void> check_package(const PluginManifest& manifest, const PackageFiles& files,
                               const ConfigSchema& base_schema) const;

    std::map<std::string, PluginRecord> records_;
};

}  // namespace scoreboard::controlhub
