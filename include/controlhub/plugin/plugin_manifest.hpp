#pragma once

#include "controlhub/config/config_schema.hpp"
#include "controlhub/plugin/plugin_version.hpp"
#include "controlhub/utils/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace scoreboard::controlhub {

struct PluginDependency {
    std::string id;
    PluginVersion minimum;
};

/**
 * @brief Parsed plugin.json of a package. Immutable once loaded.
 *
 * @code
 * {
 *   "id": "nhl_goal_horn",
 *   "version": "1.2.0",
 *   "entry_point": "board.py",
 *   "dependencies": [{"id": "audio_core", "min_version": "1.0"}],
 *   "config": [{"key": "goal_horn.volume", "type": "int", "default": 50, "min": 0, "max": 100}]
 * }
 * @endcode
 */
class PluginManifest {
public:
    static constexpr const char* kFileName = "plugin.json";

    PluginManifest() = default;

    static Result<PluginManifest> parse(const std::string& text);
    static Result<PluginManifest> from_json(const nlohmann::json& json);
    nlohmann::json to_json() const;

    static bool is_valid_id(const std::string& id);
    // Relative, non-empty, no "..", no absolute or backslash paths.
    static bool is_safe_relative_path(const std::string& path);

    const std::string& id() const { return id_; }
    const std::string& description() const { return description_; }
    const PluginVersion& version() const { return version_; }
    const std::string& entry_point() const { return entry_point_; }
    const std::vector<PluginDependency>& dependencies() const { return dependencies_; }
    const std::vector<ValidationRule>& config_rules() const { return config_rules_; }

    bool depends_on(const std::string& id) const;

private:
    std::string id_;
    std::string description_;
    PluginVersion version_;
    std::string entry_point_;
    std::vector<PluginDependency> dependencies_;
    std::vector<ValidationRule> config_rules_;
};

}  // namespace scoreboard::controlhub
