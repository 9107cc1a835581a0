#include "controlhub/plugin/plugin_manifest.hpp"

#include <algorithm>
#include <set>

namespace scoreboard::controlhub {

using json = nlohmann::json;

namespace {

Error bad_manifest(const std::string& field, const std::string& reason) {
    Error error(ErrorCode::PLUGIN_BAD_MANIFEST, "Bad manifest field '" + field + "': " + reason);
    error.with_field(field);
    return error;
}

}  // namespace

bool PluginManifest::is_valid_id(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

bool PluginManifest::is_safe_relative_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos ||
        path.find('\0') != std::string::npos) {
        return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        const std::string segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

Result<PluginManifest> PluginManifest::parse(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        return unexpected(MAKE_ERROR(PLUGIN_BAD_MANIFEST, std::string("Manifest is not valid JSON: ") + e.what()));
    }
    return from_json(root);
}

Result<PluginManifest> PluginManifest::from_json(const json& root) {
    if (!root.is_object()) {
        return unexpected(MAKE_ERROR(PLUGIN_BAD_MANIFEST, "Manifest must be a JSON object"));
    }

    PluginManifest manifest;

    auto id = root.find("id");
    if (id == root.end() || !id->is_string()) {
        return unexpected(bad_manifest("id", "missing or not a string"));
    }
    manifest.id_ = id->get<std::string>();
    if (!is_valid_id(manifest.id_)) {
        return unexpected(bad_manifest("id", "'" + manifest.id_ + "' does not match [a-z0-9_-]{1,64}"));
    }

    auto version = root.find("version");
    if (version == root.end() || !version->is_string()) {
        return unexpected(bad_manifest("version", "missing or not a string"));
    }
    auto parsed_version = PluginVersion::parse(version->get<std::string>());
    if (!parsed_version) {
        return unexpected(bad_manifest("version", parsed_version.error().message()));
    }
    manifest.version_ = *parsed_version;

    auto entry = root.find("entry_point");
    if (entry == root.end() || !entry->is_string()) {
        return unexpected(bad_manifest("entry_point", "missing or not a string"));
    }
    manifest.entry_point_ = entry->get<std::string>();
    if (!is_safe_relative_path(manifest.entry_point_)) {
        return unexpected(bad_manifest("entry_point", "must be a relative path inside the package"));
    }

    if (auto description = root.find("description"); description != root.end()) {
        if (!description->is_string()) {
            return unexpected(bad_manifest("description", "not a string"));
        }
        manifest.description_ = description->get<std::string>();
    }

    if (auto deps = root.find("dependencies"); deps != root.end()) {
        if (!deps->is_array()) {
            return unexpected(bad_manifest("dependencies", "not an array"));
        }
        std::set<std::string> seen;
        for (const auto& dep : *deps) {
            if (!dep.is_object() || !dep.contains("id") || !dep["id"].is_string()) {
                return unexpected(bad_manifest("dependencies", "each entry needs a string 'id'"));
            }
            PluginDependency dependency;
            dependency.id = dep["id"].get<std::string>();
            if (!is_valid_id(dependency.id)) {
                return unexpected(bad_manifest("dependencies", "invalid plugin id '" + dependency.id + "'"));
            }
            if (dependency.id == manifest.id_) {
                return unexpected(bad_manifest("dependencies", "plugin depends on itself"));
            }
            if (!seen.insert(dependency.id).second) {
                return unexpected(bad_manifest("dependencies", "duplicate dependency '" + dependency.id + "'"));
            }
            if (auto min = dep.find("min_version"); min != dep.end()) {
                if (!min->is_string()) {
                    return unexpected(bad_manifest("dependencies", "'min_version' must be a string"));
                }
                auto minimum = PluginVersion::parse(min->get<std::string>());
                if (!minimum) {
                    return unexpected(bad_manifest("dependencies", minimum.error().message()));
                }
                dependency.minimum = *minimum;
            }
            manifest.dependencies_.push_back(std::move(dependency));
        }
    }

    if (auto config = root.find("config"); config != root.end()) {
        if (!config->is_array()) {
            return unexpected(bad_manifest("config", "not an array"));
        }
        std::set<std::string> keys;
        for (const auto& entry_json : *config) {
            ValidationRule rule;
            ASSIGN_OR_RETURN(rule, ConfigSchema::rule_from_json(entry_json));
            if (!keys.insert(rule.key).second) {
                return unexpected(bad_manifest("config", "duplicate key '" + rule.key + "'"));
            }
            rule.owner = manifest.id_;
            manifest.config_rules_.push_back(std::move(rule));
        }
    }

    return manifest;
}

json PluginManifest::to_json() const {
    json root = {
        {"id", id_},
        {"version", version_.to_string()},
        {"entry_point", entry_point_}
    };
    if (!description_.empty()) {
        root["description"] = description_;
    }

    json deps = json::array();
    for (const auto& dep : dependencies_) {
        deps.push_back({{"id", dep.id}, {"min_version", dep.minimum.to_string()}});
    }
    root["dependencies"] = std::move(deps);

    json config = json::array();
    for (const auto& rule : config_rules_) {
        config.push_back(ConfigSchema::rule_to_json(rule));
    }
    root["config"] = std::move(config);
    return root;
}

bool PluginManifest::depends_on(const std::string& id) const {
    return std::any_of(dependencies_.begin(), dependencies_.end(),
                       [&id](const PluginDependency& dep) { return dep.id == id; });
}

}  // namespace scoreboard::controlhub
