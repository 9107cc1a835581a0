#include "controlhub/plugin/plugin_registry.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>
#include <unordered_map>

namespace scoreboard::controlhub {

namespace fs = std::filesystem;
using json = nlohmann::json;

DECLARE_LOGGER("PluginRegistry");

namespace {

enum class VisitState { Unvisited, Visiting, Visited };

struct Frame {
    std::string id;
    size_t next_dependency = 0;
};

bool keys_overlap(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    auto nested = [](const std::string& inner, const std::string& outer) {
        return inner.size() > outer.size() && inner.compare(0, outer.size(), outer) == 0 &&
               inner[outer.size()] == '.';
    };
    return nested(a, b) || nested(b, a);
}

Error record_error(const std::string& id, const std::string& reason) {
    Error error(ErrorCode::CONFIG_INVALID_FORMAT, "Plugin record '" + id + "': " + reason);
    error.with_field(std::string(ConfigDocument::kReservedSection) + ".plugins." + id);
    return error;
}

}  // namespace

const char* plugin_state_to_string(PluginState state) {
    switch (state) {
        case PluginState::Uninstalled: return "uninstalled";
        case PluginState::Disabled: return "disabled";
        case PluginState::Enabled: return "enabled";
        case PluginState::Failed: return "failed";
    }
    return "unknown";
}

std::optional<PluginState> plugin_state_from_string(const std::string& name) {
    if (name == "uninstalled") return PluginState::Uninstalled;
    if (name == "disabled") return PluginState::Disabled;
    if (name == "enabled") return PluginState::Enabled;
    if (name == "failed") return PluginState::Failed;
    return std::nullopt;
}

Result<PluginRegistry> PluginRegistry::from_document(const ConfigDocument& document, const fs::path& plugin_root) {
    PluginRegistry registry;
    const json section = document.plugin_section();

    for (const auto& item : section.items()) {
        const std::string& id = item.key();
        const json& entry = item.value();
        if (!entry.is_object()) {
            return unexpected(record_error(id, "not an object"));
        }

        auto manifest_json = entry.find("manifest");
        if (manifest_json == entry.end()) {
            return unexpected(record_error(id, "missing manifest"));
        }
        auto manifest = PluginManifest::from_json(*manifest_json);
        if (!manifest) {
            return unexpected(record_error(id, manifest.error().message()));
        }
        if (manifest->id() != id) {
            return unexpected(record_error(id, "manifest declares id '" + manifest->id() + "'"));
        }

        PluginRecord record;
        record.manifest = std::move(*manifest);

        auto state = entry.find("state");
        if (state == entry.end() || !state->is_string()) {
            return unexpected(record_error(id, "missing state"));
        }
        auto parsed_state = plugin_state_from_string(state->get<std::string>());
        if (!parsed_state || *parsed_state == PluginState::Uninstalled) {
            return unexpected(record_error(id, "invalid state '" + state->get<std::string>() + "'"));
        }
        record.state = *parsed_state;

        if (auto version = entry.find("version"); version != entry.end() && version->is_string()) {
            record.installed_version = version->get<std::string>();
        } else {
            record.installed_version = record.manifest.version().to_string();
        }
        if (auto applied = entry.find("last_applied_at"); applied != entry.end() && applied->is_number_integer()) {
            record.last_applied_at = applied->get<i64>();
        }

        if (!plugin_root.empty() && record.state != PluginState::Failed) {
            std::error_code ec;
            if (!fs::is_directory(plugin_root / id, ec)) {
                COMPONENT_LOG_WARN("Plugin {} has no installed tree under {}, marking failed",
                                   id, plugin_root.string());
                record.state = PluginState::Failed;
            }
        }

        registry.records_.emplace(id, std::move(record));
    }
    return registry;
}

void PluginRegistry::save_to(ConfigDocument& document) const {
    json section = json::object();
    for (const auto& [id, record] : records_) {
        section[id] = {
            {"state", plugin_state_to_string(record.state)},
            {"version", record.installed_version},
            {"last_applied_at", record.last_applied_at},
            {"manifest", record.manifest.to_json()}
        };
    }
    document.set_plugin_section(std::move(section));
}

std::vector<PluginRecord> PluginRegistry::list() const {
    std::vector<PluginRecord> records;
    records.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        records.push_back(record);
    }
    return records;
}

const PluginRecord* PluginRegistry::find(const std::string& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

Result<void> PluginRegistry::check_package(const PluginManifest& manifest, const PackageFiles& files,
                                           const ConfigSchema& base_schema) const {
    const std::string& id = manifest.id();
    for (const auto& entry : files) {
        if (!PluginManifest::is_safe_relative_path(entry.first)) {
            return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
                "Unsafe path in package: '" + entry.first + "'").with_field(entry.first));
        }
    }
    if (files.count(manifest.entry_point()) == 0) {
        return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
            "Entry point '" + manifest.entry_point() + "' is not part of the package").with_field("entry_point"));
    }

    for (const auto& rule : manifest.config_rules()) {
        for (const auto& base_rule : base_schema.rules()) {
            if (keys_overlap(rule.key, base_rule.key)) {
                return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
                    "Key '" + rule.key + "' collides with base key '" + base_rule.key + "'").with_field(rule.key));
            }
        }
        for (const auto& [other_id, other] : records_) {
            if (other_id == id) {
                continue;
            }
            for (const auto& other_rule : other.manifest.config_rules()) {
                if (keys_overlap(rule.key, other_rule.key)) {
                    return unexpected(Error(ErrorCode::PLUGIN_BAD_MANIFEST,
                        "Key '" + rule.key + "' collides with key '" + other_rule.key + "' of plugin '" +
                        other_id + "'").with_field(rule.key).with_related({other_id}));
                }
            }
        }
    }

    for (const auto& dependency : manifest.dependencies()) {
        if (records_.count(dependency.id) == 0) {
            return unexpected(Error(ErrorCode::DEPENDENCY_UNRESOLVED,
                "Dependency '" + dependency.id + "' of '" + id + "' is not installed").with_related({dependency.id}));
        }
    }
    return {};
}

Result<PluginRecord> PluginRegistry::install(const PluginManifest& manifest, const PackageFiles& files,
                                             const ConfigSchema& base_schema, bool existing_tree) {
    const std::string& id = manifest.id();
    if (records_.count(id) != 0) {
        return unexpected(Error(ErrorCode::PLUGIN_DUPLICATE_ID,
            "Plugin '" + id + "' is already installed").with_related({id}));
    }
    if (existing_tree) {
        return unexpected(Error(ErrorCode::PLUGIN_FILE_COLLISION,
            "A file tree for '" + id + "' already exists in the plugin directory").with_related({id}));
    }
    RETURN_IF_ERROR(check_package(manifest, files, base_schema));

    PluginRecord record;
    record.manifest = manifest;
    record.state = PluginState::Disabled;
    record.installed_version = manifest.version().to_string();
    records_.emplace(id, record);

    COMPONENT_LOG_DEBUG("Registered {} {}", id, record.installed_version);
    return record;
}

Result<PluginRecord> PluginRegistry::update(const PluginManifest& manifest, const PackageFiles& files,
                                            const ConfigSchema& base_schema) {
    const std::string& id = manifest.id();
    auto it = records_.find(id);
    if (it == records_.end()) {
        return unexpected(Error(ErrorCode::PLUGIN_NOT_FOUND,
            "Plugin '" + id + "' is not installed").with_related({id}));
    }
    RETURN_IF_ERROR(check_package(manifest, files, base_schema));

    // Enabled dependents keep their requirement: same major, at least the minimum.
    const PluginVersion& next = manifest.version();
    for (const auto& dependent : enabled_dependents(id)) {
        for (const auto& dependency : records_.at(dependent).manifest.dependencies()) {
            if (dependency.id == id && !next.satisfies(dependency.minimum)) {
                return unexpected(Error(ErrorCode::VERSION_MISMATCH,
                    "'" + dependent + "' requires " + id + " " + dependency.minimum.to_string() +
                    " (same major), update brings " + next.to_string())
                    .with_related({dependent, dependency.minimum.to_string(), next.to_string()}));
            }
        }
    }

    const PluginRecord previous = it->second;
    it->second.manifest = manifest;
    it->second.installed_version = next.to_string();
    if (it->second.state == PluginState::Failed) {
        it->second.state = PluginState::Disabled;
    }

    // An enabled plugin must not gain a dependency that is not enabled yet.
    if (it->second.state == PluginState::Enabled) {
        auto plan = plan_enable(id);
        if (!plan) {
            it->second = previous;
            return unexpected(std::move(plan).error());
        }
        if (plan->order.size() > 1) {
            it->second = previous;
            std::vector<std::string> missing(plan->order.begin(), plan->order.end() - 1);
            return unexpected(Error(ErrorCode::DEPENDENCY_UNRESOLVED,
                "Enabled plugin '" + id + "' would depend on disabled plugin '" + missing.front() + "'")
                .with_related(missing));
        }
    }

    COMPONENT_LOG_DEBUG("Updated {} {} -> {}", id, previous.installed_version, it->second.installed_version);
    return it->second;
}

Result<void> PluginRegistry::uninstall(const std::string& id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return unexpected(Error(ErrorCode::PLUGIN_NOT_FOUND,
            "Plugin '" + id + "' is not installed").with_related({id}));
    }

    auto dependents = enabled_dependents(id);
    if (!dependents.empty()) {
        return unexpected(Error(ErrorCode::HAS_DEPENDENTS,
            "Plugin '" + id + "' is required by enabled plugins").with_related(dependents));
    }

    records_.erase(it);
    return {};
}

Result<EnablePlan> PluginRegistry::plan_enable(const std::string& id) const {
    const PluginRecord* target = find(id);
    if (!target) {
        return unexpected(Error(ErrorCode::PLUGIN_NOT_FOUND,
            "Plugin '" + id + "' is not installed").with_related({id}));
    }
    if (target->state == PluginState::Failed) {
        return unexpected(Error(ErrorCode::PLUGIN_INVALID_STATE,
            "Plugin '" + id + "' is failed and must be reinstalled").with_related({id}));
    }

    EnablePlan plan;
    std::unordered_map<std::string, VisitState> visits;
    std::vector<Frame> stack;

    visits[id] = VisitState::Visiting;
    stack.push_back({id, 0});

    while (!stack.empty()) {
        const PluginRecord& record = records_.at(stack.back().id);
        const auto& dependencies = record.manifest.dependencies();

        if (stack.back().next_dependency == dependencies.size()) {
            visits[stack.back().id] = VisitState::Visited;
            if (stack.back().id == id || record.state != PluginState::Enabled) {
                plan.order.push_back(stack.back().id);
            }
            stack.pop_back();
            continue;
        }

        const PluginDependency& dependency = dependencies[stack.back().next_dependency++];
        const PluginRecord* found = find(dependency.id);
        if (!found || found->state == PluginState::Failed) {
            return unexpected(Error(ErrorCode::DEPENDENCY_UNRESOLVED,
                "Dependency '" + dependency.id + "' of '" + record.id() + "' is " +
                (found ? "failed" : "not installed")).with_related({dependency.id}));
        }
        if (!found->manifest.version().satisfies(dependency.minimum)) {
            return unexpected(Error(ErrorCode::VERSION_MISMATCH,
                "'" + record.id() + "' requires " + dependency.id + " " + dependency.minimum.to_string() +
                " (same major), found " + found->manifest.version().to_string())
                .with_related({dependency.id, dependency.minimum.to_string(), found->manifest.version().to_string()}));
        }

        VisitState& visit = visits[dependency.id];
        if (visit == VisitState::Visited) {
            continue;
        }
        if (visit == VisitState::Visiting) {
            std::vector<std::string> chain;
            auto start = std::find_if(stack.begin(), stack.end(),
                [&dependency](const Frame& frame) { return frame.id == dependency.id; });
            for (auto it = start; it != stack.end(); ++it) {
                chain.push_back(it->id);
            }
            chain.push_back(dependency.id);

            std::string rendered;
            for (const auto& link : chain) {
                rendered += rendered.empty() ? link : " -> " + link;
            }
            return unexpected(Error(ErrorCode::CYCLIC_DEPENDENCY,
                "Dependency cycle: " + rendered).with_related(chain));
        }

        visit = VisitState::Visiting;
        stack.push_back({dependency.id, 0});
    }

    return plan;
}

Result<DisablePlan> PluginRegistry::plan_disable(const std::string& id) const {
    if (!find(id)) {
        return unexpected(Error(ErrorCode::PLUGIN_NOT_FOUND,
            "Plugin '" + id + "' is not installed").with_related({id}));
    }

    auto dependents = enabled_dependents(id);
    if (!dependents.empty()) {
        return unexpected(Error(ErrorCode::HAS_DEPENDENTS,
            "Plugin '" + id + "' has enabled dependents").with_related(dependents));
    }
    return DisablePlan{id};
}

Result<void> PluginRegistry::set_state(const std::string& id, PluginState state) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return unexpected(Error(ErrorCode::PLUGIN_NOT_FOUND,
            "Plugin '" + id + "' is not installed").with_related({id}));
    }
    if (state == PluginState::Uninstalled) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Use uninstall() to remove a record"));
    }
    it->second.state = state;
    return {};
}

void PluginRegistry::touch(const std::string& id, i64 applied_at) {
    auto it = records_.find(id);
    if (it != records_.end()) {
        it->second.last_applied_at = applied_at;
    }
}

std::vector<std::string> PluginRegistry::enabled_dependents(const std::string& id) const {
    std::vector<std::string> dependents;
    for (const auto& [other_id, record] : records_) {
        if (record.state == PluginState::Enabled && record.manifest.depends_on(id)) {
            dependents.push_back(other_id);
        }
    }
    return dependents;
}

ConfigSchema PluginRegistry::effective_schema(const ConfigSchema& base) const {
    ConfigSchema schema = base;
    std::vector<std::string> boards = base.boards();
    for (const auto& [id, record] : records_) {
        if (record.state == PluginState::Enabled) {
            schema.add_rules(record.manifest.config_rules());
            boards.push_back(id);
        }
    }
    schema.set_boards(std::move(boards));
    return schema;
}

std::vector<std::string> PluginRegistry::boards() const {
    std::vector<std::string> boards = ConfigSchema::builtin_boards();
    for (const auto& [id, record] : records_) {
        if (record.state == PluginState::Enabled) {
            boards.push_back(id);
        }
    }
    return boards;
}

json PluginRegistry::side_file() const {
    json plugins = json::array();
    for (const auto& [id, record] : records_) {
        plugins.push_back({
            {"name", id},
            {"version", record.installed_version},
            {"entry_point", record.manifest.entry_point()},
            {"enabled", record.state == PluginState::Enabled}
        });
    }
    return {{"plugins", std::move(plugins)}};
}

}  // namespace scoreboard::controlhub
