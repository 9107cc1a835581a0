#include "controlhub/config/config_schema.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>
#include <sstream>

namespace scoreboard::controlhub {

using json = nlohmann::json;

DECLARE_LOGGER("ConfigSchema");

namespace {

Error violation(const std::string& key, const std::string& reason) {
    Error error(ErrorCode::CONFIG_VALIDATION_ERROR, key + ": " + reason);
    error.with_field(key);
    return error;
}

std::string describe_number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

bool type_matches(ValueType type, const json& value) {
    switch (type) {
        case ValueType::Bool: return value.is_boolean();
        case ValueType::Int: return value.is_number_integer();
        case ValueType::Float: return value.is_number();
        case ValueType::String: return value.is_string();
        case ValueType::Array: return value.is_array();
        case ValueType::Object: return value.is_object();
    }
    return false;
}

ValidationRule rule(std::string key, ValueType type, json default_value, bool required = false) {
    ValidationRule r;
    r.key = std::move(key);
    r.type = type;
    r.default_value = std::move(default_value);
    r.required = required;
    return r;
}

ValidationRule ranged(std::string key, i64 min, i64 max, i64 default_value, bool required = false) {
    ValidationRule r = rule(std::move(key), ValueType::Int, default_value, required);
    r.min_value = static_cast<double>(min);
    r.max_value = static_cast<double>(max);
    return r;
}

ValidationRule one_of(std::string key, std::vector<json> allowed, json default_value, bool required = false) {
    ValidationRule r = rule(std::move(key), ValueType::String, std::move(default_value), required);
    r.allowed_values = std::move(allowed);
    return r;
}

ValidationRule board_list(std::string key, std::vector<std::string> defaults) {
    ValidationRule r = rule(std::move(key), ValueType::Array, json(defaults));
    r.board_names = true;
    return r;
}

}  // namespace

const char* value_type_to_string(ValueType type) {
    switch (type) {
        case ValueType::Bool: return "bool";
        case ValueType::Int: return "int";
        case ValueType::Float: return "float";
        case ValueType::String: return "string";
        case ValueType::Array: return "array";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

std::optional<ValueType> value_type_from_string(const std::string& name) {
    if (name == "bool" || name == "boolean") return ValueType::Bool;
    if (name == "int" || name == "integer") return ValueType::Int;
    if (name == "float" || name == "number") return ValueType::Float;
    if (name == "string") return ValueType::String;
    if (name == "array") return ValueType::Array;
    if (name == "object") return ValueType::Object;
    return std::nullopt;
}

const std::vector<std::string>& ConfigSchema::builtin_boards() {
    static const std::vector<std::string> boards = {
        "wxalert", "wxforecast", "scoreticker", "seriesticker", "standings",
        "team_summary", "stanley_cup_champions", "christmas", "season_countdown",
        "clock", "weather", "player_stats", "ovi_tracker", "stats_leaders"
    };
    return boards;
}

ConfigSchema ConfigSchema::scoreboard_defaults() {
    ConfigSchema schema;
    schema.set_boards(builtin_boards());

    schema.add_rule(rule("debug", ValueType::Bool, false));
    schema.add_rule(one_of("loglevel", {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}, "INFO"));

    schema.add_rule(one_of("preferences.time_format", {"12h", "24h"}, "12h", true));
    schema.add_rule(rule("preferences.end_of_day", ValueType::String, "8:00", true));
    schema.add_rule(rule("preferences.location", ValueType::String, ""));
    schema.add_rule(ranged("preferences.live_game_refresh_rate", 10, 300, 15, true));
    schema.add_rule(rule("preferences.teams", ValueType::Array, json::array({"Canadiens"})));
    schema.add_rule(ranged("preferences.sog_display_frequency", 1, 20, 4));

    schema.add_rule(board_list("states.off_day", {"scoreticker", "team_summary", "standings", "clock"}));
    schema.add_rule(board_list("states.scheduled", {"scoreticker", "team_summary", "clock"}));
    schema.add_rule(board_list("states.intermission", {"scoreticker", "team_summary"}));
    schema.add_rule(board_list("states.post_game", {"scoreticker", "team_summary", "clock"}));

    schema.add_rule(rule("sbio.dimmer.enabled", ValueType::Bool, false));
    schema.add_rule(one_of("sbio.dimmer.mode", {"always", "off_day", "in_game"}, "always"));
    schema.add_rule(ranged("sbio.dimmer.light_level_lux", 0, 10000, 400));
    schema.add_rule(rule("sbio.pushbutton.enabled", ValueType::Bool, false));

    schema.add_rule(rule("mqtt.broker", ValueType::String, ""));
    schema.add_rule(ranged("mqtt.port", 1, 65535, 1883));

    return schema;
}

void ConfigSchema::add_rule(ValidationRule rule) {
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&rule](const ValidationRule& existing) { return existing.key == rule.key; });
    if (it != rules_.end()) {
        *it = std::move(rule);
    } else {
        rules_.push_back(std::move(rule));
    }
}

void ConfigSchema::add_rules(const std::vector<ValidationRule>& rules) {
    for (const auto& r : rules) {
        add_rule(r);
    }
}

const ValidationRule* ConfigSchema::find_rule(const std::string& key) const {
    for (const auto& r : rules_) {
        if (r.key == key) {
            return &r;
        }
    }
    return nullptr;
}

Result<void> ConfigSchema::check_value(const ValidationRule& rule, const json& value) const {
    if (!type_matches(rule.type, value)) {
        return unexpected(violation(rule.key,
            std::string("expected ") + value_type_to_string(rule.type) + ", got " + value.type_name()));
    }

    if (value.is_number()) {
        double number = value.get<double>();
        if (rule.min_value && number < *rule.min_value) {
            return unexpected(violation(rule.key,
                "value " + value.dump() + " is below minimum " + describe_number(*rule.min_value)));
        }
        if (rule.max_value && number > *rule.max_value) {
            return unexpected(violation(rule.key,
                "value " + value.dump() + " is above maximum " + describe_number(*rule.max_value)));
        }
    }

    auto allowed = [&rule](const json& v) {
        return rule.allowed_values.empty() ||
               std::find(rule.allowed_values.begin(), rule.allowed_values.end(), v) != rule.allowed_values.end();
    };

    if (value.is_array()) {
        for (const auto& element : value) {
            if (!allowed(element)) {
                return unexpected(violation(rule.key, "element " + element.dump() + " is not an allowed value"));
            }
            if (rule.board_names) {
                if (!element.is_string() ||
                    std::find(boards_.begin(), boards_.end(), element.get<std::string>()) == boards_.end()) {
                    return unexpected(violation(rule.key, "unknown board " + element.dump()));
                }
            }
        }
    } else if (!allowed(value)) {
        return unexpected(violation(rule.key, "value " + value.dump() + " is not an allowed value"));
    }

    return {};
}

Result<void> ConfigSchema::check_reserved_section(const ConfigDocument& document) const {
    const auto& root = document.root();
    auto it = root.find(ConfigDocument::kReservedSection);
    if (it == root.end()) {
        return {};
    }
    const std::string section = ConfigDocument::kReservedSection;
    if (!it->is_object()) {
        return unexpected(violation(section, "metadata section must be an object"));
    }
    auto version = it->find("version");
    if (version != it->end() && !version->is_number_unsigned()) {
        return unexpected(violation(section + ".version", "document version must be a non-negative integer"));
    }
    auto plugins = it->find("plugins");
    if (plugins != it->end() && !plugins->is_object()) {
        return unexpected(violation(section + ".plugins", "plugin records must be an object"));
    }
    return {};
}

Result<void> ConfigSchema::validate(const ConfigDocument& document) const {
    RETURN_IF_ERROR(check_reserved_section(document));

    for (const auto& r : rules_) {
        const json* value = document.find(r.key);
        if (!value) {
            if (r.required) {
                return unexpected(violation(r.key, "required key is missing"));
            }
            continue;
        }
        RETURN_IF_ERROR(check_value(r, *value));
    }
    return {};
}

std::vector<Error> ConfigSchema::validate_all(const ConfigDocument& document) const {
    std::vector<Error> errors;
    auto reserved = check_reserved_section(document);
    if (!reserved) {
        errors.push_back(reserved.error());
    }

    for (const auto& r : rules_) {
        const json* value = document.find(r.key);
        if (!value) {
            if (r.required) {
                errors.push_back(violation(r.key, "required key is missing"));
            }
            continue;
        }
        auto checked = check_value(r, *value);
        if (!checked) {
            errors.push_back(checked.error());
        }
    }
    return errors;
}

void ConfigSchema::apply_defaults(ConfigDocument& document) const {
    for (const auto& r : rules_) {
        if (r.default_value && !document.has(r.key)) {
            // Keys nested under a scalar cannot be defaulted; validation reports them.
            auto written = document.set(r.key, *r.default_value);
            if (!written) {
                COMPONENT_LOG_DEBUG("No default written for '{}': {}", r.key, written.error().message());
            }
        }
    }
}

ConfigDocument ConfigSchema::make_default_document() const {
    ConfigDocument document;
    apply_defaults(document);
    return document;
}

Result<ValidationRule> ConfigSchema::rule_from_json(const json& j) {
    if (!j.is_object()) {
        return unexpected(MAKE_ERROR(PLUGIN_BAD_MANIFEST, "Configuration rule must be an object"));
    }

    ValidationRule r;
    auto key = j.find("key");
    if (key == j.end() || !key->is_string() || key->get<std::string>().empty()) {
        return unexpected(MAKE_ERROR(PLUGIN_BAD_MANIFEST, "Configuration rule needs a non-empty 'key'"));
    }
    r.key = key->get<std::string>();

    auto bad = [&r](const std::string& what) {
        Error error(ErrorCode::PLUGIN_BAD_MANIFEST, "Configuration rule '" + r.key + "': " + what);
        error.with_field(r.key);
        return unexpected(std::move(error));
    };

    auto split = ConfigDocument::split_path(r.key);
    if (!split) {
        return bad("malformed key");
    }
    if (ConfigDocument::is_reserved_path(r.key)) {
        return bad("key is reserved");
    }

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        return bad("missing 'type'");
    }
    auto parsed_type = value_type_from_string(type->get<std::string>());
    if (!parsed_type) {
        return bad("unknown type '" + type->get<std::string>() + "'");
    }
    r.type = *parsed_type;

    if (auto it = j.find("min"); it != j.end()) {
        if (!it->is_number()) return bad("'min' must be a number");
        r.min_value = it->get<double>();
    }
    if (auto it = j.find("max"); it != j.end()) {
        if (!it->is_number()) return bad("'max' must be a number");
        r.max_value = it->get<double>();
    }
    if (r.min_value && r.max_value && *r.min_value > *r.max_value) {
        return bad("'min' is greater than 'max'");
    }
    if (auto it = j.find("enum"); it != j.end()) {
        if (!it->is_array()) return bad("'enum' must be an array");
        r.allowed_values.assign(it->begin(), it->end());
    }
    if (auto it = j.find("required"); it != j.end()) {
        if (!it->is_boolean()) return bad("'required' must be a boolean");
        r.required = it->get<bool>();
    }
    if (auto it = j.find("default"); it != j.end()) {
        r.default_value = *it;
        ConfigSchema probe;
        auto checked = probe.check_value(r, *it);
        if (!checked) {
            return bad("default does not satisfy the rule: " + checked.error().message());
        }
    }
    if (r.required && !r.default_value) {
        return bad("required keys must declare a default");
    }
    return r;
}

json ConfigSchema::rule_to_json(const ValidationRule& r) {
    json j = {{"key", r.key}, {"type", value_type_to_string(r.type)}};
    if (r.default_value) j["default"] = *r.default_value;
    if (r.min_value) j["min"] = *r.min_value;
    if (r.max_value) j["max"] = *r.max_value;
    if (!r.allowed_values.empty()) j["enum"] = r.allowed_values;
    if (r.required) j["required"] = true;
    return j;
}

}  // namespace scoreboard::controlhub
