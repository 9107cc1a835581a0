#pragma once

#include "controlhub/config/config_document.hpp"
#include "controlhub/utils/error.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

enum class ValueType {
    Bool,
    Int,
    Float,
    String,
    Array,
    Object
};

const char* value_type_to_string(ValueType type);
std::optional<ValueType> value_type_from_string(const std::string& name);

/**
 * @brief Constraint on one dotted configuration key.
 *
 * Ranges apply to Int and Float values. For Array values the enumeration
 * (and the board-name check) applies to every element.
 */
struct ValidationRule {
    std::string key;
    ValueType type = ValueType::String;
    std::optional<nlohmann::json> default_value;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::vector<nlohmann::json> allowed_values;
    bool required = false;
    bool board_names = false;  // array of board names known to the schema
    std::string owner;         // empty for base keys, plugin id otherwise
};

/**
 * @brief Effective schema: base scoreboard rules plus the contributed rules of
 * the enabled plugins.
 */
class ConfigSchema {
public:
    ConfigSchema() = default;

    // Base schema of the scoreboard configuration file.
    static ConfigSchema scoreboard_defaults();
    static const std::vector<std::string>& builtin_boards();

    void add_rule(ValidationRule rule);
    void add_rules(const std::vector<ValidationRule>& rules);
    const ValidationRule* find_rule(const std::string& key) const;
    bool has_rule(const std::string& key) const { return find_rule(key) != nullptr; }
    const std::vector<ValidationRule>& rules() const { return rules_; }

    void set_boards(std::vector<std::string> boards) { boards_ = std::move(boards); }
    const std::vector<std::string>& boards() const { return boards_; }

    // First violation as CONFIG_VALIDATION_ERROR with field() set to the key.
    Result<void> validate(const ConfigDocument& document) const;
    // Every violation, in rule order.
    std::vector<Error> validate_all(const ConfigDocument& document) const;

    Result<void> check_value(const ValidationRule& rule, const nlohmann::json& value) const;

    // Writes the default of every rule whose key is absent.
    void apply_defaults(ConfigDocument& document) const;
    ConfigDocument make_default_document() const;

    // Manifest representation: {"key", "type", "default", "min", "max", "enum", "required"}.
    static Result<ValidationRule> rule_from_json(const nlohmann::json& json);
    static nlohmann::json rule_to_json(const ValidationRule& rule);

private:
    Result<void> check_reserved_section(const ConfigDocument& document) const;

    std::vector<ValidationRule> rules_;
    std::vector<std::string> boards_;
};

}  // namespace scoreboard::controlhub
