#pragma once

#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

/**
 * @brief The scoreboard configuration as a nested JSON document.
 *
 * Values are addressed with dotted paths ("preferences.time_format").
 * The top-level "_controlhub" object is reserved for hub metadata: the
 * document version and the plugin record section. It is stripped from the
 * copy handed to the display process.
 */
class ConfigDocument {
public:
    static constexpr const char* kReservedSection = "_controlhub";

    ConfigDocument();
    explicit ConfigDocument(nlohmann::json root);

    static Result<ConfigDocument> parse(const std::string& text);

    // Deterministic: keys sorted, two-space indent, trailing newline.
    std::string serialize() const;
    // Same as serialize() without the reserved section.
    std::string serialize_live() const;

    DocumentVersion version() const;
    void set_version(DocumentVersion version);

    bool has(const std::string& path) const;
    const nlohmann::json* find(const std::string& path) const;

    // Creates intermediate objects. Fails on reserved or malformed paths and when an
    // intermediate segment holds a non-object value.
    Result<void> set(const std::string& path, nlohmann::json value);
    bool erase(const std::string& path);

    std::optional<std::string> get_string(const std::string& path) const;
    std::optional<i64> get_int(const std::string& path) const;
    std::optional<double> get_float(const std::string& path) const;
    std::optional<bool> get_bool(const std::string& path) const;

    // Plugin records as persisted by the registry (object keyed by plugin id).
    nlohmann::json plugin_section() const;
    void set_plugin_section(nlohmann::json section);

    const nlohmann::json& root() const { return root_; }

    bool operator==(const ConfigDocument& other) const { return root_ == other.root_; }

    static Result<std::vector<std::string>> split_path(const std::string& path);
    static bool is_reserved_path(const std::string& path);

private:
    nlohmann::json& meta();

    nlohmann::json root_;
};

}  // namespace scoreboard::controlhub
