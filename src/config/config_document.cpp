#include "controlhub/config/config_document.hpp"

namespace scoreboard::controlhub {

using json = nlohmann::json;

ConfigDocument::ConfigDocument() : root_(json::object()) {}

ConfigDocument::ConfigDocument(json root) : root_(std::move(root)) {
    if (!root_.is_object()) {
        root_ = json::object();
    }
}

Result<ConfigDocument> ConfigDocument::parse(const std::string& text) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
                "Configuration document must be a JSON object"));
        }
        return ConfigDocument(std::move(root));
    } catch (const json::exception& e) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT,
            std::string("Malformed configuration document: ") + e.what()));
    }
}

std::string ConfigDocument::serialize() const {
    return root_.dump(2) + "\n";
}

std::string ConfigDocument::serialize_live() const {
    json live = root_;
    live.erase(kReservedSection);
    return live.dump(2) + "\n";
}

json& ConfigDocument::meta() {
    auto& section = root_[kReservedSection];
    if (!section.is_object()) {
        section = json::object();
    }
    return section;
}

DocumentVersion ConfigDocument::version() const {
    auto it = root_.find(kReservedSection);
    if (it == root_.end() || !it->is_object()) {
        return 0;
    }
    auto version = it->find("version");
    if (version == it->end() || !version->is_number_unsigned()) {
        return 0;
    }
    return version->get<DocumentVersion>();
}

void ConfigDocument::set_version(DocumentVersion version) {
    meta()["version"] = version;
}

Result<std::vector<std::string>> ConfigDocument::split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            if (current.empty()) {
                return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Empty segment in key '" + path + "'"));
            }
            segments.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (current.empty()) {
        return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Empty segment in key '" + path + "'"));
    }
    segments.push_back(std::move(current));
    return segments;
}

bool ConfigDocument::is_reserved_path(const std::string& path) {
    const std::string reserved = kReservedSection;
    return path == reserved || path.rfind(reserved + ".", 0) == 0;
}

const json* ConfigDocument::find(const std::string& path) const {
    auto segments = split_path(path);
    if (!segments) {
        return nullptr;
    }

    const json* node = &root_;
    for (const auto& segment : *segments) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

bool ConfigDocument::has(const std::string& path) const {
    return find(path) != nullptr;
}

Result<void> ConfigDocument::set(const std::string& path, json value) {
    if (is_reserved_path(path)) {
        return unexpected(Error(ErrorCode::CONFIG_RESERVED_KEY,
            "Key is reserved for control hub metadata").with_field(path));
    }

    std::vector<std::string> segments;
    ASSIGN_OR_RETURN(segments, split_path(path));

    json* node = &root_;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        json& child = (*node)[segments[i]];
        if (child.is_null()) {
            child = json::object();
        } else if (!child.is_object()) {
            return unexpected(Error(ErrorCode::CONFIG_INVALID_VALUE,
                "'" + segments[i] + "' is not a section").with_field(path));
        }
        node = &child;
    }
    (*node)[segments.back()] = std::move(value);
    return {};
}

bool ConfigDocument::erase(const std::string& path) {
    auto segments = split_path(path);
    if (!segments || is_reserved_path(path)) {
        return false;
    }

    json* node = &root_;
    for (size_t i = 0; i + 1 < segments->size(); ++i) {
        auto it = node->find((*segments)[i]);
        if (it == node->end() || !it->is_object()) {
            return false;
        }
        node = &*it;
    }
    return node->erase(segments->back()) > 0;
}

std::optional<std::string> ConfigDocument::get_string(const std::string& path) const {
    const json* value = find(path);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::nullopt;
}

std::optional<i64> ConfigDocument::get_int(const std::string& path) const {
    const json* value = find(path);
    if (value && value->is_number_integer()) {
        return value->get<i64>();
    }
    return std::nullopt;
}

std::optional<double> ConfigDocument::get_float(const std::string& path) const {
    const json* value = find(path);
    if (value && value->is_number()) {
        return value->get<double>();
    }
    return std::nullopt;
}

std::optional<bool> ConfigDocument::get_bool(const std::string& path) const {
    const json* value = find(path);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return std::nullopt;
}

json ConfigDocument::plugin_section() const {
    auto it = root_.find(kReservedSection);
    if (it == root_.end() || !it->is_object()) {
        return json::object();
    }
    auto plugins = it->find("plugins");
    if (plugins == it->end() || !plugins->is_object()) {
        return json::object();
    }
    return *plugins;
}

void ConfigDocument::set_plugin_section(json section) {
    meta()["plugins"] = std::move(section);
}

}  // namespace scoreboard::controlhub
