#include "controlhub/config/hub_settings.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

namespace scoreboard::controlhub {

namespace fs = std::filesystem;
using json = nlohmann::json;

DECLARE_LOGGER("HubSettings");

namespace {

Error invalid(const std::string& key, const std::string& reason) {
    Error error(ErrorCode::CONFIG_INVALID_VALUE, key + ": " + reason);
    error.with_field(key);
    return error;
}

template<typename T>
Result<void> read_unsigned(const json& section, const char* key, const std::string& prefix, T& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    const std::string field = prefix + key;
    if (!it->is_number_integer()) {
        return unexpected(invalid(field, "expected an integer"));
    }
    i64 value = it->get<i64>();
    if (value < 0 || static_cast<u64>(value) > std::numeric_limits<T>::max()) {
        return unexpected(invalid(field, "value " + std::to_string(value) + " is out of range"));
    }
    out = static_cast<T>(value);
    return {};
}

Result<void> read_string(const json& section, const char* key, const std::string& prefix, std::string& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (!it->is_string()) {
        return unexpected(invalid(prefix + key, "expected a string"));
    }
    out = it->get<std::string>();
    return {};
}

Result<const json*> read_section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) {
        return static_cast<const json*>(nullptr);
    }
    if (!it->is_object()) {
        return unexpected(invalid(key, "expected an object"));
    }
    return &*it;
}

}  // namespace

void HubSettings::set_scoreboard_dir(fs::path dir) {
    std::error_code ec;
    auto absolute = fs::absolute(dir, ec);
    scoreboard_dir_ = ec ? std::move(dir) : absolute.lexically_normal();
}

Result<HubSettings> HubSettings::load_from_file(const fs::path& filename) {
    auto text = utils::read_file(filename);
    if (!text) {
        if (text.error().code() == ErrorCode::CONFIG_FILE_NOT_FOUND) {
            COMPONENT_LOG_INFO("No settings file at {}, using defaults", filename.string());
            HubSettings defaults;
            defaults.set_scoreboard_dir(defaults.scoreboard_dir_);
            return defaults;
        }
        return unexpected(std::move(text).error());
    }
    return load_from_string(*text);
}

Result<HubSettings> HubSettings::load_from_string(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, std::string("Malformed settings: ") + e.what()));
    }
    if (!root.is_object()) {
        return unexpected(MAKE_ERROR(CONFIG_INVALID_FORMAT, "Settings must be a JSON object"));
    }

    HubSettings settings;

    std::string scoreboard_dir = settings.scoreboard_dir_.string();
    RETURN_IF_ERROR(read_string(root, "scoreboard_dir", "", scoreboard_dir));
    settings.set_scoreboard_dir(scoreboard_dir);
    RETURN_IF_ERROR(read_string(root, "target_process", "", settings.target_process_));
    RETURN_IF_ERROR(read_unsigned(root, "restart_timeout_ms", "", settings.restart_timeout_ms_));

    std::string package_dir;
    RETURN_IF_ERROR(read_string(root, "package_dir", "", package_dir));
    settings.package_dir_ = package_dir;

    const json* section = nullptr;

    ASSIGN_OR_RETURN(section, read_section(root, "supervisor"));
    if (section) {
        RETURN_IF_ERROR(read_string(*section, "host", "supervisor.", settings.supervisor_.host));
        RETURN_IF_ERROR(read_unsigned(*section, "port", "supervisor.", settings.supervisor_.port));
        RETURN_IF_ERROR(read_unsigned(*section, "request_timeout_ms", "supervisor.",
                                      settings.supervisor_.request_timeout_ms));
    }

    ASSIGN_OR_RETURN(section, read_section(root, "health_check"));
    if (section) {
        auto& hc = settings.health_check_;
        RETURN_IF_ERROR(read_string(*section, "probe", "health_check.", hc.probe));
        RETURN_IF_ERROR(read_string(*section, "host", "health_check.", hc.host));
        RETURN_IF_ERROR(read_unsigned(*section, "port", "health_check.", hc.port));
        RETURN_IF_ERROR(read_unsigned(*section, "attempts", "health_check.", hc.attempts));
        RETURN_IF_ERROR(read_unsigned(*section, "stable_checks", "health_check.", hc.stable_checks));
        RETURN_IF_ERROR(read_unsigned(*section, "interval_ms", "health_check.", hc.interval_ms));
        RETURN_IF_ERROR(read_unsigned(*section, "max_interval_ms", "health_check.", hc.max_interval_ms));
        RETURN_IF_ERROR(read_unsigned(*section, "timeout_ms", "health_check.", hc.timeout_ms));
    }

    ASSIGN_OR_RETURN(section, read_section(root, "config_store"));
    if (section) {
        RETURN_IF_ERROR(read_unsigned(*section, "max_backups", "config_store.",
                                      settings.config_store_.max_backups));
    }

    ASSIGN_OR_RETURN(section, read_section(root, "log"));
    if (section) {
        RETURN_IF_ERROR(read_string(*section, "level", "log.", settings.log_.level));
        RETURN_IF_ERROR(read_string(*section, "file", "log.", settings.log_.file));
    }

    static const char* known[] = {"scoreboard_dir", "target_process", "restart_timeout_ms", "package_dir",
                                  "supervisor", "health_check", "config_store", "log"};
    for (const auto& item : root.items()) {
        bool recognised = false;
        for (const char* key : known) {
            recognised = recognised || item.key() == key;
        }
        if (!recognised) {
            COMPONENT_LOG_WARN("Ignoring unknown setting '{}'", item.key());
        }
    }

    RETURN_IF_ERROR(settings.validate());
    return settings;
}

std::string HubSettings::save_to_string() const {
    json root;
    root["scoreboard_dir"] = scoreboard_dir_.string();
    root["target_process"] = target_process_;
    root["restart_timeout_ms"] = restart_timeout_ms_;
    if (!package_dir_.empty()) {
        root["package_dir"] = package_dir_.string();
    }
    root["supervisor"] = {
        {"host", supervisor_.host},
        {"port", supervisor_.port},
        {"request_timeout_ms", supervisor_.request_timeout_ms}
    };
    root["health_check"] = {
        {"probe", health_check_.probe},
        {"host", health_check_.host},
        {"port", health_check_.port},
        {"attempts", health_check_.attempts},
        {"stable_checks", health_check_.stable_checks},
        {"interval_ms", health_check_.interval_ms},
        {"max_interval_ms", health_check_.max_interval_ms},
        {"timeout_ms", health_check_.timeout_ms}
    };
    root["config_store"] = {{"max_backups", config_store_.max_backups}};
    root["log"] = {{"level", log_.level}, {"file", log_.file}};
    return root.dump(2) + "\n";
}

Result<void> HubSettings::save_to_file(const fs::path& filename) const {
    return utils::atomic_write_file(filename, save_to_string());
}

Result<void> HubSettings::validate() const {
    if (target_process_.empty()) {
        return unexpected(invalid("target_process", "must not be empty"));
    }
    if (restart_timeout_ms_ == 0) {
        return unexpected(invalid("restart_timeout_ms", "must be greater than zero"));
    }
    if (supervisor_.host.empty()) {
        return unexpected(invalid("supervisor.host", "must not be empty"));
    }
    if (supervisor_.port == 0) {
        return unexpected(invalid("supervisor.port", "must be in 1..65535"));
    }
    if (supervisor_.request_timeout_ms == 0) {
        return unexpected(invalid("supervisor.request_timeout_ms", "must be greater than zero"));
    }

    const auto& hc = health_check_;
    if (hc.probe != "supervisor" && hc.probe != "tcp") {
        return unexpected(invalid("health_check.probe", "unknown probe '" + hc.probe + "'"));
    }
    if (hc.probe == "tcp" && hc.port == 0) {
        return unexpected(invalid("health_check.port", "must be in 1..65535 for the tcp probe"));
    }
    if (hc.attempts == 0) {
        return unexpected(invalid("health_check.attempts", "must be at least 1"));
    }
    if (hc.stable_checks == 0 || hc.stable_checks > hc.attempts) {
        return unexpected(invalid("health_check.stable_checks", "must be in 1..attempts"));
    }
    if (hc.interval_ms == 0) {
        return unexpected(invalid("health_check.interval_ms", "must be greater than zero"));
    }
    if (hc.max_interval_ms < hc.interval_ms) {
        return unexpected(invalid("health_check.max_interval_ms", "must not be below interval_ms"));
    }
    if (hc.timeout_ms == 0) {
        return unexpected(invalid("health_check.timeout_ms", "must be greater than zero"));
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical"};
    if (std::none_of(std::begin(levels), std::end(levels),
                     [this](const char* level) { return log_.level == level; })) {
        return unexpected(invalid("log.level", "unknown level '" + log_.level + "'"));
    }
    return {};
}

HubSettings::Paths HubSettings::paths() const {
    Paths p;
    p.scoreboard_dir = scoreboard_dir_;
    const fs::path config_dir = scoreboard_dir_ / "config";
    p.canonical_config = config_dir / ".controlhub" / "config.json";
    p.staging_dir = config_dir / ".controlhub" / "staging";
    p.lock_file = config_dir / ".controlhub" / "transaction.lock";
    p.live_config = config_dir / "config.json";
    p.sample_config = config_dir / "config.json.sample";
    p.plugins_file = scoreboard_dir_ / "plugins.json";
    p.plugin_root = scoreboard_dir_ / "plugins";
    p.plugin_staging = p.plugin_root / ".staging";
    p.package_dir = package_dir_.empty() ? scoreboard_dir_ / "plugin_packages" : package_dir_;
    p.version_file = scoreboard_dir_ / "VERSION";
    return p;
}

}  // namespace scoreboard::controlhub
