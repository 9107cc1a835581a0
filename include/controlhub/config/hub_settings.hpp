#pragma once

#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <filesystem>
#include <string>

namespace scoreboard::controlhub {

/**
 * @brief Settings of the control hub itself.
 *
 * Loaded from a JSON file (default config/controlhub.json). Missing files fall
 * back to defaults; command line options are applied on top by the caller
 * through the setters.
 */
class HubSettings {
public:
    struct SupervisorConfig {
        std::string host = "127.0.0.1";
        u16 port = 9001;
        u32 request_timeout_ms = 5000;
    };

    struct HealthCheckConfig {
        std::string probe = "supervisor";  // "supervisor" or "tcp"
        std::string host = "127.0.0.1";
        u16 port = 0;
        u32 attempts = 5;
        u32 stable_checks = 3;  // supervisor probe: consecutive RUNNING checks, same pid
        u32 interval_ms = 1000;
        u32 max_interval_ms = 8000;
        u32 timeout_ms = 30000;
    };

    struct ConfigStoreConfig {
        size_t max_backups = 5;
    };

    struct LogConfig {
        std::string level = "info";
        std::string file;
    };

    // Locations derived from scoreboard_dir.
    struct Paths {
        std::filesystem::path scoreboard_dir;
        std::filesystem::path canonical_config;
        std::filesystem::path staging_dir;
        std::filesystem::path lock_file;
        std::filesystem::path live_config;
        std::filesystem::path sample_config;
        std::filesystem::path plugins_file;
        std::filesystem::path plugin_root;
        std::filesystem::path plugin_staging;
        std::filesystem::path package_dir;
        std::filesystem::path version_file;
    };

    static constexpr const char* kDefaultPath = "config/controlhub.json";

    HubSettings() = default;

    static Result<HubSettings> load_from_file(const std::filesystem::path& filename);
    static Result<HubSettings> load_from_string(const std::string& text);
    Result<void> save_to_file(const std::filesystem::path& filename) const;
    std::string save_to_string() const;

    // CONFIG_INVALID_VALUE with field() naming the offending key.
    Result<void> validate() const;

    Paths paths() const;

    const std::filesystem::path& scoreboard_dir() const { return scoreboard_dir_; }
    void set_scoreboard_dir(std::filesystem::path dir);

    const std::string& target_process() const { return target_process_; }
    void set_target_process(std::string name) { target_process_ = std::move(name); }

    u32 restart_timeout_ms() const { return restart_timeout_ms_; }
    void set_restart_timeout_ms(u32 timeout) { restart_timeout_ms_ = timeout; }

    // Empty means <scoreboard_dir>/plugin_packages.
    const std::filesystem::path& package_dir() const { return package_dir_; }
    void set_package_dir(std::filesystem::path dir) { package_dir_ = std::move(dir); }

    const SupervisorConfig& supervisor() const { return supervisor_; }
    void set_supervisor(const SupervisorConfig& config) { supervisor_ = config; }

    const HealthCheckConfig& health_check() const { return health_check_; }
    void set_health_check(const HealthCheckConfig& config) { health_check_ = config; }

    const ConfigStoreConfig& config_store() const { return config_store_; }
    void set_config_store(const ConfigStoreConfig& config) { config_store_ = config; }

    const LogConfig& log() const { return log_; }
    void set_log(const LogConfig& config) { log_ = config; }

private:
    std::filesystem::path scoreboard_dir_ = ".";
    std::string target_process_ = "scoreboard";
    u32 restart_timeout_ms_ = 30000;
    std::filesystem::path package_dir_;

    SupervisorConfig supervisor_;
    HealthCheckConfig health_check_;
    ConfigStoreConfig config_store_;
    LogConfig log_;
};

}  // namespace scoreboard::controlhub
