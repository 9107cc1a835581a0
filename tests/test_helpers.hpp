#pragma once

#include "controlhub/config/config_document.hpp"
#include "controlhub/plugin/plugin_manifest.hpp"
#include "controlhub/process/health_probe.hpp"
#include "controlhub/process/process_controller.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace scoreboard::controlhub::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("controlhub_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Minimal manifest JSON; dependencies are {id, min_version} pairs.
inline nlohmann::json manifest_json(const std::string& id,
                                    const std::string& version = "1.0.0",
                                    const std::vector<std::pair<std::string, std::string>>& dependencies = {},
                                    const nlohmann::json& config = nlohmann::json::array()) {
    nlohmann::json deps = nlohmann::json::array();
    for (const auto& [dep_id, minimum] : dependencies) {
        deps.push_back({{"id", dep_id}, {"min_version", minimum}});
    }
    return {
        {"id", id},
        {"version", version},
        {"entry_point", "board.py"},
        {"description", "Test board " + id},
        {"dependencies", deps},
        {"config", config}
    };
}

inline PluginManifest make_manifest(const std::string& id,
                                    const std::string& version = "1.0.0",
                                    const std::vector<std::pair<std::string, std::string>>& dependencies = {},
                                    const nlohmann::json& config = nlohmann::json::array()) {
    auto manifest = PluginManifest::from_json(manifest_json(id, version, dependencies, config));
    if (!manifest) {
        throw std::runtime_error("bad test manifest: " + manifest.error().message());
    }
    return manifest.value();
}

inline PackageFiles package_files(const PluginManifest& manifest) {
    PackageFiles files;
    files[PluginManifest::kFileName] = manifest.to_json().dump(2);
    files[manifest.entry_point()] = "# " + manifest.id() + "\n";
    files["assets/logo.txt"] = manifest.id();
    return files;
}

// Valid scoreboard configuration with every required key.
inline ConfigDocument valid_config() {
    return ConfigDocument(nlohmann::json{
        {"debug", false},
        {"loglevel", "INFO"},
        {"preferences", {
            {"time_format", "12h"},
            {"end_of_day", "8:00"},
            {"location", "Montreal"},
            {"live_game_refresh_rate", 15},
            {"teams", {"Canadiens"}}
        }},
        {"states", {
            {"off_day", {"scoreticker", "clock"}},
            {"scheduled", {"scoreticker"}}
        }}
    });
}

/**
 * @brief Scripted ProcessController. restart() pops the next scripted result
 * (success once the script runs out) and counts every call.
 */
class FakeProcessController : public ProcessController {
public:
    Result<ProcessStatus> status(const std::string& name) override {
        std::lock_guard lock(mutex_);
        if (!known(name)) {
            return unexpected(MAKE_ERROR(PROCESS_NOT_FOUND, "unknown process " + name));
        }
        return running_ ? ProcessStatus::Running : ProcessStatus::Stopped;
    }

    Result<ProcessInfo> info(const std::string& name) override {
        std::lock_guard lock(mutex_);
        if (!known(name)) {
            return unexpected(MAKE_ERROR(PROCESS_NOT_FOUND, "unknown process " + name));
        }
        ProcessInfo process = describe_target();
        if (!observations_.empty()) {
            process.state = observations_.front().first;
            process.status = process.state == "RUNNING" ? ProcessStatus::Running : ProcessStatus::Stopped;
            process.pid = observations_.front().second;
            observations_.pop_front();
        }
        return process;
    }

    Result<void> start(const std::string& name) override {
        std::lock_guard lock(mutex_);
        if (!known(name)) {
            return unexpected(MAKE_ERROR(PROCESS_NOT_FOUND, "unknown process " + name));
        }
        running_ = true;
        return {};
    }

    Result<void> stop(const std::string& name) override {
        std::lock_guard lock(mutex_);
        if (!known(name)) {
            return unexpected(MAKE_ERROR(PROCESS_NOT_FOUND, "unknown process " + name));
        }
        running_ = false;
        return {};
    }

    Result<void> restart(const std::string& name, Milliseconds timeout) override {
        std::function<void()> hook;
        Result<void> result;
        {
            std::lock_guard lock(mutex_);
            ++restart_calls_;
            last_timeout_ = timeout;
            restarted_names_.push_back(name);
            hook = on_restart_;
            if (!script_.empty()) {
                result = script_.front();
                script_.pop_front();
            }
        }
        if (hook) {
            hook();
        }
        return result;
    }

    Result<std::vector<ProcessInfo>> list_processes() override {
        std::lock_guard lock(mutex_);
        return std::vector<ProcessInfo>{describe_target()};
    }

    bool is_available() override { return available_; }

    void script_restart(Result<void> result) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(result));
    }
    void set_on_restart(std::function<void()> hook) {
        std::lock_guard lock(mutex_);
        on_restart_ = std::move(hook);
    }
    void set_available(bool available) { available_ = available; }
    // Queues one (state, pid) answer for info(); the steady state resumes once drained.
    void script_info(std::string state, i64 pid) {
        std::lock_guard lock(mutex_);
        observations_.emplace_back(std::move(state), pid);
    }

    int restart_calls() const {
        std::lock_guard lock(mutex_);
        return restart_calls_;
    }
    Milliseconds last_timeout() const {
        std::lock_guard lock(mutex_);
        return last_timeout_;
    }

private:
    bool known(const std::string& name) const { return name == target_; }

    ProcessInfo describe_target() const {
        ProcessInfo process;
        process.name = target_;
        process.group = target_;
        process.state = running_ ? "RUNNING" : "STOPPED";
        process.status = running_ ? ProcessStatus::Running : ProcessStatus::Stopped;
        process.pid = running_ ? 4242 : 0;
        return process;
    }

    mutable std::mutex mutex_;
    std::string target_ = "scoreboard";
    bool running_ = true;
    std::atomic<bool> available_{true};
    int restart_calls_ = 0;
    Milliseconds last_timeout_{0};
    std::vector<std::string> restarted_names_;
    std::deque<Result<void>> script_;
    std::function<void()> on_restart_;
    std::deque<std::pair<std::string, i64>> observations_;
};

// Health probe that passes or fails on demand and counts checks.
class ScriptedHealthProbe : public HealthProbe {
public:
    Result<void> check() override {
        ++checks_;
        if (healthy_) {
            return {};
        }
        return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED, "scoreboard did not answer"));
    }
    std::string describe() const override { return "scripted"; }

    void set_healthy(bool healthy) { healthy_ = healthy; }
    int checks() const { return checks_; }

private:
    std::atomic<bool> healthy_{true};
    std::atomic<int> checks_{0};
};

}  // namespace scoreboard::controlhub::test
