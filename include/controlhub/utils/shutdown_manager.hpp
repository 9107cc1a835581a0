#pragma once

#include "controlhub/utils/types.hpp"
#include "controlhub/utils/error.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace scoreboard::controlhub::utils {

/**
 * @brief Orderly shutdown of hub components on SIGINT/SIGTERM.
 *
 * Callbacks run grouped by priority. An in-flight transaction is allowed to
 * reach a terminal state before services and logging are torn down.
 */
class ShutdownManager {
public:
    using ShutdownCallback = std::function<void()>;

    enum class Priority {
        Transactions = 0,  // cancel or drain the orchestrator
        Services = 1,      // supervisor client, probes
        Logging = 2        // flush and close sinks last
    };

    static ShutdownManager& instance();

    void register_callback(Priority priority, const std::string& name, ShutdownCallback callback);
    void unregister_callback(const std::string& name);

    // Async-signal-safe: only flips an atomic flag.
    void request_shutdown() noexcept;
    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

    void execute_shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

private:
    struct CallbackInfo {
        Priority priority;
        std::string name;
        ShutdownCallback callback;
    };

    mutable std::mutex mutex_;
    std::vector<CallbackInfo> callbacks_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_complete_{false};

    ShutdownManager() = default;
    ~ShutdownManager() = default;

    void execute_priority_group(const std::vector<CallbackInfo>& group,
                                Priority priority,
                                std::chrono::milliseconds timeout);
};

/**
 * @brief RAII helper for automatic shutdown registration
 */
class ShutdownGuard {
public:
    ShutdownGuard(ShutdownManager::Priority priority, const std::string& name,
                  ShutdownManager::ShutdownCallback callback);
    ~ShutdownGuard();

    ShutdownGuard(const ShutdownGuard&) = delete;
    ShutdownGuard& operator=(const ShutdownGuard&) = delete;

    ShutdownGuard(ShutdownGuard&& other) noexcept;
    ShutdownGuard& operator=(ShutdownGuard&& other) noexcept;

private:
    std::string name_;
    bool registered_ = false;
};

} // namespace scoreboard::controlhub::utils
