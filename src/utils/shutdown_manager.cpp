#include "controlhub/utils/shutdown_manager.hpp"
#include "controlhub/utils/logging.hpp"
#include <algorithm>
#include <future>

namespace scoreboard::controlhub::utils {

DECLARE_LOGGER("ShutdownManager");

ShutdownManager& ShutdownManager::instance() {
    static ShutdownManager instance;
    return instance;
}

void ShutdownManager::register_callback(Priority priority, const std::string& name, ShutdownCallback callback) {
    if (!callback) {
        COMPONENT_LOG_WARN("Attempted to register null shutdown callback for '{}'", name);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back({priority, name, std::move(callback)});

    // Stable so callbacks of equal priority keep registration order
    std::stable_sort(callbacks_.begin(), callbacks_.end(),
        [](const CallbackInfo& a, const CallbackInfo& b) {
            return static_cast<int>(a.priority) < static_cast<int>(b.priority);
        });

    COMPONENT_LOG_DEBUG("Registered shutdown callback '{}' with priority {}",
                        name, static_cast<int>(priority));
}

void ShutdownManager::unregister_callback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(callbacks_.begin(), callbacks_.end(),
        [&name](const CallbackInfo& info) { return info.name == name; });

    if (it != callbacks_.end()) {
        callbacks_.erase(it, callbacks_.end());
    }
}

void ShutdownManager::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

void ShutdownManager::execute_shutdown(std::chrono::milliseconds timeout) {
    bool expected = false;
    if (!shutdown_complete_.compare_exchange_strong(expected, true)) {
        COMPONENT_LOG_DEBUG("Shutdown already completed");
        return;
    }

    std::vector<CallbackInfo> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = callbacks_;
    }

    COMPONENT_LOG_INFO("Beginning coordinated shutdown with {}ms timeout", timeout.count());
    auto start_time = std::chrono::steady_clock::now();

    for (int priority = 0; priority <= static_cast<int>(Priority::Logging); ++priority) {
        auto remaining_time = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (remaining_time <= std::chrono::milliseconds(0)) {
            COMPONENT_LOG_WARN("Shutdown timeout reached, skipping priority groups >= {}", priority);
            return;
        }

        std::vector<CallbackInfo> group;
        for (const auto& info : snapshot) {
            if (static_cast<int>(info.priority) == priority) {
                group.push_back(info);
            }
        }
        execute_priority_group(group, static_cast<Priority>(priority), remaining_time);
    }
}

void ShutdownManager::execute_priority_group(const std::vector<CallbackInfo>& group,
                                             Priority priority,
                                             std::chrono::milliseconds timeout) {
    if (group.empty()) {
        return;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(group.size());

    for (const auto& info : group) {
        futures.push_back(std::async(std::launch::async, [&info]() {
            try {
                info.callback();
            } catch (const std::exception& e) {
                COMPONENT_LOG_ERROR("Exception in shutdown callback '{}': {}", info.name, e.what());
            }
        }));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto& future : futures) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            COMPONENT_LOG_WARN("Shutdown callback timed out in priority group {}",
                               static_cast<int>(priority));
        }
    }
}

//
// ShutdownGuard implementation
//

ShutdownGuard::ShutdownGuard(ShutdownManager::Priority priority, const std::string& name,
                             ShutdownManager::ShutdownCallback callback)
    : name_(name), registered_(true) {
    ShutdownManager::instance().register_callback(priority, name, std::move(callback));
}

ShutdownGuard::~ShutdownGuard() {
    if (registered_) {
        ShutdownManager::instance().unregister_callback(name_);
    }
}

ShutdownGuard::ShutdownGuard(ShutdownGuard&& other) noexcept
    : name_(std::move(other.name_)), registered_(other.registered_) {
    other.registered_ = false;
}

ShutdownGuard& ShutdownGuard::operator=(ShutdownGuard&& other) noexcept {
    if (this != &other) {
        if (registered_) {
            ShutdownManager::instance().unregister_callback(name_);
        }

        name_ = std::move(other.name_);
        registered_ = other.registered_;
        other.registered_ = false;
    }
    return *this;
}

} // namespace scoreboard::controlhub::utils
