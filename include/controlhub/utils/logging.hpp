#pragma once

#include "controlhub/utils/types.hpp"
#include "controlhub/utils/error.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace scoreboard::controlhub {

enum class LogLevel {
    TRACE = 0,
    DEBUG_LEVEL = 1,
    INFO = 2,
    WARN = 3,
    ERROR_LEVEL = 4,
    CRITICAL = 5
};

class Logger {
public:
    static Result<void> initialize(LogLevel level = LogLevel::INFO,
                                   const std::string& log_file = "",
                                   bool enable_console = true);

    static void shutdown();
    static bool is_initialized();

    // Returns nullptr until initialize() succeeded; callers drop the message then.
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name = "main");

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static LogLevel from_string(const std::string& level_str);
    static const char* to_string(LogLevel level);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    template<typename... Args>
    static void log(const std::string& logger_name, LogLevel level,
                    std::string_view format, Args&&... args) {
        if (auto logger = get_logger(logger_name)) {
            if constexpr (sizeof...(Args) == 0) {
                logger->log(to_spdlog_level(level), spdlog::string_view_t(format.data(), format.size()));
            } else {
                logger->log(to_spdlog_level(level), fmt::runtime(format), std::forward<Args>(args)...);
            }
        }
    }

    template<typename... Args>
    static void trace(std::string_view format, Args&&... args) {
        log("main", LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view format, Args&&... args) {
        log("main", LogLevel::DEBUG_LEVEL, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view format, Args&&... args) {
        log("main", LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view format, Args&&... args) {
        log("main", LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view format, Args&&... args) {
        log("main", LogLevel::ERROR_LEVEL, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view format, Args&&... args) {
        log("main", LogLevel::CRITICAL, format, std::forward<Args>(args)...);
    }

private:
    static std::atomic<bool> initialized_;
    static LogLevel current_level_;
};

// Convenience macros for logging
#define LOG_TRACE(...) ::scoreboard::controlhub::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::scoreboard::controlhub::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...) ::scoreboard::controlhub::Logger::info(__VA_ARGS__)
#define LOG_WARN(...) ::scoreboard::controlhub::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::scoreboard::controlhub::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::scoreboard::controlhub::Logger::critical(__VA_ARGS__)

// Component-specific loggers
class ComponentLogger {
public:
    explicit ComponentLogger(std::string component_name)
        : component_name_(std::move(component_name)) {}

    const std::string& name() const { return component_name_; }

    template<typename... Args>
    void trace(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::DEBUG_LEVEL, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::ERROR_LEVEL, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view format, Args&&... args) const {
        Logger::log(component_name_, LogLevel::CRITICAL, format, std::forward<Args>(args)...);
    }

private:
    std::string component_name_;
};

#define DECLARE_LOGGER(name) \
    [[maybe_unused]] static constexpr const char* logger_name_ = name

#define COMPONENT_LOG_TRACE(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::TRACE, __VA_ARGS__)
#define COMPONENT_LOG_DEBUG(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::DEBUG_LEVEL, __VA_ARGS__)
#define COMPONENT_LOG_INFO(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::INFO, __VA_ARGS__)
#define COMPONENT_LOG_WARN(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::WARN, __VA_ARGS__)
#define COMPONENT_LOG_ERROR(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::ERROR_LEVEL, __VA_ARGS__)
#define COMPONENT_LOG_CRITICAL(...) \
    ::scoreboard::controlhub::Logger::log(logger_name_, ::scoreboard::controlhub::LogLevel::CRITICAL, __VA_ARGS__)

}  // namespace scoreboard::controlhub
