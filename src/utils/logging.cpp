#include "controlhub/utils/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace scoreboard::controlhub {

std::atomic<bool> Logger::initialized_{false};
LogLevel Logger::current_level_ = LogLevel::INFO;

namespace {
std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}
}  // namespace

Result<void> Logger::initialize(LogLevel level, const std::string& log_file, bool enable_console) {
    try {
        if (initialized_) {
            return unexpected(MAKE_ERROR(ALREADY_INITIALIZED,
                "Logger already initialized"));
        }

        std::vector<spdlog::sink_ptr> sinks;

        // Add console sink if enabled
        if (enable_console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        // Add file sink if log file specified
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);  // 10MB max size, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (sinks.empty()) {
            return unexpected(MAKE_ERROR(INVALID_PARAMETER,
                "At least one logging sink must be enabled"));
        }

        // Create main logger
        auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->flush_on(spdlog::level::warn);

        {
            std::lock_guard<std::mutex> lock(registry_mutex());
            spdlog::drop("main");
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
        }

        current_level_ = level;
        initialized_ = true;

        LOG_DEBUG("Logger initialized with level: {}", to_string(level));
        return {};

    } catch (const spdlog::spdlog_ex& ex) {
        return unexpected(MAKE_ERROR(OPERATION_FAILED,
            "Failed to initialize logger: " + std::string(ex.what())));
    } catch (const std::exception& ex) {
        return unexpected(MAKE_ERROR(OPERATION_FAILED,
            "Unexpected error during logger initialization: " + std::string(ex.what())));
    }
}

void Logger::shutdown() {
    if (initialized_) {
        LOG_DEBUG("Shutting down logger");
        initialized_ = false;
        std::lock_guard<std::mutex> lock(registry_mutex());
        spdlog::shutdown();
    }
}

bool Logger::is_initialized() {
    return initialized_;
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name) {
    if (!initialized_) {
        // Return nullptr if logger not initialized - don't auto-initialize
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(registry_mutex());
    auto logger = spdlog::get(name);
    if (!logger && name != "main") {
        // Create a new logger based on the main logger's sinks
        auto main_logger = spdlog::get("main");
        if (main_logger) {
            auto& sinks = main_logger->sinks();
            logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(main_logger->level());
            logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(logger);
        }
    }

    return logger ? logger : spdlog::default_logger();
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    // Update all registered loggers
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel Logger::get_level() {
    return current_level_;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG_LEVEL: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR_LEVEL: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

LogLevel Logger::from_string(const std::string& level_str) {
    std::string lower = level_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    else if (lower == "debug") return LogLevel::DEBUG_LEVEL;
    else if (lower == "info") return LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    else if (lower == "error" || lower == "err") return LogLevel::ERROR_LEVEL;
    else if (lower == "critical") return LogLevel::CRITICAL;
    else return LogLevel::INFO; // default fallback
}

const char* Logger::to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG_LEVEL: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR_LEVEL: return "error";
        case LogLevel::CRITICAL: return "critical";
    }
    return "info";
}

}  // namespace scoreboard::controlhub
