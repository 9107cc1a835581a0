#include <algorithm>
#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "controlhub/core/control_hub.hpp"
#include "controlhub/config/hub_settings.hpp"
#include "controlhub/utils/logging.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/shutdown_manager.hpp"

using namespace scoreboard::controlhub;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUnrecoverable = 2;

std::atomic<bool> signal_handled{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        bool expected = false;
        if (!signal_handled.compare_exchange_strong(expected, true)) {
            return;
        }
        // The running command finishes; teardown happens on the main thread.
        utils::ShutdownManager::instance().request_shutdown();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [arguments]\n"
              << "\nCommands:\n"
              << "  status                       Hub, scoreboard and supervisor status\n"
              << "  boards                       Boards available to the scoreboard\n"
              << "  config show [key]            Print the configuration (or one key)\n"
              << "  config set <key>=<value>...  Change configuration values\n"
              << "  plugins list                 List installed plugins\n"
              << "  plugins install <id|dir>     Install a plugin package\n"
              << "  plugins update <id|dir>      Replace an installed plugin with a newer package\n"
              << "  plugins uninstall <id> [--keep-config]\n"
              << "                               Remove an installed plugin and its config keys\n"
              << "  plugins enable <id>          Enable a plugin and its dependencies\n"
              << "  plugins disable <id>         Disable a plugin\n"
              << "  processes                    Processes known to the supervisor\n"
              << "  processes start|stop <name>  Start or stop a supervised process\n"
              << "\nOptions:\n"
              << "  -c, --config <file>          Hub settings file (default " << HubSettings::kDefaultPath << ")\n"
              << "  -d, --scoreboard_dir <dir>   Scoreboard installation directory\n"
              << "  --debug                      Enable debug logging\n"
              << "  -l, --log-level <level>      Set log level (trace, debug, info, warn, error, critical)\n"
              << "  -f, --log-file <file>        Log file path\n"
              << "  -v, --version                Show version\n"
              << "  -h, --help                   Show this help message\n"
              << "\nExamples:\n"
              << "  " << program_name << " status\n"
              << "  " << program_name << " config set preferences.time_format=24h live_game_refresh_rate=30\n"
              << "  " << program_name << " -d /home/pi/nhl-led-scoreboard plugins install holiday_countdown\n";
}

bool is_known_log_level(const std::string& level) {
    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical"};
    return std::find(levels.begin(), levels.end(), level) != levels.end();
}

int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    if (!error.field().empty()) {
        std::cerr << "  field: " << error.field() << "\n";
    }
    if (!error.related().empty()) {
        std::cerr << "  related:";
        for (const auto& id : error.related()) {
            std::cerr << " " << id;
        }
        std::cerr << "\n";
    }
    for (auto cause = error.cause(); cause; cause = cause->cause()) {
        std::cerr << "  caused by: " << cause->to_string() << "\n";
    }
    if (error.rollback_succeeded()) {
        std::cerr << "  rollback: " << (*error.rollback_succeeded() ? "succeeded" : "failed") << "\n";
    }
    if (error.code() == ErrorCode::UNRECOVERABLE) {
        std::cerr << "The scoreboard could not be restored automatically. Check the supervisor.\n";
        return kExitUnrecoverable;
    }
    return kExitError;
}

int report_outcome(const Result<TransactionOutcome>& outcome) {
    if (!outcome) {
        return report_error(outcome.error());
    }
    std::cout << "Transaction " << outcome->id << " " << transaction_status_to_string(outcome->status)
              << ", configuration version " << outcome->version << "\n";
    if (!outcome->affected_plugins.empty()) {
        std::cout << "Affected plugins:";
        for (const auto& id : outcome->affected_plugins) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    return kExitOk;
}

// Values that parse as JSON keep their type; anything else is a string.
nlohmann::json parse_value(const std::string& text) {
    auto value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        return nlohmann::json(text);
    }
    return value;
}

int run_status(ControlHub& hub) {
    const HubStatus status = hub.status();
    std::cout << "Control hub:        " << status.hub_version << "\n"
              << "Scoreboard:         " << status.scoreboard_version << "\n"
              << "Supervisor:         " << (status.supervisor_available ? "available" : "unreachable") << "\n"
              << "Target process:     " << status.target_process << " ("
              << process_status_to_string(status.target_status) << ")\n"
              << "Config version:     " << status.config_version << "\n"
              << "Plugins:            " << status.plugin_count << " installed, "
              << status.enabled_plugin_count << " enabled\n";
    std::cout << "Transaction lock:   " << (status.transaction_in_flight ? "held, a change is being applied" : "free")
              << "\n";
    return kExitOk;
}

int run_boards(ControlHub& hub) {
    for (const auto& board : hub.boards()) {
        std::cout << board << "\n";
    }
    return kExitOk;
}

int run_config(ControlHub& hub, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "show") {
        auto document = hub.read_config();
        if (!document) {
            return report_error(document.error());
        }
        if (args.size() > 1) {
            const nlohmann::json* value = document->find(args[1]);
            if (!value) {
                std::cerr << "Error: no configuration value at '" << args[1] << "'\n";
                return kExitError;
            }
            std::cout << value->dump(2) << "\n";
            return kExitOk;
        }
        std::cout << document->serialize_live();
        return kExitOk;
    }

    if (args[0] == "set") {
        SetConfigValues change;
        for (size_t i = 1; i < args.size(); ++i) {
            const auto separator = args[i].find('=');
            if (separator == std::string::npos || separator == 0) {
                std::cerr << "Error: expected <key>=<value>, got '" << args[i] << "'\n";
                return kExitError;
            }
            change.values.emplace_back(args[i].substr(0, separator), parse_value(args[i].substr(separator + 1)));
        }
        if (change.values.empty()) {
            std::cerr << "Error: config set needs at least one <key>=<value>\n";
            return kExitError;
        }
        return report_outcome(hub.apply_change(change));
    }

    std::cerr << "Error: unknown config command '" << args[0] << "'\n";
    return kExitError;
}

int run_plugins(ControlHub& hub, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "list") {
        const auto plugins = hub.list_plugins();
        if (plugins.empty()) {
            std::cout << "No plugins installed.\n";
            return kExitOk;
        }
        for (const auto& record : plugins) {
            std::cout << record.id() << "  " << record.installed_version << "  "
                      << plugin_state_to_string(record.state);
            if (!record.manifest.description().empty()) {
                std::cout << "  " << record.manifest.description();
            }
            std::cout << "\n";
        }
        return kExitOk;
    }

    const std::string& command = args[0];
    if (command == "uninstall") {
        UninstallPlugin change;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--keep-config") {
                change.keep_config = true;
            } else if (change.id.empty()) {
                change.id = args[i];
            } else {
                std::cerr << "Error: unexpected argument '" << args[i] << "'\n";
                return kExitError;
            }
        }
        if (change.id.empty()) {
            std::cerr << "Error: plugins uninstall needs a plugin id\n";
            return kExitError;
        }
        return report_outcome(hub.apply_change(change));
    }

    if (args.size() != 2) {
        std::cerr << "Error: plugins " << command << " needs exactly one argument\n";
        return kExitError;
    }
    const std::string& target = args[1];

    if (command == "install") {
        return report_outcome(hub.install_package(target));
    }
    if (command == "update") {
        return report_outcome(hub.update_package(target));
    }
    if (command == "enable") {
        return report_outcome(hub.apply_change(EnablePlugin{target}));
    }
    if (command == "disable") {
        return report_outcome(hub.apply_change(DisablePlugin{target}));
    }

    std::cerr << "Error: unknown plugins command '" << command << "'\n";
    return kExitError;
}

int run_processes(ControlHub& hub, const std::vector<std::string>& args) {
    if (!args.empty() && args[0] != "list") {
        const std::string& command = args[0];
        if (args.size() != 2 || (command != "start" && command != "stop")) {
            std::cerr << "Error: expected processes start|stop <name>\n";
            return kExitError;
        }
        auto result = command == "start" ? hub.start_process(args[1]) : hub.stop_process(args[1]);
        if (!result) {
            return report_error(result.error());
        }
        std::cout << args[1] << (command == "start" ? " started" : " stopped") << "\n";
        return kExitOk;
    }

    auto processes = hub.processes();
    if (!processes) {
        return report_error(processes.error());
    }
    for (const auto& info : processes.value()) {
        std::cout << info.name << "  " << info.state;
        if (info.pid > 0) {
            std::cout << "  pid " << info.pid;
        }
        if (!info.description.empty()) {
            std::cout << "  " << info.description;
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int run_command(ControlHub& hub, const std::string& command, const std::vector<std::string>& args) {
    if (command == "status") return run_status(hub);
    if (command == "boards") return run_boards(hub);
    if (command == "config") return run_config(hub, args);
    if (command == "plugins") return run_plugins(hub, args);
    if (command == "processes") return run_processes(hub, args);

    std::cerr << "Error: Unknown command " << command << std::endl;
    return kExitError;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_file = HubSettings::kDefaultPath;
    std::string scoreboard_dir;
    std::string log_level;
    std::string log_file;
    bool debug_mode = false;
    std::string command;
    std::vector<std::string> command_args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (!command.empty()) {
            command_args.push_back(arg);
        }
        else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return kExitOk;
        }
        else if (arg == "-v" || arg == "--version") {
            std::cout << "controlhub " << CONTROLHUB_VERSION << "\n";
            return kExitOk;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            } else {
                std::cerr << "Error: Config file path required after " << arg << std::endl;
                return kExitError;
            }
        }
        else if (arg == "-d" || arg == "--scoreboard_dir") {
            if (i + 1 < argc) {
                scoreboard_dir = argv[++i];
            } else {
                std::cerr << "Error: Scoreboard directory required after " << arg << std::endl;
                return kExitError;
            }
        }
        else if (arg == "--debug") {
            debug_mode = true;
        }
        else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 < argc) {
                log_level = argv[++i];
            } else {
                std::cerr << "Error: Log level required after " << arg << std::endl;
                return kExitError;
            }
        }
        else if (arg == "-f" || arg == "--log-file") {
            if (i + 1 < argc) {
                log_file = argv[++i];
            } else {
                std::cerr << "Error: Log file path required after " << arg << std::endl;
                return kExitError;
            }
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return kExitError;
        }
        else {
            command = arg;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return kExitError;
    }

    auto settings = HubSettings::load_from_file(config_file);
    if (!settings) {
        std::cerr << "Failed to load settings from " << config_file << ": "
                  << settings.error().to_string() << std::endl;
        return kExitError;
    }

    // Command line overrides the settings file.
    if (!scoreboard_dir.empty()) {
        settings->set_scoreboard_dir(scoreboard_dir);
    }
    HubSettings::LogConfig log_config = settings->log();
    if (!log_level.empty()) {
        log_config.level = log_level;
    }
    if (debug_mode) {
        log_config.level = "debug";
    }
    if (!log_file.empty()) {
        log_config.file = log_file;
    }
    settings->set_log(log_config);

    if (!is_known_log_level(log_config.level)) {
        std::cerr << "Error: Invalid log level '" << log_config.level << "'" << std::endl;
        return kExitError;
    }

    auto log_result = Logger::initialize(Logger::from_string(log_config.level), log_config.file, true);
    if (!log_result) {
        std::cerr << "Failed to initialize logger: " << log_result.error().to_string() << std::endl;
        return kExitError;
    }

    LOG_DEBUG("Scoreboard control hub {} starting", CONTROLHUB_VERSION);

    auto hub = std::make_unique<ControlHub>(settings.value());
    auto init_result = hub->initialize();
    if (!init_result) {
        LOG_ERROR("Failed to initialize control hub: {}", init_result.error().to_string());
        int code = report_error(init_result.error());
        Logger::shutdown();
        return code;
    }

    auto& shutdown_mgr = utils::ShutdownManager::instance();
    utils::ShutdownGuard hub_guard(utils::ShutdownManager::Priority::Transactions, "control_hub", [&hub]() {
        auto result = hub->shutdown();
        if (!result) {
            LOG_WARN("Control hub did not shut down cleanly: {}", result.error().to_string());
        }
    });

    int exit_code = run_command(*hub, command, command_args);

    if (shutdown_mgr.is_shutdown_requested()) {
        LOG_INFO("Shutdown requested, stopping");
    }
    shutdown_mgr.request_shutdown();
    shutdown_mgr.execute_shutdown(std::chrono::milliseconds(5000));

    hub.reset();
    Logger::shutdown();
    return exit_code;
}
