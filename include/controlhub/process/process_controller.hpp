#pragma once

#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <string>
#include <vector>

namespace scoreboard::controlhub {

enum class ProcessStatus {
    Running,
    Stopped,
    Unknown
};

const char* process_status_to_string(ProcessStatus status);

struct ProcessInfo {
    std::string name;
    std::string group;
    std::string state;  // supervisor state name, e.g. "RUNNING"
    ProcessStatus status = ProcessStatus::Unknown;
    i64 pid = 0;
    std::string description;
};

/**
 * @brief Capability to control the target process from outside.
 *
 * The only component allowed to call restart() is the orchestrator.
 */
class ProcessController {
public:
    virtual ~ProcessController() = default;

    virtual Result<ProcessStatus> status(const std::string& name) = 0;
    // Full supervisor view of one process, including its pid.
    virtual Result<ProcessInfo> info(const std::string& name) = 0;

    virtual Result<void> start(const std::string& name) = 0;
    virtual Result<void> stop(const std::string& name) = 0;

    // Succeeds once the process was seen leaving and re-entering Running within
    // `timeout`. Says nothing about the health of the process. Failures:
    // RESTART_TIMEOUT when the deadline passed, SUPERVISOR_UNREACHABLE when the
    // supervisor cannot be reached, PROCESS_NOT_FOUND for an unknown name,
    // SUPERVISOR_FAULT for any other fault (e.g. SPAWN_ERROR) and
    // PROTOCOL_ERROR for an unreadable reply.
    virtual Result<void> restart(const std::string& name, Milliseconds timeout) = 0;

    virtual Result<std::vector<ProcessInfo>> list_processes() = 0;

    virtual bool is_available() = 0;
};

}  // namespace scoreboard::controlhub
