#include "controlhub/process/process_controller.hpp"

namespace scoreboard::controlhub {

const char* process_status_to_string(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Running: return "running";
        case ProcessStatus::Stopped: return "stopped";
        case ProcessStatus::Unknown: return "unknown";
    }
    return "unknown";
}

}  // namespace scoreboard::controlhub
