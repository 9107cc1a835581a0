#include "controlhub/utils/error.hpp"
#include <sstream>

namespace scoreboard::controlhub {

ErrorCategory Error::category() const noexcept {
    return get_error_category(code_);
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "]";

    if (!message_.empty()) {
        oss << " " << message_;
    }

    if (!field_.empty()) {
        oss << " (field: " << field_ << ")";
    }

    if (!related_.empty()) {
        oss << " [";
        for (size_t i = 0; i < related_.size(); ++i) {
            if (i > 0) {
                oss << ", ";
            }
            oss << related_[i];
        }
        oss << "]";
    }

    if (rollback_succeeded_.has_value()) {
        oss << (*rollback_succeeded_ ? " (rolled back)" : " (rollback failed)");
    }

    if (cause_) {
        oss << " caused by " << error_code_to_string(cause_->code());
        if (!cause_->message().empty()) {
            oss << ": " << cause_->message();
        }
    }

    oss << " (at " << location_.file_name()
        << ":" << location_.line()
        << " in " << location_.function_name() << ")";

    return oss.str();
}

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "SUCCESS";

        // Configuration errors
        case ErrorCode::CONFIG_INVALID_FORMAT:
            return "CONFIG_INVALID_FORMAT";
        case ErrorCode::CONFIG_MISSING_FIELD:
            return "CONFIG_MISSING_FIELD";
        case ErrorCode::CONFIG_INVALID_VALUE:
            return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:
            return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_VALIDATION_ERROR:
            return "CONFIG_VALIDATION_ERROR";
        case ErrorCode::CONFIG_RESERVED_KEY:
            return "CONFIG_RESERVED_KEY";

        // Config store errors
        case ErrorCode::STORE_UNAVAILABLE:
            return "STORE_UNAVAILABLE";
        case ErrorCode::STAGE_FAILED:
            return "STAGE_FAILED";
        case ErrorCode::COMMIT_FAILED:
            return "COMMIT_FAILED";
        case ErrorCode::STALE_STAGE:
            return "STALE_STAGE";
        case ErrorCode::PUBLISH_FAILED:
            return "PUBLISH_FAILED";

        // Plugin errors
        case ErrorCode::PLUGIN_NOT_FOUND:
            return "PLUGIN_NOT_FOUND";
        case ErrorCode::PLUGIN_BAD_MANIFEST:
            return "PLUGIN_BAD_MANIFEST";
        case ErrorCode::PLUGIN_DUPLICATE_ID:
            return "PLUGIN_DUPLICATE_ID";
        case ErrorCode::PLUGIN_FILE_COLLISION:
            return "PLUGIN_FILE_COLLISION";
        case ErrorCode::PLUGIN_INVALID_STATE:
            return "PLUGIN_INVALID_STATE";
        case ErrorCode::PACKAGE_NOT_FOUND:
            return "PACKAGE_NOT_FOUND";

        // Dependency errors
        case ErrorCode::DEPENDENCY_UNRESOLVED:
            return "DEPENDENCY_UNRESOLVED";
        case ErrorCode::CYCLIC_DEPENDENCY:
            return "CYCLIC_DEPENDENCY";
        case ErrorCode::VERSION_MISMATCH:
            return "VERSION_MISMATCH";
        case ErrorCode::HAS_DEPENDENTS:
            return "HAS_DEPENDENTS";

        // Process control errors
        case ErrorCode::PROCESS_NOT_FOUND:
            return "PROCESS_NOT_FOUND";
        case ErrorCode::SUPERVISOR_UNREACHABLE:
            return "SUPERVISOR_UNREACHABLE";
        case ErrorCode::SUPERVISOR_FAULT:
            return "SUPERVISOR_FAULT";
        case ErrorCode::RESTART_TIMEOUT:
            return "RESTART_TIMEOUT";
        case ErrorCode::RESTART_FAILED:
            return "RESTART_FAILED";
        case ErrorCode::PROTOCOL_ERROR:
            return "PROTOCOL_ERROR";

        // Transaction errors
        case ErrorCode::TRANSACTION_BUSY:
            return "TRANSACTION_BUSY";
        case ErrorCode::HEALTH_CHECK_FAILED:
            return "HEALTH_CHECK_FAILED";
        case ErrorCode::UNRECOVERABLE:
            return "UNRECOVERABLE";
        case ErrorCode::TRANSACTION_CANCELLED:
            return "TRANSACTION_CANCELLED";

        // I/O errors
        case ErrorCode::IO_READ_FAILED:
            return "IO_READ_FAILED";
        case ErrorCode::IO_WRITE_FAILED:
            return "IO_WRITE_FAILED";
        case ErrorCode::LOCK_HELD:
            return "LOCK_HELD";

        // Generic errors
        case ErrorCode::INVALID_PARAMETER:
            return "INVALID_PARAMETER";
        case ErrorCode::OPERATION_FAILED:
            return "OPERATION_FAILED";
        case ErrorCode::TIMEOUT:
            return "TIMEOUT";
        case ErrorCode::INVALID_STATE:
            return "INVALID_STATE";
        case ErrorCode::FILE_ERROR:
            return "FILE_ERROR";
        case ErrorCode::ALREADY_INITIALIZED:
            return "ALREADY_INITIALIZED";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
    }
    return "UNKNOWN_ERROR";
}

ErrorCategory get_error_category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:
            return ErrorCategory::NONE;

        case ErrorCode::CONFIG_INVALID_FORMAT:
        case ErrorCode::CONFIG_MISSING_FIELD:
        case ErrorCode::CONFIG_INVALID_VALUE:
        case ErrorCode::CONFIG_VALIDATION_ERROR:
        case ErrorCode::CONFIG_RESERVED_KEY:
        case ErrorCode::PLUGIN_NOT_FOUND:
        case ErrorCode::PLUGIN_BAD_MANIFEST:
        case ErrorCode::PLUGIN_DUPLICATE_ID:
        case ErrorCode::PLUGIN_FILE_COLLISION:
        case ErrorCode::PLUGIN_INVALID_STATE:
        case ErrorCode::PACKAGE_NOT_FOUND:
        case ErrorCode::INVALID_PARAMETER:
            return ErrorCategory::INPUT;

        case ErrorCode::DEPENDENCY_UNRESOLVED:
        case ErrorCode::CYCLIC_DEPENDENCY:
        case ErrorCode::VERSION_MISMATCH:
        case ErrorCode::HAS_DEPENDENTS:
            return ErrorCategory::DEPENDENCY;

        case ErrorCode::PROCESS_NOT_FOUND:
        case ErrorCode::SUPERVISOR_UNREACHABLE:
        case ErrorCode::SUPERVISOR_FAULT:
        case ErrorCode::RESTART_TIMEOUT:
        case ErrorCode::RESTART_FAILED:
        case ErrorCode::PROTOCOL_ERROR:
        case ErrorCode::HEALTH_CHECK_FAILED:
            return ErrorCategory::OPERATIONAL;

        case ErrorCode::UNRECOVERABLE:
            return ErrorCategory::UNRECOVERABLE;

        case ErrorCode::TRANSACTION_BUSY:
        case ErrorCode::STALE_STAGE:
        case ErrorCode::LOCK_HELD:
            return ErrorCategory::CONCURRENCY;

        default:
            return ErrorCategory::SYSTEM;
    }
}

}  // namespace scoreboard::controlhub
