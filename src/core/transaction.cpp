#include "controlhub/core/transaction.hpp"
#include "controlhub/utils/logging.hpp"

namespace scoreboard::controlhub {

DECLARE_LOGGER("Transaction");

const char* transaction_status_to_string(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Open: return "Open";
        case TransactionStatus::Validated: return "Validated";
        case TransactionStatus::Applying: return "Applying";
        case TransactionStatus::Verifying: return "Verifying";
        case TransactionStatus::Committed: return "Committed";
        case TransactionStatus::RolledBack: return "RolledBack";
    }
    return "Unknown";
}

std::string describe_mutation(const Mutation& mutation) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SetConfigValues>) {
            std::string keys;
            for (const auto& [key, value] : m.values) {
                keys += keys.empty() ? key : ", " + key;
            }
            return "set " + keys;
        } else if constexpr (std::is_same_v<T, EnablePlugin>) {
            return "enable " + m.id;
        } else if constexpr (std::is_same_v<T, DisablePlugin>) {
            return "disable " + m.id;
        } else if constexpr (std::is_same_v<T, InstallPlugin>) {
            return "install " + m.manifest.id() + " " + m.manifest.version().to_string();
        } else if constexpr (std::is_same_v<T, UpdatePlugin>) {
            return "update " + m.manifest.id() + " to " + m.manifest.version().to_string();
        } else {
            return m.keep_config ? "uninstall " + m.id + " (keeping config)" : "uninstall " + m.id;
        }
    }, mutation);
}

Transaction::Transaction(TransactionId id, ConfigDocument document, std::string snapshot, PluginRegistry registry)
    : id_(id),
      document_(std::move(document)),
      snapshot_(std::move(snapshot)),
      registry_(std::move(registry)) {}

bool Transaction::transition_allowed(TransactionStatus from, TransactionStatus to) {
    switch (from) {
        case TransactionStatus::Open:
            return to == TransactionStatus::Validated || to == TransactionStatus::RolledBack;
        case TransactionStatus::Validated:
            return to == TransactionStatus::Applying || to == TransactionStatus::RolledBack;
        case TransactionStatus::Applying:
            return to == TransactionStatus::Verifying || to == TransactionStatus::RolledBack;
        case TransactionStatus::Verifying:
            return to == TransactionStatus::Committed || to == TransactionStatus::RolledBack;
        case TransactionStatus::Committed:
        case TransactionStatus::RolledBack:
            return false;
    }
    return false;
}

Result<void> Transaction::advance(TransactionStatus next) {
    if (!transition_allowed(status_, next)) {
        return unexpected(MAKE_ERROR(INVALID_STATE,
            std::string("Transaction ") + std::to_string(id_) + " cannot move from " +
            transaction_status_to_string(status_) + " to " + transaction_status_to_string(next)));
    }

    const TransactionStatus previous = status_;
    status_ = next;
    if (next == TransactionStatus::RolledBack) {
        COMPONENT_LOG_WARN("Transaction {}: {} -> {}", id_, transaction_status_to_string(previous),
                           transaction_status_to_string(next));
    } else {
        COMPONENT_LOG_INFO("Transaction {}: {} -> {}", id_, transaction_status_to_string(previous),
                           transaction_status_to_string(next));
    }
    return {};
}

void Transaction::mark_rolled_back() {
    if (terminal()) {
        return;
    }
    COMPONENT_LOG_WARN("Transaction {}: {} -> RolledBack", id_, transaction_status_to_string(status_));
    status_ = TransactionStatus::RolledBack;
}

}  // namespace scoreboard::controlhub
