#pragma once

#include "controlhub/process/process_controller.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <functional>
#include <string>

namespace scoreboard::controlhub {

/**
 * @brief One health observation of the target process after a restart.
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    // Success when healthy, HEALTH_CHECK_FAILED (or a transport error) otherwise.
    virtual Result<void> check() = 0;
    virtual std::string describe() const = 0;
    // Forgets earlier observations; called before each verification run.
    virtual void reset() {}
};

/**
 * @brief Healthy once the supervisor has reported the process RUNNING with
 * the same pid on `stable_checks` consecutive checks.
 *
 * A single RUNNING observation only repeats what restart() already saw; a
 * process that crashes shortly after start shows up as a state change or a
 * new pid between checks.
 */
class SupervisorStateProbe : public HealthProbe {
public:
    static constexpr u32 kDefaultStableChecks = 3;

    SupervisorStateProbe(ProcessController& controller, std::string process_name,
                         u32 stable_checks = kDefaultStableChecks);

    Result<void> check() override;
    std::string describe() const override;
    void reset() override;

    u32 stable_checks() const { return stable_checks_; }

private:
    ProcessController& controller_;
    std::string process_name_;
    u32 stable_checks_;
    i64 observed_pid_ = 0;
    u32 consecutive_ = 0;
};

// Healthy when a TCP connection to host:port succeeds within the timeout.
class TcpHealthProbe : public HealthProbe {
public:
    TcpHealthProbe(std::string host, u16 port, Milliseconds connect_timeout);

    Result<void> check() override;
    std::string describe() const override;

private:
    std::string host_;
    u16 port_;
    Milliseconds connect_timeout_;
};

struct HealthPolicy {
    u32 attempts = 5;
    Milliseconds interval{1000};
    Milliseconds max_interval{8000};
    Milliseconds timeout{30000};  // overall budget
};

/**
 * @brief Polls `probe` until it succeeds or the policy is exhausted.
 *
 * The delay between attempts starts at `interval` and doubles up to
 * `max_interval`. Returns HEALTH_CHECK_FAILED with the last probe error as cause.
 */
Result<void> wait_until_healthy(HealthProbe& probe, const HealthPolicy& policy,
                                const std::function<void(Milliseconds)>& sleep);

}  // namespace scoreboard::controlhub
