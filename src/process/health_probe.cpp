#include "controlhub/process/health_probe.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace scoreboard::controlhub {

DECLARE_LOGGER("HealthProbe");

namespace {

class AddrInfo {
public:
    AddrInfo() = default;
    ~AddrInfo() {
        if (info_) {
            freeaddrinfo(info_);
        }
    }
    AddrInfo(const AddrInfo&) = delete;
    AddrInfo& operator=(const AddrInfo&) = delete;

    addrinfo** out() { return &info_; }
    addrinfo* get() const { return info_; }

private:
    addrinfo* info_ = nullptr;
};

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

// Non-blocking connect bounded by `timeout`. Empty string on success.
std::string try_connect(const addrinfo* address, Milliseconds timeout) {
    Socket socket(::socket(address->ai_family, address->ai_socktype | SOCK_CLOEXEC, address->ai_protocol));
    if (socket.get() < 0) {
        return std::strerror(errno);
    }

    int flags = ::fcntl(socket.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::strerror(errno);
    }

    if (::connect(socket.get(), address->ai_addr, address->ai_addrlen) == 0) {
        return {};
    }
    if (errno != EINPROGRESS) {
        return std::strerror(errno);
    }

    pollfd pfd{};
    pfd.fd = socket.get();
    pfd.events = POLLOUT;
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
        return "connect timed out";
    }
    if (ready < 0) {
        return std::strerror(errno);
    }

    int so_error = 0;
    socklen_t length = sizeof(so_error);
    if (::getsockopt(socket.get(), SOL_SOCKET, SO_ERROR, &so_error, &length) < 0) {
        return std::strerror(errno);
    }
    return so_error == 0 ? std::string() : std::string(std::strerror(so_error));
}

}  // namespace

SupervisorStateProbe::SupervisorStateProbe(ProcessController& controller, std::string process_name,
                                           u32 stable_checks)
    : controller_(controller),
      process_name_(std::move(process_name)),
      stable_checks_(std::max<u32>(stable_checks, 1)) {}

void SupervisorStateProbe::reset() {
    observed_pid_ = 0;
    consecutive_ = 0;
}

Result<void> SupervisorStateProbe::check() {
    auto process = controller_.info(process_name_);
    if (!process) {
        reset();
        return unexpected(std::move(process).error());
    }

    if (process->status != ProcessStatus::Running) {
        reset();
        return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED,
            "Process '" + process_name_ + "' is " + process->state));
    }

    if (consecutive_ > 0 && process->pid != observed_pid_) {
        COMPONENT_LOG_WARN("Process '{}' changed pid {} -> {} during verification", process_name_,
                           observed_pid_, process->pid);
        consecutive_ = 0;
    }
    observed_pid_ = process->pid;
    ++consecutive_;

    if (consecutive_ < stable_checks_) {
        return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED,
            "Process '" + process_name_ + "' running (pid " + std::to_string(observed_pid_) + ") for " +
            std::to_string(consecutive_) + "/" + std::to_string(stable_checks_) + " checks"));
    }
    return {};
}

std::string SupervisorStateProbe::describe() const {
    return "supervisor state of " + process_name_;
}

TcpHealthProbe::TcpHealthProbe(std::string host, u16 port, Milliseconds connect_timeout)
    : host_(std::move(host)), port_(port), connect_timeout_(connect_timeout) {}

Result<void> TcpHealthProbe::check() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfo addresses;
    int rc = ::getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, addresses.out());
    if (rc != 0) {
        return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED,
            "Cannot resolve " + host_ + ": " + gai_strerror(rc)));
    }

    std::string last_error = "no addresses";
    for (const addrinfo* address = addresses.get(); address; address = address->ai_next) {
        last_error = try_connect(address, connect_timeout_);
        if (last_error.empty()) {
            return {};
        }
    }
    return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED,
        "Cannot connect to " + describe() + ": " + last_error));
}

std::string TcpHealthProbe::describe() const {
    return host_ + ":" + std::to_string(port_);
}

Result<void> wait_until_healthy(HealthProbe& probe, const HealthPolicy& policy,
                                const std::function<void(Milliseconds)>& sleep) {
    const TimePoint deadline = std::chrono::steady_clock::now() + policy.timeout;
    Milliseconds delay = policy.interval;
    std::shared_ptr<Error> last_error;
    probe.reset();

    for (u32 attempt = 1; attempt <= policy.attempts; ++attempt) {
        auto healthy = probe.check();
        if (healthy) {
            COMPONENT_LOG_DEBUG("Health probe ({}) passed on attempt {}", probe.describe(), attempt);
            return {};
        }
        last_error = std::make_shared<Error>(healthy.error());
        COMPONENT_LOG_DEBUG("Health probe ({}) attempt {}/{} failed: {}", probe.describe(), attempt,
                            policy.attempts, healthy.error().message());

        if (attempt == policy.attempts) {
            break;
        }
        auto left = std::chrono::duration_cast<Milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }
        sleep(std::min(delay, left));
        delay = std::min(delay * 2, policy.max_interval);
    }

    Error error(ErrorCode::HEALTH_CHECK_FAILED, "Health probe (" + probe.describe() + ") did not pass");
    error.with_cause(std::move(last_error));
    return unexpected(std::move(error));
}

}  // namespace scoreboard::controlhub
