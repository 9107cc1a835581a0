#pragma once

#include "controlhub/process/process_controller.hpp"
#include "controlhub/process/xmlrpc.hpp"
#include "controlhub/utils/error.hpp"
#include "controlhub/utils/types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scoreboard::controlhub {

/**
 * @brief Carries one XML-RPC request body to the supervisor and returns the
 * response body.
 *
 * Errors: TIMEOUT when `timeout` elapsed, SUPERVISOR_UNREACHABLE for connection
 * failures, SUPERVISOR_FAULT for HTTP-level errors.
 */
class XmlRpcTransport {
public:
    virtual ~XmlRpcTransport() = default;
    virtual Result<std::string> post(const std::string& body, Milliseconds timeout) = 0;
};

// HTTP POST to http://<host>:<port>/RPC2 through libcurl.
class CurlTransport : public XmlRpcTransport {
public:
    CurlTransport(std::string host, u16 port);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<std::string> post(const std::string& body, Milliseconds timeout) override;

    const std::string& url() const { return url_; }

private:
    std::string url_;
};

/**
 * @brief ProcessController backed by supervisord's XML-RPC interface.
 */
class SupervisorClient : public ProcessController {
public:
    // Supervisor fault codes handled explicitly.
    static constexpr int kFaultBadName = 10;
    static constexpr int kFaultAlreadyStarted = 60;
    static constexpr int kFaultNotRunning = 70;

    struct Options {
        Milliseconds request_timeout{5000};
        Milliseconds poll_interval{250};
        std::function<void(Milliseconds)> sleep;  // defaults to std::this_thread::sleep_for
    };

    explicit SupervisorClient(std::unique_ptr<XmlRpcTransport> transport);
    SupervisorClient(std::unique_ptr<XmlRpcTransport> transport, Options options);

    Result<ProcessStatus> status(const std::string& name) override;
    Result<ProcessInfo> info(const std::string& name) override;
    Result<void> start(const std::string& name) override;
    Result<void> stop(const std::string& name) override;
    Result<void> restart(const std::string& name, Milliseconds timeout) override;
    Result<std::vector<ProcessInfo>> list_processes() override;
    bool is_available() override;

    static ProcessStatus map_state(const std::string& state_name);

private:
    Result<xmlrpc::Response> call(const std::string& method, const std::vector<nlohmann::json>& params,
                                  Milliseconds timeout);
    Result<void> start_before(const std::string& name, TimePoint deadline);
    Result<void> stop_before(const std::string& name, TimePoint deadline);
    Result<void> wait_for(const std::string& name, ProcessStatus wanted, TimePoint deadline);
    static Result<ProcessInfo> info_from_json(const nlohmann::json& value);

    std::unique_ptr<XmlRpcTransport> transport_;
    Options options_;
};

}  // namespace scoreboard::controlhub
