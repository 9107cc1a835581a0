#include "controlhub/process/supervisor_client.hpp"
#include "controlhub/utils/logging.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace scoreboard::controlhub {

using json = nlohmann::json;

DECLARE_LOGGER("SupervisorClient");

namespace {

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const char* header) { list_ = curl_slist_append(list_, header); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

Error curl_error(CURLcode code, const std::string& url) {
    std::string message = "Supervisor request to " + url + " failed: " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error(ErrorCode::TIMEOUT, std::move(message));
        default:
            return Error(ErrorCode::SUPERVISOR_UNREACHABLE, std::move(message));
    }
}

Milliseconds remaining_until(TimePoint deadline) {
    auto left = std::chrono::duration_cast<Milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : Milliseconds(0);
}

Error fault_error(const xmlrpc::Response& response, const std::string& name) {
    if (response.fault_code == SupervisorClient::kFaultBadName) {
        return Error(ErrorCode::PROCESS_NOT_FOUND,
                     "Supervisor does not know process '" + name + "'").with_related({name});
    }
    return Error(ErrorCode::SUPERVISOR_FAULT,
                 "Supervisor fault " + std::to_string(response.fault_code) + ": " + response.fault_string);
}

}  // namespace

//
// CurlTransport
//

CurlTransport::CurlTransport(std::string host, u16 port)
    : url_("http://" + host + ":" + std::to_string(port) + "/RPC2") {
    static std::once_flag curl_init;
    std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::~CurlTransport() = default;

Result<std::string> CurlTransport::post(const std::string& body, Milliseconds timeout) {
    CurlHandle curl;
    if (!curl) {
        return unexpected(MAKE_ERROR(SUPERVISOR_UNREACHABLE, "Failed to initialize cURL"));
    }

    std::string response;
    HeaderList headers;
    headers.append("Content-Type: text/xml");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<i64>(timeout.count(), 1)));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return unexpected(curl_error(res, url_));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        return unexpected(MAKE_ERROR(SUPERVISOR_FAULT,
            "Supervisor answered HTTP " + std::to_string(http_code) + " at " + url_));
    }
    return response;
}

//
// SupervisorClient
//

SupervisorClient::SupervisorClient(std::unique_ptr<XmlRpcTransport> transport)
    : SupervisorClient(std::move(transport), Options{}) {}

SupervisorClient::SupervisorClient(std::unique_ptr<XmlRpcTransport> transport, Options options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    if (!options_.sleep) {
        options_.sleep = [](Milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

ProcessStatus SupervisorClient::map_state(const std::string& state_name) {
    if (state_name == "RUNNING") {
        return ProcessStatus::Running;
    }
    static const char* not_running[] = {"STOPPED", "EXITED", "FATAL", "BACKOFF", "STOPPING", "STARTING"};
    for (const char* candidate : not_running) {
        if (state_name == candidate) {
            return ProcessStatus::Stopped;
        }
    }
    return ProcessStatus::Unknown;
}

Result<xmlrpc::Response> SupervisorClient::call(const std::string& method, const std::vector<json>& params,
                                                Milliseconds timeout) {
    COMPONENT_LOG_TRACE("XML-RPC call {}", method);

    std::string body;
    ASSIGN_OR_RETURN(body, transport_->post(xmlrpc::build_request(method, params), timeout));
    return xmlrpc::parse_response(body);
}

Result<ProcessInfo> SupervisorClient::info_from_json(const json& value) {
    if (!value.is_object() || !value.contains("name") || !value["name"].is_string()) {
        return unexpected(MAKE_ERROR(PROTOCOL_ERROR, "Malformed process info from supervisor"));
    }

    ProcessInfo info;
    info.name = value["name"].get<std::string>();
    if (value.contains("group") && value["group"].is_string()) {
        info.group = value["group"].get<std::string>();
    }
    if (value.contains("statename") && value["statename"].is_string()) {
        info.state = value["statename"].get<std::string>();
    }
    if (value.contains("pid") && value["pid"].is_number_integer()) {
        info.pid = value["pid"].get<i64>();
    }
    if (value.contains("description") && value["description"].is_string()) {
        info.description = value["description"].get<std::string>();
    }
    info.status = map_state(info.state);
    return info;
}

Result<ProcessInfo> SupervisorClient::info(const std::string& name) {
    xmlrpc::Response reply;
    ASSIGN_OR_RETURN(reply, call("supervisor.getProcessInfo", {name}, options_.request_timeout));
    if (reply.is_fault) {
        return unexpected(fault_error(reply, name));
    }
    return info_from_json(reply.value);
}

Result<ProcessStatus> SupervisorClient::status(const std::string& name) {
    ProcessInfo process;
    ASSIGN_OR_RETURN(process, info(name));
    return process.status;
}

Result<void> SupervisorClient::start_before(const std::string& name, TimePoint deadline) {
    const Milliseconds left = remaining_until(deadline);
    if (left.count() == 0) {
        return unexpected(MAKE_ERROR(TIMEOUT, "No time left to start '" + name + "'"));
    }

    xmlrpc::Response reply;
    ASSIGN_OR_RETURN(reply, call("supervisor.startProcess", {name, true},
                                 std::min(left, options_.request_timeout)));
    if (reply.is_fault) {
        if (reply.fault_code == kFaultAlreadyStarted) {
            COMPONENT_LOG_DEBUG("Process {} was already running", name);
            return {};
        }
        return unexpected(fault_error(reply, name));
    }
    return {};
}

Result<void> SupervisorClient::stop_before(const std::string& name, TimePoint deadline) {
    const Milliseconds left = remaining_until(deadline);
    if (left.count() == 0) {
        return unexpected(MAKE_ERROR(TIMEOUT, "No time left to stop '" + name + "'"));
    }

    xmlrpc::Response reply;
    ASSIGN_OR_RETURN(reply, call("supervisor.stopProcess", {name, true},
                                 std::min(left, options_.request_timeout)));
    if (reply.is_fault) {
        if (reply.fault_code == kFaultNotRunning) {
            COMPONENT_LOG_DEBUG("Process {} was not running", name);
            return {};
        }
        return unexpected(fault_error(reply, name));
    }
    return {};
}

Result<void> SupervisorClient::wait_for(const std::string& name, ProcessStatus wanted, TimePoint deadline) {
    while (true) {
        ProcessStatus current;
        ASSIGN_OR_RETURN(current, status(name));
        if (current == wanted) {
            return {};
        }

        const Milliseconds left = remaining_until(deadline);
        if (left.count() == 0) {
            return unexpected(MAKE_ERROR(TIMEOUT, "Process '" + name + "' did not become " +
                                                  process_status_to_string(wanted) + " in time"));
        }
        options_.sleep(std::min(left, options_.poll_interval));
    }
}

Result<void> SupervisorClient::start(const std::string& name) {
    return start_before(name, std::chrono::steady_clock::now() + options_.request_timeout);
}

Result<void> SupervisorClient::stop(const std::string& name) {
    return stop_before(name, std::chrono::steady_clock::now() + options_.request_timeout);
}

Result<void> SupervisorClient::restart(const std::string& name, Milliseconds timeout) {
    const TimePoint deadline = std::chrono::steady_clock::now() + timeout;
    COMPONENT_LOG_INFO("Restarting {} (timeout {}ms)", name, timeout.count());

    auto restarted = [&]() -> Result<void> {
        RETURN_IF_ERROR(stop_before(name, deadline));
        RETURN_IF_ERROR(wait_for(name, ProcessStatus::Stopped, deadline));
        RETURN_IF_ERROR(start_before(name, deadline));
        RETURN_IF_ERROR(wait_for(name, ProcessStatus::Running, deadline));
        return {};
    }();

    if (!restarted) {
        const Error& error = restarted.error();
        if (error.code() == ErrorCode::TIMEOUT) {
            return unexpected(Error(ErrorCode::RESTART_TIMEOUT,
                "Restart of '" + name + "' exceeded " + std::to_string(timeout.count()) + "ms")
                .with_cause(std::make_shared<Error>(error)));
        }
        return restarted;
    }

    COMPONENT_LOG_INFO("Process {} is running again", name);
    return {};
}

Result<std::vector<ProcessInfo>> SupervisorClient::list_processes() {
    xmlrpc::Response reply;
    ASSIGN_OR_RETURN(reply, call("supervisor.getAllProcessInfo", {}, options_.request_timeout));
    if (reply.is_fault) {
        return unexpected(fault_error(reply, "*"));
    }
    if (!reply.value.is_array()) {
        return unexpected(MAKE_ERROR(PROTOCOL_ERROR, "getAllProcessInfo did not return an array"));
    }

    std::vector<ProcessInfo> processes;
    for (const auto& entry : reply.value) {
        ProcessInfo info;
        ASSIGN_OR_RETURN(info, info_from_json(entry));
        processes.push_back(std::move(info));
    }
    return processes;
}

bool SupervisorClient::is_available() {
    auto reply = call("supervisor.getState", {}, options_.request_timeout);
    if (!reply) {
        COMPONENT_LOG_DEBUG("Supervisor not available: {}", reply.error().message());
        return false;
    }
    return !reply->is_fault;
}

}  // namespace scoreboard::controlhub
