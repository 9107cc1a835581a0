#include <gtest/gtest.h>
#include "controlhub/process/supervisor_client.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scoreboard::controlhub::test {

namespace {

std::string between(const std::string& text, const std::string& open, const std::string& close) {
    const auto start = text.find(open);
    if (start == std::string::npos) {
        return {};
    }
    const auto end = text.find(close, start + open.size());
    return text.substr(start + open.size(), end - start - open.size());
}

std::string success(const std::string& value) {
    return "<?xml version=\"1.0\"?><methodResponse><params><param><value>" + value +
           "</value></param></params></methodResponse>";
}

std::string fault(int code, const std::string& text) {
    return "<?xml version=\"1.0\"?><methodResponse><fault><value><struct>"
           "<member><name>faultCode</name><value><int>" + std::to_string(code) + "</int></value></member>"
           "<member><name>faultString</name><value><string>" + text + "</string></value></member>"
           "</struct></value></fault></methodResponse>";
}

/**
 * @brief In-memory supervisord serving one program.
 *
 * Stop and start requests flip the state immediately unless starts are set
 * to hang in BACKOFF.
 */
class FakeSupervisor : public XmlRpcTransport {
public:
    explicit FakeSupervisor(std::string program = "scoreboard") : program_(std::move(program)) {}

    Result<std::string> post(const std::string& body, Milliseconds) override {
        std::lock_guard lock(mutex_);
        const std::string method = between(body, "<methodName>", "</methodName>");
        methods_.push_back(method);

        if (unreachable_) {
            return unexpected(MAKE_ERROR(SUPERVISOR_UNREACHABLE, "connection refused"));
        }
        if (method == "supervisor.getState") {
            return success("<struct><member><name>statecode</name><value><int>1</int></value></member>"
                           "<member><name>statename</name><value><string>RUNNING</string></value></member>"
                           "</struct>");
        }
        if (method == "supervisor.getAllProcessInfo") {
            return success("<array><data><value>" + info() + "</value></data></array>");
        }

        const std::string name = between(body, "<string>", "</string>");
        if (name != program_) {
            return fault(SupervisorClient::kFaultBadName, "BAD_NAME: " + name);
        }
        if (method == "supervisor.getProcessInfo") {
            return success(info());
        }
        if (method == "supervisor.stopProcess") {
            if (state_ != "RUNNING") {
                return fault(SupervisorClient::kFaultNotRunning, "NOT_RUNNING");
            }
            state_ = "STOPPED";
            return success("<boolean>1</boolean>");
        }
        if (method == "supervisor.startProcess") {
            if (state_ == "RUNNING") {
                return fault(SupervisorClient::kFaultAlreadyStarted, "ALREADY_STARTED");
            }
            if (spawn_error_) {
                return fault(50, "SPAWN_ERROR: " + name);
            }
            state_ = start_hangs_ ? "BACKOFF" : "RUNNING";
            return success("<boolean>1</boolean>");
        }
        return fault(1, "UNKNOWN_METHOD");
    }

    void set_state(std::string state) { std::lock_guard lock(mutex_); state_ = std::move(state); }
    void set_unreachable(bool unreachable) { std::lock_guard lock(mutex_); unreachable_ = unreachable; }
    void set_start_hangs(bool hangs) { std::lock_guard lock(mutex_); start_hangs_ = hangs; }
    void set_spawn_error(bool error) { std::lock_guard lock(mutex_); spawn_error_ = error; }

    std::vector<std::string> methods() const { std::lock_guard lock(mutex_); return methods_; }

private:
    std::string info() const {
        return "<struct>"
               "<member><name>name</name><value><string>" + program_ + "</string></value></member>"
               "<member><name>group</name><value><string>" + program_ + "</string></value></member>"
               "<member><name>statename</name><value><string>" + state_ + "</string></value></member>"
               "<member><name>pid</name><value><int>" + std::string(state_ == "RUNNING" ? "321" : "0") +
               "</int></value></member>"
               "<member><name>description</name><value><string>test</string></value></member>"
               "</struct>";
    }

    mutable std::mutex mutex_;
    std::string program_;
    std::string state_ = "RUNNING";
    bool unreachable_ = false;
    bool start_hangs_ = false;
    bool spawn_error_ = false;
    std::vector<std::string> methods_;
};

}  // namespace

class SupervisorClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto transport = std::make_unique<FakeSupervisor>();
        supervisor = transport.get();

        SupervisorClient::Options options;
        options.request_timeout = Milliseconds(500);
        options.poll_interval = Milliseconds(1);
        client = std::make_unique<SupervisorClient>(std::move(transport), options);
    }

    FakeSupervisor* supervisor = nullptr;
    std::unique_ptr<SupervisorClient> client;
};

TEST_F(SupervisorClientTest, MapsSupervisorStates) {
    EXPECT_EQ(SupervisorClient::map_state("RUNNING"), ProcessStatus::Running);
    EXPECT_EQ(SupervisorClient::map_state("STOPPED"), ProcessStatus::Stopped);
    EXPECT_EQ(SupervisorClient::map_state("FATAL"), ProcessStatus::Stopped);
    EXPECT_EQ(SupervisorClient::map_state("STARTING"), ProcessStatus::Stopped);
    EXPECT_EQ(SupervisorClient::map_state("UNKNOWN"), ProcessStatus::Unknown);
}

TEST_F(SupervisorClientTest, StatusOfKnownProcess) {
    auto status = client->status("scoreboard");
    ASSERT_TRUE(status.has_value()) << status.error().to_string();
    EXPECT_EQ(status.value(), ProcessStatus::Running);

    supervisor->set_state("EXITED");
    EXPECT_EQ(client->status("scoreboard").value(), ProcessStatus::Stopped);
}

TEST_F(SupervisorClientTest, InfoCarriesStateAndPid) {
    auto process = client->info("scoreboard");
    ASSERT_TRUE(process.has_value()) << process.error().to_string();
    EXPECT_EQ(process->state, "RUNNING");
    EXPECT_EQ(process->pid, 321);

    supervisor->set_state("BACKOFF");
    process = client->info("scoreboard");
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ(process->state, "BACKOFF");
    EXPECT_EQ(process->pid, 0);
    EXPECT_NE(process->status, ProcessStatus::Running);
}

TEST_F(SupervisorClientTest, UnknownProcessIsNotFound) {
    auto status = client->status("ghost");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::PROCESS_NOT_FOUND);

    auto restarted = client->restart("ghost", Milliseconds(1000));
    ASSERT_FALSE(restarted.has_value());
    EXPECT_EQ(restarted.error().code(), ErrorCode::PROCESS_NOT_FOUND);
}

TEST_F(SupervisorClientTest, StartAndStopToleratesBenignFaults) {
    EXPECT_TRUE(client->start("scoreboard").has_value());

    EXPECT_TRUE(client->stop("scoreboard").has_value());
    EXPECT_TRUE(client->stop("scoreboard").has_value());
    EXPECT_EQ(client->status("scoreboard").value(), ProcessStatus::Stopped);
}

TEST_F(SupervisorClientTest, RestartStopsThenStarts) {
    auto restarted = client->restart("scoreboard", Milliseconds(2000));
    ASSERT_TRUE(restarted.has_value()) << restarted.error().to_string();

    const auto methods = supervisor->methods();
    ASSERT_GE(methods.size(), 4u);
    EXPECT_EQ(methods.front(), "supervisor.stopProcess");
    const auto start = std::find(methods.begin(), methods.end(), "supervisor.startProcess");
    ASSERT_NE(start, methods.end());
    EXPECT_EQ(methods.back(), "supervisor.getProcessInfo");
    EXPECT_EQ(client->status("scoreboard").value(), ProcessStatus::Running);
}

TEST_F(SupervisorClientTest, RestartOfStoppedProcess) {
    supervisor->set_state("STOPPED");

    auto restarted = client->restart("scoreboard", Milliseconds(2000));
    ASSERT_TRUE(restarted.has_value()) << restarted.error().to_string();
    EXPECT_EQ(client->status("scoreboard").value(), ProcessStatus::Running);
}

TEST_F(SupervisorClientTest, RestartTimesOutWhenProcessNeverRuns) {
    supervisor->set_start_hangs(true);

    auto restarted = client->restart("scoreboard", Milliseconds(50));
    ASSERT_FALSE(restarted.has_value());
    EXPECT_EQ(restarted.error().code(), ErrorCode::RESTART_TIMEOUT);
    ASSERT_NE(restarted.error().cause(), nullptr);
    EXPECT_EQ(restarted.error().cause()->code(), ErrorCode::TIMEOUT);
}

TEST_F(SupervisorClientTest, SpawnErrorIsSupervisorFault) {
    supervisor->set_spawn_error(true);

    auto restarted = client->restart("scoreboard", Milliseconds(2000));
    ASSERT_FALSE(restarted.has_value());
    EXPECT_EQ(restarted.error().code(), ErrorCode::SUPERVISOR_FAULT);
    EXPECT_NE(restarted.error().message().find("SPAWN_ERROR"), std::string::npos);
}

TEST_F(SupervisorClientTest, UnreachableSupervisor) {
    supervisor->set_unreachable(true);

    EXPECT_FALSE(client->is_available());
    auto status = client->status("scoreboard");
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::SUPERVISOR_UNREACHABLE);

    supervisor->set_unreachable(false);
    EXPECT_TRUE(client->is_available());
    EXPECT_EQ(supervisor->methods().back(), "supervisor.getState");
}

TEST_F(SupervisorClientTest, ListProcesses) {
    auto processes = client->list_processes();
    ASSERT_TRUE(processes.has_value()) << processes.error().to_string();
    ASSERT_EQ(processes->size(), 1u);

    const ProcessInfo& info = processes->front();
    EXPECT_EQ(info.name, "scoreboard");
    EXPECT_EQ(info.state, "RUNNING");
    EXPECT_EQ(info.status, ProcessStatus::Running);
    EXPECT_EQ(info.pid, 321);
}

}  // namespace scoreboard::controlhub::test
