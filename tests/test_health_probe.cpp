#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "controlhub/process/health_probe.hpp"
#include "test_helpers.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <vector>

namespace scoreboard::controlhub::test {

using ::testing::ElementsAre;

namespace {

// Fails the first `failures` checks, then passes.
class FlakyProbe : public HealthProbe {
public:
    explicit FlakyProbe(int failures) : failures_(failures) {}

    Result<void> check() override {
        ++checks_;
        if (checks_ <= failures_) {
            return unexpected(MAKE_ERROR(HEALTH_CHECK_FAILED, "attempt " + std::to_string(checks_)));
        }
        return {};
    }
    std::string describe() const override { return "flaky"; }

    int checks() const { return checks_; }

private:
    int failures_;
    int checks_ = 0;
};

// Listening IPv4 socket on an ephemeral loopback port.
class Listener {
public:
    Listener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        if (fd_ >= 0 && ::bind(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0 &&
            ::listen(fd_, 4) == 0) {
            socklen_t length = sizeof(address);
            if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&address), &length) == 0) {
                port_ = ntohs(address.sin_port);
            }
        }
    }
    ~Listener() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    u16 port() const { return port_; }

private:
    int fd_ = -1;
    u16 port_ = 0;
};

HealthPolicy fast_policy(u32 attempts) {
    HealthPolicy policy;
    policy.attempts = attempts;
    policy.interval = Milliseconds(100);
    policy.max_interval = Milliseconds(400);
    policy.timeout = Milliseconds(60000);
    return policy;
}

}  // namespace

TEST(WaitUntilHealthyTest, PassesOnFirstAttemptWithoutSleeping) {
    FlakyProbe probe(0);
    std::vector<Milliseconds> sleeps;

    auto result = wait_until_healthy(probe, fast_policy(5), [&sleeps](Milliseconds d) { sleeps.push_back(d); });
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(probe.checks(), 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST(WaitUntilHealthyTest, BackoffDoublesUpToCeiling) {
    FlakyProbe probe(4);
    std::vector<Milliseconds> sleeps;

    auto result = wait_until_healthy(probe, fast_policy(5), [&sleeps](Milliseconds d) { sleeps.push_back(d); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(probe.checks(), 5);
    EXPECT_THAT(sleeps, ElementsAre(Milliseconds(100), Milliseconds(200), Milliseconds(400), Milliseconds(400)));
}

TEST(WaitUntilHealthyTest, ExhaustedAttemptsCarryLastError) {
    FlakyProbe probe(10);

    auto result = wait_until_healthy(probe, fast_policy(3), [](Milliseconds) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::HEALTH_CHECK_FAILED);
    EXPECT_EQ(probe.checks(), 3);
    ASSERT_NE(result.error().cause(), nullptr);
    EXPECT_EQ(result.error().cause()->message(), "attempt 3");
}

TEST(WaitUntilHealthyTest, OverallTimeoutStopsEarly) {
    FlakyProbe probe(10);
    HealthPolicy policy = fast_policy(100);
    policy.timeout = Milliseconds(0);

    auto result = wait_until_healthy(probe, policy, [](Milliseconds) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(probe.checks(), 1);
}

TEST(SupervisorStateProbeTest, HealthyAfterStableChecks) {
    FakeProcessController controller;
    SupervisorStateProbe probe(controller, "scoreboard", 3);
    EXPECT_EQ(probe.stable_checks(), 3u);

    EXPECT_FALSE(probe.check().has_value());
    EXPECT_FALSE(probe.check().has_value());
    EXPECT_TRUE(probe.check().has_value());
    EXPECT_NE(probe.describe().find("scoreboard"), std::string::npos);

    ASSERT_TRUE(controller.stop("scoreboard").has_value());
    auto stopped = probe.check();
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().code(), ErrorCode::HEALTH_CHECK_FAILED);
}

TEST(SupervisorStateProbeTest, RunningThenBackoffIsUnhealthy) {
    FakeProcessController controller;
    controller.script_info("RUNNING", 4242);
    controller.script_info("BACKOFF", 0);
    for (int i = 0; i < 4; ++i) {
        controller.script_info("BACKOFF", 0);
    }
    SupervisorStateProbe probe(controller, "scoreboard", 2);

    auto result = wait_until_healthy(probe, fast_policy(5), [](Milliseconds) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::HEALTH_CHECK_FAILED);
    ASSERT_NE(result.error().cause(), nullptr);
    EXPECT_NE(result.error().cause()->message().find("BACKOFF"), std::string::npos);
}

TEST(SupervisorStateProbeTest, PidChangeRestartsTheCount) {
    FakeProcessController controller;
    controller.script_info("RUNNING", 100);
    controller.script_info("RUNNING", 101);
    controller.script_info("RUNNING", 101);
    SupervisorStateProbe probe(controller, "scoreboard", 2);

    EXPECT_FALSE(probe.check().has_value());
    EXPECT_FALSE(probe.check().has_value());
    EXPECT_TRUE(probe.check().has_value());
}

TEST(SupervisorStateProbeTest, WaitResetsEarlierObservations) {
    FakeProcessController controller;
    SupervisorStateProbe probe(controller, "scoreboard", 2);
    EXPECT_FALSE(probe.check().has_value());

    std::vector<Milliseconds> sleeps;
    auto result = wait_until_healthy(probe, fast_policy(5), [&sleeps](Milliseconds d) { sleeps.push_back(d); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST(SupervisorStateProbeTest, ControllerErrorsPropagate) {
    FakeProcessController controller;
    SupervisorStateProbe probe(controller, "ghost");

    auto result = probe.check();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::PROCESS_NOT_FOUND);
}

TEST(TcpHealthProbeTest, ConnectsToListeningPort) {
    Listener listener;
    ASSERT_NE(listener.port(), 0);

    TcpHealthProbe probe("127.0.0.1", listener.port(), Milliseconds(500));
    auto result = probe.check();
    EXPECT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(probe.describe(), "127.0.0.1:" + std::to_string(listener.port()));
}

TEST(TcpHealthProbeTest, ClosedPortFails) {
    u16 port = 0;
    {
        Listener listener;
        port = listener.port();
    }
    ASSERT_NE(port, 0);

    TcpHealthProbe probe("127.0.0.1", port, Milliseconds(500));
    auto result = probe.check();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::HEALTH_CHECK_FAILED);
}

}  // namespace scoreboard::controlhub::test
