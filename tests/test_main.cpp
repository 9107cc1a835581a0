#include <gtest/gtest.h>
#include <iostream>

#include "controlhub/utils/logging.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "==============================================" << std::endl;
    std::cout << "Scoreboard Control Hub - Unit Test Suite" << std::endl;
    std::cout << "==============================================" << std::endl;
    std::cout << "Testing:" << std::endl;
    std::cout << "• Configuration document, schema and store" << std::endl;
    std::cout << "• Plugin manifests, registry and dependency planning" << std::endl;
    std::cout << "• Supervisor XML-RPC client and health probes" << std::endl;
    std::cout << "• Transactional orchestration and rollback" << std::endl;
    std::cout << "==============================================" << std::endl;
    std::cout << std::endl;

    // Keep test output readable; failures are asserted, not logged.
    auto logging = scoreboard::controlhub::Logger::initialize(
        scoreboard::controlhub::LogLevel::ERROR_LEVEL, "", true);
    if (!logging) {
        std::cerr << "Logger unavailable: " << logging.error().to_string() << std::endl;
    }

    int result = RUN_ALL_TESTS();
    scoreboard::controlhub::Logger::shutdown();
    return result;
}
