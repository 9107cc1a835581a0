#include <gtest/gtest.h>
#include "controlhub/utils/error.hpp"
#include <string>
#include <memory>

namespace scoreboard::controlhub::test {

TEST(ErrorHandlingTest, BasicErrorCreation) {
    auto error = MAKE_ERROR(INVALID_PARAMETER, "Test error message");

    EXPECT_EQ(error.code(), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(error.message(), "Test error message");
    EXPECT_NE(std::string(error.location().file_name()).find("test_error_handling"), std::string::npos);
    EXPECT_GT(error.location().line(), 0u);
}

TEST(ErrorHandlingTest, FieldAndRelatedIds) {
    Error error(ErrorCode::HAS_DEPENDENTS, "Plugin 'b' is required by enabled plugins");
    error.with_field("plugins.b").with_related({"a", "c"});

    EXPECT_EQ(error.field(), "plugins.b");
    ASSERT_EQ(error.related().size(), 2u);
    EXPECT_EQ(error.related()[0], "a");
    EXPECT_EQ(error.related()[1], "c");
}

TEST(ErrorHandlingTest, ErrorChaining) {
    auto root_error = MAKE_ERROR(TIMEOUT, "Process did not become running in time");
    Error chained_error(ErrorCode::RESTART_FAILED, "Restart failed");
    chained_error.with_cause(std::make_shared<Error>(root_error));

    EXPECT_EQ(chained_error.code(), ErrorCode::RESTART_FAILED);
    ASSERT_TRUE(chained_error.cause() != nullptr);
    EXPECT_EQ(chained_error.cause()->code(), ErrorCode::TIMEOUT);
}

TEST(ErrorHandlingTest, RollbackFlag) {
    Error error(ErrorCode::HEALTH_CHECK_FAILED, "Health probe did not pass");
    EXPECT_FALSE(error.rollback_succeeded().has_value());

    error.with_rollback(true);
    ASSERT_TRUE(error.rollback_succeeded().has_value());
    EXPECT_TRUE(*error.rollback_succeeded());
    EXPECT_NE(error.to_string().find("rolled back"), std::string::npos);
}

TEST(ErrorHandlingTest, ErrorCategories) {
    EXPECT_EQ(get_error_category(ErrorCode::PLUGIN_BAD_MANIFEST), ErrorCategory::INPUT);
    EXPECT_EQ(get_error_category(ErrorCode::CONFIG_VALIDATION_ERROR), ErrorCategory::INPUT);
    EXPECT_EQ(get_error_category(ErrorCode::CYCLIC_DEPENDENCY), ErrorCategory::DEPENDENCY);
    EXPECT_EQ(get_error_category(ErrorCode::HAS_DEPENDENTS), ErrorCategory::DEPENDENCY);
    EXPECT_EQ(get_error_category(ErrorCode::RESTART_FAILED), ErrorCategory::OPERATIONAL);
    EXPECT_EQ(get_error_category(ErrorCode::HEALTH_CHECK_FAILED), ErrorCategory::OPERATIONAL);
    EXPECT_EQ(get_error_category(ErrorCode::UNRECOVERABLE), ErrorCategory::UNRECOVERABLE);
    EXPECT_EQ(get_error_category(ErrorCode::TRANSACTION_BUSY), ErrorCategory::CONCURRENCY);
}

TEST(ErrorHandlingTest, ErrorCodeToString) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INVALID_PARAMETER), "INVALID_PARAMETER");
    EXPECT_STREQ(error_code_to_string(ErrorCode::STALE_STAGE), "STALE_STAGE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::TRANSACTION_BUSY), "TRANSACTION_BUSY");
}

TEST(ErrorHandlingTest, ToStringIncludesContext) {
    Error error(ErrorCode::CONFIG_VALIDATION_ERROR, "value 5 is below minimum 10");
    error.with_field("preferences.live_game_refresh_rate");

    auto formatted = error.to_string();
    EXPECT_NE(formatted.find("CONFIG_VALIDATION_ERROR"), std::string::npos);
    EXPECT_NE(formatted.find("below minimum"), std::string::npos);
    EXPECT_NE(formatted.find("preferences.live_game_refresh_rate"), std::string::npos);
}

TEST(ErrorHandlingTest, ResultSuccess) {
    Result<int> success_result = 42;

    EXPECT_TRUE(success_result.has_value());
    EXPECT_EQ(success_result.value(), 42);
    EXPECT_EQ(success_result.value_or(7), 42);
}

TEST(ErrorHandlingTest, ResultError) {
    Result<int> error_result = unexpected(MAKE_ERROR(INVALID_PARAMETER, "bad"));

    EXPECT_FALSE(error_result.has_value());
    EXPECT_EQ(error_result.error().code(), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(error_result.value_or(7), 7);
}

TEST(ErrorHandlingTest, AssignOrReturnSuccess) {
    auto test_function = []() -> Result<int> {
        int value = 0;
        ASSIGN_OR_RETURN(value, Result<int>(10));
        return value * 2;
    };

    auto result = test_function();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 20);
}

TEST(ErrorHandlingTest, AssignOrReturnPropagates) {
    auto failing = []() -> Result<int> {
        return unexpected(MAKE_ERROR(PLUGIN_NOT_FOUND, "missing"));
    };
    auto test_function = [&failing]() -> Result<std::string> {
        int value = 0;
        ASSIGN_OR_RETURN(value, failing());
        return std::to_string(value);
    };

    auto result = test_function();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::PLUGIN_NOT_FOUND);
}

TEST(ErrorHandlingTest, ReturnIfErrorPropagates) {
    int reached = 0;
    auto test_function = [&reached](bool fail) -> Result<void> {
        RETURN_IF_ERROR(fail ? Result<void>(unexpected(MAKE_ERROR(TIMEOUT, "slow"))) : Result<void>());
        ++reached;
        return {};
    };

    EXPECT_TRUE(test_function(false).has_value());
    auto failed = test_function(true);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::TIMEOUT);
    EXPECT_EQ(reached, 1);
}

}  // namespace scoreboard::controlhub::test
