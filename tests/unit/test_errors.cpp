#include <string>
#include <gtest/gtest.h>
#include "core/errors/engine_errors.hpp"

using namespace conduit::core::errors;

// A dummy function to simulate a tool lookup failing
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return EngineError{ErrorCategory::NotFound, "Tool not found: build", "tool_not_found"};
    }
    return std::string("build");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "build");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::NotFound);
    EXPECT_EQ(error.message, "Tool not found: build");
    EXPECT_EQ(error.code, "tool_not_found");
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));

    status = EngineError{ErrorCategory::Overload, "queue full", "job_queue_full"};
    EXPECT_TRUE(is_error(status));
}

TEST(ErrorModelTest, DescribesErrorsWithCode) {
    const EngineError error{ErrorCategory::Timeout, "deadline exceeded", "tool_execution_timeout"};
    EXPECT_EQ(describe(error), "[tool_execution_timeout] deadline exceeded");
    EXPECT_EQ(to_string(ErrorCategory::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
