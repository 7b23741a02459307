#include <gtest/gtest.h>
#include "core/errors/collector_errors.hpp"

using namespace diagcollect::core::errors;

// Simulates an export tool that may not be installed
Result<int> simulate_export(bool tool_missing) {
    if (tool_missing) {
        return CollectorError{ErrorCategory::Execution, "wevtutil not found"};
    }
    return 0;
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_export(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0);
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_export(true);

    EXPECT_TRUE(is_error(result));
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "wevtutil not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoriesHaveStableNames) {
    EXPECT_EQ(to_string(ErrorCategory::Precondition), "precondition");
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
}
