#include <gtest/gtest.h>
#include "core/errors/fix_errors.hpp"

using namespace eolfix::core::errors;

// A dummy function to simulate a file operation failing
Result<std::string> simulate_repair(bool should_fail) {
    if (should_fail) {
        return FixError{ErrorCategory::Io, "Permission denied", "open_failed"};
    }
    return std::string("repaired");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_repair(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "repaired");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_repair(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Io);
    EXPECT_EQ(error.message, "Permission denied");
    EXPECT_EQ(error.code, "open_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    FixError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_EQ(to_string(error.category), "internal");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
}
