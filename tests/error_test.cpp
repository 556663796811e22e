// ============================================================================
// Error Code Tests
// ============================================================================

#include "paratask/core/error.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace paratask;

// ============================================================================
// Basic Error Tests
// ============================================================================

TEST(ErrorTest, MakeErrorCode) {
    std::error_code ec = make_error_code(Errc::AlreadyStarted);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.value(), static_cast<int>(Errc::AlreadyStarted));
    EXPECT_EQ(std::string(ec.category().name()), "paratask");
}

TEST(ErrorTest, ErrorMessages) {
    EXPECT_EQ(make_error_code(Errc::AlreadyStarted).message(), "Task group already started");
    EXPECT_EQ(make_error_code(Errc::NoTasks).message(), "No tasks defined");
    EXPECT_EQ(make_error_code(Errc::NoResult).message(), "No successful result found");
    EXPECT_EQ(make_error_code(Errc::AmbiguousResult).message(), "More than one successful result found");
    EXPECT_EQ(make_error_code(Errc::EmptyResult).message(), "Successful result carries no value");
    EXPECT_EQ(make_error_code(Errc::InvalidArgument).message(), "Invalid argument");
    EXPECT_EQ(make_error_code(Errc::ExecutorStopped).message(), "Executor is not running");
}

TEST(ErrorTest, CategorySingleton) {
    const auto& cat1 = ParataskCategory();
    const auto& cat2 = ParataskCategory();
    EXPECT_EQ(&cat1, &cat2);
}

TEST(ErrorTest, ImplicitConversionFromErrc) {
    // Errc is registered as is_error_code_enum, so implicit conversion works
    std::error_code ec = Errc::NoResult;
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.message(), "No successful result found");
}

TEST(ErrorTest, ComparisonBetweenErrorCodes) {
    std::error_code ec1 = Errc::NoTasks;
    std::error_code ec2 = Errc::NoTasks;
    std::error_code ec3 = Errc::AmbiguousResult;
    EXPECT_EQ(ec1, ec2);
    EXPECT_NE(ec1, ec3);
}

TEST(ErrorTest, DefaultErrorCodeIsFalsy) {
    Error ec;
    EXPECT_FALSE(static_cast<bool>(ec));
}

TEST(ErrorTest, UnknownErrorCodeMessage) {
    std::error_code ec = make_error_code(static_cast<Errc>(9999));
    EXPECT_EQ(ec.message(), "Unknown paratask error");
}

// ============================================================================
// DescribeException Tests
// ============================================================================

TEST(ErrorTest, DescribeNullException) {
    EXPECT_EQ(DescribeException(nullptr), "no error");
}

TEST(ErrorTest, DescribeStdException) {
    auto error = std::make_exception_ptr(std::runtime_error("connection refused"));
    EXPECT_EQ(DescribeException(error), "connection refused");
}

TEST(ErrorTest, DescribeNonStdException) {
    auto error = std::make_exception_ptr(42);
    EXPECT_EQ(DescribeException(error), "unknown exception");
}
