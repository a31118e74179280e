#include <sstream>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"

using namespace std;
using namespace grader;

TEST(ExceptionsTest, KindNames) {
    EXPECT_STREQ(get_kind_name(error_kind::SANDBOX_UNAVAILABLE), "SandboxUnavailable");
    EXPECT_STREQ(get_kind_name(error_kind::EXECUTION_TIMEOUT), "ExecutionTimeout");
    EXPECT_STREQ(get_kind_name(error_kind::ENTRY_POINT_NOT_FOUND), "EntryPointNotFound");
    EXPECT_STREQ(get_kind_name(error_kind::JOB_PARTIAL_FAILURE), "JobPartialFailure");

    EXPECT_EQ(parse_error_kind("AnalyzerFailure"), error_kind::ANALYZER_FAILURE);
    EXPECT_EQ(parse_error_kind("CleanupError"), error_kind::CLEANUP_ERROR);
    EXPECT_EQ(parse_error_kind("Segfault"), error_kind::INTERNAL_ERROR);
}

TEST(ExceptionsTest, SubclassesCarryKind) {
    EXPECT_EQ(sandbox_unavailable("").kind(), error_kind::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(execution_timeout("").kind(), error_kind::EXECUTION_TIMEOUT);
    EXPECT_EQ(entry_point_not_found("").kind(), error_kind::ENTRY_POINT_NOT_FOUND);
    EXPECT_EQ(analyzer_failure("").kind(), error_kind::ANALYZER_FAILURE);
    EXPECT_EQ(cleanup_error("").kind(), error_kind::CLEANUP_ERROR);
    EXPECT_EQ(not_found_error("").kind(), error_kind::NOT_FOUND);
    EXPECT_EQ(invalid_argument_error("").kind(), error_kind::INVALID_ARGUMENT);
    EXPECT_EQ(internal_error().kind(), error_kind::INTERNAL_ERROR);
}

TEST(ExceptionsTest, CatchAsGraderException) {
    try {
        throw not_found_error("Job 42 does not exist");
    } catch (grader_exception &ex) {
        EXPECT_EQ(ex.kind(), error_kind::NOT_FOUND);
        EXPECT_STREQ(ex.what(), "Job 42 does not exist");
    }
}

TEST(ExceptionsTest, AppendsToMessage) {
    grader_exception ex = execution_timeout("All test cases timed out after ") << 10 << "s";
    EXPECT_STREQ(ex.what(), "All test cases timed out after 10s");
    EXPECT_EQ(ex.kind(), error_kind::EXECUTION_TIMEOUT);
}

TEST(ExceptionsTest, StreamsKindName) {
    stringstream ss;
    ss << invalid_argument_error("Unsupported language cobol");
    EXPECT_EQ(ss.str().rfind("InvalidArgument: ", 0), 0u);
}
