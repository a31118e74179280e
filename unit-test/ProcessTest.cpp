#include <filesystem>
#include <stdexcept>
#include "gtest/gtest.h"
#include "config.hpp"
#include "sandbox/process.hpp"

using namespace std;
using namespace grader;

class ProcessTest : public ::testing::Test {
protected:
    static process_options shell(const string &script) {
        process_options options;
        options.argv = {"/bin/sh", "-c", script};
        options.env = minimal_environment();
        options.wall_time_limit = chrono::seconds(10);
        return options;
    }
};

TEST_F(ProcessTest, CapturesOutputAndExitCode) {
    process_result result = run_process(shell("echo hello; echo oops >&2; exit 3"));
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.output_limit_exceeded);
}

TEST_F(ProcessTest, KillsProcessGroupOnTimeout) {
    auto options = shell("sleep 30 & sleep 30");
    options.wall_time_limit = chrono::milliseconds(300);
    process_result result = run_process(options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.signal, 0);
    EXPECT_LT(result.wall_time, 10000);
}

TEST_F(ProcessTest, TimesOutAfterClosingOutput) {
    auto options = shell("exec >&- 2>&-; sleep 30");
    options.wall_time_limit = chrono::milliseconds(300);
    process_result result = run_process(options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.signal, 0);
    EXPECT_LT(result.wall_time, 10000);
}

TEST_F(ProcessTest, ExitsAfterClosingOutput) {
    process_result result = run_process(shell("exec >&- 2>&-; sleep 0.1; exit 4"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 4);
}

TEST_F(ProcessTest, StopsAtOutputLimit) {
    auto options = shell("while true; do echo aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa; done");
    options.output_limit = 1024;
    process_result result = run_process(options);
    EXPECT_TRUE(result.output_limit_exceeded);
    EXPECT_EQ(result.stdout_text.size(), 1024);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(ProcessTest, UsesGivenEnvironmentAndDirectory) {
    auto options = shell("echo \"$ONLY:$USER\"; pwd");
    options.env["ONLY"] = "1";
    options.working_directory = WORK_DIR;
    process_result result = run_process(options);
    EXPECT_EQ(result.stdout_text, "1:\n" + filesystem::canonical(WORK_DIR).string() + "\n");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ProcessTest, StdinIsEmpty) {
    process_result result = run_process(shell("cat; echo done"));
    EXPECT_EQ(result.stdout_text, "done\n");
}

TEST_F(ProcessTest, ReportsMissingExecutable) {
    process_options options;
    options.argv = {"grader-no-such-binary"};
    options.env = minimal_environment();
    process_result result = run_process(options);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_text.find("unable to execute grader-no-such-binary"), string::npos);
}

TEST_F(ProcessTest, RejectsEmptyCommand) {
    EXPECT_THROW(run_process(process_options()), std::invalid_argument);
}

TEST_F(ProcessTest, MinimalEnvironmentKeepsOnlyPathHomeAndLang) {
    auto env = minimal_environment();
    EXPECT_TRUE(env.count("PATH"));
    EXPECT_EQ(env.size(), 3);
    EXPECT_EQ(env.at("LANG"), "C.UTF-8");
}
