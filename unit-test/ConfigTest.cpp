#include <stdlib.h>
#include <system_error>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_work_dir = WORK_DIR;
        saved_debug = DEBUG;
        config_path = WORK_DIR / "grader-config.json";
    }

    void TearDown() override {
        WORK_DIR = saved_work_dir;
        DEBUG = saved_debug;
        error_code ec;
        fs::remove(config_path, ec);
        for (const char *key : {"GRADER_WORK_DIR", "GRADER_WORKERS", "GRADER_SANDBOX_SLOTS",
                                "GRADER_CONTAINER_BINARY", "GRADER_DEBUG"})
            unsetenv(key);
    }

    fs::path saved_work_dir;
    bool saved_debug = false;
    fs::path config_path;
};

TEST_F(ConfigTest, Defaults) {
    grader_config config;
    EXPECT_EQ(config.sandbox.container_binary, "docker");
    EXPECT_EQ(config.sandbox.images.at("python"), "python:3.9-slim");
    EXPECT_EQ(config.sandbox.images.at("javascript"), "node:16-alpine");
    EXPECT_EQ(config.sandbox.slots, 4u);
    EXPECT_TRUE(config.sandbox.disable_network);
    EXPECT_DOUBLE_EQ(config.sandbox.limits.time_limit, 10);
    EXPECT_EQ(config.sandbox.limits.memory_limit, 256 * 1024);

    double total = config.weights.correctness + config.weights.quality + config.weights.style +
                   config.weights.performance + config.weights.naming;
    EXPECT_NEAR(total, 0.9, 1e-9);
    EXPECT_EQ(config.orchestrator.workers, 4u);
    EXPECT_TRUE(config.orchestrator.fail_on_total_timeout);
}

TEST_F(ConfigTest, LoadsConfigFile) {
    write_file_content(config_path, R"({
        "sandbox": {
            "container_binary": "podman",
            "slots": 8,
            "images": {"python": "python:3.11-slim"},
            "limits": {"time_limit": 2.5, "memory_limit": 65536}
        },
        "weights": {"correctness": 0.5},
        "orchestrator": {"workers": 2, "fail_on_total_timeout": false},
        "debug": true
    })");

    grader_config config = load_config(config_path);
    EXPECT_EQ(config.sandbox.container_binary, "podman");
    EXPECT_EQ(config.sandbox.slots, 8u);
    EXPECT_EQ(config.sandbox.images.at("python"), "python:3.11-slim");
    EXPECT_EQ(config.sandbox.images.at("java"), "openjdk:11-jdk-slim");
    EXPECT_DOUBLE_EQ(config.sandbox.limits.time_limit, 2.5);
    EXPECT_EQ(config.sandbox.limits.memory_limit, 65536);
    EXPECT_EQ(config.sandbox.limits.output_limit, size_t(1 << 20));
    EXPECT_DOUBLE_EQ(config.weights.correctness, 0.5);
    EXPECT_DOUBLE_EQ(config.weights.quality, 0.15);
    EXPECT_EQ(config.orchestrator.workers, 2u);
    EXPECT_FALSE(config.orchestrator.fail_on_total_timeout);
    EXPECT_TRUE(DEBUG);
}

TEST_F(ConfigTest, MissingOrMalformedFile) {
    EXPECT_THROW(load_config(WORK_DIR / "no-such-config.json"), invalid_argument_error);

    write_file_content(config_path, "{\"sandbox\": ");
    EXPECT_THROW(load_config(config_path), invalid_argument_error);

    write_file_content(config_path, R"({"sandbox": {"slots": "many"}})");
    EXPECT_THROW(load_config(config_path), invalid_argument_error);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("GRADER_WORKERS", "6", 1);
    setenv("GRADER_SANDBOX_SLOTS", "12", 1);
    setenv("GRADER_CONTAINER_BINARY", "podman", 1);
    setenv("GRADER_WORK_DIR", "/tmp/grader-env", 1);
    setenv("GRADER_DEBUG", "1", 1);

    grader_config config;
    apply_env_overrides(config);
    EXPECT_EQ(config.orchestrator.workers, 6u);
    EXPECT_EQ(config.sandbox.slots, 12u);
    EXPECT_EQ(config.sandbox.container_binary, "podman");
    EXPECT_EQ(WORK_DIR, fs::path("/tmp/grader-env"));
    EXPECT_TRUE(DEBUG);
}

TEST_F(ConfigTest, DebugFlagAcceptsWords) {
    grader_config config;
    setenv("GRADER_DEBUG", "true", 1);
    apply_env_overrides(config);
    EXPECT_TRUE(DEBUG);

    setenv("GRADER_DEBUG", "Off", 1);
    apply_env_overrides(config);
    EXPECT_FALSE(DEBUG);

    setenv("GRADER_DEBUG", "maybe", 1);
    apply_env_overrides(config);
    EXPECT_FALSE(DEBUG);
}

TEST_F(ConfigTest, ReadsFileContent) {
    write_file_content(config_path, "{\"debug\": false}\n");
    EXPECT_EQ(read_file_content(config_path), "{\"debug\": false}\n");
    EXPECT_THROW(read_file_content(WORK_DIR / "no-such-config.json"), std::system_error);
}

TEST_F(ConfigTest, MalformedEnvironmentIsIgnored) {
    setenv("GRADER_WORKERS", "several", 1);
    grader_config config;
    apply_env_overrides(config);
    EXPECT_EQ(config.orchestrator.workers, 4u);
}
