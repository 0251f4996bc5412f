#include <gtest/gtest.h>
#include <algorithm>
#include "runtime/docker_engine.hpp"
#include "runtime/provisioner.hpp"
#include "test_support.hpp"

using namespace execbox::runtime;
using execbox::testing::TempDir;

namespace {

// Value following flag in argv, empty if absent
std::string flag_value(const std::vector<std::string>& cmd, const std::string& flag) {
    auto it = std::find(cmd.begin(), cmd.end(), flag);
    if (it == cmd.end() || it + 1 == cmd.end()) {
        return "";
    }
    return *(it + 1);
}

bool has(const std::vector<std::string>& cmd, const std::string& arg) {
    return std::find(cmd.begin(), cmd.end(), arg) != cmd.end();
}

} // namespace

class DockerCommandTest : public ::testing::Test {
protected:
    SandboxSpec make_spec(uint64_t cpu_shares = 0) {
        SandboxPolicy policy;
        policy.engine = EngineKind::DOCKER;
        policy.scratch_root = dir_.path();
        policy.limits.memory_limit_bytes = 64 * 1024 * 1024;
        policy.limits.max_pids = 32;
        policy.limits.cpu_shares = cpu_shares;
        policy.limits.tmpfs_size_bytes = 8 * 1024 * 1024;
        return Provisioner().provision(policy, "a1b2c3d4e5f6", "print(1)");
    }

    TempDir dir_;
    DockerEngine engine_{"docker"};
};

TEST_F(DockerCommandTest, IsolatesNetworkFilesystemAndResources) {
    SandboxSpec spec = make_spec();
    auto cmd = engine_.build_run_command(spec);

    ASSERT_GE(cmd.size(), 2u);
    EXPECT_EQ(cmd[0], "docker");
    EXPECT_EQ(cmd[1], "run");
    EXPECT_EQ(flag_value(cmd, "--name"), "execbox_a1b2c3d4e5f6");
    EXPECT_EQ(flag_value(cmd, "--network"), "none");
    EXPECT_EQ(flag_value(cmd, "--memory"), std::to_string(64 * 1024 * 1024));
    EXPECT_EQ(flag_value(cmd, "--memory-swap"), std::to_string(64 * 1024 * 1024));
    EXPECT_EQ(flag_value(cmd, "--pids-limit"), "32");
    EXPECT_TRUE(has(cmd, "--read-only"));
    EXPECT_EQ(flag_value(cmd, "--cap-drop"), "ALL");
    EXPECT_EQ(flag_value(cmd, "--security-opt"), "no-new-privileges");
    EXPECT_EQ(flag_value(cmd, "--tmpfs"), "/tmp:rw,size=" + std::to_string(8 * 1024 * 1024));
    EXPECT_EQ(flag_value(cmd, "-v"), spec.scratch.code_dir() + ":/sandbox:ro");
    EXPECT_FALSE(has(cmd, "--cpu-shares"));
}

TEST_F(DockerCommandTest, ImageInterpreterAndScriptComeLast) {
    SandboxSpec spec = make_spec();
    auto cmd = engine_.build_run_command(spec);

    ASSERT_GE(cmd.size(), 3u);
    EXPECT_EQ(cmd[cmd.size() - 3], "python:3.11-slim");
    EXPECT_EQ(cmd[cmd.size() - 2], "python3");
    EXPECT_EQ(cmd.back(), "/sandbox/main.py");
}

TEST_F(DockerCommandTest, CpuSharesOnlyWhenConfigured) {
    SandboxSpec spec = make_spec(512);
    auto cmd = engine_.build_run_command(spec);
    EXPECT_EQ(flag_value(cmd, "--cpu-shares"), "512");
}

TEST(DockerEngineTest, ContainerNameIsDerivedFromRequestId) {
    EXPECT_EQ(DockerEngine::container_name("0123456789ab"), "execbox_0123456789ab");
}

TEST(DockerEngineTest, MissingCliIsUnavailable) {
    DockerEngine engine("/nonexistent/docker");
    EXPECT_FALSE(engine.available());
}
