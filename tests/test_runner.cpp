#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <thread>
#include <sys/socket.h>
#include "runtime/runner.hpp"
#include "runtime/namespace_engine.hpp"
#include "runtime/provisioner.hpp"
#include "fake_engine.hpp"
#include "test_support.hpp"

using namespace execbox;
using namespace execbox::runtime;
using namespace std::chrono_literals;
using execbox::testing::FakeEngine;
using execbox::testing::FakeScript;
using execbox::testing::TempDir;

// ============================================================================
// StreamCapture
// ============================================================================

TEST(StreamCaptureTest, KeepsPrefixAndCountsEverything) {
    StreamCapture capture(5);
    capture.append("abc", 3);
    EXPECT_FALSE(capture.truncated());
    capture.append("defgh", 5);
    EXPECT_EQ(capture.data(), "abcde");
    EXPECT_TRUE(capture.truncated());
    capture.append("ij", 2);
    EXPECT_EQ(capture.data(), "abcde");
    EXPECT_EQ(capture.total_bytes(), 10u);
}

TEST(StreamCaptureTest, ExactlyAtLimitIsNotTruncated) {
    StreamCapture capture(4);
    capture.append("abcd", 4);
    EXPECT_FALSE(capture.truncated());
    capture.append("", 0);
    EXPECT_FALSE(capture.truncated());
    EXPECT_EQ(capture.take(), "abcd");
}

// ============================================================================
// Runner with a scripted engine
// ============================================================================

class FakeRunnerTest : public ::testing::Test {
protected:
    SandboxSpec make_spec(uint32_t timeout_seconds = 5) {
        SandboxPolicy policy;
        policy.scratch_root = dir_.path();
        policy.timeout_seconds = timeout_seconds;
        policy.drain_timeout_ms = 200;
        policy.max_output_bytes = 64;
        return Provisioner().provision(policy, "fakerequest1", "ignored");
    }

    TempDir dir_;
    FakeEngine engine_;
};

TEST_F(FakeRunnerTest, CapturesOutputAndExitCode) {
    FakeScript script;
    script.stdout_text = "out";
    script.stderr_text = "err";
    script.exit_code = 2;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_EQ(raw.stdout_text, "out");
    EXPECT_EQ(raw.stderr_text, "err");
    EXPECT_EQ(raw.exit_code, 2);
    EXPECT_FALSE(raw.signal.has_value());
    EXPECT_EQ(raw.final_state, RunState::EXITED_NORMALLY);
    EXPECT_TRUE(raw.cleaned);
    EXPECT_EQ(engine_.live(), 0);
}

TEST_F(FakeRunnerTest, LaunchErrorBecomesLaunchFailed) {
    FakeScript script;
    script.fail_launch = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_TRUE(raw.launch_failed);
    EXPECT_EQ(raw.final_state, RunState::LAUNCH_FAILED);
    EXPECT_NE(raw.failure_reason.find("scripted launch failure"), std::string::npos);
    EXPECT_TRUE(raw.cleaned);
}

TEST_F(FakeRunnerTest, HangingSandboxIsKilledAtTheDeadline) {
    FakeScript script;
    script.hang = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec(1);
    auto started = std::chrono::steady_clock::now();
    RawOutcome raw = SandboxRunner(engine_).run(spec);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(raw.timed_out);
    EXPECT_TRUE(raw.killed_by_runner);
    EXPECT_EQ(raw.final_state, RunState::KILLED_ON_TIMEOUT);
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 3s);
    EXPECT_EQ(engine_.live(), 0);
}

TEST_F(FakeRunnerTest, OomIsReportedForSignalledSandbox) {
    FakeScript script;
    script.exit_code.reset();
    script.signal = SIGKILL;
    script.oom = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_TRUE(raw.oom_killed);
    EXPECT_FALSE(raw.killed_by_runner);
    EXPECT_EQ(raw.final_state, RunState::KILLED_ON_RESOURCE_LIMIT);
}

TEST_F(FakeRunnerTest, SigkillWithAuthoritativeNoOomIsNotAResourceKill) {
    FakeScript script;
    script.exit_code.reset();
    script.signal = SIGKILL;
    script.oom = false;
    script.oom_authoritative = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_FALSE(raw.oom_killed);
    EXPECT_TRUE(raw.oom_authoritative);
    EXPECT_EQ(raw.signal, SIGKILL);
    EXPECT_EQ(raw.final_state, RunState::EXITED_NORMALLY);
}

TEST_F(FakeRunnerTest, CleanupFailureIsReportedNotFatal) {
    FakeScript script;
    script.stdout_text = "done";
    script.release_fails = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_TRUE(raw.cleanup_failed);
    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_EQ(raw.stdout_text, "done");
    EXPECT_TRUE(raw.cleaned);
}

TEST_F(FakeRunnerTest, OutputIsCappedPerStream) {
    FakeScript script;
    script.stdout_text = std::string(1000, 'x');
    script.stderr_text = "short";
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    RawOutcome raw = SandboxRunner(engine_).run(spec);

    EXPECT_EQ(raw.stdout_text.size(), 64u);
    EXPECT_TRUE(raw.stdout_truncated);
    EXPECT_EQ(raw.stderr_text, "short");
    EXPECT_FALSE(raw.stderr_truncated);
}

TEST_F(FakeRunnerTest, CancelledTokenStopsTheSandbox) {
    FakeScript script;
    script.hang = true;
    engine_.set_script(script);

    SandboxSpec spec = make_spec();
    CancelToken token;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });
    RawOutcome raw = SandboxRunner(engine_).run(spec, &token);
    canceller.join();

    EXPECT_TRUE(raw.cancelled);
    EXPECT_FALSE(raw.timed_out);
    EXPECT_EQ(raw.final_state, RunState::CANCELLED);
    EXPECT_EQ(engine_.live(), 0);
}

TEST_F(FakeRunnerTest, CancelBeforeLaunchNeverLaunches) {
    SandboxSpec spec = make_spec();
    CancelToken token;
    token.cancel();

    RawOutcome raw = SandboxRunner(engine_).run(spec, &token);
    EXPECT_TRUE(raw.cancelled);
    EXPECT_EQ(engine_.launches(), 0);
}

TEST_F(FakeRunnerTest, PeerHangUpCancels) {
    FakeScript script;
    script.hang = true;
    engine_.set_script(script);

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);

    SandboxSpec spec = make_spec();
    CancelToken token;
    token.watch_peer(fds[0]);
    std::thread client([&]() {
        std::this_thread::sleep_for(100ms);
        close(fds[1]);
    });
    RawOutcome raw = SandboxRunner(engine_).run(spec, &token);
    client.join();
    close(fds[0]);

    EXPECT_TRUE(raw.cancelled);
    EXPECT_EQ(raw.final_state, RunState::CANCELLED);
}

// ============================================================================
// Runner with the namespace engine (real processes)
// ============================================================================

class ShellRunnerTest : public ::testing::Test {
protected:
    SandboxSpec provision(const std::string& script, uint32_t timeout_seconds = 5,
                          size_t max_output = 200000) {
        SandboxPolicy policy = execbox::testing::shell_policy(dir_.path());
        policy.timeout_seconds = timeout_seconds;
        policy.max_output_bytes = max_output;
        return Provisioner().provision(policy, "shellrequest", script);
    }

    RawOutcome run(const std::string& script, uint32_t timeout_seconds = 5,
                   size_t max_output = 200000) {
        SandboxSpec spec = provision(script, timeout_seconds, max_output);
        return SandboxRunner(engine_).run(spec);
    }

    TempDir dir_;
    NamespaceEngine engine_{"/sys/fs/cgroup/execbox_test"};
};

TEST_F(ShellRunnerTest, EchoSucceeds) {
    RawOutcome raw = run("echo hello\n");
    ASSERT_FALSE(raw.launch_failed) << raw.failure_reason;
    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_EQ(raw.stdout_text, "hello\n");
    EXPECT_EQ(raw.stderr_text, "");
    EXPECT_EQ(raw.final_state, RunState::EXITED_NORMALLY);
    EXPECT_GT(raw.pid, 0);
}

TEST_F(ShellRunnerTest, NonZeroExitAndStderr) {
    RawOutcome raw = run("echo oops >&2\nexit 3\n");
    ASSERT_FALSE(raw.launch_failed) << raw.failure_reason;
    EXPECT_EQ(raw.exit_code, 3);
    EXPECT_EQ(raw.stderr_text, "oops\n");
}

TEST_F(ShellRunnerTest, InfiniteLoopTimesOut) {
    auto started = std::chrono::steady_clock::now();
    RawOutcome raw = run("while :; do :; done\n", 1);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(raw.launch_failed) << raw.failure_reason;
    EXPECT_TRUE(raw.timed_out);
    EXPECT_EQ(raw.final_state, RunState::KILLED_ON_TIMEOUT);
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 5s);

    // Reaped and gone
    EXPECT_EQ(::kill(raw.pid, 0), -1);
}

TEST_F(ShellRunnerTest, OutputFloodIsTruncatedButRunCompletes) {
    RawOutcome raw = run(
        "i=0\nwhile [ $i -lt 5000 ]; do echo 0123456789; i=$((i+1)); done\n", 5, 100);
    ASSERT_FALSE(raw.launch_failed) << raw.failure_reason;
    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_EQ(raw.stdout_text.size(), 100u);
    EXPECT_TRUE(raw.stdout_truncated);
}

TEST_F(ShellRunnerTest, MissingInterpreterIsLaunchFailure) {
    SandboxPolicy policy = execbox::testing::shell_policy(dir_.path());
    policy.interpreter = {"/nonexistent/interpreter"};
    SandboxSpec spec = Provisioner().provision(policy, "badinterp", "x");

    RawOutcome raw = SandboxRunner(engine_).run(spec);
    EXPECT_TRUE(raw.launch_failed);
    EXPECT_EQ(raw.final_state, RunState::LAUNCH_FAILED);
    EXPECT_FALSE(raw.failure_reason.empty());
}

TEST_F(ShellRunnerTest, StdinIsEmpty) {
    RawOutcome raw = run("if read line; then echo got; else echo eof; fi\n");
    ASSERT_FALSE(raw.launch_failed) << raw.failure_reason;
    EXPECT_EQ(raw.stdout_text, "eof\n");
}
