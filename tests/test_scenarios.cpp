#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include "core/dispatcher.hpp"
#include "runtime/namespace_engine.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/runner.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace execbox;
using namespace execbox::core;
using namespace std::chrono_literals;
using execbox::testing::TempDir;

// End to end: dispatcher, provisioner, runner and the namespace engine with
// real interpreters. Isolation-dependent checks skip on hosts that cannot
// grant the needed namespaces.

namespace {

size_t scratch_entries(const std::string& root) {
    if (!fs::exists(root)) return 0;
    return static_cast<size_t>(std::distance(fs::directory_iterator(root), fs::directory_iterator()));
}

} // namespace

class ScenarioTest : public ::testing::Test {
protected:
    runtime::SandboxPolicy shell() const {
        return execbox::testing::shell_policy(scratch_root());
    }

    runtime::SandboxPolicy python() const {
        runtime::SandboxPolicy policy = shell();
        policy.interpreter = {"python3"};
        return policy;
    }

    ExecutionOutcome execute(const runtime::SandboxPolicy& policy, const std::string& code) {
        DispatcherConfig config;
        Dispatcher dispatcher(std::make_shared<const runtime::SandboxPolicy>(policy),
                              engine_, config);
        return dispatcher.execute(code);
    }

    ExecutionOutcome execute_project(const runtime::SandboxPolicy& policy,
                                     const std::vector<runtime::ProjectFile>& files) {
        DispatcherConfig config;
        Dispatcher dispatcher(std::make_shared<const runtime::SandboxPolicy>(policy),
                              engine_, config);
        return dispatcher.execute_project(files);
    }

    // What this host actually grants a sandbox
    runtime::IsolationStatus isolation_of(const runtime::SandboxPolicy& policy) {
        runtime::SandboxSpec spec = runtime::Provisioner().provision(policy, "isol00000000", "exit 0\n");
        return runtime::SandboxRunner(engine_).run(spec).isolation;
    }

    std::string scratch_root() const { return dir_.path() + "/scratch"; }

    TempDir dir_;
    runtime::NamespaceEngine engine_{"/sys/fs/cgroup/execbox_test"};
};

// ============================================================================
// Shell scripts
// ============================================================================

TEST_F(ScenarioTest, ShellSuccess) {
    ExecutionOutcome outcome = execute(shell(), "echo hello world\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(outcome.stdout_text, "hello world\n");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(scratch_entries(scratch_root()), 0u);
}

TEST_F(ScenarioTest, ShellRuntimeError) {
    ExecutionOutcome outcome = execute(shell(), "echo partial\necho failing >&2\nexit 4\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::RUNTIME_ERROR);
    EXPECT_EQ(outcome.stdout_text, "partial\n");
    EXPECT_EQ(outcome.stderr_text, "failing\n");
    EXPECT_EQ(outcome.exit_code, 4);
}

TEST_F(ScenarioTest, ShellTimeout) {
    runtime::SandboxPolicy policy = shell();
    policy.timeout_seconds = 1;

    ExecutionOutcome outcome = execute(policy, "echo started\nwhile :; do :; done\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::TIMEOUT);
    EXPECT_EQ(outcome.stdout_text, "started\n");
    EXPECT_GE(outcome.duration_ms, 1000u);
    EXPECT_LT(outcome.duration_ms, 5000u);
    EXPECT_EQ(scratch_entries(scratch_root()), 0u);
}

TEST_F(ScenarioTest, ConcurrentRequestsDoNotInterfere) {
    DispatcherConfig config;
    config.admission.max_concurrent = 3;
    Dispatcher dispatcher(std::make_shared<const runtime::SandboxPolicy>(shell()), engine_, config);

    std::vector<ExecutionOutcome> outcomes(4);
    std::vector<std::thread> clients;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        clients.emplace_back([&, i]() {
            outcomes[i] = dispatcher.execute("echo request-" + std::to_string(i) + "\n");
        });
    }
    for (auto& t : clients) t.join();

    for (size_t i = 0; i < outcomes.size(); ++i) {
        EXPECT_EQ(outcomes[i].status, ExecutionStatus::SUCCESS);
        EXPECT_EQ(outcomes[i].stdout_text, "request-" + std::to_string(i) + "\n");
    }
    EXPECT_EQ(scratch_entries(scratch_root()), 0u);
}

TEST_F(ScenarioTest, ProjectFilesAreVisibleNextToTheEntryPoint) {
    ExecutionOutcome outcome = execute_project(shell(), {
        {"main.py", ". \"$(dirname \"$0\")/lib/helper.sh\"\necho \"value=$VALUE\"\n"},
        {"lib/helper.sh", "VALUE=42\n"},
    });
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS) << outcome.stderr_text;
    EXPECT_EQ(outcome.stdout_text, "value=42\n");
    EXPECT_EQ(scratch_entries(scratch_root()), 0u);
}

TEST_F(ScenarioTest, HostFilesAreNotReachable) {
    runtime::IsolationStatus isolation = isolation_of(shell());
    if (!isolation.mnt_namespace) {
        GTEST_SKIP() << "mount namespace unavailable on this host";
    }

    std::string secret = dir_.path() + "/secret.txt";
    std::ofstream(secret) << "top secret\n";

    ExecutionOutcome outcome = execute(shell(), "cat " + secret + "\n");
    EXPECT_EQ(outcome.stdout_text.find("top secret"), std::string::npos);
    EXPECT_EQ(outcome.status, ExecutionStatus::RUNTIME_ERROR);
}

TEST_F(ScenarioTest, WritesOutsideTmpFail) {
    runtime::IsolationStatus isolation = isolation_of(shell());
    if (!isolation.readonly_root) {
        GTEST_SKIP() << "read-only root unavailable on this host";
    }

    ExecutionOutcome outcome = execute(shell(),
        "echo data > /evil.txt || echo root-denied\n"
        "echo data > /sandbox/evil.txt || echo code-denied\n"
        "echo data > /usr/evil.txt || echo usr-denied\n"
        "echo data > /tmp/ok.txt && echo tmp-ok\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(outcome.stdout_text, "root-denied\ncode-denied\nusr-denied\ntmp-ok\n");
    EXPECT_FALSE(outcome.stderr_text.empty());
    EXPECT_FALSE(fs::exists("/usr/evil.txt"));
}

// ============================================================================
// Python
// ============================================================================

class PythonScenarioTest : public ScenarioTest {
protected:
    void SetUp() override {
        if (!execbox::testing::python_available()) {
            GTEST_SKIP() << "python3 not installed";
        }
    }
};

TEST_F(PythonScenarioTest, PrintSucceeds) {
    ExecutionOutcome outcome = execute(python(), "print('hello from python')\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(outcome.stdout_text, "hello from python\n");
}

TEST_F(PythonScenarioTest, ProjectImportsSiblingPackages) {
    ExecutionOutcome outcome = execute_project(python(), {
        {"main.py", "from pkg import helper\nprint(helper.double(21))\n"},
        {"pkg/__init__.py", ""},
        {"pkg/helper.py", "def double(x):\n    return 2 * x\n"},
    });
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS) << outcome.stderr_text;
    EXPECT_EQ(outcome.stdout_text, "42\n");
}

TEST_F(PythonScenarioTest, ExceptionIsRuntimeError) {
    ExecutionOutcome outcome = execute(python(), "print('before')\nraise ValueError('bad input')\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::RUNTIME_ERROR);
    EXPECT_EQ(outcome.stdout_text, "before\n");
    EXPECT_NE(outcome.stderr_text.find("ValueError: bad input"), std::string::npos);
    EXPECT_EQ(outcome.exit_code, 1);
}

TEST_F(PythonScenarioTest, InfiniteLoopTimesOut) {
    runtime::SandboxPolicy policy = python();
    policy.timeout_seconds = 1;

    ExecutionOutcome outcome = execute(policy, "while True:\n    pass\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::TIMEOUT);
    EXPECT_LT(outcome.duration_ms, 5000u);
}

TEST_F(PythonScenarioTest, MemoryHogIsMemoryExceeded) {
    runtime::SandboxPolicy policy = python();
    policy.limits.memory_limit_bytes = 128ULL * 1024 * 1024;

    runtime::IsolationStatus isolation = isolation_of(policy);
    if (!isolation.memory_limit_applied && !isolation.memory_rlimit) {
        GTEST_SKIP() << "no memory cap available on this host";
    }

    ExecutionOutcome outcome = execute(policy, "x = 'a' * 1000000000\nprint(len(x))\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::MEMORY_EXCEEDED);
    EXPECT_EQ(outcome.stdout_text.find("1000000000"), std::string::npos);
}

TEST_F(PythonScenarioTest, NetworkIsUnreachable) {
    runtime::IsolationStatus isolation = isolation_of(python());
    if (!isolation.net_namespace) {
        GTEST_SKIP() << "network namespace unavailable on this host";
    }

    ExecutionOutcome outcome = execute(python(),
        "import socket\n"
        "try:\n"
        "    socket.create_connection(('1.1.1.1', 53), timeout=2)\n"
        "    print('connected')\n"
        "except OSError:\n"
        "    print('blocked')\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(outcome.stdout_text, "blocked\n");
}

TEST_F(PythonScenarioTest, OutputFloodIsTruncated) {
    runtime::SandboxPolicy policy = python();
    policy.max_output_bytes = 1000;

    ExecutionOutcome outcome = execute(policy, "for i in range(100000):\n    print('x' * 50)\n");
    EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(outcome.stdout_text.size(), 1000u);
    EXPECT_TRUE(outcome.stdout_truncated);
}
