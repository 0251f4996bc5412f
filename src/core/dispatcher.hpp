/**
 * execbox Dispatcher
 *
 * Public entry point: validate -> admit -> provision -> run -> classify ->
 * record. Every sandbox and scratch artifact of a request is gone before
 * execute() returns, whatever the outcome.
 */
#pragma once
#include <string>
#include <vector>
#include <functional>
#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "core/outcome.hpp"
#include "core/admission.hpp"
#include "core/history.hpp"
#include "runtime/policy.hpp"
#include "runtime/engine.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/runner.hpp"
#include "runtime/cancel_token.hpp"

namespace execbox::core {

struct DispatcherConfig {
    size_t max_code_bytes = 5000;
    size_t max_project_bytes = 512 * 1024;  // Sum over all files of a project
    size_t max_project_files = 64;
    AdmissionConfig admission;
};

struct DispatcherStats {
    uint64_t completed = 0;
    std::array<uint64_t, 5> by_status{};    // Indexed by ExecutionStatus
    uint64_t validation_rejected = 0;
    uint64_t provision_failed = 0;
    uint64_t admission_rejected = 0;
    uint32_t in_flight = 0;
    uint32_t queued = 0;
    bool shutting_down = false;

    uint64_t count(ExecutionStatus status) const {
        return by_status[static_cast<size_t>(status)];
    }

    nlohmann::json to_json() const;
};

class Dispatcher {
public:
    // sink may be null; engine must outlive the dispatcher
    Dispatcher(runtime::PolicyPtr policy,
               runtime::IsolationEngine& engine,
               const DispatcherConfig& config,
               ExecutionSink* sink = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Throws ValidationError, OverloadedError, ShuttingDownError, ProvisionError
    ExecutionOutcome execute(const std::string& code);
    // cancel may be fired from any thread (caller disconnected)
    ExecutionOutcome execute(const std::string& code, runtime::CancelToken& cancel);

    // Multi-file run: files are laid out under the read-only /sandbox and
    // main.py is the entry point. Same errors as execute().
    ExecutionOutcome execute_project(const std::vector<runtime::ProjectFile>& files);
    ExecutionOutcome execute_project(const std::vector<runtime::ProjectFile>& files,
                                     runtime::CancelToken& cancel);

    // Refuse new work, cancel everything in flight, fail everything queued and
    // wait until no call is left inside execute(). Returns false if some were
    // still running at the deadline.
    bool shutdown(std::chrono::milliseconds wait = std::chrono::milliseconds(30000));
    bool shutting_down() const { return shutting_down_.load(); }

    DispatcherStats stats() const;
    const runtime::SandboxPolicy& policy() const { return *policy_; }
    const DispatcherConfig& config() const { return config_; }

    // 12 hex digits
    static std::string generate_request_id();

private:
    using ProvisionFn = std::function<runtime::SandboxSpec(const std::string& request_id)>;

    void validate(const std::string& code);
    void validate_project(const std::vector<runtime::ProjectFile>& files);
    // Everything after validation: admit, provision, run, classify, record
    ExecutionOutcome run_request(size_t code_bytes, runtime::CancelToken& cancel,
                                 const ProvisionFn& provision);
    void enter();
    void leave();
    void register_token(runtime::CancelToken* token);
    void unregister_token(runtime::CancelToken* token);
    void publish(const ExecutionOutcome& outcome, size_t code_bytes);

    runtime::PolicyPtr policy_;
    runtime::IsolationEngine& engine_;
    DispatcherConfig config_;
    ExecutionSink* sink_;

    runtime::Provisioner provisioner_;
    runtime::SandboxRunner runner_;
    AdmissionController admission_;

    std::mutex tokens_mutex_;
    std::condition_variable tokens_cv_;
    std::unordered_set<runtime::CancelToken*> tokens_;   // One per admitted request
    uint32_t active_ = 0;   // Calls between enter() and leave(), queued ones included

    std::atomic<bool> shutting_down_{false};
    std::array<std::atomic<uint64_t>, 5> status_counts_{};
    std::atomic<uint64_t> validation_rejected_{0};
    std::atomic<uint64_t> provision_failed_{0};
};

} // namespace execbox::core
