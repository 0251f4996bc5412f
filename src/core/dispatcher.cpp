#include "core/dispatcher.hpp"
#include "core/classifier.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <random>

namespace execbox::core {

using json = nlohmann::json;

json DispatcherStats::to_json() const {
    json j;
    j["completed"] = completed;
    json statuses = json::object();
    for (auto status : {ExecutionStatus::SUCCESS, ExecutionStatus::TIMEOUT,
                        ExecutionStatus::MEMORY_EXCEEDED, ExecutionStatus::RUNTIME_ERROR,
                        ExecutionStatus::INTERNAL_ERROR}) {
        statuses[execution_status_to_string(status)] = count(status);
    }
    j["by_status"] = statuses;
    j["validation_rejected"] = validation_rejected;
    j["provision_failed"] = provision_failed;
    j["admission_rejected"] = admission_rejected;
    j["in_flight"] = in_flight;
    j["queued"] = queued;
    j["shutting_down"] = shutting_down;
    return j;
}

// ============================================================================
// Dispatcher Implementation
// ============================================================================

Dispatcher::Dispatcher(runtime::PolicyPtr policy,
                       runtime::IsolationEngine& engine,
                       const DispatcherConfig& config,
                       ExecutionSink* sink)
    : policy_(std::move(policy)),
      engine_(engine),
      config_(config),
      sink_(sink),
      runner_(engine),
      admission_(config.admission) {
    if (!policy_) {
        throw ConfigError("dispatcher needs a sandbox policy");
    }
    auto problems = policy_->validate();
    if (!problems.empty()) {
        throw ConfigError("invalid sandbox policy: " + problems.front());
    }
    if (config_.admission.max_concurrent == 0) {
        throw ConfigError("max_concurrent must be at least 1");
    }

    spdlog::info("Dispatcher ready: engine={}, max_concurrent={}, admission={}, timeout={}s",
                 engine_.name(), config_.admission.max_concurrent,
                 admission_mode_to_string(config_.admission.mode), policy_->timeout_seconds);
}

Dispatcher::~Dispatcher() {
    if (!shutdown()) {
        // Members must outlive every caller still inside execute()
        std::unique_lock<std::mutex> lock(tokens_mutex_);
        tokens_cv_.wait(lock, [this]() { return active_ == 0; });
    }
}

std::string Dispatcher::generate_request_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("{:012x}", rng() & 0xffffffffffffULL);
}

void Dispatcher::validate(const std::string& code) {
    if (code.empty()) {
        ++validation_rejected_;
        throw ValidationError("code must not be empty");
    }
    if (code.size() > config_.max_code_bytes) {
        ++validation_rejected_;
        throw ValidationError(fmt::format("code too long: {} bytes (max {})",
                                          code.size(), config_.max_code_bytes));
    }
}

void Dispatcher::validate_project(const std::vector<runtime::ProjectFile>& files) {
    auto reject = [this](const std::string& message) {
        ++validation_rejected_;
        throw ValidationError(message);
    };

    if (files.empty()) {
        reject("project has no files");
    }
    if (files.size() > config_.max_project_files) {
        reject(fmt::format("too many files: {} (max {})", files.size(), config_.max_project_files));
    }

    std::unordered_set<std::string> paths;
    size_t total = 0;
    for (const auto& file : files) {
        if (!runtime::is_safe_project_path(file.path)) {
            reject("invalid file path: '" + file.path + "'");
        }
        if (!paths.insert(file.path).second) {
            reject("duplicate file path: " + file.path);
        }
        total += file.content.size();
    }
    if (total > config_.max_project_bytes) {
        reject(fmt::format("project too large: {} bytes (max {})", total, config_.max_project_bytes));
    }
    if (!paths.count(runtime::Provisioner::SCRIPT_NAME)) {
        reject(std::string("project must contain ") + runtime::Provisioner::SCRIPT_NAME);
    }

    // "a" and "a/b" cannot both be files
    for (const auto& path : paths) {
        for (size_t slash = path.find('/'); slash != std::string::npos;
             slash = path.find('/', slash + 1)) {
            if (paths.count(path.substr(0, slash))) {
                reject("file path is also a directory: " + path.substr(0, slash));
            }
        }
    }
}

void Dispatcher::enter() {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    if (shutting_down_.load()) {
        throw ShuttingDownError("dispatcher is shutting down");
    }
    ++active_;
}

void Dispatcher::leave() {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    --active_;
    tokens_cv_.notify_all();
}

void Dispatcher::register_token(runtime::CancelToken* token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_.insert(token);
    // shutdown() may have swept the set just before we got here
    if (shutting_down_.load()) {
        token->cancel();
    }
}

void Dispatcher::unregister_token(runtime::CancelToken* token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_.erase(token);
}

ExecutionOutcome Dispatcher::execute(const std::string& code) {
    runtime::CancelToken cancel;
    return execute(code, cancel);
}

ExecutionOutcome Dispatcher::execute(const std::string& code, runtime::CancelToken& cancel) {
    // Nothing is provisioned for input we would reject anyway
    validate(code);

    return run_request(code.size(), cancel, [&](const std::string& request_id) {
        return provisioner_.provision(*policy_, request_id, code);
    });
}

ExecutionOutcome Dispatcher::execute_project(const std::vector<runtime::ProjectFile>& files) {
    runtime::CancelToken cancel;
    return execute_project(files, cancel);
}

ExecutionOutcome Dispatcher::execute_project(const std::vector<runtime::ProjectFile>& files,
                                             runtime::CancelToken& cancel) {
    validate_project(files);

    size_t total = 0;
    for (const auto& file : files) {
        total += file.content.size();
    }
    return run_request(total, cancel, [&](const std::string& request_id) {
        return provisioner_.provision_project(*policy_, request_id, files);
    });
}

ExecutionOutcome Dispatcher::run_request(size_t code_bytes, runtime::CancelToken& cancel,
                                         const ProvisionFn& provision) {
    enter();
    // Declared first so it runs last, after the slot has been handed back
    struct Activity {
        Dispatcher* self;
        ~Activity() { self->leave(); }
    } activity{this};

    AdmissionController::Slot slot = admission_.acquire();

    const std::string request_id = generate_request_id();
    register_token(&cancel);

    struct Registration {
        Dispatcher* self;
        runtime::CancelToken* token;
        ~Registration() { self->unregister_token(token); }
    } registration{this, &cancel};

    spdlog::debug("Request {} admitted ({} bytes of code)", request_id, code_bytes);

    runtime::SandboxSpec spec;
    try {
        spec = provision(request_id);
    } catch (const ProvisionError& e) {
        ++provision_failed_;
        spdlog::error("Request {}: provisioning failed: {}", request_id, e.what());
        throw;
    }

    runtime::RawOutcome raw = runner_.run(spec, &cancel);
    ExecutionOutcome outcome = classify(raw, request_id, policy_->memory_error_markers);

    // Scratch artifact goes before we hand anything back; a failure is only logged
    spec.scratch.remove();

    ++status_counts_[static_cast<size_t>(outcome.status)];
    publish(outcome, code_bytes);

    spdlog::info("Request {} finished: {} in {}ms{}", request_id,
                 execution_status_to_string(outcome.status), outcome.duration_ms,
                 raw.isolation.is_degraded() ? " (degraded isolation)" : "");
    return outcome;
}

void Dispatcher::publish(const ExecutionOutcome& outcome, size_t code_bytes) {
    if (!sink_) {
        return;
    }

    ExecutionRecord record;
    record.request_id = outcome.request_id;
    record.timestamp = std::chrono::system_clock::now();
    record.status = outcome.status;
    record.duration_ms = outcome.duration_ms;
    record.exit_code = outcome.exit_code;
    record.stdout_truncated = outcome.stdout_truncated;
    record.stderr_truncated = outcome.stderr_truncated;
    record.code_bytes = code_bytes;

    // The outcome is final; a broken sink must not change it
    try {
        sink_->record(record);
    } catch (const std::exception& e) {
        spdlog::warn("Request {}: execution sink failed: {}", outcome.request_id, e.what());
    }
}

bool Dispatcher::shutdown(std::chrono::milliseconds wait) {
    if (!shutting_down_.exchange(true)) {
        spdlog::info("Dispatcher shutting down");
    }
    // Wakes queued requests; they leave with ShuttingDownError
    admission_.close();

    std::unique_lock<std::mutex> lock(tokens_mutex_);
    if (!tokens_.empty()) {
        spdlog::info("Cancelling {} in-flight execution(s)", tokens_.size());
    }
    for (auto* token : tokens_) {
        token->cancel();
    }

    bool drained = tokens_cv_.wait_for(lock, wait, [this]() { return active_ == 0; });
    if (!drained) {
        spdlog::warn("Dispatcher shutdown: {} request(s) still active after {}ms",
                     active_, wait.count());
    }
    return drained;
}

DispatcherStats Dispatcher::stats() const {
    DispatcherStats s;
    for (size_t i = 0; i < s.by_status.size(); ++i) {
        s.by_status[i] = status_counts_[i].load();
        s.completed += s.by_status[i];
    }
    s.validation_rejected = validation_rejected_.load();
    s.provision_failed = provision_failed_.load();
    s.admission_rejected = admission_.rejected();
    s.in_flight = admission_.in_flight();
    s.queued = admission_.queued();
    s.shutting_down = shutting_down_.load();
    return s;
}

} // namespace execbox::core
