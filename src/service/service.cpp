#include "service/service.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <algorithm>

using json = nlohmann::json;

namespace execbox::service {

// Global service pointer for signal handling
static Service* g_service = nullptr;

static void signal_handler(int /*signum*/) {
    if (g_service) {
        g_service->shutdown();
    }
}

Service::Service(const ServiceConfig& config)
    : config_(config) {}

Service::~Service() {
    if (g_service == this) {
        g_service = nullptr;
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
    }
    if (socket_server_) {
        socket_server_->stop();
    }
    if (dispatcher_) {
        dispatcher_->shutdown();
    }
}

bool Service::init() {
    spdlog::info("Initializing execbox v{}...", VERSION);

    auto problems = validate_config(config_);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::error("Config: {}", problem);
        }
        return false;
    }

    engine_ = runtime::make_engine(config_.policy);
    if (!engine_->available()) {
        spdlog::error("Isolation engine '{}' is not available on this host", engine_->name());
        return false;
    }

    history_ = std::make_unique<core::ExecutionHistory>(config_.history);

    try {
        auto policy = std::make_shared<const runtime::SandboxPolicy>(config_.policy);
        dispatcher_ = std::make_unique<core::Dispatcher>(
            policy, *engine_, config_.dispatcher, history_.get());
    } catch (const ConfigError& e) {
        spdlog::error("Failed to create dispatcher: {}", e.what());
        return false;
    }

    spdlog::info("Service initialized successfully");
    spdlog::info("Engine: {}", engine_->name());
    spdlog::info("Limits: timeout={}s memory={}B pids={} output_cap={}B code_cap={}B",
        config_.policy.timeout_seconds,
        config_.policy.limits.memory_limit_bytes,
        config_.policy.limits.max_pids,
        config_.policy.max_output_bytes,
        config_.dispatcher.max_code_bytes);
    if (config_.policy.allow_degraded) {
        spdlog::warn("allow_degraded is set: sandboxes may run with partial isolation");
    }
    return true;
}

bool Service::run() {
    if (!dispatcher_) {
        spdlog::error("Service not initialized");
        return false;
    }

    socket_server_ = std::make_unique<ipc::SocketServer>(config_.socket_path,
                                                          config_.max_connections);
    socket_server_->set_handler([this](const ipc::Message& msg, const ipc::ClientContext& client) {
        return handle_message(msg, client);
    });
    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    // Set up signal handlers
    g_service = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("execbox v{} running", VERSION);
    spdlog::info("Listening on: {}", config_.socket_path);

    if (!shutdown_requested_) {
        socket_server_->run();
    }

    spdlog::info("Shutting down...");
    // Dispatcher first: cancels running sandboxes so connection threads can finish
    bool drained = dispatcher_->shutdown();
    socket_server_->stop();

    auto stats = dispatcher_->stats();
    spdlog::info("Served {} execution(s); {} rejected by admission",
                 stats.completed, stats.admission_rejected);
    return drained;
}

void Service::shutdown() {
    shutdown_requested_ = true;
    if (socket_server_) {
        socket_server_->request_stop();
    }
}

core::ExecutionOutcome Service::execute_once(const std::string& code) {
    if (!dispatcher_) {
        throw ConfigError("service not initialized");
    }
    return dispatcher_->execute(code);
}

// ============================================================================
// Message handling
// ============================================================================

ipc::Message Service::make_response(const ipc::Message& request, const json& body) {
    return ipc::Message(request.request_tag, request.opcode, body.dump());
}

json Service::error_body(ErrorKind kind, const std::string& message) {
    json body;
    body["ok"] = false;
    body["status"] = core::transport_status(kind);
    body["error"] = {
        {"kind", error_kind_to_string(kind)},
        {"message", message},
        {"retryable", error_kind_retryable(kind)}
    };
    return body;
}

ipc::Message Service::handle_message(const ipc::Message& msg, const ipc::ClientContext& client) {
    try {
        switch (msg.opcode) {
            case ipc::Opcode::PING:    return handle_ping(msg);
            case ipc::Opcode::EXECUTE: return handle_execute(msg, client);
            case ipc::Opcode::HISTORY: return handle_history(msg);
            case ipc::Opcode::STATS:   return handle_stats(msg);
            case ipc::Opcode::EXECUTE_PROJECT: return handle_execute_project(msg, client);
            default:
                spdlog::warn("Client {}: unknown opcode 0x{:02x}", client.client_id,
                             static_cast<int>(msg.opcode));
                return make_response(msg, error_body(ErrorKind::VALIDATION, "unknown opcode"));
        }
    } catch (const Error& e) {
        return make_response(msg, error_body(e.kind(), e.what()));
    } catch (const json::exception& e) {
        return make_response(msg, error_body(ErrorKind::VALIDATION,
                                             std::string("invalid request: ") + e.what()));
    } catch (const std::exception& e) {
        spdlog::error("Client {}: {} failed: {}", client.client_id,
                      ipc::opcode_to_string(msg.opcode), e.what());
        json body;
        body["ok"] = false;
        body["status"] = 500;
        body["error"] = {{"kind", "INTERNAL"}, {"message", e.what()}, {"retryable", false}};
        return make_response(msg, body);
    }
}

ipc::Message Service::handle_ping(const ipc::Message& msg) {
    json body;
    body["ok"] = true;
    body["status"] = 200;
    body["version"] = VERSION;
    body["engine"] = engine_->name();
    return make_response(msg, body);
}

ipc::Message Service::handle_execute(const ipc::Message& msg, const ipc::ClientContext& client) {
    json request = json::parse(msg.payload_str());
    if (!request.is_object() || !request.contains("code") || !request["code"].is_string()) {
        throw ValidationError("request must be an object with a string 'code' field");
    }

    // Client hang-up while the code runs cancels the sandbox
    runtime::CancelToken cancel;
    cancel.watch_peer(client.fd);

    core::ExecutionOutcome outcome = dispatcher_->execute(request["code"].get<std::string>(), cancel);
    return outcome_response(msg, outcome);
}

ipc::Message Service::handle_execute_project(const ipc::Message& msg,
                                             const ipc::ClientContext& client) {
    json request = json::parse(msg.payload_str());
    if (!request.is_object() || !request.contains("files") || !request["files"].is_array()) {
        throw ValidationError("request must be an object with a 'files' array");
    }

    std::vector<runtime::ProjectFile> files;
    for (const auto& entry : request["files"]) {
        if (!entry.is_object() || !entry.contains("path") || !entry["path"].is_string() ||
            !entry.contains("content") || !entry["content"].is_string()) {
            throw ValidationError("each file needs string 'path' and 'content' fields");
        }
        files.push_back({entry["path"].get<std::string>(), entry["content"].get<std::string>()});
    }

    runtime::CancelToken cancel;
    cancel.watch_peer(client.fd);

    core::ExecutionOutcome outcome = dispatcher_->execute_project(files, cancel);
    return outcome_response(msg, outcome);
}

ipc::Message Service::outcome_response(const ipc::Message& msg,
                                       const core::ExecutionOutcome& outcome) {
    int status = core::transport_status(outcome.status);
    json body;
    body["ok"] = status == 200;
    body["status"] = status;
    body["outcome"] = outcome.to_json();
    return make_response(msg, body);
}

ipc::Message Service::handle_history(const ipc::Message& msg) {
    json request = msg.payload.empty() ? json::object() : json::parse(msg.payload_str());

    size_t limit = request.value("limit", size_t{100});
    uint64_t since_id = request.value("since_id", uint64_t{0});
    limit = std::min<size_t>(limit, 1000);

    json records = json::array();
    for (const auto& record : history_->entries(since_id, limit)) {
        records.push_back(record.to_json());
    }

    json body;
    body["ok"] = true;
    body["status"] = 200;
    body["records"] = records;
    body["last_id"] = history_->last_id();
    return make_response(msg, body);
}

ipc::Message Service::handle_stats(const ipc::Message& msg) {
    json body;
    body["ok"] = true;
    body["status"] = 200;
    body["engine"] = engine_->name();
    body["dispatcher"] = dispatcher_->stats().to_json();
    body["history_count"] = history_->count();
    body["clients"] = socket_server_ ? socket_server_->client_count() : 0;
    return make_response(msg, body);
}

} // namespace execbox::service
