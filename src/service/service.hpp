/**
 * execbox Service
 *
 * Wires the subsystems together:
 * - IsolationEngine (namespaces or docker)
 * - Dispatcher (admission, sandbox lifecycle, classification)
 * - ExecutionHistory (record sink)
 * - SocketServer (Unix domain socket front end)
 */
#pragma once
#include <string>
#include <memory>
#include <atomic>
#include <nlohmann/json.hpp>
#include "service/config.hpp"
#include "runtime/engine.hpp"
#include "core/dispatcher.hpp"
#include "core/history.hpp"
#include "ipc/socket_server.hpp"
#include "util/errors.hpp"

namespace execbox::service {

constexpr const char* VERSION = "0.1.0";

class Service {
public:
    explicit Service(const ServiceConfig& config);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Build engine, history and dispatcher; false on failure (logged)
    bool init();

    // Listen on the socket and serve until shutdown() or SIGINT/SIGTERM.
    // On return every in-flight sandbox has been killed and cleaned up.
    bool run();

    // Async-signal-safe shutdown request
    void shutdown();

    // One execution without the socket (execboxd --run)
    core::ExecutionOutcome execute_once(const std::string& code);

    // Socket message entry point
    ipc::Message handle_message(const ipc::Message& msg, const ipc::ClientContext& client);

    core::Dispatcher& dispatcher() { return *dispatcher_; }
    core::ExecutionHistory& history() { return *history_; }
    const ServiceConfig& config() const { return config_; }

private:
    ipc::Message handle_ping(const ipc::Message& msg);
    ipc::Message handle_execute(const ipc::Message& msg, const ipc::ClientContext& client);
    ipc::Message handle_execute_project(const ipc::Message& msg, const ipc::ClientContext& client);
    ipc::Message outcome_response(const ipc::Message& msg, const core::ExecutionOutcome& outcome);
    ipc::Message handle_history(const ipc::Message& msg);
    ipc::Message handle_stats(const ipc::Message& msg);

    static ipc::Message make_response(const ipc::Message& request, const nlohmann::json& body);
    static nlohmann::json error_body(ErrorKind kind, const std::string& message);

    ServiceConfig config_;
    std::atomic<bool> shutdown_requested_{false};

    std::unique_ptr<runtime::IsolationEngine> engine_;
    std::unique_ptr<core::ExecutionHistory> history_;
    std::unique_ptr<core::Dispatcher> dispatcher_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
};

} // namespace execbox::service
