/**
 * execbox Service Configuration
 *
 * Loaded once at startup: optional JSON file, then EXECBOX_* environment
 * overrides, then validation. Everything downstream receives read-only values.
 */
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "runtime/policy.hpp"
#include "core/dispatcher.hpp"
#include "core/history.hpp"

namespace execbox::service {

struct ServiceConfig {
    std::string socket_path = "/tmp/execbox.sock";
    std::string log_level = "info";
    std::string log_file;                   // Empty = console only
    size_t max_connections = 64;

    runtime::SandboxPolicy policy;
    core::DispatcherConfig dispatcher;
    core::HistoryConfig history;
};

// Throws ConfigError on malformed or mistyped fields; missing fields keep defaults
ServiceConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const ServiceConfig& config);

// Throws ConfigError if the file cannot be read or parsed
ServiceConfig load_config_file(const std::string& path);

// EXECBOX_SOCKET, EXECBOX_LOG_LEVEL, EXECBOX_ENGINE, EXECBOX_TIMEOUT,
// EXECBOX_MEMORY, EXECBOX_MAX_CONCURRENT, EXECBOX_HISTORY_PATH.
// Throws ConfigError on an unparsable value.
void apply_env_overrides(ServiceConfig& config);

// "134217728", "128m", "16K", "1g"; false on garbage or overflow
bool parse_byte_size(const std::string& text, uint64_t& out);

// Empty = usable
std::vector<std::string> validate_config(const ServiceConfig& config);

} // namespace execbox::service
