#include "service/config.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <limits>

namespace execbox::service {

using json = nlohmann::json;

namespace {

uint64_t byte_size_field(const json& value, const char* name) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        uint64_t bytes = 0;
        if (parse_byte_size(value.get<std::string>(), bytes)) {
            return bytes;
        }
    }
    throw ConfigError(std::string("invalid byte size for ") + name + ": " + value.dump());
}

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> out;
    for (const auto& item : value) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool parse_unsigned(const std::string& text, uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

void policy_from_json(const json& j, runtime::SandboxPolicy& policy) {
    if (j.contains("timeout_seconds")) policy.timeout_seconds = j["timeout_seconds"].get<uint32_t>();
    if (j.contains("memory_limit")) {
        policy.limits.memory_limit_bytes = byte_size_field(j["memory_limit"], "memory_limit");
    }
    if (j.contains("max_pids")) policy.limits.max_pids = j["max_pids"].get<uint64_t>();
    if (j.contains("cpu_shares")) policy.limits.cpu_shares = j["cpu_shares"].get<uint64_t>();
    if (j.contains("tmpfs_size")) {
        policy.limits.tmpfs_size_bytes = byte_size_field(j["tmpfs_size"], "tmpfs_size");
    }
    if (j.contains("network_enabled")) policy.network_enabled = j["network_enabled"].get<bool>();
    if (j.contains("filesystem_writable")) {
        policy.filesystem_writable = j["filesystem_writable"].get<bool>();
    }

    if (j.contains("engine")) {
        std::string name = j["engine"].get<std::string>();
        if (!runtime::engine_kind_from_string(name, policy.engine)) {
            throw ConfigError("unknown engine: " + name);
        }
    }
    if (j.contains("image")) policy.image = j["image"].get<std::string>();
    if (j.contains("interpreter")) {
        if (j["interpreter"].is_string()) {
            policy.interpreter = {j["interpreter"].get<std::string>()};
        } else {
            policy.interpreter = string_list(j["interpreter"]);
        }
    }
    if (j.contains("scratch_root")) policy.scratch_root = j["scratch_root"].get<std::string>();
    if (j.contains("rootfs_binds")) policy.rootfs_binds = string_list(j["rootfs_binds"]);
    if (j.contains("max_output_bytes")) {
        policy.max_output_bytes = static_cast<size_t>(
            byte_size_field(j["max_output_bytes"], "max_output_bytes"));
    }
    if (j.contains("drain_timeout_ms")) policy.drain_timeout_ms = j["drain_timeout_ms"].get<uint32_t>();
    if (j.contains("allow_degraded")) policy.allow_degraded = j["allow_degraded"].get<bool>();
    if (j.contains("memory_error_markers")) {
        policy.memory_error_markers = string_list(j["memory_error_markers"]);
    }
}

void dispatcher_from_json(const json& j, core::DispatcherConfig& config) {
    if (j.contains("max_code_bytes")) {
        config.max_code_bytes = static_cast<size_t>(
            byte_size_field(j["max_code_bytes"], "max_code_bytes"));
    }
    if (j.contains("max_project_bytes")) {
        config.max_project_bytes = static_cast<size_t>(
            byte_size_field(j["max_project_bytes"], "max_project_bytes"));
    }
    if (j.contains("max_project_files")) {
        config.max_project_files = j["max_project_files"].get<size_t>();
    }
    if (j.contains("max_concurrent")) {
        config.admission.max_concurrent = j["max_concurrent"].get<uint32_t>();
    }
    if (j.contains("admission")) {
        std::string mode = j["admission"].get<std::string>();
        if (!core::admission_mode_from_string(mode, config.admission.mode)) {
            throw ConfigError("unknown admission mode: " + mode);
        }
    }
    if (j.contains("max_queue_depth")) {
        config.admission.max_queue_depth = j["max_queue_depth"].get<uint32_t>();
    }
    if (j.contains("queue_timeout_ms")) {
        config.admission.queue_timeout_ms = j["queue_timeout_ms"].get<uint32_t>();
    }
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

ServiceConfig config_from_json(const json& j) {
    ServiceConfig config;
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    try {
        if (j.contains("socket_path")) config.socket_path = j["socket_path"].get<std::string>();
        if (j.contains("log_level")) config.log_level = j["log_level"].get<std::string>();
        if (j.contains("log_file")) config.log_file = j["log_file"].get<std::string>();
        if (j.contains("max_connections")) config.max_connections = j["max_connections"].get<size_t>();

        if (j.contains("policy")) policy_from_json(j["policy"], config.policy);
        if (j.contains("dispatcher")) dispatcher_from_json(j["dispatcher"], config.dispatcher);

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("max_entries")) config.history.max_entries = h["max_entries"].get<size_t>();
            if (h.contains("path")) config.history.path = h["path"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    return config;
}

json config_to_json(const ServiceConfig& config) {
    const auto& policy = config.policy;
    json p;
    p["timeout_seconds"] = policy.timeout_seconds;
    p["memory_limit"] = policy.limits.memory_limit_bytes;
    p["max_pids"] = policy.limits.max_pids;
    p["cpu_shares"] = policy.limits.cpu_shares;
    p["tmpfs_size"] = policy.limits.tmpfs_size_bytes;
    p["network_enabled"] = policy.network_enabled;
    p["filesystem_writable"] = policy.filesystem_writable;
    p["engine"] = runtime::engine_kind_to_string(policy.engine);
    p["image"] = policy.image;
    p["interpreter"] = policy.interpreter;
    p["scratch_root"] = policy.scratch_root;
    p["rootfs_binds"] = policy.rootfs_binds;
    p["max_output_bytes"] = policy.max_output_bytes;
    p["drain_timeout_ms"] = policy.drain_timeout_ms;
    p["allow_degraded"] = policy.allow_degraded;
    p["memory_error_markers"] = policy.memory_error_markers;

    const auto& admission = config.dispatcher.admission;
    json d;
    d["max_code_bytes"] = config.dispatcher.max_code_bytes;
    d["max_project_bytes"] = config.dispatcher.max_project_bytes;
    d["max_project_files"] = config.dispatcher.max_project_files;
    d["max_concurrent"] = admission.max_concurrent;
    d["admission"] = core::admission_mode_to_string(admission.mode);
    d["max_queue_depth"] = admission.max_queue_depth;
    d["queue_timeout_ms"] = admission.queue_timeout_ms;

    json j;
    j["socket_path"] = config.socket_path;
    j["log_level"] = config.log_level;
    j["log_file"] = config.log_file;
    j["max_connections"] = config.max_connections;
    j["policy"] = p;
    j["dispatcher"] = d;
    j["history"] = {
        {"max_entries", config.history.max_entries},
        {"path", config.history.path}
    };
    return j;
}

ServiceConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse config file " + path + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path);
    return config_from_json(j);
}

// ============================================================================
// Environment
// ============================================================================

void apply_env_overrides(ServiceConfig& config) {
    if (const char* v = std::getenv("EXECBOX_SOCKET")) {
        config.socket_path = v;
    }
    if (const char* v = std::getenv("EXECBOX_LOG_LEVEL")) {
        config.log_level = v;
    }
    if (const char* v = std::getenv("EXECBOX_ENGINE")) {
        if (!runtime::engine_kind_from_string(v, config.policy.engine)) {
            throw ConfigError(std::string("EXECBOX_ENGINE: unknown engine '") + v + "'");
        }
    }
    if (const char* v = std::getenv("EXECBOX_TIMEOUT")) {
        uint64_t seconds = 0;
        if (!parse_unsigned(v, seconds) || seconds > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError(std::string("EXECBOX_TIMEOUT: not a number of seconds: ") + v);
        }
        config.policy.timeout_seconds = static_cast<uint32_t>(seconds);
    }
    if (const char* v = std::getenv("EXECBOX_MEMORY")) {
        if (!parse_byte_size(v, config.policy.limits.memory_limit_bytes)) {
            throw ConfigError(std::string("EXECBOX_MEMORY: invalid byte size: ") + v);
        }
    }
    if (const char* v = std::getenv("EXECBOX_MAX_CONCURRENT")) {
        uint64_t n = 0;
        if (!parse_unsigned(v, n) || n > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError(std::string("EXECBOX_MAX_CONCURRENT: not a number: ") + v);
        }
        config.dispatcher.admission.max_concurrent = static_cast<uint32_t>(n);
    }
    if (const char* v = std::getenv("EXECBOX_HISTORY_PATH")) {
        config.history.path = v;
    }
}

bool parse_byte_size(const std::string& text, uint64_t& out) {
    if (text.empty()) {
        return false;
    }

    uint64_t multiplier = 1;
    std::string digits = text;
    switch (std::tolower(static_cast<unsigned char>(text.back()))) {
        case 'b': multiplier = 1; break;
        case 'k': multiplier = 1024ULL; break;
        case 'm': multiplier = 1024ULL * 1024; break;
        case 'g': multiplier = 1024ULL * 1024 * 1024; break;
        default: multiplier = 0; break;
    }
    if (multiplier != 0) {
        digits.pop_back();
    } else {
        multiplier = 1;
    }

    uint64_t value = 0;
    if (!parse_unsigned(digits, value)) {
        return false;
    }
    if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return false;
    }
    out = value * multiplier;
    return true;
}

std::vector<std::string> validate_config(const ServiceConfig& config) {
    std::vector<std::string> problems = config.policy.validate();

    if (config.socket_path.empty()) {
        problems.push_back("socket_path must not be empty");
    }
    if (config.max_connections == 0) {
        problems.push_back("max_connections must be positive");
    }
    if (config.dispatcher.max_code_bytes == 0) {
        problems.push_back("max_code_bytes must be positive");
    }
    if (config.dispatcher.max_project_bytes == 0 || config.dispatcher.max_project_files == 0) {
        problems.push_back("max_project_bytes and max_project_files must be positive");
    }
    if (config.dispatcher.admission.max_concurrent == 0) {
        problems.push_back("max_concurrent must be positive");
    }
    if (config.history.max_entries == 0) {
        problems.push_back("history.max_entries must be positive");
    }

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        problems.push_back("unknown log_level '" + config.log_level + "'");
    }

    return problems;
}

} // namespace execbox::service
