#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "service/service.hpp"
#include "service/config.hpp"
#include "util/logger.hpp"
#include "util/errors.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <optional>

// ANSI escape codes
namespace term {
    constexpr const char* RESET  = "\033[0m";
    constexpr const char* BOLD   = "\033[1m";
    constexpr const char* CYAN   = "\033[36m";
    constexpr const char* GREEN  = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* RED    = "\033[31m";
}

struct Options {
    std::string config_path;
    std::optional<std::string> socket_path;
    std::optional<std::string> run_file;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config FILE] [--socket PATH] [--run FILE]\n"
              << "\n"
              << "  --config FILE   JSON configuration (EXECBOX_* variables override it)\n"
              << "  --socket PATH   Unix socket to listen on\n"
              << "  --run FILE      Execute FILE once, print the outcome as JSON and exit\n"
              << "                  (exit status 0 on success, 1 otherwise)\n";
}

// Returns nullopt and prints usage on bad arguments
std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << flag << " needs an argument\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next("--config");
            if (!v) return std::nullopt;
            opts.config_path = *v;
        } else if (arg == "--socket") {
            auto v = next("--socket");
            if (!v) return std::nullopt;
            opts.socket_path = *v;
        } else if (arg == "--run") {
            auto v = next("--run");
            if (!v) return std::nullopt;
            opts.run_file = *v;
        } else {
            if (arg != "--help" && arg != "-h") {
                std::cerr << "Unknown argument: " << arg << "\n";
            }
            return std::nullopt;
        }
    }
    return opts;
}

void print_status_box(const execbox::service::ServiceConfig& config) {
    const auto& policy = config.policy;
    std::cout << term::CYAN << term::BOLD << "\n    execbox " << term::RESET
              << term::GREEN << "v" << execbox::service::VERSION << term::RESET << "\n";
    std::cout << "    Socket      " << term::YELLOW << config.socket_path << term::RESET << "\n";
    std::cout << "    Engine      " << execbox::runtime::engine_kind_to_string(policy.engine) << "\n";
    std::cout << "    Limits      " << fmt::format("{}s, {} MiB, {} pids",
        policy.timeout_seconds, policy.limits.memory_limit_bytes / (1024 * 1024),
        policy.limits.max_pids) << "\n";
    std::cout << "    Concurrency " << config.dispatcher.admission.max_concurrent << " ("
              << execbox::core::admission_mode_to_string(config.dispatcher.admission.mode)
              << ")\n\n";
}

int run_file(execbox::service::Service& service, const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << term::RED << "Cannot open " << path << term::RESET << "\n";
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto outcome = service.execute_once(buffer.str());
        std::cout << outcome.to_json().dump(2) << std::endl;
        return outcome.status == execbox::core::ExecutionStatus::SUCCESS ? 0 : 1;
    } catch (const execbox::Error& e) {
        nlohmann::json err;
        err["error"] = {
            {"kind", execbox::error_kind_to_string(e.kind())},
            {"message", e.what()},
            {"retryable", e.retryable()}
        };
        std::cout << err.dump(2) << std::endl;
        return 1;
    }
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    execbox::service::ServiceConfig config;
    try {
        if (!opts->config_path.empty()) {
            config = execbox::service::load_config_file(opts->config_path);
        }
        execbox::service::apply_env_overrides(config);
    } catch (const execbox::ConfigError& e) {
        std::cerr << term::RED << "Configuration error: " << e.what() << term::RESET << "\n";
        return 2;
    }
    if (opts->socket_path) {
        config.socket_path = *opts->socket_path;
    }

    // In --run mode stdout carries the outcome JSON
    const bool one_shot = opts->run_file.has_value();
    execbox::util::init_logger(config.log_level, config.log_file, one_shot);

    execbox::service::Service service(config);
    if (!service.init()) {
        std::cerr << term::RED << "Failed to initialize execbox" << term::RESET << "\n";
        return 2;
    }

    if (one_shot) {
        return run_file(service, *opts->run_file);
    }

    print_status_box(config);
    if (!service.run()) {
        spdlog::warn("Shutdown finished with executions still running");
        return 1;
    }
    return 0;
}
