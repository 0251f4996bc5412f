#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <vector>

namespace execbox::util {

void init_logger(const std::string& level, const std::string& log_file, bool console_to_stderr) {
    std::vector<spdlog::sink_ptr> sinks;
    if (console_to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("execbox", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!set_log_level(level)) {
        spdlog::warn("Unknown log level '{}', using info", level);
        spdlog::set_level(spdlog::level::info);
    }
}

bool set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace execbox::util
