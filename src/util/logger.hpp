#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace execbox::util {

// Install the default "execbox" logger (console, plus a file sink if log_file is set).
// Console output goes to stderr when stdout carries program output.
void init_logger(const std::string& level = "info", const std::string& log_file = "",
                 bool console_to_stderr = false);

// Accepts trace|debug|info|warn|error|off; returns false for unknown names
bool set_log_level(const std::string& level);

} // namespace execbox::util
