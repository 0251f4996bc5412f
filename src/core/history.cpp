#include "core/history.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace execbox::core {

using json = nlohmann::json;

// ============================================================================
// Timestamps
// ============================================================================

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

bool parse_timestamp(const std::string& text, std::chrono::system_clock::time_point& out) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        iss >> millis;
    }

    time_t seconds = timegm(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
    return true;
}

// ============================================================================
// ExecutionRecord Implementation
// ============================================================================

json ExecutionRecord::to_json() const {
    json j;
    j["id"] = id;
    j["request_id"] = request_id;
    j["timestamp"] = format_timestamp(timestamp);
    j["status"] = execution_status_to_string(status);
    j["duration_ms"] = duration_ms;
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["stdout_truncated"] = stdout_truncated;
    j["stderr_truncated"] = stderr_truncated;
    j["code_bytes"] = code_bytes;
    return j;
}

std::string ExecutionRecord::to_jsonl() const {
    return to_json().dump() + "\n";
}

ExecutionRecord ExecutionRecord::from_json(const json& j) {
    ExecutionRecord record;
    record.id = j.at("id").get<uint64_t>();
    record.request_id = j.at("request_id").get<std::string>();

    if (!parse_timestamp(j.at("timestamp").get<std::string>(), record.timestamp)) {
        throw std::runtime_error("invalid timestamp: " + j.at("timestamp").dump());
    }
    if (!execution_status_from_string(j.at("status").get<std::string>(), record.status)) {
        throw std::runtime_error("unknown status: " + j.at("status").dump());
    }

    record.duration_ms = j.value("duration_ms", uint64_t{0});
    if (j.contains("exit_code") && !j["exit_code"].is_null()) {
        record.exit_code = j["exit_code"].get<int>();
    }
    record.stdout_truncated = j.value("stdout_truncated", false);
    record.stderr_truncated = j.value("stderr_truncated", false);
    record.code_bytes = j.value("code_bytes", size_t{0});
    return record;
}

// ============================================================================
// ExecutionHistory Implementation
// ============================================================================

ExecutionHistory::ExecutionHistory(const HistoryConfig& config)
    : config_(config) {
    if (config_.path.empty()) {
        spdlog::debug("ExecutionHistory initialized in memory (max_entries={})", config_.max_entries);
        return;
    }

    load_existing();
    file_.open(config_.path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        spdlog::warn("Cannot open history file {} - history kept in memory only", config_.path);
        return;
    }
    spdlog::info("Execution history: {} ({} records restored)", config_.path, entries_.size());
}

void ExecutionHistory::load_existing() {
    std::ifstream in(config_.path);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        try {
            ExecutionRecord record = ExecutionRecord::from_json(json::parse(line));
            // Ids must stay increasing for since_id scans; renumber anything
            // missing or out of order
            if (record.id < next_id_) {
                record.id = next_id_;
            }
            next_id_ = record.id + 1;
            entries_.push_back(std::move(record));
            trim_entries();
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed history line {}:{}: {}", config_.path, line_no, e.what());
        }
    }
}

void ExecutionHistory::record(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    ExecutionRecord entry = record;
    entry.id = next_id_++;

    if (file_.is_open()) {
        file_ << entry.to_jsonl();
        file_.flush();
        if (!file_.good()) {
            spdlog::warn("Failed to append to history file {}", config_.path);
            file_.clear();
        }
    }

    spdlog::trace("History[{}]: {} {} {}ms", entry.id, entry.request_id,
                  execution_status_to_string(entry.status), entry.duration_ms);

    entries_.push_back(std::move(entry));
    trim_entries();
}

std::vector<ExecutionRecord> ExecutionHistory::entries(uint64_t since_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionRecord> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->id <= since_id) {
            break;
        }
        result.push_back(*it);
    }

    // Reverse to get chronological order
    std::reverse(result.begin(), result.end());
    return result;
}

std::string ExecutionHistory::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }

    return oss.str();
}

size_t ExecutionHistory::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t ExecutionHistory::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void ExecutionHistory::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace execbox::core
