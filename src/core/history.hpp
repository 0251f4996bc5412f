/**
 * execbox Execution History
 *
 * One immutable record per finished request: id, time, status, duration and
 * truncation flags. Never the submitted code or its output. Kept in a
 * bounded in-memory buffer and optionally appended to a JSONL file.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/outcome.hpp"

namespace execbox::core {

struct ExecutionRecord {
    uint64_t id = 0;                                // Monotonic sequence number
    std::string request_id;
    std::chrono::system_clock::time_point timestamp;
    ExecutionStatus status = ExecutionStatus::INTERNAL_ERROR;
    uint64_t duration_ms = 0;
    std::optional<int> exit_code;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    size_t code_bytes = 0;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;

    // Throws nlohmann::json::exception or std::runtime_error on malformed input
    static ExecutionRecord from_json(const nlohmann::json& j);
};

// Receives one record after every execution
class ExecutionSink {
public:
    virtual ~ExecutionSink() = default;
    virtual void record(const ExecutionRecord& record) = 0;
};

struct HistoryConfig {
    size_t max_entries = 10000;     // In-memory buffer bound
    std::string path;               // JSONL file, empty = memory only
};

class ExecutionHistory : public ExecutionSink {
public:
    explicit ExecutionHistory(const HistoryConfig& config);

    // Assigns the record's id; file write failures are logged, not thrown
    void record(const ExecutionRecord& record) override;

    // Records with id > since_id, oldest first, at most limit (newest kept)
    std::vector<ExecutionRecord> entries(uint64_t since_id = 0, size_t limit = 100) const;

    // Oldest first; limit 0 = everything buffered
    std::string export_jsonl(size_t limit = 0) const;

    size_t count() const;
    uint64_t last_id() const;
    const HistoryConfig& config() const { return config_; }

private:
    void load_existing();
    void trim_entries();

    HistoryConfig config_;
    mutable std::mutex mutex_;
    std::deque<ExecutionRecord> entries_;
    uint64_t next_id_ = 1;
    std::ofstream file_;
};

// ISO 8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);
bool parse_timestamp(const std::string& text, std::chrono::system_clock::time_point& out);

} // namespace execbox::core
