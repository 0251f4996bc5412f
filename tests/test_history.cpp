#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "core/history.hpp"
#include "test_support.hpp"

using namespace execbox::core;
using execbox::testing::TempDir;

namespace {

ExecutionRecord make_record(const std::string& request_id,
                            ExecutionStatus status = ExecutionStatus::SUCCESS) {
    ExecutionRecord record;
    record.request_id = request_id;
    record.timestamp = std::chrono::system_clock::now();
    record.status = status;
    record.duration_ms = 42;
    record.exit_code = status == ExecutionStatus::SUCCESS ? std::optional<int>(0) : std::nullopt;
    record.code_bytes = 17;
    return record;
}

size_t count_lines(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

} // namespace

TEST(TimestampTest, FormatsIso8601WithMilliseconds) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(1234);
    EXPECT_EQ(format_timestamp(tp), "1970-01-01T00:00:01.234Z");

    std::chrono::system_clock::time_point parsed;
    ASSERT_TRUE(parse_timestamp("1970-01-01T00:00:01.234Z", parsed));
    EXPECT_EQ(parsed, tp);
    EXPECT_FALSE(parse_timestamp("yesterday", parsed));
}

TEST(ExecutionRecordTest, JsonNeverContainsCodeOrOutput) {
    auto j = make_record("abc").to_json();
    EXPECT_EQ(j["request_id"], "abc");
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["code_bytes"], 17);
    EXPECT_FALSE(j.contains("code"));
    EXPECT_FALSE(j.contains("stdout"));
    EXPECT_FALSE(j.contains("stderr"));
}

TEST(ExecutionRecordTest, FromJsonRejectsUnknownStatus) {
    auto j = make_record("abc").to_json();
    j["status"] = "exploded";
    EXPECT_ANY_THROW(ExecutionRecord::from_json(j));
}

TEST(ExecutionHistoryTest, AssignsIdsAndFiltersBySince) {
    ExecutionHistory history(HistoryConfig{});
    history.record(make_record("a"));
    history.record(make_record("b", ExecutionStatus::TIMEOUT));
    history.record(make_record("c"));

    EXPECT_EQ(history.count(), 3u);
    EXPECT_EQ(history.last_id(), 3u);

    auto all = history.entries();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 1u);
    EXPECT_EQ(all[0].request_id, "a");
    EXPECT_EQ(all[2].request_id, "c");

    auto newer = history.entries(1);
    ASSERT_EQ(newer.size(), 2u);
    EXPECT_EQ(newer[0].request_id, "b");
    EXPECT_EQ(newer[0].status, ExecutionStatus::TIMEOUT);

    // Limit keeps the newest, still oldest first
    auto last_two = history.entries(0, 2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0].request_id, "b");
    EXPECT_EQ(last_two[1].request_id, "c");
}

TEST(ExecutionHistoryTest, InMemoryBufferIsBounded) {
    HistoryConfig config;
    config.max_entries = 3;
    ExecutionHistory history(config);
    for (int i = 0; i < 10; ++i) {
        history.record(make_record("r" + std::to_string(i)));
    }
    EXPECT_EQ(history.count(), 3u);
    EXPECT_EQ(history.entries().front().request_id, "r7");
    EXPECT_EQ(history.last_id(), 10u);
}

TEST(ExecutionHistoryTest, AppendsJsonlAndRestoresOnRestart) {
    TempDir dir;
    HistoryConfig config;
    config.path = dir.path() + "/history.jsonl";

    {
        ExecutionHistory history(config);
        history.record(make_record("first"));
        history.record(make_record("second", ExecutionStatus::RUNTIME_ERROR));
    }
    EXPECT_EQ(count_lines(config.path), 2u);

    ExecutionHistory restored(config);
    EXPECT_EQ(restored.count(), 2u);
    auto entries = restored.entries();
    EXPECT_EQ(entries[1].request_id, "second");
    EXPECT_EQ(entries[1].status, ExecutionStatus::RUNTIME_ERROR);
    EXPECT_FALSE(entries[1].exit_code.has_value());

    // Ids continue after the restored ones
    restored.record(make_record("third"));
    EXPECT_EQ(restored.last_id(), 3u);
    EXPECT_EQ(count_lines(config.path), 3u);
}

TEST(ExecutionHistoryTest, MalformedLinesAreSkipped) {
    TempDir dir;
    HistoryConfig config;
    config.path = dir.path() + "/history.jsonl";
    {
        std::ofstream out(config.path);
        out << make_record("good").to_jsonl();
        out << "{not json\n";
        out << "\n";
    }

    ExecutionHistory history(config);
    EXPECT_EQ(history.count(), 1u);
    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].request_id, "good");
    EXPECT_EQ(entries[0].id, 1u);
}

TEST(ExecutionHistoryTest, RestoredRecordsWithoutIdsAreRenumbered) {
    TempDir dir;
    HistoryConfig config;
    config.path = dir.path() + "/history.jsonl";
    {
        ExecutionRecord later = make_record("later");
        later.id = 7;
        ExecutionRecord stale = make_record("stale");
        stale.id = 3;

        std::ofstream out(config.path);
        out << make_record("no-id").to_jsonl();
        out << later.to_jsonl();
        out << stale.to_jsonl();
    }

    ExecutionHistory history(config);
    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].id, 1u);
    EXPECT_EQ(entries[1].id, 7u);
    EXPECT_EQ(entries[2].id, 8u);
    EXPECT_EQ(entries[2].request_id, "stale");

    auto newer = history.entries(7);
    ASSERT_EQ(newer.size(), 1u);
    EXPECT_EQ(newer[0].request_id, "stale");

    history.record(make_record("next"));
    EXPECT_EQ(history.last_id(), 9u);
}

TEST(ExecutionHistoryTest, ExportIsOneLinePerRecord) {
    ExecutionHistory history(HistoryConfig{});
    history.record(make_record("a"));
    history.record(make_record("b"));

    std::istringstream in(history.export_jsonl());
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        auto record = ExecutionRecord::from_json(nlohmann::json::parse(line));
        EXPECT_FALSE(record.request_id.empty());
        ++lines;
    }
    EXPECT_EQ(lines, 2);

    std::istringstream limited(history.export_jsonl(1));
    lines = 0;
    while (std::getline(limited, line)) ++lines;
    EXPECT_EQ(lines, 1);
}
