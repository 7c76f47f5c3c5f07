// File: tests/test_run_journal.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dw/core/events/jsonl_event_sink.hpp"
#include "dw/core/events/run_journal.hpp"
#include "test_fakes.hpp"

namespace dw {
namespace {

namespace fs = std::filesystem;

std::vector<nlohmann::json> read_lines(const std::string& path) {
  std::vector<nlohmann::json> out;
  std::ifstream f(path);
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty()) out.push_back(nlohmann::json::parse(line));
  }
  return out;
}

class RunJournalTest : public ::testing::Test {
 protected:
  void SetUp() override { dir = testing::make_temp_dir("journal"); }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
  std::string dir;
};

TEST_F(RunJournalTest, WritesHeaderAndEventsToBothFiles) {
  JsonlEventSink sink;
  RunJournal journal(sink, dir, 10);

  RunInfo run;
  run.config_path = "doorwatch.yaml";
  run.mode = "poll";
  run.device_count = 2;
  ASSERT_TRUE(journal.start(run).ok());
  ASSERT_TRUE(journal.emit("motion_accepted", "42", "e1", "").ok());
  ASSERT_TRUE(journal.emit("shutdown", "stop requested").ok());
  journal.stop();

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0]["type"], "run_started");
  EXPECT_EQ(lines[0]["mode"], "poll");
  EXPECT_EQ(lines[0]["device_count"], 2);
  EXPECT_EQ(lines[0]["t_ns"], 0);

  EXPECT_EQ(lines[1]["type"], "motion_accepted");
  EXPECT_EQ(lines[1]["device_id"], "42");
  EXPECT_EQ(lines[1]["event_id"], "e1");
  EXPECT_FALSE(lines[1].contains("message"));

  EXPECT_EQ(lines[2]["message"], "stop requested");
  EXPECT_FALSE(lines[2].contains("device_id"));
  EXPECT_GE(lines[2]["t_ns"].get<std::int64_t>(), lines[1]["t_ns"].get<std::int64_t>());

  EXPECT_EQ(read_lines(sink.latest_path()).size(), 3u);
}

TEST_F(RunJournalTest, EmitBeforeStartIsDropped) {
  testing::MemoryEventSink sink;
  RunJournal journal(sink, dir, 10);
  EXPECT_TRUE(journal.emit("classified", "ignored").ok());
  EXPECT_TRUE(sink.events().empty());
  EXPECT_FALSE(journal.started());
}

TEST_F(RunJournalTest, StopIsIdempotent) {
  testing::MemoryEventSink sink;
  RunJournal journal(sink, dir, 10);
  ASSERT_TRUE(journal.start(RunInfo{}).ok());
  EXPECT_EQ(sink.run().out_dir, dir);
  journal.stop();
  journal.stop();
  EXPECT_TRUE(journal.emit("late", "").ok());
  EXPECT_TRUE(sink.events().empty());
}

TEST_F(RunJournalTest, PruneKeepsNewestRuns) {
  for (const char* name : {"events_100.jsonl", "events_200.jsonl", "events_300.jsonl",
                           "events_latest.jsonl", "notes.txt"}) {
    std::ofstream(fs::path(dir) / name) << "x\n";
  }
  RunJournal::prune_out_dir(dir, 1);

  EXPECT_FALSE(fs::exists(fs::path(dir) / "events_100.jsonl"));
  EXPECT_FALSE(fs::exists(fs::path(dir) / "events_200.jsonl"));
  EXPECT_TRUE(fs::exists(fs::path(dir) / "events_300.jsonl"));
  EXPECT_TRUE(fs::exists(fs::path(dir) / "events_latest.jsonl"));
  EXPECT_TRUE(fs::exists(fs::path(dir) / "notes.txt"));
}

TEST_F(RunJournalTest, SinkRejectsEmitWhenClosed) {
  JsonlEventSink sink;
  Event e;
  e.type = "x";
  EXPECT_EQ(sink.emit(e).code(), Status::Code::kInvalidArgument);
}

}  // namespace
}  // namespace dw
