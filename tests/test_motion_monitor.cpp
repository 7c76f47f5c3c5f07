// File: tests/test_motion_monitor.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

#include "dw/core/events/run_journal.hpp"
#include "dw/core/pipeline/motion_monitor.hpp"
#include "test_fakes.hpp"

namespace dw {
namespace {

namespace fs = std::filesystem;
using namespace dw::testing;

MotionSignal motion(const DeviceId& dev, const EventId& id) { return MotionSignal{dev, id, TimestampNs{1}}; }

class MotionMonitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    CaptureConfig capture;
    capture.frame_timeout_ns = seconds_to_ns(1.0);
    capture.skip_frames = 0;
    capture.ice_poll_ms = 5;
    factory.script.pictures_on_answer = 1;

    MotionConfig motion_cfg;
    motion_cfg.cooldown_ns = 0;

    journal_dir = make_temp_dir("monitor_journal");
    local_dir = make_temp_dir("monitor_local");

    sessions = std::make_unique<MediaSessionManager>(factory, capture, 0.0);
    tracker = std::make_unique<MotionEventTracker>(motion_cfg);
    store = std::make_unique<LocalImageStore>(local_dir);
    journal = std::make_unique<RunJournal>(sink, journal_dir, 5);
    ASSERT_TRUE(journal->start(RunInfo{}).ok());

    PipelineDeps deps{*tracker, *sessions, classifier, *store};
    deps.journal = journal.get();
    pipeline = std::make_unique<DetectionPipeline>(deps, AlertOptions{});
    pool = std::make_unique<WorkerPool>("monitor", 2, 16);

    registry.devices = {Device{"1", "Front", true}, Device{"2", "Back", false}};
  }

  void TearDown() override {
    pool->stop();
    journal->stop();
    std::error_code ec;
    fs::remove_all(journal_dir, ec);
    fs::remove_all(local_dir, ec);
  }

  std::unique_ptr<MotionMonitor> make_monitor(MonitorConfig cfg = {}) {
    return std::make_unique<MotionMonitor>(registry, *pipeline, *pool, cfg, 15, journal.get());
  }

  FakeRegistry registry;
  FakePeerFactory factory;
  FakeClassifier classifier;
  MemoryEventSink sink;

  std::string journal_dir;
  std::string local_dir;
  std::unique_ptr<MediaSessionManager> sessions;
  std::unique_ptr<MotionEventTracker> tracker;
  std::unique_ptr<LocalImageStore> store;
  std::unique_ptr<RunJournal> journal;
  std::unique_ptr<DetectionPipeline> pipeline;
  std::unique_ptr<WorkerPool> pool;
};

TEST_F(MotionMonitorTest, ScanDispatchesNewMotionAndSkipsReplays) {
  registry.history["1"] = {motion("1", "a"), motion("1", "b")};
  registry.history["2"] = {motion("2", "c")};
  auto monitor = make_monitor();

  const ScanStats first = monitor->scan_once();
  pool->wait_idle();
  EXPECT_EQ(first.devices, 2u);
  EXPECT_EQ(first.signals, 3u);
  EXPECT_EQ(first.dispatched, 3u);
  EXPECT_EQ(first.device_errors, 0u);
  EXPECT_EQ(classifier.calls.load(), 3);

  // The next poll sees the same history; every id is a duplicate.
  const ScanStats second = monitor->scan_once();
  pool->wait_idle();
  EXPECT_EQ(second.signals, 3u);
  EXPECT_EQ(second.dispatched, 0u);
  EXPECT_EQ(classifier.calls.load(), 3);
}

TEST_F(MotionMonitorTest, PerDeviceErrorsDoNotStopTheScan) {
  registry.devices.push_back(Device{"3", "Side", true});
  registry.history_errors["1"] = Status::unavailable("HTTP 503");
  registry.throwing_device = "2";
  registry.history["3"] = {motion("3", "z")};
  auto monitor = make_monitor();

  const ScanStats stats = monitor->scan_once();
  pool->wait_idle();
  EXPECT_EQ(stats.devices, 3u);
  EXPECT_EQ(stats.device_errors, 2u);
  EXPECT_EQ(stats.dispatched, 1u);
  EXPECT_EQ(classifier.calls.load(), 1);
}

TEST_F(MotionMonitorTest, RefreshFailureKeepsLastKnownDevices) {
  auto monitor = make_monitor();
  ASSERT_TRUE(monitor->refresh_devices().ok());
  ASSERT_EQ(monitor->known_devices().size(), 2u);

  registry.refresh_status = Status::permission_denied("HTTP 401");
  registry.history["1"] = {motion("1", "a")};
  const ScanStats stats = monitor->scan_once();
  EXPECT_EQ(stats.devices, 2u);
  EXPECT_EQ(stats.dispatched, 1u);
}

TEST_F(MotionMonitorTest, KnownDevicesAreSortedByName) {
  auto monitor = make_monitor();
  ASSERT_TRUE(monitor->refresh_devices().ok());
  const auto devices = monitor->known_devices();
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].name, "Back");
  EXPECT_EQ(devices[1].name, "Front");
}

TEST_F(MotionMonitorTest, DispatchIgnoresUnknownDevice) {
  auto monitor = make_monitor();
  ASSERT_TRUE(monitor->refresh_devices().ok());
  EXPECT_FALSE(monitor->dispatch(motion("999", "x")));
  EXPECT_FALSE(tracker->has_seen("999", "x"));
}

TEST_F(MotionMonitorTest, SaturatedPoolDropsAndJournals) {
  auto monitor = make_monitor();
  ASSERT_TRUE(monitor->refresh_devices().ok());
  pool->stop();

  EXPECT_FALSE(monitor->dispatch(motion("1", "late")));
  EXPECT_EQ(sink.message_of("motion_rejected"), "saturated");
}

TEST_F(MotionMonitorTest, RunStopsAtMaxRuntime) {
  MonitorConfig cfg;
  cfg.scan_interval_ns = seconds_to_ns(0.05);
  cfg.max_run_s = 0.3;
  auto monitor = make_monitor(cfg);

  const auto t0 = std::chrono::steady_clock::now();
  monitor->run();
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_GE(elapsed, std::chrono::milliseconds(250));
  EXPECT_LT(elapsed, std::chrono::seconds(3));
  EXPECT_GE(registry.refreshes.load(), 2);
  EXPECT_EQ(sink.message_of("shutdown"), "max_run_s reached");
}

TEST_F(MotionMonitorTest, RunHonoursStopPredicate) {
  MonitorConfig cfg;
  cfg.scan_interval_ns = seconds_to_ns(10.0);
  auto monitor = make_monitor(cfg);

  std::atomic<bool> stop{false};
  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stop = true;
  });
  const auto t0 = std::chrono::steady_clock::now();
  monitor->run([&] { return stop.load(); });
  stopper.join();

  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(3));
  EXPECT_EQ(sink.message_of("shutdown"), "stop requested");
}

TEST_F(MotionMonitorTest, PushModeOnlyRefreshes) {
  registry.history["1"] = {motion("1", "a")};
  MonitorConfig cfg;
  cfg.mode = MonitorMode::kPush;
  cfg.scan_interval_ns = seconds_to_ns(0.05);
  cfg.max_run_s = 0.2;
  auto monitor = make_monitor(cfg);

  monitor->run();
  pool->wait_idle();
  EXPECT_GE(registry.refreshes.load(), 1);
  EXPECT_EQ(classifier.calls.load(), 0);

  EXPECT_TRUE(monitor->dispatch(motion("1", "pushed")));
  pool->wait_idle();
  EXPECT_EQ(classifier.calls.load(), 1);
}

}  // namespace
}  // namespace dw
