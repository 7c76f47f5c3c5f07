// File: tests/test_motion_event_tracker.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "dw/core/motion/motion_event_tracker.hpp"

namespace dw {
namespace {

TimestampNs at_s(double s) { return TimestampNs{seconds_to_ns(s)}; }

MotionConfig default_motion() { return MotionConfig{}; }

TEST(MotionEventTracker, FirstEventIsAccepted) {
  MotionEventTracker t(default_motion());
  EXPECT_EQ(t.evaluate_at("dev", "e1", at_s(0)), GateDecision::kAccepted);
  EXPECT_TRUE(t.has_seen("dev", "e1"));
  ASSERT_TRUE(t.last_triggered_at("dev").has_value());
  EXPECT_EQ(*t.last_triggered_at("dev"), at_s(0));
}

TEST(MotionEventTracker, SameIdIsDuplicateEvenAfterCooldown) {
  MotionEventTracker t(default_motion());
  ASSERT_EQ(t.evaluate_at("dev", "e1", at_s(0)), GateDecision::kAccepted);
  EXPECT_EQ(t.evaluate_at("dev", "e1", at_s(1)), GateDecision::kDuplicate);
  EXPECT_EQ(t.evaluate_at("dev", "e1", at_s(500)), GateDecision::kDuplicate);
}

TEST(MotionEventTracker, CooldownRejectsWithoutRecordingId) {
  MotionEventTracker t(default_motion());
  ASSERT_EQ(t.evaluate_at("dev", "e1", at_s(0)), GateDecision::kAccepted);

  EXPECT_EQ(t.evaluate_at("dev", "e2", at_s(5)), GateDecision::kCooldown);
  EXPECT_FALSE(t.has_seen("dev", "e2"));
  EXPECT_EQ(*t.last_triggered_at("dev"), at_s(0));

  // Same id retried after the cooldown is a fresh trigger.
  EXPECT_EQ(t.evaluate_at("dev", "e2", at_s(31)), GateDecision::kAccepted);
  EXPECT_EQ(*t.last_triggered_at("dev"), at_s(31));
}

TEST(MotionEventTracker, CooldownBoundaryIsInclusive) {
  MotionEventTracker t(default_motion());
  ASSERT_EQ(t.evaluate_at("dev", "e1", at_s(0)), GateDecision::kAccepted);
  EXPECT_EQ(t.evaluate_at("dev", "e2", at_s(29.999)), GateDecision::kCooldown);
  EXPECT_EQ(t.evaluate_at("dev", "e3", at_s(30)), GateDecision::kAccepted);
}

TEST(MotionEventTracker, DevicesAreIndependent) {
  MotionEventTracker t(default_motion());
  ASSERT_EQ(t.evaluate_at("front", "e1", at_s(0)), GateDecision::kAccepted);
  EXPECT_EQ(t.evaluate_at("back", "e1", at_s(1)), GateDecision::kAccepted);
  EXPECT_EQ(t.evaluate_at("back", "e2", at_s(2)), GateDecision::kCooldown);
}

TEST(MotionEventTracker, ZeroCooldownAcceptsEveryNewId) {
  MotionConfig cfg;
  cfg.cooldown_ns = 0;
  MotionEventTracker t(cfg);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(t.evaluate_at("dev", "e" + std::to_string(i), at_s(0)), GateDecision::kAccepted);
  }
}

TEST(MotionEventTracker, SeenSetIsTrimmedToNewest) {
  MotionConfig cfg;
  cfg.cooldown_ns = 0;
  MotionEventTracker t(cfg);

  for (int i = 0; i < 100; ++i) {
    ASSERT_EQ(t.evaluate_at("dev", "e" + std::to_string(i), at_s(i)), GateDecision::kAccepted);
  }
  EXPECT_EQ(t.seen_count("dev"), 100u);

  // The 101st id pushes it over the threshold.
  ASSERT_EQ(t.evaluate_at("dev", "e100", at_s(100)), GateDecision::kAccepted);
  EXPECT_EQ(t.seen_count("dev"), 50u);
  EXPECT_FALSE(t.has_seen("dev", "e0"));
  EXPECT_FALSE(t.has_seen("dev", "e50"));
  EXPECT_TRUE(t.has_seen("dev", "e51"));
  EXPECT_TRUE(t.has_seen("dev", "e100"));

  // A forgotten id looks new again.
  EXPECT_EQ(t.evaluate_at("dev", "e0", at_s(200)), GateDecision::kAccepted);
}

TEST(MotionEventTracker, UnknownDeviceHasNoState) {
  MotionEventTracker t(default_motion());
  EXPECT_EQ(t.seen_count("nope"), 0u);
  EXPECT_FALSE(t.last_triggered_at("nope").has_value());
}

TEST(MotionEventTracker, ConcurrentSignalsAcceptExactlyOnePerCooldown) {
  MotionEventTracker t(default_motion());
  std::atomic<int> accepted{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&t, &accepted, i] {
      if (t.evaluate_at("dev", "e" + std::to_string(i), at_s(1)) == GateDecision::kAccepted) {
        ++accepted;
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(accepted.load(), 1);
  EXPECT_EQ(t.seen_count("dev"), 1u);
}

TEST(MotionEventTracker, ShouldTriggerUsesTheSteadyClock) {
  MotionEventTracker t(default_motion());
  EXPECT_TRUE(t.should_trigger("dev", "e1"));
  EXPECT_FALSE(t.should_trigger("dev", "e1"));
  EXPECT_FALSE(t.should_trigger("dev", "e2"));
}

}  // namespace
}  // namespace dw
