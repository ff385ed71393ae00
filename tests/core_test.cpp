// radflow-Prod headers
#include "core/Clock.hpp"
#include "core/DelayQueue.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/PeriodicTimer.hpp"
#include "core/RingBuffer.hpp"
#include "core/SettingsStore.hpp"

// radflow-Fake headers
#include "FakeClock.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace radflow::core;
using namespace radflow::test;
using namespace std::chrono_literals;

namespace {

  /// Polls \p pred for up to 2 s.
  template <typename Pred> bool eventually(Pred pred) {
    for (int i = 0; i < 200; ++i) {
      if (pred())
        return true;
      std::this_thread::sleep_for(10ms);
    }
    return pred();
  }

} // namespace

// ---- RingBuffer -----------------------------------------------------------

TEST(RingBufferTest, PopsInPushOrder) {
  RingBuffer<int> rb(4);
  EXPECT_TRUE(rb.tryPush(1));
  EXPECT_TRUE(rb.tryPush(2));
  EXPECT_EQ(rb.tryPop(), 1);
  EXPECT_EQ(rb.tryPop(), 2);
  EXPECT_EQ(rb.tryPop(), std::nullopt);
}

TEST(RingBufferTest, DropsNewWhenFull) {
  RingBuffer<int> rb(2);
  rb.tryPush(1);
  rb.tryPush(2);
  EXPECT_FALSE(rb.tryPush(3));
  EXPECT_EQ(rb.dropped(), 1u);
  EXPECT_EQ(rb.size(), 2u);
  EXPECT_EQ(rb.tryPop(), 1);
  EXPECT_TRUE(rb.tryPush(4)); // wraps
  EXPECT_EQ(rb.tryPop(), 2);
  EXPECT_EQ(rb.tryPop(), 4);
}

// ---- ErrorMonitor ---------------------------------------------------------

TEST(ErrorMonitorTest, EscalatesFirstFailure) {
  FakeClock clock;
  ErrorMonitor monitor(2s, &clock);
  std::vector<std::string> toasts;
  monitor.registerEscalation([&](const std::string& m) { toasts.push_back(m); });

  monitor.notifyFailure("scrape failed");
  ASSERT_EQ(toasts.size(), 1u);
  EXPECT_EQ(toasts.front(), "scrape failed");
  EXPECT_EQ(monitor.failureCount(), 1u);
}

TEST(ErrorMonitorTest, DebouncesRepeatsWithinWindow) {
  FakeClock clock;
  ErrorMonitor monitor(2s, &clock);
  int escalations = 0;
  monitor.registerEscalation([&](const std::string&) { ++escalations; });

  monitor.notifyFailure("same");
  clock.advance(500ms);
  monitor.notifyFailure("same");
  monitor.notifyFailure("other");
  EXPECT_EQ(escalations, 2);

  clock.advance(2s);
  monitor.notifyFailure("same");
  EXPECT_EQ(escalations, 3);
  EXPECT_EQ(monitor.failureCount(), 4u);
}

TEST(ErrorMonitorTest, ForgetsMessagesOnceTheirWindowExpires) {
  FakeClock clock;
  ErrorMonitor monitor(2s, &clock);
  monitor.notifyFailure("a");
  monitor.notifyFailure("b");
  EXPECT_EQ(monitor.trackedMessages(), 2u);

  clock.advance(3s);
  monitor.notifyFailure("c");
  EXPECT_EQ(monitor.trackedMessages(), 1u);
}

TEST(ErrorMonitorTest, NoCallbackIsFine) {
  ErrorMonitor monitor;
  monitor.notifyFailure("nobody listening");
  EXPECT_EQ(monitor.failureCount(), 1u);
}

// ---- SettingsStore / criteria ---------------------------------------------

TEST(SettingsStoreTest, ReplaceBumpsRevisionAndSnapshotIsACopy) {
  SettingsStore store;
  EXPECT_EQ(store.revision(), 0u);

  Settings s = store.snapshot();
  s.stickyOffThreshold = 7;
  EXPECT_EQ(store.snapshot().stickyOffThreshold, 3);

  store.replace(s);
  EXPECT_EQ(store.revision(), 1u);
  EXPECT_EQ(store.snapshot().stickyOffThreshold, 7);
}

TEST(StudyCriteriaTest, RequiredAndAnyTerms) {
  StudyCriteria c;
  EXPECT_TRUE(c.matches("anything"));

  c.requiredTerms = { "ct" };
  c.anyTerms = { "head", "brain" };
  EXPECT_TRUE(c.matches("CT HEAD WO CONTRAST"));
  EXPECT_TRUE(c.matches("ct brain"));
  EXPECT_FALSE(c.matches("MR HEAD"));
  EXPECT_FALSE(c.matches("CT CHEST"));
}

TEST(SettingsTest, MicButtonLookup) {
  Settings s;
  s.actionBindings[ActionKind::SignReport] = ActionBinding{ "", "Checkmark" };
  EXPECT_EQ(s.micButtonFor(ActionKind::SignReport), "Checkmark");
  EXPECT_EQ(s.micButtonFor(ActionKind::ProcessReport), "");
}

TEST(ActionRequestTest, NamesRoundTripThroughLookup) {
  for (std::size_t i = 0; i < kActionNames.size(); ++i) {
    auto kind = static_cast<ActionKind>(i);
    EXPECT_EQ(actionFromName(toString(kind)), kind);
  }
  EXPECT_EQ(actionFromName("Launch Rockets"), std::nullopt);
}

// ---- Logger ---------------------------------------------------------------

TEST(LoggerTest, CsvEscapesQuotesAndNewlines) {
  LogEvent e;
  e.level = LogLevel::Warn;
  e.component = "Poller";
  e.message = "said \"hi\"\nbye";
  const std::string line = formatCsv(e);
  EXPECT_THAT(line, ::testing::HasSubstr(",WARN,Poller,\"said \"\"hi\"\" bye\"\n"));
}

TEST(LoggerTest, FinishRunWritesQueuedEvents) {
  const std::string path = ::testing::TempDir() + "radflow_logger_test.csv";
  std::remove(path.c_str());

  Logger log(16);
  log.startNewRun(path);
  log.info("Test", "first");
  log.error("Test", "second");
  log.finishRun();

  std::FILE* fp = std::fopen(path.c_str(), "r");
  ASSERT_NE(fp, nullptr);
  std::string content;
  char buf[256];
  while (std::fgets(buf, sizeof buf, fp))
    content += buf;
  std::fclose(fp);

  EXPECT_THAT(content, ::testing::HasSubstr("INFO,Test,\"first\""));
  EXPECT_THAT(content, ::testing::HasSubstr("ERROR,Test,\"second\""));
}

TEST(LoggerTest, MinLevelFiltersBeforeQueueing) {
  const std::string path = ::testing::TempDir() + "radflow_logger_level.csv";
  std::remove(path.c_str());

  Logger log(16);
  log.setMinLevel(LogLevel::Warn);
  log.startNewRun(path);
  log.trace("Test", "hidden");
  log.warn("Test", "shown");
  log.finishRun();

  std::FILE* fp = std::fopen(path.c_str(), "r");
  ASSERT_NE(fp, nullptr);
  std::string content;
  char buf[256];
  while (std::fgets(buf, sizeof buf, fp))
    content += buf;
  std::fclose(fp);

  EXPECT_THAT(content, ::testing::Not(::testing::HasSubstr("hidden")));
  EXPECT_THAT(content, ::testing::HasSubstr("shown"));
}

// ---- timers ---------------------------------------------------------------

TEST(PeriodicTimerTest, KeepsTickingAfterAThrowingTick) {
  Logger log;
  std::atomic<int> ticks{ 0 };
  PeriodicTimer timer("test", 5ms, [&] {
    if (++ticks == 1)
      throw std::runtime_error("first tick fails");
  }, log);

  timer.start();
  EXPECT_TRUE(eventually([&] { return ticks >= 3; }));
  timer.stop();
  EXPECT_FALSE(timer.running());
}

TEST(PeriodicTimerTest, SurvivesATickThrowingANonStandardType) {
  Logger log;
  std::atomic<int> ticks{ 0 };
  PeriodicTimer timer("odd", 5ms, [&] {
    if (++ticks == 1)
      throw 42;
  }, log);

  timer.start();
  EXPECT_TRUE(eventually([&] { return ticks >= 3; }));
  timer.stop();
}

TEST(PeriodicTimerTest, SetIntervalFromInsideTick) {
  Logger log;
  std::atomic<int> ticks{ 0 };
  PeriodicTimer* self = nullptr;
  PeriodicTimer timer("rearm", 10s, [&] {
    ++ticks;
    self->setInterval(5ms);
  }, log);
  self = &timer;

  timer.start(); // first tick is immediate, then the 10 s period is replaced
  EXPECT_TRUE(eventually([&] { return ticks >= 3; }));
  EXPECT_EQ(timer.interval(), 5ms);
  timer.stop();
}

TEST(DelayQueueTest, RunsJobsInDeadlineOrder) {
  Logger log;
  DelayQueue queue(log);
  queue.start();

  std::mutex m;
  std::vector<int> order;
  auto record = [&](int v) {
    std::lock_guard<std::mutex> lock(m);
    order.push_back(v);
  };
  queue.runAfter(60ms, [&] { record(3); });
  queue.runAfter(0ms, [&] { record(1); });
  queue.runAfter(20ms, [&] { record(2); });

  EXPECT_TRUE(eventually([&] {
    std::lock_guard<std::mutex> lock(m);
    return order.size() == 3;
  }));
  queue.stop();
  EXPECT_EQ(order, (std::vector<int>{ 1, 2, 3 }));
}

TEST(DelayQueueTest, JobThrowingANonStandardTypeDoesNotStopTheQueue) {
  Logger log;
  DelayQueue queue(log);
  queue.start();
  std::atomic<bool> ran{ false };
  queue.runAfter(0ms, [] { throw 42; });
  queue.runAfter(10ms, [&] { ran = true; });
  EXPECT_TRUE(eventually([&] { return ran.load(); }));
  queue.stop();
}

TEST(DelayQueueTest, StopDiscardsPendingJobs) {
  Logger log;
  DelayQueue queue(log);
  queue.start();
  std::atomic<bool> ran{ false };
  queue.runAfter(10s, [&] { ran = true; });
  EXPECT_EQ(queue.pending(), 1u);
  queue.stop();
  EXPECT_EQ(queue.pending(), 0u);
  EXPECT_FALSE(ran);
}
