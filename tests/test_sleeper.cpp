#include <gtest/gtest.h>
#include "mt/sleeper.h"

#include <thread>

TEST(SleeperTest, FullWaitReturnsTrue) {
  Sleeper sleeper;
  EXPECT_TRUE(sleeper.sleep_for(milliseconds{5}));
  EXPECT_TRUE(sleeper.sleep_fn()(milliseconds{5}));
}

TEST(SleeperTest, ShutdownWakesWaitingThread) {
  Sleeper sleeper;
  std::thread td{[&] {
    std::this_thread::sleep_for(milliseconds{50});
    sleeper.request_shutdown();
  }};

  Timer timer;
  EXPECT_FALSE(sleeper.sleep_for(seconds{30}));
  td.join();

  EXPECT_LT(timer.diff_s(), 10.0);
  EXPECT_TRUE(sleeper.should_shutdown());
}

TEST(SleeperTest, WaitAfterShutdownEndsImmediately) {
  Sleeper sleeper;
  sleeper.request_shutdown();

  Timer timer;
  EXPECT_FALSE(sleeper.sleep_fn()(seconds{30}));
  EXPECT_LT(timer.diff_s(), 1.0);
}
