/*
 * Copyright 2025 LiveKit
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/test_common.h"

#include <stdexcept>

namespace meetbridge {
namespace test {

class PeriodicTaskTest : public ::testing::Test {
protected:
  boost::asio::io_context io_;
};

TEST_F(PeriodicTaskTest, TicksRepeatUntilStopped) {
  PeriodicTask task(io_, "ticker");
  int ticks = 0;
  task.start(5ms, [&] { ++ticks; });
  EXPECT_TRUE(task.running());

  ASSERT_TRUE(runUntil(io_, [&] { return ticks >= 3; }))
      << "Task should fire repeatedly";

  task.stop();
  EXPECT_FALSE(task.running());
  const int after_stop = ticks;
  io_.restart();
  io_.run_for(40ms);
  EXPECT_EQ(ticks, after_stop) << "No tick may run after stop()";
}

TEST_F(PeriodicTaskTest, RestartReplacesSchedule) {
  PeriodicTask task(io_, "ticker");
  int old_ticks = 0;
  int new_ticks = 0;
  task.start(5ms, [&] { ++old_ticks; });
  task.start(5ms, [&] { ++new_ticks; });

  ASSERT_TRUE(runUntil(io_, [&] { return new_ticks >= 2; }));
  EXPECT_EQ(old_ticks, 0) << "Replaced schedule must never fire";
}

TEST_F(PeriodicTaskTest, FailingTickKeepsRunning) {
  PeriodicTask task(io_, "flaky");
  int ticks = 0;
  task.start(5ms, [&] {
    ++ticks;
    throw std::runtime_error("tick failed");
  });

  ASSERT_TRUE(runUntil(io_, [&] { return ticks >= 2; }))
      << "An exception from one tick must not end the schedule";
  EXPECT_TRUE(task.running());
}

TEST_F(PeriodicTaskTest, StopFromInsideTick) {
  PeriodicTask task(io_, "once");
  int ticks = 0;
  task.start(5ms, [&] {
    ++ticks;
    task.stop();
  });

  ASSERT_TRUE(runUntil(io_, [&] { return ticks >= 1; }));
  io_.restart();
  io_.run_for(30ms);
  EXPECT_EQ(ticks, 1);
  EXPECT_FALSE(task.running());
}

TEST_F(PeriodicTaskTest, DestroyedTaskDoesNotFire) {
  int ticks = 0;
  {
    PeriodicTask task(io_, "short-lived");
    task.start(5ms, [&] { ++ticks; });
  }
  io_.run_for(30ms);
  EXPECT_EQ(ticks, 0);
}

} // namespace test
} // namespace meetbridge
