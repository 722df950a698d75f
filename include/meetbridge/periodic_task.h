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
 * distributed under the License is distributed on an “AS IS” BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace meetbridge {

/**
 * Fixed-interval callback driven by a boost::asio::steady_timer.
 *
 * start() while running replaces the previous schedule, so a task never
 * fires twice per interval. Every start()/stop() bumps a generation
 * counter; a tick that was already queued for an older generation is
 * ignored. The callback runs on the io_context thread.
 */
class PeriodicTask {
public:
  PeriodicTask(boost::asio::io_context &io, std::string name);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void start(std::chrono::milliseconds interval, std::function<void()> tick);
  void stop();

  bool running() const noexcept { return running_; }
  const std::string &name() const noexcept { return name_; }

private:
  void arm(std::uint64_t generation);

  struct Generation {
    std::uint64_t value = 0;
  };

  boost::asio::steady_timer timer_;
  std::string name_;
  std::chrono::milliseconds interval_{0};
  std::function<void()> tick_;
  bool running_ = false;
  // Shared with queued handlers so they can detect a stale or destroyed
  // task without touching `this`.
  std::shared_ptr<Generation> generation_;
};

} // namespace meetbridge
