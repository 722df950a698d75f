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

#include "meetbridge/periodic_task.h"

#include <exception>
#include <iostream>

namespace meetbridge {

PeriodicTask::PeriodicTask(boost::asio::io_context &io, std::string name)
    : timer_(io), name_(std::move(name)),
      generation_(std::make_shared<Generation>()) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start(std::chrono::milliseconds interval,
                         std::function<void()> tick) {
  stop();
  interval_ = interval;
  tick_ = std::move(tick);
  running_ = true;
  arm(generation_->value);
}

void PeriodicTask::stop() {
  ++generation_->value;
  running_ = false;
  timer_.cancel();
}

void PeriodicTask::arm(std::uint64_t generation) {
  timer_.expires_after(interval_);
  auto state = generation_;
  timer_.async_wait(
      [this, state, generation](const boost::system::error_code &ec) {
        if (ec || state->value != generation) {
          return;
        }
        try {
          tick_();
        } catch (const std::exception &e) {
          std::cerr << "[PeriodicTask] " << name_
                    << " tick failed: " << e.what() << std::endl;
        }
        // The tick may have stopped or restarted this task.
        if (state->value == generation) {
          arm(generation);
        }
      });
}

} // namespace meetbridge
