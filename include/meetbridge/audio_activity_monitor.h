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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "meetbridge/control_message.h"

namespace meetbridge {

/**
 * Rolling view of the mixed meeting audio used to detect activity.
 *
 * Samples are kept as unsigned bytes centred on 128, the way an analyser
 * node exposes its time-domain data. check() averages |byte - 128| over
 * the window and reports activity when it exceeds the threshold.
 */
class AudioActivityMonitor {
public:
  static constexpr std::size_t kDefaultWindowSize = 4096;

  explicit AudioActivityMonitor(double silence_threshold,
                                std::size_t window_size = kDefaultWindowSize);

  /// Append mono float samples in [-1, 1]; older samples roll off.
  void feed(const float *samples, std::size_t count);
  void feed(const std::vector<float> &samples) {
    feed(samples.data(), samples.size());
  }

  double averageDeviation() const;

  /// SilenceStatus{volume, false} when audio is active, otherwise nullopt.
  std::optional<control::SilenceStatus> check() const;

  void reset();

  double threshold() const noexcept { return threshold_; }

private:
  double threshold_;
  std::vector<std::uint8_t> window_;
  std::size_t next_ = 0;
};

} // namespace meetbridge
