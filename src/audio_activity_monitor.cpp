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

#include "meetbridge/audio_activity_monitor.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace meetbridge {

namespace {

constexpr std::uint8_t kCentre = 128;

std::uint8_t toByte(float sample) {
  if (std::isnan(sample)) {
    return kCentre;
  }
  const double scaled = std::floor(128.0 * (1.0 + static_cast<double>(sample)));
  if (scaled < 0.0) {
    return 0;
  }
  if (scaled > 255.0) {
    return 255;
  }
  return static_cast<std::uint8_t>(scaled);
}

} // namespace

AudioActivityMonitor::AudioActivityMonitor(double silence_threshold,
                                           std::size_t window_size)
    : threshold_(silence_threshold),
      window_(window_size == 0 ? 1 : window_size, kCentre) {}

void AudioActivityMonitor::feed(const float *samples, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    window_[next_] = toByte(samples[i]);
    next_ = (next_ + 1) % window_.size();
  }
}

double AudioActivityMonitor::averageDeviation() const {
  std::uint64_t sum = 0;
  for (std::uint8_t b : window_) {
    sum += static_cast<std::uint64_t>(std::abs(static_cast<int>(b) - kCentre));
  }
  return static_cast<double>(sum) / static_cast<double>(window_.size());
}

std::optional<control::SilenceStatus> AudioActivityMonitor::check() const {
  const double deviation = averageDeviation();
  if (deviation > threshold_) {
    return control::SilenceStatus{deviation, false};
  }
  return std::nullopt;
}

void AudioActivityMonitor::reset() {
  std::fill(window_.begin(), window_.end(), kCentre);
  next_ = 0;
}

} // namespace meetbridge
