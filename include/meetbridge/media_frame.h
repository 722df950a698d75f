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

#include <cstdint>
#include <string>
#include <vector>

#include "meetbridge/control_message.h"

namespace meetbridge {

/// Bytes needed for an I420 image: full-size Y plus 2x2 subsampled U and V.
/// Throws std::invalid_argument for non-positive dimensions.
std::size_t computeI420Size(int width, int height);

/**
 * One decoded video frame in I420 layout, as pulled from a remote track.
 */
class VideoFrame {
public:
  VideoFrame() = default;

  /**
   * @param width         Display width in pixels.
   * @param height        Display height in pixels.
   * @param timestamp_us  Capture time, monotonic microseconds.
   * @param data          Y, U and V planes back to back.
   *
   * Throws std::invalid_argument if `data` is smaller than
   * computeI420Size(width, height).
   */
  VideoFrame(int width, int height, std::int64_t timestamp_us,
             std::vector<std::uint8_t> data);

  /// Zero-filled (black luma) frame of the right size.
  static VideoFrame create(int width, int height, std::int64_t timestamp_us);

  int width() const noexcept { return width_; }
  int height() const noexcept { return height_; }
  std::int64_t timestampUs() const noexcept { return timestamp_us_; }

  const std::vector<std::uint8_t> &data() const noexcept { return data_; }
  /// Moves the pixel buffer out; the frame is empty afterwards.
  std::vector<std::uint8_t> takeData() noexcept { return std::move(data_); }

private:
  int width_ = 0;
  int height_ = 0;
  std::int64_t timestamp_us_ = 0;
  std::vector<std::uint8_t> data_;
};

/**
 * One decoded audio frame with planar float32 samples (plane per channel).
 */
class AudioFrame {
public:
  AudioFrame() = default;

  /**
   * Throws std::invalid_argument if data.size() is not
   * num_channels * samples_per_channel, or either count is not positive.
   */
  AudioFrame(std::vector<float> data, int sample_rate, int num_channels,
             int samples_per_channel, std::string format = "f32-planar");

  const std::vector<float> &data() const noexcept { return data_; }
  int sample_rate() const noexcept { return sample_rate_; }
  int num_channels() const noexcept { return num_channels_; }
  int samples_per_channel() const noexcept { return samples_per_channel_; }
  const std::string &format() const noexcept { return format_; }

  /// Duration in microseconds (samples_per_channel / sample_rate).
  std::int64_t durationUs() const noexcept;

  /// Channels averaged into one mono buffer.
  std::vector<float> downmixToMono() const;

  /// Description sent in AudioFormatUpdate.
  AudioFormat describe() const;

private:
  std::vector<float> data_;
  int sample_rate_ = 0;
  int num_channels_ = 0;
  int samples_per_channel_ = 0;
  std::string format_;
};

} // namespace meetbridge
