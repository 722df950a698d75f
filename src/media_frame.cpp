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

#include "meetbridge/media_frame.h"

#include <stdexcept>

namespace meetbridge {

std::size_t computeI420Size(int width, int height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("VideoFrame: width and height must be positive");
  }

  const auto w = static_cast<std::size_t>(width);
  const auto h = static_cast<std::size_t>(height);
  // Y full, U and V subsampled 2x2
  const std::size_t chroma_w = (w + 1) / 2;
  const std::size_t chroma_h = (h + 1) / 2;
  return w * h + chroma_w * chroma_h * 2;
}

VideoFrame::VideoFrame(int width, int height, std::int64_t timestamp_us,
                       std::vector<std::uint8_t> data)
    : width_(width), height_(height), timestamp_us_(timestamp_us),
      data_(std::move(data)) {
  const std::size_t expected = computeI420Size(width_, height_);
  if (data_.size() < expected) {
    throw std::invalid_argument("VideoFrame: provided data is too small for "
                                "the specified size");
  }
}

VideoFrame VideoFrame::create(int width, int height,
                              std::int64_t timestamp_us) {
  const std::size_t size = computeI420Size(width, height);
  std::vector<std::uint8_t> buffer(size, 0);
  return VideoFrame(width, height, timestamp_us, std::move(buffer));
}

AudioFrame::AudioFrame(std::vector<float> data, int sample_rate,
                       int num_channels, int samples_per_channel,
                       std::string format)
    : data_(std::move(data)), sample_rate_(sample_rate),
      num_channels_(num_channels), samples_per_channel_(samples_per_channel),
      format_(std::move(format)) {
  if (num_channels <= 0 || samples_per_channel <= 0) {
    throw std::invalid_argument(
        "AudioFrame: num_channels and samples_per_channel must be positive");
  }
  const auto expected = static_cast<std::size_t>(num_channels) *
                        static_cast<std::size_t>(samples_per_channel);
  if (data_.size() != expected) {
    throw std::invalid_argument(
        "AudioFrame: data size must equal num_channels * "
        "samples_per_channel");
  }
}

std::int64_t AudioFrame::durationUs() const noexcept {
  if (sample_rate_ <= 0) {
    return 0;
  }
  return static_cast<std::int64_t>(samples_per_channel_) * 1000000 /
         sample_rate_;
}

std::vector<float> AudioFrame::downmixToMono() const {
  const auto n = static_cast<std::size_t>(samples_per_channel_);
  if (num_channels_ <= 1) {
    return std::vector<float>(data_.begin(), data_.begin() + n);
  }

  std::vector<float> mono(n, 0.0f);
  for (int ch = 0; ch < num_channels_; ++ch) {
    const float *plane = data_.data() + static_cast<std::size_t>(ch) * n;
    for (std::size_t i = 0; i < n; ++i) {
      mono[i] += plane[i];
    }
  }
  for (auto &s : mono) {
    s /= static_cast<float>(num_channels_);
  }
  return mono;
}

AudioFormat AudioFrame::describe() const {
  AudioFormat f;
  f.number_of_channels = 1;
  f.original_number_of_channels = num_channels_;
  f.number_of_frames = samples_per_channel_;
  f.sample_rate = sample_rate_;
  f.format = format_;
  f.duration_us = durationUs();
  return f;
}

} // namespace meetbridge
