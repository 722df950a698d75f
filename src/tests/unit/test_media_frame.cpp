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

#include <gtest/gtest.h>
#include <meetbridge/media_frame.h>

namespace meetbridge {
namespace test {

TEST(VideoFrameTest, I420SizeRoundsChromaUp) {
  EXPECT_EQ(computeI420Size(1920, 1080), 1920u * 1080u * 3u / 2u);
  EXPECT_EQ(computeI420Size(3, 3), 9u + 2u * 2u * 2u);
  EXPECT_THROW(computeI420Size(0, 10), std::invalid_argument);
  EXPECT_THROW(computeI420Size(10, -1), std::invalid_argument);
}

TEST(VideoFrameTest, RejectsUndersizedBuffer) {
  EXPECT_THROW(VideoFrame(4, 4, 0, std::vector<std::uint8_t>(10)),
               std::invalid_argument);

  VideoFrame frame = VideoFrame::create(4, 4, 77);
  EXPECT_EQ(frame.data().size(), 24u);
  EXPECT_EQ(frame.timestampUs(), 77);
}

TEST(AudioFrameTest, DownmixAveragesPlanes) {
  // Two planes of two samples each.
  AudioFrame frame({1.0f, 0.5f, 0.0f, -0.5f}, 48000, 2, 2);

  const auto mono = frame.downmixToMono();

  ASSERT_EQ(mono.size(), 2u);
  EXPECT_FLOAT_EQ(mono[0], 0.5f);
  EXPECT_FLOAT_EQ(mono[1], 0.0f);
}

TEST(AudioFrameTest, DescribeReportsMonoOutputFormat) {
  AudioFrame frame(std::vector<float>(960, 0.0f), 48000, 2, 480);

  const AudioFormat format = frame.describe();

  EXPECT_EQ(format.number_of_channels, 1);
  EXPECT_EQ(format.original_number_of_channels, 2);
  EXPECT_EQ(format.number_of_frames, 480);
  EXPECT_EQ(format.sample_rate, 48000);
  EXPECT_EQ(format.format, "f32-planar");
  EXPECT_EQ(format.duration_us, 10000);
}

TEST(AudioFrameTest, RejectsInconsistentSizes) {
  EXPECT_THROW(AudioFrame(std::vector<float>(10), 48000, 2, 4),
               std::invalid_argument);
  EXPECT_THROW(AudioFrame(std::vector<float>(), 48000, 0, 0),
               std::invalid_argument);
}

} // namespace test
} // namespace meetbridge
