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

#include <cstdio>
#include <fstream>

namespace meetbridge {
namespace test {

TEST(BridgeOptionsTest, EmptyObjectKeepsDefaults) {
  const auto options = BridgeOptions::fromString("{}");

  EXPECT_EQ(options.recording_view, RecordingView::SpeakerView);
  EXPECT_FALSE(options.send_mixed_audio);
  EXPECT_FALSE(options.send_per_participant_audio);
  EXPECT_FALSE(options.collect_captions);
  EXPECT_DOUBLE_EQ(options.silence_threshold, 0.5);
  EXPECT_EQ(options.media_disable_grace_ms, 2000);
  EXPECT_EQ(options.screen_share_fps, 5);
  EXPECT_EQ(options.camera_fps, 15);
}

TEST(BridgeOptionsTest, ParsesEveryKey) {
  const auto options = BridgeOptions::fromString(R"({
    "recordingView": "gallery_view",
    "sendMixedAudio": true,
    "sendPerParticipantAudio": true,
    "collectCaptions": true,
    "silenceThreshold": 2.5,
    "mediaDisableGraceMs": 0,
    "audioActivityIntervalMs": 250,
    "memoryUsageIntervalMs": 1000,
    "neededInteractionsIntervalMs": 750,
    "screenShareFps": 2,
    "cameraFps": 30
  })");

  EXPECT_EQ(options.recording_view, RecordingView::GalleryView);
  EXPECT_TRUE(options.send_mixed_audio);
  EXPECT_TRUE(options.send_per_participant_audio);
  EXPECT_TRUE(options.collect_captions);
  EXPECT_DOUBLE_EQ(options.silence_threshold, 2.5);
  EXPECT_EQ(options.media_disable_grace_ms, 0);
  EXPECT_EQ(options.audio_activity_interval_ms, 250);
  EXPECT_EQ(options.memory_usage_interval_ms, 1000);
  EXPECT_EQ(options.needed_interactions_interval_ms, 750);
  EXPECT_EQ(options.screen_share_fps, 2);
  EXPECT_EQ(options.camera_fps, 30);
}

TEST(BridgeOptionsTest, NullKeepsDefault) {
  const auto options =
      BridgeOptions::fromString(R"({"cameraFps": null, "recordingView": null})");
  EXPECT_EQ(options.camera_fps, 15);
  EXPECT_EQ(options.recording_view, RecordingView::SpeakerView);
}

TEST(BridgeOptionsTest, UnknownKeysAreIgnored) {
  const auto options = BridgeOptions::fromString(
      R"({"videoFrameWidth": 1280, "botName": "Recorder", "cameraFps": 10})");
  EXPECT_EQ(options.camera_fps, 10);

  const auto json = toJson(options);
  EXPECT_FALSE(json.contains("videoFrameWidth"))
      << "Only known options are written back";
}

TEST(BridgeOptionsTest, ToJsonReadsBack) {
  BridgeOptions options;
  options.recording_view = RecordingView::GalleryView;
  options.camera_fps = 24;

  const auto json = toJson(options);
  EXPECT_EQ(json["recordingView"], "gallery_view");
  EXPECT_EQ(json["cameraFps"], 24);
  EXPECT_EQ(BridgeOptions::fromJson(json).camera_fps, 24);
}

TEST(BridgeOptionsTest, RejectsBadDocuments) {
  EXPECT_THROW(BridgeOptions::fromString("[1, 2]"), std::runtime_error);
  EXPECT_THROW(BridgeOptions::fromString("{not json"), std::runtime_error);
  EXPECT_THROW(BridgeOptions::fromString(R"({"sendMixedAudio": "yes"})"),
               std::runtime_error)
      << "Wrong value types are configuration errors";
  EXPECT_THROW(
      BridgeOptions::fromString(R"({"recordingView": "picture_in_picture"})"),
      std::runtime_error);
}

TEST(BridgeOptionsTest, RejectsOutOfRangeValues) {
  EXPECT_THROW(BridgeOptions::fromString(R"({"cameraFps": 0})"),
               std::runtime_error);
  EXPECT_THROW(BridgeOptions::fromString(R"({"screenShareFps": -1})"),
               std::runtime_error);
  EXPECT_THROW(
      BridgeOptions::fromString(R"({"audioActivityIntervalMs": 0})"),
      std::runtime_error);
  EXPECT_THROW(BridgeOptions::fromString(R"({"mediaDisableGraceMs": -5})"),
               std::runtime_error);
}

TEST(BridgeOptionsTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "meetbridge_options.json";
  {
    std::ofstream out(path);
    out << R"({"collectCaptions": true, "screenShareFps": 1})";
  }

  const auto options = BridgeOptions::fromFile(path);
  EXPECT_TRUE(options.collect_captions);
  EXPECT_EQ(options.screen_share_fps, 1);
  std::remove(path.c_str());
}

TEST(BridgeOptionsTest, MissingFileThrows) {
  EXPECT_THROW(BridgeOptions::fromFile("/nonexistent/meetbridge.json"),
               std::runtime_error);
}

} // namespace test
} // namespace meetbridge
