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

#include "meetbridge/bridge_options.h"

#include <fstream>
#include <stdexcept>

namespace meetbridge {

namespace {

constexpr const char *kSpeakerView = "speaker_view";
constexpr const char *kGalleryView = "gallery_view";

RecordingView parseRecordingView(const std::string &value) {
  if (value == kSpeakerView) {
    return RecordingView::SpeakerView;
  }
  if (value == kGalleryView) {
    return RecordingView::GalleryView;
  }
  throw std::runtime_error("BridgeOptions: unknown recordingView '" + value +
                           "'");
}

template <typename T>
void readKey(const nlohmann::json &doc, const char *key, T &out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  out = it->get<T>();
}

void requirePositive(const char *key, int value) {
  if (value <= 0) {
    throw std::runtime_error(std::string("BridgeOptions: ") + key +
                             " must be positive");
  }
}

} // namespace

const char *toString(RecordingView view) {
  switch (view) {
  case RecordingView::SpeakerView:
    return kSpeakerView;
  case RecordingView::GalleryView:
    return kGalleryView;
  }
  return kSpeakerView;
}

BridgeOptions BridgeOptions::fromJson(const nlohmann::json &doc) {
  if (!doc.is_object()) {
    throw std::runtime_error("BridgeOptions: expected a JSON object");
  }

  BridgeOptions options;
  try {
    std::string view = toString(options.recording_view);
    readKey(doc, "recordingView", view);
    options.recording_view = parseRecordingView(view);

    readKey(doc, "sendMixedAudio", options.send_mixed_audio);
    readKey(doc, "sendPerParticipantAudio", options.send_per_participant_audio);
    readKey(doc, "collectCaptions", options.collect_captions);
    readKey(doc, "silenceThreshold", options.silence_threshold);
    readKey(doc, "mediaDisableGraceMs", options.media_disable_grace_ms);
    readKey(doc, "audioActivityIntervalMs",
            options.audio_activity_interval_ms);
    readKey(doc, "memoryUsageIntervalMs", options.memory_usage_interval_ms);
    readKey(doc, "neededInteractionsIntervalMs",
            options.needed_interactions_interval_ms);
    readKey(doc, "screenShareFps", options.screen_share_fps);
    readKey(doc, "cameraFps", options.camera_fps);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("BridgeOptions: ") + e.what());
  }

  requirePositive("audioActivityIntervalMs",
                  options.audio_activity_interval_ms);
  requirePositive("memoryUsageIntervalMs", options.memory_usage_interval_ms);
  requirePositive("neededInteractionsIntervalMs",
                  options.needed_interactions_interval_ms);
  requirePositive("screenShareFps", options.screen_share_fps);
  requirePositive("cameraFps", options.camera_fps);
  if (options.media_disable_grace_ms < 0) {
    throw std::runtime_error(
        "BridgeOptions: mediaDisableGraceMs must not be negative");
  }
  return options;
}

BridgeOptions BridgeOptions::fromString(const std::string &text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("BridgeOptions: ") + e.what());
  }
  return fromJson(doc);
}

BridgeOptions BridgeOptions::fromFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("BridgeOptions: cannot open " + path);
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("BridgeOptions: " + path + ": " + e.what());
  }
  return fromJson(doc);
}

nlohmann::json toJson(const BridgeOptions &options) {
  return nlohmann::json{
      {"recordingView", toString(options.recording_view)},
      {"sendMixedAudio", options.send_mixed_audio},
      {"sendPerParticipantAudio", options.send_per_participant_audio},
      {"collectCaptions", options.collect_captions},
      {"silenceThreshold", options.silence_threshold},
      {"mediaDisableGraceMs", options.media_disable_grace_ms},
      {"audioActivityIntervalMs", options.audio_activity_interval_ms},
      {"memoryUsageIntervalMs", options.memory_usage_interval_ms},
      {"neededInteractionsIntervalMs",
       options.needed_interactions_interval_ms},
      {"screenShareFps", options.screen_share_fps},
      {"cameraFps", options.camera_fps},
  };
}

} // namespace meetbridge
