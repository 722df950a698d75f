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

#include <string>

#include <nlohmann/json.hpp>

#include "meetbridge/ui_automation.h"

namespace meetbridge {

/**
 * Session settings injected by the bot launcher.
 *
 * Keys match the launcher's JSON document; missing keys keep the defaults
 * below.
 */
struct BridgeOptions {
  RecordingView recording_view = RecordingView::SpeakerView;
  bool send_mixed_audio = false;
  bool send_per_participant_audio = false;
  bool collect_captions = false;
  /// Average byte-scale deviation above which audio counts as active.
  double silence_threshold = 0.5;
  int media_disable_grace_ms = 2000;
  int audio_activity_interval_ms = 1000;
  int memory_usage_interval_ms = 60000;
  int needed_interactions_interval_ms = 5000;
  int screen_share_fps = 5;
  int camera_fps = 15;

  /**
   * Parse options from a JSON object. Unknown keys are ignored.
   *
   * @throws std::runtime_error on a wrong value type, a non-positive
   *         interval or rate, or an unknown recordingView.
   */
  static BridgeOptions fromJson(const nlohmann::json &doc);

  /// Parse options from JSON text. Throws std::runtime_error.
  static BridgeOptions fromString(const std::string &text);

  /// Read and parse a JSON file. Throws std::runtime_error.
  static BridgeOptions fromFile(const std::string &path);
};

const char *toString(RecordingView view);

nlohmann::json toJson(const BridgeOptions &options);

} // namespace meetbridge
