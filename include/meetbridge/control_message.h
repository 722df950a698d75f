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
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "meetbridge/device.h"

namespace meetbridge {

struct CaptionRecord {
  std::int64_t caption_id = 0;
  std::string device_id;
  std::int64_t version = 0;
  bool is_final = false;
  std::string text;
  std::int64_t language_id = 0;
};

struct ChatMessageRecord {
  std::string message_id;
  std::string device_id;
  /// Platform timestamp in milliseconds.
  std::int64_t timestamp_ms = 0;
  std::string text;
};

struct AudioFormat {
  int number_of_channels = 1;
  int original_number_of_channels = 1;
  int number_of_frames = 0;
  int sample_rate = 0;
  std::string format;
  std::int64_t duration_us = 0;

  bool operator==(const AudioFormat &o) const {
    return number_of_channels == o.number_of_channels &&
           original_number_of_channels == o.original_number_of_channels &&
           number_of_frames == o.number_of_frames &&
           sample_rate == o.sample_rate && format == o.format &&
           duration_us == o.duration_us;
  }
  bool operator!=(const AudioFormat &o) const { return !(*this == o); }
};

// JSON control kinds carried by the JSON wire message. Each maps to one
// "type" value of the same name.
namespace control {

struct UsersUpdate {
  std::vector<Device> new_users;
  std::vector<Device> removed_users;
  std::vector<Device> updated_users;
};

struct DeviceOutputsUpdate {
  std::vector<DeviceOutput> device_outputs;
};

struct CaptionUpdate {
  CaptionRecord caption;
};

struct ChatMessage {
  ChatMessageRecord message;
};

struct SilenceStatus {
  double volume = 0.0;
  bool is_silent = false;
};

struct MemoryUsage {
  std::int64_t peak_resident_bytes = 0;
};

struct Error {
  std::string message;
};

struct UiInteraction {
  std::string message;
};

struct MeetingStatusChange {
  std::string change;
};

struct ChatStatusChange {
  std::string change;
};

struct AudioFormatUpdate {
  AudioFormat format;
};

} // namespace control

using ControlMessage =
    std::variant<control::UsersUpdate, control::DeviceOutputsUpdate,
                 control::CaptionUpdate, control::ChatMessage,
                 control::SilenceStatus, control::MemoryUsage, control::Error,
                 control::UiInteraction, control::MeetingStatusChange,
                 control::ChatStatusChange, control::AudioFormatUpdate>;

/// Value of the "type" field for this message.
const char *controlTypeName(const ControlMessage &message);

nlohmann::json toJson(const ControlMessage &message);
nlohmann::json toJson(const CaptionRecord &caption);
nlohmann::json toJson(const AudioFormat &format);

} // namespace meetbridge
