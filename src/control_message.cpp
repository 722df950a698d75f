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

#include "meetbridge/control_message.h"

namespace meetbridge {

namespace {

template <typename T> nlohmann::json jsonArray(const std::vector<T> &items) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &item : items) {
    arr.push_back(toJson(item));
  }
  return arr;
}

// One overload per alternative; a missing one fails to compile.
struct TypeNameVisitor {
  const char *operator()(const control::UsersUpdate &) const {
    return "UsersUpdate";
  }
  const char *operator()(const control::DeviceOutputsUpdate &) const {
    return "DeviceOutputsUpdate";
  }
  const char *operator()(const control::CaptionUpdate &) const {
    return "CaptionUpdate";
  }
  const char *operator()(const control::ChatMessage &) const {
    return "ChatMessage";
  }
  const char *operator()(const control::SilenceStatus &) const {
    return "SilenceStatus";
  }
  const char *operator()(const control::MemoryUsage &) const {
    return "MemoryUsage";
  }
  const char *operator()(const control::Error &) const { return "Error"; }
  const char *operator()(const control::UiInteraction &) const {
    return "UiInteraction";
  }
  const char *operator()(const control::MeetingStatusChange &) const {
    return "MeetingStatusChange";
  }
  const char *operator()(const control::ChatStatusChange &) const {
    return "ChatStatusChange";
  }
  const char *operator()(const control::AudioFormatUpdate &) const {
    return "AudioFormatUpdate";
  }
};

struct BodyVisitor {
  nlohmann::json &j;

  void operator()(const control::UsersUpdate &m) const {
    j["newUsers"] = jsonArray(m.new_users);
    j["removedUsers"] = jsonArray(m.removed_users);
    j["updatedUsers"] = jsonArray(m.updated_users);
  }
  void operator()(const control::DeviceOutputsUpdate &m) const {
    j["deviceOutputs"] = jsonArray(m.device_outputs);
  }
  void operator()(const control::CaptionUpdate &m) const {
    j["caption"] = toJson(m.caption);
  }
  void operator()(const control::ChatMessage &m) const {
    j["message_uuid"] = m.message.message_id;
    j["participant_uuid"] = m.message.device_id;
    // Floor division, so negative timestamps round down as well.
    std::int64_t seconds = m.message.timestamp_ms / 1000;
    if (m.message.timestamp_ms % 1000 != 0 && m.message.timestamp_ms < 0) {
      --seconds;
    }
    j["timestamp"] = seconds;
    j["text"] = m.message.text;
  }
  void operator()(const control::SilenceStatus &m) const {
    j["volume"] = m.volume;
    j["isSilent"] = m.is_silent;
  }
  void operator()(const control::MemoryUsage &m) const {
    j["memoryUsage"] = {{"peakResidentSetBytes", m.peak_resident_bytes}};
  }
  void operator()(const control::Error &m) const { j["message"] = m.message; }
  void operator()(const control::UiInteraction &m) const {
    j["message"] = m.message;
  }
  void operator()(const control::MeetingStatusChange &m) const {
    j["change"] = m.change;
  }
  void operator()(const control::ChatStatusChange &m) const {
    j["change"] = m.change;
  }
  void operator()(const control::AudioFormatUpdate &m) const {
    j["format"] = toJson(m.format);
  }
};

} // namespace

const char *controlTypeName(const ControlMessage &message) {
  return std::visit(TypeNameVisitor{}, message);
}

nlohmann::json toJson(const ControlMessage &message) {
  nlohmann::json j;
  j["type"] = controlTypeName(message);
  std::visit(BodyVisitor{j}, message);
  return j;
}

nlohmann::json toJson(const CaptionRecord &caption) {
  nlohmann::json j;
  j["captionId"] = caption.caption_id;
  j["deviceId"] = caption.device_id;
  j["version"] = caption.version;
  j["isFinal"] = caption.is_final;
  j["text"] = caption.text;
  j["languageId"] = caption.language_id;
  return j;
}

nlohmann::json toJson(const AudioFormat &format) {
  nlohmann::json j;
  j["numberOfChannels"] = format.number_of_channels;
  j["originalNumberOfChannels"] = format.original_number_of_channels;
  j["numberOfFrames"] = format.number_of_frames;
  j["sampleRate"] = format.sample_rate;
  j["format"] = format.format;
  j["duration"] = format.duration_us;
  return j;
}

} // namespace meetbridge
