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
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace meetbridge {

enum class DeviceStatus : std::uint32_t {
  UNKNOWN = 0,
  IN_MEETING = 1,
  NOT_IN_MEETING = 6,
  REMOVED = 7,
};

enum class OutputType : std::uint32_t {
  AUDIO = 1,
  VIDEO = 2,
};

/// Map a raw platform status value; unrecognized values become UNKNOWN.
DeviceStatus toDeviceStatus(std::uint32_t raw);

/// "in_meeting", "not_in_meeting", "removed_from_meeting" or "unknown".
const char *humanizedStatus(DeviceStatus status);

/// Roster entry exactly as the platform reported it.
struct RawDevice {
  std::string device_id;
  std::string display_name;
  std::string full_name;
  std::string profile_picture;
  std::uint32_t status = 0;
  // Set only on the entry describing this client.
  std::optional<std::string> current_user_marker;
  std::optional<std::string> parent_device_id;
  std::optional<std::uint32_t> is_host;
};

/// Normalized participant device.
struct Device {
  std::string device_id;
  std::string display_name;
  std::string full_name;
  std::string profile_picture;
  /// Raw platform value, kept for the JSON form.
  std::uint32_t raw_status = 0;
  DeviceStatus status = DeviceStatus::UNKNOWN;
  /// Present only on screen-share pseudo-devices; names the sharer.
  std::optional<std::string> parent_device_id;
  bool is_host = false;
  bool is_current_user = false;

  bool isScreenShare() const noexcept { return parent_device_id.has_value(); }
  bool inMeeting() const noexcept {
    return status == DeviceStatus::IN_MEETING;
  }
};

struct RawDeviceOutput {
  std::string device_id;
  std::uint32_t output_type = 0;
  std::string stream_id;
  bool disabled = false;
};

struct DeviceOutput {
  std::string device_id;
  OutputType output_type = OutputType::AUDIO;
  std::string stream_id;
  bool disabled = false;
  /// Monotonic milliseconds of the last upsert.
  std::int64_t last_updated_ms = 0;
};

nlohmann::json toJson(const Device &device);
nlohmann::json toJson(const DeviceOutput &output);

} // namespace meetbridge
