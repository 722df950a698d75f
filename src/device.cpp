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

#include "meetbridge/device.h"

namespace meetbridge {

DeviceStatus toDeviceStatus(std::uint32_t raw) {
  switch (raw) {
  case 1:
    return DeviceStatus::IN_MEETING;
  case 6:
    return DeviceStatus::NOT_IN_MEETING;
  case 7:
    return DeviceStatus::REMOVED;
  default:
    return DeviceStatus::UNKNOWN;
  }
}

const char *humanizedStatus(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::IN_MEETING:
    return "in_meeting";
  case DeviceStatus::NOT_IN_MEETING:
    return "not_in_meeting";
  case DeviceStatus::REMOVED:
    return "removed_from_meeting";
  case DeviceStatus::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}

nlohmann::json toJson(const Device &device) {
  nlohmann::json j;
  j["deviceId"] = device.device_id;
  j["displayName"] = device.display_name;
  j["fullName"] = device.full_name;
  j["profilePicture"] = device.profile_picture;
  j["status"] = device.raw_status;
  j["humanized_status"] = humanizedStatus(device.status);
  if (device.parent_device_id) {
    j["parentDeviceId"] = *device.parent_device_id;
  }
  j["isCurrentUser"] = device.is_current_user;
  j["isHost"] = device.is_host;
  return j;
}

nlohmann::json toJson(const DeviceOutput &output) {
  nlohmann::json j;
  j["deviceId"] = output.device_id;
  j["outputType"] = static_cast<std::uint32_t>(output.output_type);
  j["streamId"] = output.stream_id;
  j["disabled"] = output.disabled;
  j["lastUpdated"] = output.last_updated_ms;
  return j;
}

} // namespace meetbridge
