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
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "meetbridge/device.h"

namespace meetbridge {

/// Result of reconciling one roster snapshot. Screen-share pseudo-devices
/// never appear here.
struct RosterDiff {
  std::vector<Device> joined;
  std::vector<Device> left;
  std::vector<Device> updated;

  bool empty() const noexcept {
    return joined.empty() && left.empty() && updated.empty();
  }
};

/**
 * Interface for receiving ParticipantStore notifications.
 *
 * All methods provide default no-op implementations so you can override
 * only the callbacks you care about.
 */
class ParticipantStoreDelegate {
public:
  virtual ~ParticipantStoreDelegate() = default;

  /**
   * Called once per roster change that produced at least one join, leave
   * or update.
   */
  virtual void onUsersUpdated(const RosterDiff &) {}

  /**
   * Called after every device-output batch with the full current table.
   */
  virtual void onDeviceOutputsUpdated(const std::vector<DeviceOutput> &) {}
};

/**
 * Authoritative view of the meeting roster and of each device's audio and
 * video outputs.
 *
 * The "current roster" holds the IN_MEETING devices of the latest snapshot.
 * Every device ever reported stays in the all-devices table so that
 * lookups by id or stream keep working after it leaves.
 */
class ParticipantStore {
public:
  ParticipantStore() = default;

  ParticipantStore(const ParticipantStore &) = delete;
  ParticipantStore &operator=(const ParticipantStore &) = delete;

  /// Not owned; may be nullptr.
  void setDelegate(ParticipantStoreDelegate *delegate) noexcept {
    delegate_ = delegate;
  }

  /// Replace the current roster with the IN_MEETING subset of `devices`.
  RosterDiff applyFullRoster(const std::vector<RawDevice> &devices);

  /// Merge one device into the current roster, the incoming entry winning
  /// over any current entry with the same id. A device that left can only
  /// be detected here if the platform reports it with a non-IN_MEETING
  /// status; otherwise the next full snapshot picks the leave up.
  RosterDiff applySingleDevice(const RawDevice &device);

  /// Upsert by (device_id, output_type) and notify with the full table.
  void applyDeviceOutputs(const std::vector<RawDeviceOutput> &outputs,
                          std::int64_t now_ms);
  void applyDeviceOutputs(const std::vector<RawDeviceOutput> &outputs);

  // ---- lookups ----

  const Device *deviceById(const std::string &device_id) const;
  const Device *deviceByStreamId(const std::string &stream_id) const;
  /// Names are not unique; the first device seen wins.
  const Device *deviceByFullName(const std::string &full_name) const;
  const Device *deviceByDisplayName(const std::string &display_name) const;

  const DeviceOutput *deviceOutput(const std::string &device_id,
                                   OutputType type) const;
  /// False when the stream is unknown.
  bool isStreamEnabled(const std::string &stream_id) const;

  const std::vector<Device> &currentDevices() const noexcept {
    return current_;
  }
  std::vector<Device> currentScreenShareDevices() const;
  std::vector<DeviceOutput> deviceOutputs() const { return outputs_; }

  std::optional<std::string> currentUserId() const { return current_user_; }

private:
  Device normalize(const RawDevice &raw);
  void remember(const Device &device);
  RosterDiff reconcile(std::vector<Device> snapshot);

  ParticipantStoreDelegate *delegate_ = nullptr;

  std::vector<Device> current_;
  std::unordered_map<std::string, Device> all_devices_;
  std::vector<std::string> all_device_order_;

  std::vector<DeviceOutput> outputs_;
  std::map<std::pair<std::string, std::uint32_t>, std::size_t> output_index_;

  std::optional<std::string> current_user_;
};

} // namespace meetbridge
