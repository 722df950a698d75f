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

#include "meetbridge/participant_store.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace meetbridge {

namespace {

std::int64_t steadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

const Device *findIn(const std::vector<Device> &devices,
                     const std::string &device_id) {
  auto it = std::find_if(
      devices.begin(), devices.end(),
      [&device_id](const Device &d) { return d.device_id == device_id; });
  return it == devices.end() ? nullptr : &*it;
}

// Later entries with the same id replace earlier ones in place.
void upsertInto(std::vector<Device> &devices, Device device) {
  auto it = std::find_if(devices.begin(), devices.end(),
                         [&device](const Device &d) {
                           return d.device_id == device.device_id;
                         });
  if (it == devices.end()) {
    devices.push_back(std::move(device));
  } else {
    *it = std::move(device);
  }
}

} // namespace

Device ParticipantStore::normalize(const RawDevice &raw) {
  if (raw.current_user_marker && !current_user_) {
    current_user_ = raw.device_id;
    std::cout << "[ParticipantStore] current user is " << raw.device_id
              << std::endl;
  }

  Device d;
  d.device_id = raw.device_id;
  d.display_name = raw.display_name;
  d.full_name = raw.full_name;
  d.profile_picture = raw.profile_picture;
  d.raw_status = raw.status;
  d.status = toDeviceStatus(raw.status);
  d.parent_device_id = raw.parent_device_id;
  d.is_host = raw.is_host.value_or(0) != 0;
  d.is_current_user = current_user_ && *current_user_ == raw.device_id;
  return d;
}

void ParticipantStore::remember(const Device &device) {
  auto it = all_devices_.find(device.device_id);
  if (it == all_devices_.end()) {
    all_device_order_.push_back(device.device_id);
    all_devices_.emplace(device.device_id, device);
  } else {
    it->second = device;
  }
}

RosterDiff ParticipantStore::applyFullRoster(
    const std::vector<RawDevice> &devices) {
  std::vector<Device> snapshot;
  snapshot.reserve(devices.size());
  for (const auto &raw : devices) {
    upsertInto(snapshot, normalize(raw));
  }
  return reconcile(std::move(snapshot));
}

RosterDiff ParticipantStore::applySingleDevice(const RawDevice &device) {
  std::vector<Device> snapshot = current_;
  upsertInto(snapshot, normalize(device));
  return reconcile(std::move(snapshot));
}

RosterDiff ParticipantStore::reconcile(std::vector<Device> snapshot) {
  std::vector<Device> next;
  next.reserve(snapshot.size());
  for (auto &device : snapshot) {
    remember(device);
    if (device.inMeeting()) {
      next.push_back(std::move(device));
    }
  }

  RosterDiff diff;
  for (const auto &device : next) {
    if (device.isScreenShare()) {
      continue;
    }
    const Device *previous = findIn(current_, device.device_id);
    if (previous == nullptr) {
      diff.joined.push_back(device);
    } else if (toJson(*previous) != toJson(device)) {
      diff.updated.push_back(device);
    }
  }
  for (const auto &device : current_) {
    if (!device.isScreenShare() &&
        findIn(next, device.device_id) == nullptr) {
      diff.left.push_back(device);
    }
  }

  current_ = std::move(next);

  if (!diff.empty() && delegate_) {
    delegate_->onUsersUpdated(diff);
  }
  return diff;
}

void ParticipantStore::applyDeviceOutputs(
    const std::vector<RawDeviceOutput> &outputs, std::int64_t now_ms) {
  for (const auto &raw : outputs) {
    DeviceOutput out;
    out.device_id = raw.device_id;
    out.output_type = static_cast<OutputType>(raw.output_type);
    out.stream_id = raw.stream_id;
    out.disabled = raw.disabled;
    out.last_updated_ms = now_ms;

    const auto key = std::make_pair(raw.device_id, raw.output_type);
    auto it = output_index_.find(key);
    if (it == output_index_.end()) {
      output_index_.emplace(key, outputs_.size());
      outputs_.push_back(std::move(out));
    } else {
      outputs_[it->second] = std::move(out);
    }
  }

  if (delegate_) {
    delegate_->onDeviceOutputsUpdated(outputs_);
  }
}

void ParticipantStore::applyDeviceOutputs(
    const std::vector<RawDeviceOutput> &outputs) {
  applyDeviceOutputs(outputs, steadyNowMs());
}

const Device *ParticipantStore::deviceById(const std::string &device_id) const {
  auto it = all_devices_.find(device_id);
  return it == all_devices_.end() ? nullptr : &it->second;
}

const Device *
ParticipantStore::deviceByStreamId(const std::string &stream_id) const {
  for (const auto &out : outputs_) {
    if (out.stream_id == stream_id) {
      return deviceById(out.device_id);
    }
  }
  return nullptr;
}

const Device *
ParticipantStore::deviceByFullName(const std::string &full_name) const {
  for (const auto &id : all_device_order_) {
    const Device &d = all_devices_.at(id);
    if (d.full_name == full_name) {
      return &d;
    }
  }
  return nullptr;
}

const Device *
ParticipantStore::deviceByDisplayName(const std::string &display_name) const {
  for (const auto &id : all_device_order_) {
    const Device &d = all_devices_.at(id);
    if (d.display_name == display_name) {
      return &d;
    }
  }
  return nullptr;
}

const DeviceOutput *ParticipantStore::deviceOutput(const std::string &device_id,
                                                   OutputType type) const {
  auto it = output_index_.find(
      std::make_pair(device_id, static_cast<std::uint32_t>(type)));
  return it == output_index_.end() ? nullptr : &outputs_[it->second];
}

bool ParticipantStore::isStreamEnabled(const std::string &stream_id) const {
  for (const auto &out : outputs_) {
    if (out.stream_id == stream_id) {
      return !out.disabled;
    }
  }
  return false;
}

std::vector<Device> ParticipantStore::currentScreenShareDevices() const {
  std::vector<Device> out;
  for (const auto &d : current_) {
    if (d.isScreenShare()) {
      out.push_back(d);
    }
  }
  return out;
}

} // namespace meetbridge
