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

#include <optional>
#include <vector>

#include "meetbridge/control_message.h"
#include "meetbridge/device.h"
#include "meetbridge/message_decoder.h"

namespace meetbridge {

/// Everything one collections-channel event can carry.
struct CollectionUpdate {
  bool has_device_outputs = false;
  std::vector<RawDeviceOutput> device_outputs;
  std::vector<ChatMessageRecord> chat_messages;
  // Usually a single device joining or leaving.
  std::vector<RawDevice> devices;
};

// --------- record conversions ---------

RawDevice toRawDevice(const DecodedMessage &user_info);
RawDeviceOutput toRawDeviceOutput(const DecodedMessage &output_info);
CaptionRecord toCaptionRecord(const DecodedMessage &caption);
/// nullopt when the wrapper holds no chat message.
std::optional<ChatMessageRecord>
toChatMessageRecord(const DecodedMessage &chat_message_wrapper);

// --------- top-level messages ---------

CollectionUpdate fromCollectionEvent(const DecodedMessage &event);
std::vector<RawDevice>
fromUserInfoListResponse(const DecodedMessage &response);
std::optional<CaptionRecord> fromCaptionWrapper(const DecodedMessage &wrapper);

} // namespace meetbridge
