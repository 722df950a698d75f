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

#include "meetbridge/message_schema.h"

namespace meetbridge {

/// Message types of the conferencing platform. The enumerator value is the
/// MessageTypeId inside buildMeetSchemaRegistry().
enum class MeetMessage : MessageTypeId {
  CollectionEvent = 0,
  CollectionEventBody,
  UserInfoListWrapperAndChatWrapperWrapper,
  UserInfoListWrapperAndChatWrapper,
  DeviceInfoWrapper,
  DeviceOutputInfoList,
  DeviceOutputStatus,
  UserInfoListResponse,
  UserInfoListWrapperWrapper,
  UserEventInfo,
  UserInfoListWrapper,
  UserInfoList,
  CaptionWrapper,
  Caption,
  ChatMessageWrapper,
  ChatMessage,
  ChatMessageContent,
};

inline constexpr MessageTypeId toTypeId(MeetMessage m) {
  return static_cast<MessageTypeId>(m);
}

// Field numbers, grouped by message.
namespace meet_fields {

namespace collection_event {
constexpr std::uint32_t kBody = 1;
}
namespace collection_event_body {
constexpr std::uint32_t kUserInfoListWrapperAndChatWrapperWrapper = 2;
}
namespace user_info_and_chat_wrapper_wrapper {
constexpr std::uint32_t kDeviceInfoWrapper = 3;
constexpr std::uint32_t kUserInfoListWrapperAndChatWrapper = 13;
} // namespace user_info_and_chat_wrapper_wrapper
namespace user_info_and_chat_wrapper {
constexpr std::uint32_t kUserInfoListWrapper = 1;
constexpr std::uint32_t kChatMessageWrapper = 4;
} // namespace user_info_and_chat_wrapper
namespace device_info_wrapper {
constexpr std::uint32_t kDeviceOutputInfoList = 2;
}
namespace device_output_info {
constexpr std::uint32_t kDeviceOutputType = 2;
constexpr std::uint32_t kStreamId = 4;
constexpr std::uint32_t kDeviceId = 6;
constexpr std::uint32_t kDeviceOutputStatus = 10;
} // namespace device_output_info
namespace device_output_status {
constexpr std::uint32_t kDisabled = 1;
}
namespace user_info_list_response {
constexpr std::uint32_t kUserInfoListWrapperWrapper = 2;
}
namespace user_info_list_wrapper_wrapper {
constexpr std::uint32_t kUserInfoListWrapper = 2;
}
namespace user_event_info {
constexpr std::uint32_t kEventNumber = 1;
}
namespace user_info_list_wrapper {
constexpr std::uint32_t kUserEventInfo = 1;
constexpr std::uint32_t kUserInfoList = 2;
} // namespace user_info_list_wrapper
namespace user_info {
constexpr std::uint32_t kDeviceId = 1;
constexpr std::uint32_t kFullName = 2;
constexpr std::uint32_t kProfilePicture = 3;
constexpr std::uint32_t kStatus = 4;
// Present only on the bot's own entry; the value is an opaque token.
constexpr std::uint32_t kIsCurrentUserString = 7;
// Present only on screen-share pseudo-devices; names the sharer.
constexpr std::uint32_t kParentDeviceId = 21;
constexpr std::uint32_t kDisplayName = 29;
constexpr std::uint32_t kIsHost = 34;
} // namespace user_info
namespace caption_wrapper {
constexpr std::uint32_t kCaption = 1;
}
namespace caption {
constexpr std::uint32_t kDeviceId = 1;
constexpr std::uint32_t kCaptionId = 2;
constexpr std::uint32_t kVersion = 3;
constexpr std::uint32_t kIsFinal = 4;
constexpr std::uint32_t kText = 6;
constexpr std::uint32_t kLanguageId = 8;
} // namespace caption
namespace chat_message_wrapper {
constexpr std::uint32_t kChatMessage = 2;
}
namespace chat_message {
constexpr std::uint32_t kMessageId = 1;
constexpr std::uint32_t kDeviceId = 2;
constexpr std::uint32_t kTimestamp = 3;
constexpr std::uint32_t kChatMessageContent = 5;
} // namespace chat_message
namespace chat_message_content {
constexpr std::uint32_t kText = 1;
}

} // namespace meet_fields

/// Build a validated registry holding every MeetMessage schema. The owner
/// keeps it alive for as long as any MessageDecoder refers to it.
SchemaRegistry buildMeetSchemaRegistry();

} // namespace meetbridge
