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

#include "meetbridge/meet_schema.h"

#include <stdexcept>

namespace meetbridge {

namespace {

FieldSpec str(const char *name, std::uint32_t number) {
  return FieldSpec{name, number, FieldKind::String, false, 0};
}

FieldSpec varint(const char *name, std::uint32_t number) {
  return FieldSpec{name, number, FieldKind::Varint, false, 0};
}

FieldSpec int64(const char *name, std::uint32_t number) {
  return FieldSpec{name, number, FieldKind::Int64, false, 0};
}

FieldSpec msg(const char *name, std::uint32_t number, MeetMessage type,
              bool repeated = false) {
  return FieldSpec{name, number, FieldKind::Message, repeated,
                   toTypeId(type)};
}

const char *messageName(MeetMessage m) {
  switch (m) {
  case MeetMessage::CollectionEvent:
    return "CollectionEvent";
  case MeetMessage::CollectionEventBody:
    return "CollectionEventBody";
  case MeetMessage::UserInfoListWrapperAndChatWrapperWrapper:
    return "UserInfoListWrapperAndChatWrapperWrapper";
  case MeetMessage::UserInfoListWrapperAndChatWrapper:
    return "UserInfoListWrapperAndChatWrapper";
  case MeetMessage::DeviceInfoWrapper:
    return "DeviceInfoWrapper";
  case MeetMessage::DeviceOutputInfoList:
    return "DeviceOutputInfoList";
  case MeetMessage::DeviceOutputStatus:
    return "DeviceOutputStatus";
  case MeetMessage::UserInfoListResponse:
    return "UserInfoListResponse";
  case MeetMessage::UserInfoListWrapperWrapper:
    return "UserInfoListWrapperWrapper";
  case MeetMessage::UserEventInfo:
    return "UserEventInfo";
  case MeetMessage::UserInfoListWrapper:
    return "UserInfoListWrapper";
  case MeetMessage::UserInfoList:
    return "UserInfoList";
  case MeetMessage::CaptionWrapper:
    return "CaptionWrapper";
  case MeetMessage::Caption:
    return "Caption";
  case MeetMessage::ChatMessageWrapper:
    return "ChatMessageWrapper";
  case MeetMessage::ChatMessage:
    return "ChatMessage";
  case MeetMessage::ChatMessageContent:
    return "ChatMessageContent";
  }
  return "Unknown";
}

constexpr MessageTypeId kMessageCount =
    toTypeId(MeetMessage::ChatMessageContent) + 1;

} // namespace

SchemaRegistry buildMeetSchemaRegistry() {
  namespace f = meet_fields;
  using M = MeetMessage;

  SchemaRegistry reg;
  for (MessageTypeId id = 0; id < kMessageCount; ++id) {
    if (reg.declare(messageName(static_cast<M>(id))) != id) {
      throw std::logic_error("meet schema ids out of order");
    }
  }

  auto define = [&reg](M m, std::vector<FieldSpec> fields) {
    reg.define(toTypeId(m), std::move(fields));
  };

  define(M::CollectionEvent,
         {msg("body", f::collection_event::kBody, M::CollectionEventBody)});
  define(M::CollectionEventBody,
         {msg("userInfoListWrapperAndChatWrapperWrapper",
              f::collection_event_body::
                  kUserInfoListWrapperAndChatWrapperWrapper,
              M::UserInfoListWrapperAndChatWrapperWrapper)});
  define(M::UserInfoListWrapperAndChatWrapperWrapper,
         {msg("deviceInfoWrapper",
              f::user_info_and_chat_wrapper_wrapper::kDeviceInfoWrapper,
              M::DeviceInfoWrapper),
          msg("userInfoListWrapperAndChatWrapper",
              f::user_info_and_chat_wrapper_wrapper::
                  kUserInfoListWrapperAndChatWrapper,
              M::UserInfoListWrapperAndChatWrapper)});
  define(M::UserInfoListWrapperAndChatWrapper,
         {msg("userInfoListWrapper",
              f::user_info_and_chat_wrapper::kUserInfoListWrapper,
              M::UserInfoListWrapper),
          msg("chatMessageWrapper",
              f::user_info_and_chat_wrapper::kChatMessageWrapper,
              M::ChatMessageWrapper, true)});
  define(M::DeviceInfoWrapper,
         {msg("deviceOutputInfoList",
              f::device_info_wrapper::kDeviceOutputInfoList,
              M::DeviceOutputInfoList, true)});
  define(M::DeviceOutputInfoList,
         {varint("deviceOutputType", f::device_output_info::kDeviceOutputType),
          str("streamId", f::device_output_info::kStreamId),
          str("deviceId", f::device_output_info::kDeviceId),
          msg("deviceOutputStatus", f::device_output_info::kDeviceOutputStatus,
              M::DeviceOutputStatus)});
  define(M::DeviceOutputStatus,
         {varint("disabled", f::device_output_status::kDisabled)});
  define(M::UserInfoListResponse,
         {msg("userInfoListWrapperWrapper",
              f::user_info_list_response::kUserInfoListWrapperWrapper,
              M::UserInfoListWrapperWrapper)});
  define(M::UserInfoListWrapperWrapper,
         {msg("userInfoListWrapper",
              f::user_info_list_wrapper_wrapper::kUserInfoListWrapper,
              M::UserInfoListWrapper)});
  define(M::UserEventInfo,
         {varint("eventNumber", f::user_event_info::kEventNumber)});
  define(M::UserInfoListWrapper,
         {msg("userEventInfo", f::user_info_list_wrapper::kUserEventInfo,
              M::UserEventInfo),
          msg("userInfoList", f::user_info_list_wrapper::kUserInfoList,
              M::UserInfoList, true)});
  define(M::UserInfoList,
         {str("deviceId", f::user_info::kDeviceId),
          str("fullName", f::user_info::kFullName),
          str("profilePicture", f::user_info::kProfilePicture),
          varint("status", f::user_info::kStatus),
          str("isCurrentUserString", f::user_info::kIsCurrentUserString),
          str("displayName", f::user_info::kDisplayName),
          str("parentDeviceId", f::user_info::kParentDeviceId),
          varint("isHost", f::user_info::kIsHost)});
  define(M::CaptionWrapper,
         {msg("caption", f::caption_wrapper::kCaption, M::Caption)});
  define(M::Caption, {str("deviceId", f::caption::kDeviceId),
                      int64("captionId", f::caption::kCaptionId),
                      int64("version", f::caption::kVersion),
                      varint("isFinal", f::caption::kIsFinal),
                      str("text", f::caption::kText),
                      int64("languageId", f::caption::kLanguageId)});
  define(M::ChatMessageWrapper,
         {msg("chatMessage", f::chat_message_wrapper::kChatMessage,
              M::ChatMessage)});
  define(M::ChatMessage,
         {str("messageId", f::chat_message::kMessageId),
          str("deviceId", f::chat_message::kDeviceId),
          int64("timestamp", f::chat_message::kTimestamp),
          msg("chatMessageContent", f::chat_message::kChatMessageContent,
              M::ChatMessageContent)});
  define(M::ChatMessageContent,
         {str("text", f::chat_message_content::kText)});

  reg.validate();
  return reg;
}

} // namespace meetbridge
