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

#include "meet_proto_converter.h"

#include "meetbridge/meet_schema.h"

namespace meetbridge {

namespace f = meet_fields;

namespace {

std::vector<RawDevice> devicesFromWrapper(const DecodedMessage *wrapper) {
  std::vector<RawDevice> out;
  if (wrapper == nullptr) {
    return out;
  }
  for (const auto *user :
       wrapper->getMessages(f::user_info_list_wrapper::kUserInfoList)) {
    out.push_back(toRawDevice(*user));
  }
  return out;
}

} // namespace

RawDevice toRawDevice(const DecodedMessage &m) {
  RawDevice d;
  d.device_id = m.getString(f::user_info::kDeviceId).value_or("");
  d.full_name = m.getString(f::user_info::kFullName).value_or("");
  d.display_name = m.getString(f::user_info::kDisplayName).value_or("");
  d.profile_picture = m.getString(f::user_info::kProfilePicture).value_or("");
  d.status = m.getVarint(f::user_info::kStatus).value_or(0);
  d.current_user_marker = m.getString(f::user_info::kIsCurrentUserString);
  d.parent_device_id = m.getString(f::user_info::kParentDeviceId);
  d.is_host = m.getVarint(f::user_info::kIsHost);
  return d;
}

RawDeviceOutput toRawDeviceOutput(const DecodedMessage &m) {
  RawDeviceOutput out;
  out.device_id = m.getString(f::device_output_info::kDeviceId).value_or("");
  out.output_type =
      m.getVarint(f::device_output_info::kDeviceOutputType).value_or(0);
  out.stream_id = m.getString(f::device_output_info::kStreamId).value_or("");
  if (const auto *status =
          m.getMessage(f::device_output_info::kDeviceOutputStatus)) {
    out.disabled =
        status->getVarint(f::device_output_status::kDisabled).value_or(0) != 0;
  }
  return out;
}

CaptionRecord toCaptionRecord(const DecodedMessage &m) {
  CaptionRecord c;
  c.caption_id = m.getInt64(f::caption::kCaptionId).value_or(0);
  c.device_id = m.getString(f::caption::kDeviceId).value_or("");
  c.version = m.getInt64(f::caption::kVersion).value_or(0);
  c.is_final = m.getVarint(f::caption::kIsFinal).value_or(0) != 0;
  c.text = m.getString(f::caption::kText).value_or("");
  c.language_id = m.getInt64(f::caption::kLanguageId).value_or(0);
  return c;
}

std::optional<ChatMessageRecord>
toChatMessageRecord(const DecodedMessage &wrapper) {
  const auto *m = wrapper.getMessage(f::chat_message_wrapper::kChatMessage);
  if (m == nullptr) {
    return std::nullopt;
  }
  ChatMessageRecord r;
  r.message_id = m->getString(f::chat_message::kMessageId).value_or("");
  r.device_id = m->getString(f::chat_message::kDeviceId).value_or("");
  r.timestamp_ms = m->getInt64(f::chat_message::kTimestamp).value_or(0);
  if (const auto *content =
          m->getMessage(f::chat_message::kChatMessageContent)) {
    r.text = content->getString(f::chat_message_content::kText).value_or("");
  }
  return r;
}

CollectionUpdate fromCollectionEvent(const DecodedMessage &event) {
  CollectionUpdate update;

  const auto *body = event.getMessage(f::collection_event::kBody);
  if (body == nullptr) {
    return update;
  }
  const auto *wrapper = body->getMessage(
      f::collection_event_body::kUserInfoListWrapperAndChatWrapperWrapper);
  if (wrapper == nullptr) {
    return update;
  }

  if (const auto *device_info = wrapper->getMessage(
          f::user_info_and_chat_wrapper_wrapper::kDeviceInfoWrapper)) {
    if (device_info->has(f::device_info_wrapper::kDeviceOutputInfoList)) {
      update.has_device_outputs = true;
      for (const auto *output : device_info->getMessages(
               f::device_info_wrapper::kDeviceOutputInfoList)) {
        update.device_outputs.push_back(toRawDeviceOutput(*output));
      }
    }
  }

  if (const auto *inner = wrapper->getMessage(
          f::user_info_and_chat_wrapper_wrapper::
              kUserInfoListWrapperAndChatWrapper)) {
    for (const auto *chat : inner->getMessages(
             f::user_info_and_chat_wrapper::kChatMessageWrapper)) {
      if (auto record = toChatMessageRecord(*chat)) {
        update.chat_messages.push_back(std::move(*record));
      }
    }
    update.devices = devicesFromWrapper(inner->getMessage(
        f::user_info_and_chat_wrapper::kUserInfoListWrapper));
  }

  return update;
}

std::vector<RawDevice> fromUserInfoListResponse(const DecodedMessage &response) {
  const auto *ww = response.getMessage(
      f::user_info_list_response::kUserInfoListWrapperWrapper);
  if (ww == nullptr) {
    return {};
  }
  return devicesFromWrapper(
      ww->getMessage(f::user_info_list_wrapper_wrapper::kUserInfoListWrapper));
}

std::optional<CaptionRecord> fromCaptionWrapper(const DecodedMessage &wrapper) {
  const auto *caption = wrapper.getMessage(f::caption_wrapper::kCaption);
  if (caption == nullptr) {
    return std::nullopt;
  }
  return toCaptionRecord(*caption);
}

} // namespace meetbridge
