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
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>
#include <meetbridge/meet_schema.h>
#include <meetbridge/message_decoder.h>

#include "meet_collections.pb.h"
#include "meet_proto_converter.h"

namespace meetbridge {
namespace test {

class MeetSchemaTest : public ::testing::Test {
protected:
  template <typename Proto>
  DecodedMessage decode(MeetMessage type, const Proto &proto) {
    return decoder_.decode(toTypeId(type), proto.SerializeAsString());
  }

  static void fillUser(testproto::UserInfoList *user, const std::string &id,
                       const std::string &name, std::uint32_t status) {
    user->set_device_id(id);
    user->set_full_name(name + " Fullname");
    user->set_display_name(name);
    user->set_profile_picture("https://example.com/" + id + ".png");
    user->set_status(status);
  }

  SchemaRegistry registry_ = buildMeetSchemaRegistry();
  MessageDecoder decoder_{registry_};
};

TEST_F(MeetSchemaTest, RegistryHoldsEveryPlatformMessage) {
  EXPECT_EQ(registry_.size(), 17u);
  EXPECT_EQ(registry_.schema(toTypeId(MeetMessage::CollectionEvent)).name,
            "CollectionEvent");
  EXPECT_EQ(registry_.schema(toTypeId(MeetMessage::ChatMessageContent)).name,
            "ChatMessageContent");

  const auto &user = registry_.schema(toTypeId(MeetMessage::UserInfoList));
  const FieldSpec *display_name =
      user.findField(meet_fields::user_info::kDisplayName);
  ASSERT_NE(display_name, nullptr);
  EXPECT_EQ(display_name->kind, FieldKind::String);

  const auto &wrapper =
      registry_.schema(toTypeId(MeetMessage::UserInfoListWrapper));
  const FieldSpec *list =
      wrapper.findField(meet_fields::user_info_list_wrapper::kUserInfoList);
  ASSERT_NE(list, nullptr);
  EXPECT_TRUE(list->repeated);
  EXPECT_EQ(list->message_type, toTypeId(MeetMessage::UserInfoList));
}

TEST_F(MeetSchemaTest, CollectionEventCarriesOutputsChatAndDevices) {
  testproto::CollectionEvent event;
  event.set_trace_id("ignored");
  auto *body = event.mutable_body();
  body->set_revision(77);
  auto *outer = body->mutable_user_info_list_wrapper_and_chat_wrapper_wrapper();

  auto *outputs = outer->mutable_device_info_wrapper();
  auto *video = outputs->add_device_output_info_list();
  video->set_device_id("dev-1");
  video->set_device_output_type(2);
  video->set_stream_id("stream-v1");
  video->set_ssrc(1234);
  auto *audio = outputs->add_device_output_info_list();
  audio->set_device_id("dev-1");
  audio->set_device_output_type(1);
  audio->set_stream_id("stream-a1");
  audio->mutable_device_output_status()->set_disabled(1);

  auto *inner = outer->mutable_user_info_list_wrapper_and_chat_wrapper();
  auto *chat = inner->add_chat_message_wrapper()->mutable_chat_message();
  chat->set_message_id("msg-1");
  chat->set_device_id("dev-1");
  chat->set_timestamp(1700000000123);
  chat->mutable_chat_message_content()->set_text("hello");
  inner->add_chat_message_wrapper(); // wrapper with no message

  auto *users = inner->mutable_user_info_list_wrapper();
  users->mutable_user_event_info()->set_event_number(3);
  auto *user = users->add_user_info_list();
  fillUser(user, "dev-1", "Alice", 1);
  user->set_is_host(1);
  user->set_join_score(0.5);
  user->set_opaque_blob(std::string("\x00\x01\x02", 3));

  const CollectionUpdate update =
      fromCollectionEvent(decode(MeetMessage::CollectionEvent, event));

  ASSERT_TRUE(update.has_device_outputs);
  ASSERT_EQ(update.device_outputs.size(), 2u);
  EXPECT_EQ(update.device_outputs[0].device_id, "dev-1");
  EXPECT_EQ(update.device_outputs[0].output_type, 2u);
  EXPECT_EQ(update.device_outputs[0].stream_id, "stream-v1");
  EXPECT_FALSE(update.device_outputs[0].disabled);
  EXPECT_EQ(update.device_outputs[1].output_type, 1u);
  EXPECT_TRUE(update.device_outputs[1].disabled);

  ASSERT_EQ(update.chat_messages.size(), 1u)
      << "Wrappers without a message are dropped";
  EXPECT_EQ(update.chat_messages[0].message_id, "msg-1");
  EXPECT_EQ(update.chat_messages[0].timestamp_ms, 1700000000123);
  EXPECT_EQ(update.chat_messages[0].text, "hello");

  ASSERT_EQ(update.devices.size(), 1u);
  EXPECT_EQ(update.devices[0].device_id, "dev-1");
  EXPECT_EQ(update.devices[0].display_name, "Alice");
  EXPECT_EQ(update.devices[0].full_name, "Alice Fullname");
  EXPECT_EQ(update.devices[0].status, 1u);
  EXPECT_EQ(update.devices[0].is_host.value_or(0), 1u);
  EXPECT_FALSE(update.devices[0].parent_device_id.has_value());
  EXPECT_FALSE(update.devices[0].current_user_marker.has_value());
}

TEST_F(MeetSchemaTest, CollectionEventWithoutDeviceInfoHasNoOutputs) {
  testproto::CollectionEvent event;
  auto *inner = event.mutable_body()
                    ->mutable_user_info_list_wrapper_and_chat_wrapper_wrapper()
                    ->mutable_user_info_list_wrapper_and_chat_wrapper();
  fillUser(inner->mutable_user_info_list_wrapper()->add_user_info_list(),
           "dev-2", "Bob", 6);

  const CollectionUpdate update =
      fromCollectionEvent(decode(MeetMessage::CollectionEvent, event));

  EXPECT_FALSE(update.has_device_outputs);
  EXPECT_TRUE(update.chat_messages.empty());
  ASSERT_EQ(update.devices.size(), 1u);
  EXPECT_EQ(update.devices[0].status, 6u);
}

TEST_F(MeetSchemaTest, UserInfoListResponseYieldsRoster) {
  testproto::UserInfoListResponse response;
  response.set_sync_token("opaque");
  auto *list = response.mutable_user_info_list_wrapper_wrapper()
                   ->mutable_user_info_list_wrapper();
  fillUser(list->add_user_info_list(), "dev-1", "Alice", 1);
  auto *bot = list->add_user_info_list();
  fillUser(bot, "dev-bot", "Recorder", 1);
  bot->set_is_current_user_string("self");
  auto *share = list->add_user_info_list();
  fillUser(share, "dev-1-ss", "Alice (presentation)", 1);
  share->set_parent_device_id("dev-1");

  const auto roster = fromUserInfoListResponse(
      decode(MeetMessage::UserInfoListResponse, response));

  ASSERT_EQ(roster.size(), 3u);
  EXPECT_EQ(roster[0].device_id, "dev-1");
  EXPECT_EQ(roster[1].current_user_marker.value_or(""), "self");
  EXPECT_EQ(roster[2].parent_device_id.value_or(""), "dev-1");
}

TEST_F(MeetSchemaTest, EmptyUserInfoListResponseYieldsEmptyRoster) {
  testproto::UserInfoListResponse response;
  response.set_sync_token("nothing");
  EXPECT_TRUE(fromUserInfoListResponse(
                  decode(MeetMessage::UserInfoListResponse, response))
                  .empty());
}

TEST_F(MeetSchemaTest, CaptionWrapperYieldsCaptionRecord) {
  testproto::CaptionWrapper wrapper;
  auto *caption = wrapper.mutable_caption();
  caption->set_device_id("dev-1");
  caption->set_caption_id(12);
  caption->set_version(3);
  caption->set_is_final(1);
  caption->set_text("good morning");
  caption->set_language_id(1);

  const auto record =
      fromCaptionWrapper(decode(MeetMessage::CaptionWrapper, wrapper));

  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->caption_id, 12);
  EXPECT_EQ(record->device_id, "dev-1");
  EXPECT_EQ(record->version, 3);
  EXPECT_TRUE(record->is_final);
  EXPECT_EQ(record->text, "good morning");
  EXPECT_EQ(record->language_id, 1);

  testproto::CaptionWrapper empty;
  EXPECT_FALSE(
      fromCaptionWrapper(decode(MeetMessage::CaptionWrapper, empty)).has_value());
}

} // namespace test
} // namespace meetbridge
