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
#include <meetbridge/participant_store.h>

#include <algorithm>
#include <string>
#include <vector>

namespace meetbridge {
namespace test {

namespace {

RawDevice user(const std::string &id, std::uint32_t status = 1) {
  RawDevice d;
  d.device_id = id;
  d.display_name = "Name " + id;
  d.full_name = "Full Name " + id;
  d.status = status;
  return d;
}

RawDevice screenShare(const std::string &id, const std::string &parent) {
  RawDevice d = user(id);
  d.parent_device_id = parent;
  return d;
}

std::vector<std::string> ids(const std::vector<Device> &devices) {
  std::vector<std::string> out;
  for (const auto &d : devices) {
    out.push_back(d.device_id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

class RecordingDelegate : public ParticipantStoreDelegate {
public:
  void onUsersUpdated(const RosterDiff &diff) override {
    diffs.push_back(diff);
  }
  void onDeviceOutputsUpdated(const std::vector<DeviceOutput> &outputs) override {
    output_tables.push_back(outputs);
  }

  std::vector<RosterDiff> diffs;
  std::vector<std::vector<DeviceOutput>> output_tables;
};

} // namespace

class ParticipantStoreTest : public ::testing::Test {
protected:
  void SetUp() override { store_.setDelegate(&delegate_); }

  ParticipantStore store_;
  RecordingDelegate delegate_;
};

TEST_F(ParticipantStoreTest, FirstSnapshotJoinsEveryoneInMeeting) {
  const RosterDiff diff =
      store_.applyFullRoster({user("A"), user("B"), user("C", 6)});

  EXPECT_EQ(ids(diff.joined), (std::vector<std::string>{"A", "B"}));
  EXPECT_TRUE(diff.left.empty());
  EXPECT_TRUE(diff.updated.empty());
  ASSERT_EQ(delegate_.diffs.size(), 1u);
  EXPECT_EQ(ids(store_.currentDevices()), (std::vector<std::string>{"A", "B"}));
  EXPECT_NE(store_.deviceById("C"), nullptr)
      << "Every snapshot entry is remembered";
}

TEST_F(ParticipantStoreTest, DiffMatchesSetDifferenceAndChanges) {
  store_.applyFullRoster({user("A"), user("B"), user("C")});

  RawDevice renamed = user("B");
  renamed.display_name = "Bobby";
  const RosterDiff diff =
      store_.applyFullRoster({user("A"), renamed, user("D")});

  EXPECT_EQ(ids(diff.joined), (std::vector<std::string>{"D"}));
  EXPECT_EQ(ids(diff.left), (std::vector<std::string>{"C"}));
  EXPECT_EQ(ids(diff.updated), (std::vector<std::string>{"B"}));
  EXPECT_EQ(delegate_.diffs.size(), 2u);
}

TEST_F(ParticipantStoreTest, RepeatedSnapshotEmitsNothing) {
  store_.applyFullRoster({user("A"), user("B")});
  const RosterDiff diff = store_.applyFullRoster({user("A"), user("B")});

  EXPECT_TRUE(diff.empty());
  EXPECT_EQ(delegate_.diffs.size(), 1u) << "No notification for a no-op";
}

TEST_F(ParticipantStoreTest, StatusChangeOutOfMeetingIsALeave) {
  store_.applyFullRoster({user("A"), user("B")});
  const RosterDiff diff = store_.applyFullRoster({user("A"), user("B", 7)});

  EXPECT_EQ(ids(diff.left), (std::vector<std::string>{"B"}));
  ASSERT_NE(store_.deviceById("B"), nullptr);
  EXPECT_EQ(store_.deviceById("B")->status, DeviceStatus::REMOVED);
}

TEST_F(ParticipantStoreTest, ScreenSharesStayOutOfRosterEvents) {
  RosterDiff diff = store_.applyFullRoster({user("A"), screenShare("A-ss", "A")});
  EXPECT_EQ(ids(diff.joined), (std::vector<std::string>{"A"}));

  const auto shares = store_.currentScreenShareDevices();
  ASSERT_EQ(shares.size(), 1u);
  EXPECT_EQ(shares[0].device_id, "A-ss");

  diff = store_.applyFullRoster({user("A")});
  EXPECT_TRUE(diff.empty()) << "A screen share ending is not a leave";
  EXPECT_TRUE(store_.currentScreenShareDevices().empty());
  EXPECT_NE(store_.deviceById("A-ss"), nullptr);
}

TEST_F(ParticipantStoreTest, CurrentUserIsAssignedOnceAndKept) {
  RawDevice bot = user("BOT");
  bot.current_user_marker = "marker";
  store_.applyFullRoster({user("A"), bot});

  ASSERT_TRUE(store_.currentUserId().has_value());
  EXPECT_EQ(*store_.currentUserId(), "BOT");
  EXPECT_TRUE(store_.deviceById("BOT")->is_current_user);
  EXPECT_FALSE(store_.deviceById("A")->is_current_user);

  RawDevice impostor = user("X");
  impostor.current_user_marker = "marker";
  store_.applyFullRoster({user("A"), user("BOT"), impostor});

  EXPECT_EQ(*store_.currentUserId(), "BOT") << "Never reassigned";
  EXPECT_TRUE(store_.deviceById("BOT")->is_current_user);
  EXPECT_FALSE(store_.deviceById("X")->is_current_user);
}

TEST_F(ParticipantStoreTest, SingleDeviceMergesIntoCurrentRoster) {
  store_.applyFullRoster({user("A")});

  RosterDiff diff = store_.applySingleDevice(user("B"));
  EXPECT_EQ(ids(diff.joined), (std::vector<std::string>{"B"}));
  EXPECT_EQ(ids(store_.currentDevices()), (std::vector<std::string>{"A", "B"}));

  diff = store_.applySingleDevice(user("B", 6));
  EXPECT_EQ(ids(diff.left), (std::vector<std::string>{"B"}));
  EXPECT_EQ(ids(store_.currentDevices()), (std::vector<std::string>{"A"}));
}

TEST_F(ParticipantStoreTest, DeviceOutputsUpsertByKeyAndAlwaysNotify) {
  store_.applyFullRoster({user("A")});

  store_.applyDeviceOutputs({{"A", 2, "s-video", false}, {"A", 1, "s-audio", false}},
                            100);
  store_.applyDeviceOutputs({{"A", 2, "s-video-2", true}}, 200);
  store_.applyDeviceOutputs({}, 300);

  ASSERT_EQ(delegate_.output_tables.size(), 3u);
  EXPECT_EQ(delegate_.output_tables.back().size(), 2u)
      << "Notification carries the full table";

  const DeviceOutput *video = store_.deviceOutput("A", OutputType::VIDEO);
  ASSERT_NE(video, nullptr);
  EXPECT_EQ(video->stream_id, "s-video-2");
  EXPECT_TRUE(video->disabled);
  EXPECT_EQ(video->last_updated_ms, 200);

  EXPECT_EQ(store_.deviceByStreamId("s-audio"), store_.deviceById("A"));
  EXPECT_EQ(store_.deviceByStreamId("unknown"), nullptr);
  EXPECT_TRUE(store_.isStreamEnabled("s-audio"));
  EXPECT_FALSE(store_.isStreamEnabled("s-video-2"));
  EXPECT_FALSE(store_.isStreamEnabled("unknown"));
}

TEST_F(ParticipantStoreTest, NameLookupsReturnFirstMatch) {
  RawDevice first = user("A");
  first.display_name = "Sam";
  RawDevice second = user("B");
  second.display_name = "Sam";
  store_.applyFullRoster({first, second});

  ASSERT_NE(store_.deviceByDisplayName("Sam"), nullptr);
  EXPECT_EQ(store_.deviceByDisplayName("Sam")->device_id, "A");
  ASSERT_NE(store_.deviceByFullName("Full Name B"), nullptr);
  EXPECT_EQ(store_.deviceByFullName("Full Name B")->device_id, "B");
  EXPECT_EQ(store_.deviceByFullName("Nobody"), nullptr);
}

TEST_F(ParticipantStoreTest, ThreeSnapshotsJoinLeaveJoin) {
  store_.applyFullRoster({user("A"), user("B")});
  store_.applyFullRoster({user("A")});
  store_.applyFullRoster({user("A"), user("B")});

  ASSERT_EQ(delegate_.diffs.size(), 3u);
  EXPECT_EQ(ids(delegate_.diffs[0].joined),
            (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(ids(delegate_.diffs[1].left), (std::vector<std::string>{"B"}));
  EXPECT_TRUE(delegate_.diffs[1].joined.empty());
  EXPECT_EQ(ids(delegate_.diffs[2].joined), (std::vector<std::string>{"B"}));
  EXPECT_TRUE(delegate_.diffs[2].left.empty());
}

TEST_F(ParticipantStoreTest, JsonFormCarriesHumanizedStatus) {
  RawDevice share = screenShare("A-ss", "A");
  share.is_host = 1;
  store_.applyFullRoster({share});

  const nlohmann::json j = toJson(*store_.deviceById("A-ss"));
  EXPECT_EQ(j["deviceId"], "A-ss");
  EXPECT_EQ(j["status"], 1);
  EXPECT_EQ(j["humanized_status"], "in_meeting");
  EXPECT_EQ(j["parentDeviceId"], "A");
  EXPECT_EQ(j["isHost"], true);
  EXPECT_EQ(j["isCurrentUser"], false);

  EXPECT_STREQ(humanizedStatus(toDeviceStatus(42)), "unknown");
  EXPECT_STREQ(humanizedStatus(toDeviceStatus(7)), "removed_from_meeting");
}

} // namespace test
} // namespace meetbridge
