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

#include "common/test_common.h"

namespace meetbridge {
namespace test {

namespace {

class CountingDelegate : public MediaChannelDelegate {
public:
  void onMediaSendingEnabled() override { ++enabled; }
  void onMediaSendingDisabling() override { ++disabling; }
  void onMediaSendingDisabled() override { ++disabled; }

  int enabled = 0;
  int disabling = 0;
  int disabled = 0;
};

WireMessage videoMessage() {
  wire::Video video;
  video.stream_id = "s";
  video.width = 2;
  video.height = 2;
  video.frame.assign(6, 0);
  return WireMessage(std::move(video));
}

} // namespace

class MediaChannelTest : public ::testing::Test {
protected:
  void SetUp() override { channel_.setDelegate(&delegate_); }

  boost::asio::io_context io_;
  FakeTransport transport_;
  MediaChannel channel_{io_, transport_, 50ms};
  CountingDelegate delegate_;
};

TEST_F(MediaChannelTest, StartsDisabledAndGatesMedia) {
  EXPECT_EQ(channel_.state(), MediaSendingState::Disabled);

  EXPECT_FALSE(channel_.send(videoMessage()));
  EXPECT_FALSE(channel_.send(WireMessage(wire::MixedAudio{{0.1f}})));
  EXPECT_FALSE(channel_.send(
      WireMessage(wire::PerParticipantAudio{"dev", {0.1f}})));
  EXPECT_FALSE(channel_.send(WireMessage(wire::EncodedMediaChunk{{1}})));

  EXPECT_TRUE(transport_.sent.empty()) << "Gated media is dropped silently";
  EXPECT_EQ(channel_.stats().gated, 4u);
}

TEST_F(MediaChannelTest, JsonIsNeverGated) {
  EXPECT_TRUE(channel_.sendJson(control::Error{"still delivered"}));

  const auto json = transport_.jsonOfType("Error");
  ASSERT_EQ(json.size(), 1u);
  EXPECT_EQ(json[0]["message"], "still delivered");
}

TEST_F(MediaChannelTest, EnabledChannelSendsInCallOrder) {
  channel_.enableMediaSending();
  EXPECT_EQ(delegate_.enabled, 1);

  channel_.sendJson(control::UiInteraction{"first"});
  channel_.send(videoMessage());
  channel_.send(WireMessage(wire::MixedAudio{{0.1f}}));

  ASSERT_EQ(transport_.sent.size(), 3u);
  EXPECT_EQ(transport_.sent[0][0], 1);
  EXPECT_EQ(transport_.sent[1][0], 2);
  EXPECT_EQ(transport_.sent[2][0], 3);
  EXPECT_EQ(channel_.stats().sent, 3u);
}

TEST_F(MediaChannelTest, DisableWaitsOutGraceDelay) {
  channel_.enableMediaSending();
  channel_.disableMediaSending();

  EXPECT_EQ(channel_.state(), MediaSendingState::Disabling);
  EXPECT_EQ(delegate_.disabling, 1);
  EXPECT_TRUE(channel_.send(videoMessage())) << "Media flows during grace";

  ASSERT_TRUE(runUntil(io_, [&] { return delegate_.disabled == 1; }));
  EXPECT_EQ(channel_.state(), MediaSendingState::Disabled);
  EXPECT_FALSE(channel_.send(videoMessage()));
}

TEST_F(MediaChannelTest, ReenableDuringGraceCancelsDisable) {
  channel_.enableMediaSending();
  channel_.disableMediaSending();
  channel_.enableMediaSending();

  io_.run_for(150ms);

  EXPECT_EQ(channel_.state(), MediaSendingState::Enabled);
  EXPECT_EQ(delegate_.disabled, 0);
  EXPECT_EQ(delegate_.enabled, 2);
}

TEST_F(MediaChannelTest, CaptionsOnlyWhileEnabled) {
  CaptionRecord caption;
  caption.caption_id = 1;
  caption.text = "hi";

  EXPECT_FALSE(channel_.sendCaptionUpdate(caption));
  channel_.enableMediaSending();
  EXPECT_TRUE(channel_.sendCaptionUpdate(caption));

  EXPECT_EQ(transport_.jsonOfType("CaptionUpdate").size(), 1u);
}

TEST_F(MediaChannelTest, ClosedTransportDropsAndCounts) {
  transport_.open = false;
  channel_.enableMediaSending();

  EXPECT_FALSE(channel_.sendJson(control::Error{"lost"}));
  EXPECT_FALSE(channel_.send(videoMessage()));

  EXPECT_EQ(channel_.stats().not_ready, 2u);
  EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(MediaChannelTest, TransportFailureIsCountedNotThrown) {
  transport_.throw_on_send = true;

  EXPECT_NO_THROW(channel_.sendJson(control::Error{"x"}));
  EXPECT_EQ(channel_.stats().failed, 1u);
}

TEST_F(MediaChannelTest, InboundMessagesNeverThrow) {
  const auto json = encodeWireMessage(WireMessage(wire::Json{"{\"ok\":true}"}));
  EXPECT_NO_THROW(channel_.handleInbound(json.data(), json.size()));

  const auto bad_json = encodeWireMessage(WireMessage(wire::Json{"{nope"}));
  EXPECT_NO_THROW(channel_.handleInbound(bad_json.data(), bad_json.size()));

  const std::vector<std::uint8_t> tiny = {1};
  EXPECT_NO_THROW(channel_.handleInbound(tiny.data(), tiny.size()));

  const std::vector<std::uint8_t> truncated = {2, 0, 0, 0, 9};
  EXPECT_NO_THROW(channel_.handleInbound(truncated.data(), truncated.size()));

  EXPECT_TRUE(transport_.sent.empty());
}

} // namespace test
} // namespace meetbridge
