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

#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "meetbridge/control_message.h"
#include "meetbridge/transport.h"
#include "meetbridge/wire_message.h"

namespace meetbridge {

enum class MediaSendingState {
  Disabled,
  Enabled,
  /// Restore hook has run; waiting out the grace delay. Media still flows.
  Disabling,
};

/**
 * Hooks for the media-sending state machine. Default no-ops.
 */
class MediaChannelDelegate {
public:
  virtual ~MediaChannelDelegate() = default;

  /// Entered Enabled; start auxiliary work.
  virtual void onMediaSendingEnabled() {}
  /// Leaving Enabled; the grace delay starts after this returns.
  virtual void onMediaSendingDisabling() {}
  /// Grace delay elapsed; media is now gated.
  virtual void onMediaSendingDisabled() {}
};

/// Counters kept by MediaChannel.
struct MediaChannelStats {
  std::uint64_t sent = 0;
  /// Media dropped because sending was disabled.
  std::uint64_t gated = 0;
  /// Dropped because the transport was not open.
  std::uint64_t not_ready = 0;
  /// Transport threw while writing.
  std::uint64_t failed = 0;
};

/**
 * The single outbound channel: frames every WireMessage and writes it to
 * the Transport in call order.
 *
 * JSON is never gated. VIDEO, AUDIO, PER_PARTICIPANT_AUDIO and
 * ENCODED_MEDIA_CHUNK are silently dropped unless media sending is enabled
 * (or still inside the disable grace delay).
 */
class MediaChannel {
public:
  MediaChannel(boost::asio::io_context &io, Transport &transport,
               std::chrono::milliseconds disable_grace =
                   std::chrono::milliseconds(2000));
  ~MediaChannel();

  MediaChannel(const MediaChannel &) = delete;
  MediaChannel &operator=(const MediaChannel &) = delete;

  /// Not owned; may be nullptr.
  void setDelegate(MediaChannelDelegate *delegate) noexcept {
    delegate_ = delegate;
  }

  void enableMediaSending();
  void disableMediaSending();

  MediaSendingState state() const noexcept { return state_; }
  bool mediaSendingEnabled() const noexcept {
    return state_ != MediaSendingState::Disabled;
  }

  /**
   * Frame and send. Returns true when the bytes reached the transport.
   *
   * @throws std::invalid_argument if the message cannot be framed.
   */
  bool send(const WireMessage &message);

  bool sendJson(const ControlMessage &message);

  /// Captions are only forwarded while media sending is enabled.
  bool sendCaptionUpdate(const CaptionRecord &caption);

  /**
   * Handle a message the backend sent us. JSON is parsed and logged;
   * anything else is ignored.
   */
  void handleInbound(const std::uint8_t *data, std::size_t size);

  const MediaChannelStats &stats() const noexcept { return stats_; }

  /// Cancel a pending disable without touching the state.
  void shutdown();

private:
  bool write(MessageType type, const std::vector<std::uint8_t> &bytes);

  struct Generation {
    std::uint64_t value = 0;
  };

  Transport &transport_;
  boost::asio::steady_timer grace_timer_;
  std::chrono::milliseconds disable_grace_;
  MediaChannelDelegate *delegate_ = nullptr;
  MediaSendingState state_ = MediaSendingState::Disabled;
  MediaChannelStats stats_;
  std::shared_ptr<Generation> generation_;
};

} // namespace meetbridge
