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

#include "meetbridge/media_channel.h"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace meetbridge {

namespace {

const char *typeName(MessageType type) {
  switch (type) {
  case MessageType::JSON:
    return "JSON";
  case MessageType::VIDEO:
    return "VIDEO";
  case MessageType::AUDIO:
    return "AUDIO";
  case MessageType::ENCODED_MEDIA_CHUNK:
    return "ENCODED_MEDIA_CHUNK";
  case MessageType::PER_PARTICIPANT_AUDIO:
    return "PER_PARTICIPANT_AUDIO";
  }
  return "UNKNOWN";
}

} // namespace

MediaChannel::MediaChannel(boost::asio::io_context &io, Transport &transport,
                           std::chrono::milliseconds disable_grace)
    : transport_(transport), grace_timer_(io), disable_grace_(disable_grace),
      generation_(std::make_shared<Generation>()) {}

MediaChannel::~MediaChannel() { shutdown(); }

void MediaChannel::enableMediaSending() {
  if (state_ == MediaSendingState::Enabled) {
    return;
  }
  if (state_ == MediaSendingState::Disabling) {
    std::cout << "[MediaChannel] re-enabled during grace delay" << std::endl;
    ++generation_->value;
    grace_timer_.cancel();
  }
  state_ = MediaSendingState::Enabled;
  std::cout << "[MediaChannel] media sending enabled" << std::endl;
  if (delegate_) {
    delegate_->onMediaSendingEnabled();
  }
}

void MediaChannel::disableMediaSending() {
  if (state_ != MediaSendingState::Enabled) {
    return;
  }
  state_ = MediaSendingState::Disabling;
  if (delegate_) {
    delegate_->onMediaSendingDisabling();
  }

  const std::uint64_t generation = ++generation_->value;
  auto state = generation_;
  grace_timer_.expires_after(disable_grace_);
  grace_timer_.async_wait(
      [this, state, generation](const boost::system::error_code &ec) {
        if (ec || state->value != generation) {
          return;
        }
        state_ = MediaSendingState::Disabled;
        std::cout << "[MediaChannel] media sending disabled" << std::endl;
        if (delegate_) {
          delegate_->onMediaSendingDisabled();
        }
      });
}

void MediaChannel::shutdown() {
  ++generation_->value;
  grace_timer_.cancel();
}

bool MediaChannel::send(const WireMessage &message) {
  const MessageType type = messageTypeOf(message);
  if (isMediaMessage(type) && !mediaSendingEnabled()) {
    ++stats_.gated;
    return false;
  }
  return write(type, encodeWireMessage(message));
}

bool MediaChannel::sendJson(const ControlMessage &message) {
  // Platform text is not validated upstream; invalid UTF-8 becomes U+FFFD.
  wire::Json json;
  json.text = toJson(message).dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace);
  return send(WireMessage(std::move(json)));
}

bool MediaChannel::sendCaptionUpdate(const CaptionRecord &caption) {
  if (!mediaSendingEnabled()) {
    return false;
  }
  return sendJson(control::CaptionUpdate{caption});
}

bool MediaChannel::write(MessageType type,
                         const std::vector<std::uint8_t> &bytes) {
  if (!transport_.isOpen()) {
    ++stats_.not_ready;
    std::cerr << "[MediaChannel] transport not open, dropping "
              << typeName(type) << " message" << std::endl;
    return false;
  }
  try {
    transport_.send(bytes);
  } catch (const std::runtime_error &e) {
    ++stats_.failed;
    std::cerr << "[MediaChannel] error sending " << typeName(type)
              << " message: " << e.what() << std::endl;
    return false;
  }
  ++stats_.sent;
  return true;
}

void MediaChannel::handleInbound(const std::uint8_t *data, std::size_t size) {
  std::optional<WireMessage> message;
  try {
    message = decodeWireMessage(data, size);
  } catch (const std::invalid_argument &e) {
    std::cerr << "[MediaChannel] malformed inbound message: " << e.what()
              << std::endl;
    return;
  }
  if (!message) {
    return;
  }

  const auto *json = std::get_if<wire::Json>(&*message);
  if (json == nullptr) {
    return;
  }
  try {
    auto parsed = nlohmann::json::parse(json->text);
    std::cout << "[MediaChannel] received JSON message: "
              << parsed.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace)
              << std::endl;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[MediaChannel] invalid inbound JSON: " << e.what()
              << std::endl;
  }
}

} // namespace meetbridge
