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
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace meetbridge {

/// 4-byte little-endian tag that starts every message on the outbound
/// channel.
enum class MessageType : std::int32_t {
  JSON = 1,
  VIDEO = 2,
  AUDIO = 3,
  ENCODED_MEDIA_CHUNK = 4,
  PER_PARTICIPANT_AUDIO = 5,
};

constexpr std::size_t kMaxParticipantIdBytes = 255;

namespace wire {

struct Json {
  std::string text;
};

/// Layout: int64 timestamp_us | int32 stream-id length | stream id |
/// int32 width | int32 height | planar frame bytes.
struct Video {
  std::int64_t timestamp_us = 0;
  std::string stream_id;
  std::int32_t width = 0;
  std::int32_t height = 0;
  std::vector<std::uint8_t> frame;
};

/// Mono float32 PCM of the meeting mix.
struct MixedAudio {
  std::vector<float> samples;
};

/// Opaque container bytes.
struct EncodedMediaChunk {
  std::vector<std::uint8_t> data;
};

/// Layout: uint8 id length | id bytes | mono float32 PCM.
struct PerParticipantAudio {
  std::string participant_id;
  std::vector<float> samples;
};

} // namespace wire

using WireMessage =
    std::variant<wire::Json, wire::Video, wire::MixedAudio,
                 wire::EncodedMediaChunk, wire::PerParticipantAudio>;

MessageType messageTypeOf(const WireMessage &message);

/// True for the media kinds that are gated by the media-sending state.
bool isMediaMessage(MessageType type);

/**
 * Frame a message for the channel.
 *
 * @throws std::invalid_argument if a participant id is longer than
 *         kMaxParticipantIdBytes.
 */
std::vector<std::uint8_t> encodeWireMessage(const WireMessage &message);

/**
 * Parse one channel message.
 *
 * @return std::nullopt for messages shorter than the tag or with an
 *         unknown tag.
 * @throws std::invalid_argument when a known tag has a malformed body.
 */
std::optional<WireMessage> decodeWireMessage(const std::uint8_t *data,
                                             std::size_t size);
std::optional<WireMessage>
decodeWireMessage(const std::vector<std::uint8_t> &bytes);

} // namespace meetbridge
