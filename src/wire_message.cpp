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

#include "meetbridge/wire_message.h"

#include <cstring>
#include <limits>
#include <stdexcept>

namespace meetbridge {

namespace {

constexpr std::size_t kTagBytes = 4;

void putU32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
}

void putI32(std::vector<std::uint8_t> &out, std::int32_t v) {
  putU32(out, static_cast<std::uint32_t>(v));
}

void putI64(std::vector<std::uint8_t> &out, std::int64_t v) {
  const auto u = static_cast<std::uint64_t>(v);
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<std::uint8_t>(u >> (8 * i)));
  }
}

void putFloats(std::vector<std::uint8_t> &out, const std::vector<float> &v) {
  out.reserve(out.size() + v.size() * sizeof(float));
  for (float f : v) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &f, sizeof(bits));
    putU32(out, bits);
  }
}

class Reader {
public:
  Reader(const std::uint8_t *data, std::size_t size)
      : data_(data), size_(size) {}

  std::size_t remaining() const { return size_ - pos_; }

  std::uint32_t u32() {
    need(4);
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      v |= static_cast<std::uint32_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 4;
    return v;
  }

  std::int32_t i32() { return static_cast<std::int32_t>(u32()); }

  std::int64_t i64() {
    need(8);
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
      v |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 8;
    return static_cast<std::int64_t>(v);
  }

  std::uint8_t u8() {
    need(1);
    return data_[pos_++];
  }

  std::string str(std::size_t n) {
    need(n);
    std::string s(reinterpret_cast<const char *>(data_ + pos_), n);
    pos_ += n;
    return s;
  }

  std::vector<std::uint8_t> rest() {
    std::vector<std::uint8_t> v(data_ + pos_, data_ + size_);
    pos_ = size_;
    return v;
  }

  std::vector<float> floats() {
    if (remaining() % sizeof(float) != 0) {
      throw std::invalid_argument("wire: PCM length is not a multiple of 4");
    }
    std::vector<float> v;
    v.reserve(remaining() / sizeof(float));
    while (remaining() > 0) {
      const std::uint32_t bits = u32();
      float f = 0.0f;
      std::memcpy(&f, &bits, sizeof(f));
      v.push_back(f);
    }
    return v;
  }

private:
  void need(std::size_t n) const {
    if (remaining() < n) {
      throw std::invalid_argument("wire: message truncated");
    }
  }

  const std::uint8_t *data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

struct TypeVisitor {
  MessageType operator()(const wire::Json &) const { return MessageType::JSON; }
  MessageType operator()(const wire::Video &) const {
    return MessageType::VIDEO;
  }
  MessageType operator()(const wire::MixedAudio &) const {
    return MessageType::AUDIO;
  }
  MessageType operator()(const wire::EncodedMediaChunk &) const {
    return MessageType::ENCODED_MEDIA_CHUNK;
  }
  MessageType operator()(const wire::PerParticipantAudio &) const {
    return MessageType::PER_PARTICIPANT_AUDIO;
  }
};

struct EncodeVisitor {
  std::vector<std::uint8_t> &out;

  void operator()(const wire::Json &m) const {
    out.insert(out.end(), m.text.begin(), m.text.end());
  }
  void operator()(const wire::Video &m) const {
    if (m.stream_id.size() >
        static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
      throw std::invalid_argument("wire: stream id too long");
    }
    out.reserve(out.size() + 8 + 4 + m.stream_id.size() + 8 + m.frame.size());
    putI64(out, m.timestamp_us);
    putI32(out, static_cast<std::int32_t>(m.stream_id.size()));
    out.insert(out.end(), m.stream_id.begin(), m.stream_id.end());
    putI32(out, m.width);
    putI32(out, m.height);
    out.insert(out.end(), m.frame.begin(), m.frame.end());
  }
  void operator()(const wire::MixedAudio &m) const { putFloats(out, m.samples); }
  void operator()(const wire::EncodedMediaChunk &m) const {
    out.insert(out.end(), m.data.begin(), m.data.end());
  }
  void operator()(const wire::PerParticipantAudio &m) const {
    if (m.participant_id.size() > kMaxParticipantIdBytes) {
      throw std::invalid_argument(
          "wire: participant id longer than 255 bytes cannot be framed");
    }
    out.push_back(static_cast<std::uint8_t>(m.participant_id.size()));
    out.insert(out.end(), m.participant_id.begin(), m.participant_id.end());
    putFloats(out, m.samples);
  }
};

} // namespace

MessageType messageTypeOf(const WireMessage &message) {
  return std::visit(TypeVisitor{}, message);
}

bool isMediaMessage(MessageType type) {
  switch (type) {
  case MessageType::VIDEO:
  case MessageType::AUDIO:
  case MessageType::ENCODED_MEDIA_CHUNK:
  case MessageType::PER_PARTICIPANT_AUDIO:
    return true;
  case MessageType::JSON:
    return false;
  }
  return false;
}

std::vector<std::uint8_t> encodeWireMessage(const WireMessage &message) {
  std::vector<std::uint8_t> out;
  putI32(out, static_cast<std::int32_t>(messageTypeOf(message)));
  std::visit(EncodeVisitor{out}, message);
  return out;
}

std::optional<WireMessage> decodeWireMessage(const std::uint8_t *data,
                                             std::size_t size) {
  if (size < kTagBytes) {
    return std::nullopt;
  }
  Reader r(data, size);
  const std::int32_t tag = r.i32();

  switch (static_cast<MessageType>(tag)) {
  case MessageType::JSON: {
    wire::Json m;
    m.text = r.str(r.remaining());
    return WireMessage(std::move(m));
  }
  case MessageType::VIDEO: {
    wire::Video m;
    m.timestamp_us = r.i64();
    const std::int32_t len = r.i32();
    if (len < 0) {
      throw std::invalid_argument("wire: negative stream id length");
    }
    m.stream_id = r.str(static_cast<std::size_t>(len));
    m.width = r.i32();
    m.height = r.i32();
    m.frame = r.rest();
    return WireMessage(std::move(m));
  }
  case MessageType::AUDIO: {
    wire::MixedAudio m;
    m.samples = r.floats();
    return WireMessage(std::move(m));
  }
  case MessageType::ENCODED_MEDIA_CHUNK: {
    wire::EncodedMediaChunk m;
    m.data = r.rest();
    return WireMessage(std::move(m));
  }
  case MessageType::PER_PARTICIPANT_AUDIO: {
    wire::PerParticipantAudio m;
    const std::uint8_t len = r.u8();
    m.participant_id = r.str(len);
    m.samples = r.floats();
    return WireMessage(std::move(m));
  }
  }
  return std::nullopt;
}

std::optional<WireMessage>
decodeWireMessage(const std::vector<std::uint8_t> &bytes) {
  return decodeWireMessage(bytes.data(), bytes.size());
}

} // namespace meetbridge
