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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "meetbridge/message_schema.h"

namespace google {
namespace protobuf {
namespace io {
class CodedInputStream;
}
} // namespace protobuf
} // namespace google

namespace meetbridge {

class DecodedMessage;

/// One decoded field occurrence. The alternative matches the field kind:
/// String -> std::string, Varint -> std::uint32_t, Int64 -> std::int64_t,
/// Fixed64 -> std::uint64_t, Message -> nested message.
using FieldValue =
    std::variant<std::string, std::uint32_t, std::int64_t, std::uint64_t,
                 std::shared_ptr<const DecodedMessage>>;

/**
 * Generic record produced by MessageDecoder.
 *
 * Values are stored per field number. Repeated fields keep every occurrence
 * in wire order; for non-repeated fields only the last occurrence is kept.
 * The typed getters return std::nullopt / nullptr when the field is absent
 * or holds a different kind.
 */
class DecodedMessage {
public:
  explicit DecodedMessage(MessageTypeId type = 0) : type_(type) {}

  MessageTypeId type() const noexcept { return type_; }

  bool has(std::uint32_t field) const;
  std::size_t fieldCount() const noexcept { return fields_.size(); }

  /// All occurrences of a field; empty when absent.
  const std::vector<FieldValue> &values(std::uint32_t field) const;

  std::optional<std::string> getString(std::uint32_t field) const;
  std::optional<std::uint32_t> getVarint(std::uint32_t field) const;
  std::optional<std::int64_t> getInt64(std::uint32_t field) const;
  std::optional<std::uint64_t> getFixed64(std::uint32_t field) const;
  const DecodedMessage *getMessage(std::uint32_t field) const;
  std::vector<const DecodedMessage *> getMessages(std::uint32_t field) const;

  /// Replace any previous value (non-repeated field).
  void set(std::uint32_t field, FieldValue value);
  /// Append an occurrence (repeated field).
  void append(std::uint32_t field, FieldValue value);

  /// Deep structural equality; nested messages compare by content.
  bool operator==(const DecodedMessage &other) const;
  bool operator!=(const DecodedMessage &other) const {
    return !(*this == other);
  }

private:
  MessageTypeId type_;
  std::map<std::uint32_t, std::vector<FieldValue>> fields_;
};

/**
 * Schema-driven decoder for the platform's tag/length nested format.
 *
 * Decoding is pure over one buffer: on any failure a DecodeError is thrown
 * and no partial result escapes. Fields the schema does not know are
 * skipped by wire type, groups included.
 */
class MessageDecoder {
public:
  static constexpr int kMaxNestingDepth = 64;

  explicit MessageDecoder(const SchemaRegistry &registry)
      : registry_(registry) {}

  DecodedMessage decode(MessageTypeId type, const std::uint8_t *data,
                        std::size_t size) const;
  DecodedMessage decode(MessageTypeId type,
                        const std::vector<std::uint8_t> &buffer) const;
  DecodedMessage decode(MessageTypeId type, const std::string &buffer) const;

  const SchemaRegistry &registry() const noexcept { return registry_; }

private:
  void decodeFields(const MessageSchema &schema,
                    google::protobuf::io::CodedInputStream &input,
                    std::size_t total_size, DecodedMessage &out,
                    int depth) const;

  FieldValue readValue(const MessageSchema &schema, const FieldSpec &field,
                       google::protobuf::io::CodedInputStream &input,
                       std::size_t total_size, int depth) const;

  const SchemaRegistry &registry_;
};

} // namespace meetbridge
