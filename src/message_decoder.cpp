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

#include "meetbridge/message_decoder.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/wire_format_lite.h>

#include <limits>

#include "meetbridge/decode_error.h"

namespace meetbridge {

using google::protobuf::io::CodedInputStream;
using google::protobuf::internal::WireFormatLite;

namespace {

const std::vector<FieldValue> kNoValues;

const char *kindName(FieldKind kind) {
  switch (kind) {
  case FieldKind::String:
    return "string";
  case FieldKind::Varint:
    return "varint";
  case FieldKind::Int64:
    return "int64";
  case FieldKind::Fixed64:
    return "fixed64";
  case FieldKind::Message:
    return "message";
  }
  return "unknown";
}

WireFormatLite::WireType expectedWireType(FieldKind kind) {
  switch (kind) {
  case FieldKind::Varint:
  case FieldKind::Int64:
    return WireFormatLite::WIRETYPE_VARINT;
  case FieldKind::Fixed64:
    return WireFormatLite::WIRETYPE_FIXED64;
  case FieldKind::String:
  case FieldKind::Message:
    return WireFormatLite::WIRETYPE_LENGTH_DELIMITED;
  }
  return WireFormatLite::WIRETYPE_LENGTH_DELIMITED;
}

std::size_t remaining(const CodedInputStream &input, std::size_t total_size) {
  return total_size - static_cast<std::size_t>(input.CurrentPosition());
}

std::string fieldLabel(const MessageSchema &schema, const FieldSpec &field) {
  return schema.name + "." + field.name + " (#" +
         std::to_string(field.number) + ")";
}

bool valuesEqual(const FieldValue &a, const FieldValue &b) {
  if (a.index() != b.index()) {
    return false;
  }
  if (const auto *lhs =
          std::get_if<std::shared_ptr<const DecodedMessage>>(&a)) {
    const auto &rhs = std::get<std::shared_ptr<const DecodedMessage>>(b);
    if (!*lhs || !rhs) {
      return *lhs == rhs;
    }
    return **lhs == *rhs;
  }
  return a == b;
}

} // namespace

// ---------------------------------------------------------------------------
// DecodedMessage
// ---------------------------------------------------------------------------

bool DecodedMessage::has(std::uint32_t field) const {
  return fields_.find(field) != fields_.end();
}

const std::vector<FieldValue> &DecodedMessage::values(
    std::uint32_t field) const {
  auto it = fields_.find(field);
  return it == fields_.end() ? kNoValues : it->second;
}

std::optional<std::string> DecodedMessage::getString(
    std::uint32_t field) const {
  const auto &all = values(field);
  if (all.empty()) {
    return std::nullopt;
  }
  if (const auto *v = std::get_if<std::string>(&all.back())) {
    return *v;
  }
  return std::nullopt;
}

std::optional<std::uint32_t> DecodedMessage::getVarint(
    std::uint32_t field) const {
  const auto &all = values(field);
  if (all.empty()) {
    return std::nullopt;
  }
  if (const auto *v = std::get_if<std::uint32_t>(&all.back())) {
    return *v;
  }
  return std::nullopt;
}

std::optional<std::int64_t> DecodedMessage::getInt64(
    std::uint32_t field) const {
  const auto &all = values(field);
  if (all.empty()) {
    return std::nullopt;
  }
  if (const auto *v = std::get_if<std::int64_t>(&all.back())) {
    return *v;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> DecodedMessage::getFixed64(
    std::uint32_t field) const {
  const auto &all = values(field);
  if (all.empty()) {
    return std::nullopt;
  }
  if (const auto *v = std::get_if<std::uint64_t>(&all.back())) {
    return *v;
  }
  return std::nullopt;
}

const DecodedMessage *DecodedMessage::getMessage(std::uint32_t field) const {
  const auto &all = values(field);
  if (all.empty()) {
    return nullptr;
  }
  if (const auto *v =
          std::get_if<std::shared_ptr<const DecodedMessage>>(&all.back())) {
    return v->get();
  }
  return nullptr;
}

std::vector<const DecodedMessage *> DecodedMessage::getMessages(
    std::uint32_t field) const {
  std::vector<const DecodedMessage *> out;
  for (const auto &value : values(field)) {
    if (const auto *v =
            std::get_if<std::shared_ptr<const DecodedMessage>>(&value)) {
      if (*v) {
        out.push_back(v->get());
      }
    }
  }
  return out;
}

void DecodedMessage::set(std::uint32_t field, FieldValue value) {
  auto &slot = fields_[field];
  slot.clear();
  slot.push_back(std::move(value));
}

void DecodedMessage::append(std::uint32_t field, FieldValue value) {
  fields_[field].push_back(std::move(value));
}

bool DecodedMessage::operator==(const DecodedMessage &other) const {
  if (type_ != other.type_ || fields_.size() != other.fields_.size()) {
    return false;
  }
  auto lhs = fields_.begin();
  auto rhs = other.fields_.begin();
  for (; lhs != fields_.end(); ++lhs, ++rhs) {
    if (lhs->first != rhs->first ||
        lhs->second.size() != rhs->second.size()) {
      return false;
    }
    for (std::size_t i = 0; i < lhs->second.size(); ++i) {
      if (!valuesEqual(lhs->second[i], rhs->second[i])) {
        return false;
      }
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// MessageDecoder
// ---------------------------------------------------------------------------

DecodedMessage MessageDecoder::decode(MessageTypeId type,
                                      const std::uint8_t *data,
                                      std::size_t size) const {
  const MessageSchema &schema = registry_.schema(type);
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw DecodeError(DecodeError::ErrorCode::INVALID_PAYLOAD_ENCODING,
                      "Buffer of " + std::to_string(size) +
                          " bytes is too large to decode");
  }

  DecodedMessage out(type);
  if (size == 0) {
    return out;
  }

  CodedInputStream input(data, static_cast<int>(size));
  const auto limit = input.PushLimit(static_cast<int>(size));
  decodeFields(schema, input, size, out, 0);
  input.PopLimit(limit);
  return out;
}

DecodedMessage
MessageDecoder::decode(MessageTypeId type,
                       const std::vector<std::uint8_t> &buffer) const {
  return decode(type, buffer.data(), buffer.size());
}

DecodedMessage MessageDecoder::decode(MessageTypeId type,
                                      const std::string &buffer) const {
  return decode(type, reinterpret_cast<const std::uint8_t *>(buffer.data()),
                buffer.size());
}

void MessageDecoder::decodeFields(const MessageSchema &schema,
                                  CodedInputStream &input,
                                  std::size_t total_size, DecodedMessage &out,
                                  int depth) const {
  while (input.BytesUntilLimit() > 0) {
    const std::uint32_t tag = input.ReadTag();
    const int number = WireFormatLite::GetTagFieldNumber(tag);
    if (tag == 0 || number == 0) {
      throw DecodeError(DecodeError::ErrorCode::INVALID_TAG,
                        "Invalid tag in " + schema.name);
    }

    const auto wire_type = WireFormatLite::GetTagWireType(tag);
    const FieldSpec *field =
        schema.findField(static_cast<std::uint32_t>(number));
    if (field == nullptr) {
      if (!WireFormatLite::SkipField(&input, tag)) {
        const bool bad_type =
            wire_type == WireFormatLite::WIRETYPE_END_GROUP ||
            static_cast<int>(wire_type) > 5;
        throw DecodeError(
            bad_type ? DecodeError::ErrorCode::INVALID_TAG
                     : DecodeError::ErrorCode::SHORT_READ,
            "Could not skip unknown field #" + std::to_string(number) +
                " in " + schema.name);
      }
      continue;
    }

    if (wire_type != expectedWireType(field->kind)) {
      throw DecodeError(DecodeError::ErrorCode::WIRE_TYPE_MISMATCH,
                        fieldLabel(schema, *field) + " is declared " +
                            kindName(field->kind) + " but has wire type " +
                            std::to_string(static_cast<int>(wire_type)));
    }

    FieldValue value = readValue(schema, *field, input, total_size, depth);
    if (field->repeated) {
      out.append(field->number, std::move(value));
    } else {
      out.set(field->number, std::move(value));
    }
  }
}

FieldValue MessageDecoder::readValue(const MessageSchema &schema,
                                     const FieldSpec &field,
                                     CodedInputStream &input,
                                     std::size_t total_size, int depth) const {
  switch (field.kind) {
  case FieldKind::Varint: {
    std::uint32_t v = 0;
    if (!input.ReadVarint32(&v)) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated varint in " + fieldLabel(schema, field));
    }
    return v;
  }
  case FieldKind::Int64: {
    std::uint64_t v = 0;
    if (!input.ReadVarint64(&v)) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated varint in " + fieldLabel(schema, field));
    }
    return static_cast<std::int64_t>(v);
  }
  case FieldKind::Fixed64: {
    std::uint64_t v = 0;
    if (!input.ReadLittleEndian64(&v)) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated fixed64 in " + fieldLabel(schema, field));
    }
    return v;
  }
  case FieldKind::String: {
    std::uint32_t length = 0;
    if (!input.ReadVarint32(&length) ||
        length > remaining(input, total_size)) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated string in " + fieldLabel(schema, field));
    }
    std::string v;
    if (!input.ReadString(&v, static_cast<int>(length))) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated string in " + fieldLabel(schema, field));
    }
    return v;
  }
  case FieldKind::Message: {
    if (depth + 1 > kMaxNestingDepth) {
      throw DecodeError(DecodeError::ErrorCode::NESTING_TOO_DEEP,
                        "Nesting exceeds " + std::to_string(kMaxNestingDepth) +
                            " levels at " + fieldLabel(schema, field));
    }
    std::uint32_t length = 0;
    if (!input.ReadVarint32(&length) ||
        length > remaining(input, total_size) ||
        static_cast<int>(length) > input.BytesUntilLimit()) {
      throw DecodeError(DecodeError::ErrorCode::SHORT_READ,
                        "Truncated message in " + fieldLabel(schema, field));
    }
    const MessageSchema &nested_schema = registry_.schema(field.message_type);
    auto nested = std::make_shared<DecodedMessage>(field.message_type);
    const auto limit = input.PushLimit(static_cast<int>(length));
    decodeFields(nested_schema, input, total_size, *nested, depth + 1);
    input.PopLimit(limit);
    return std::shared_ptr<const DecodedMessage>(std::move(nested));
  }
  }

  throw DecodeError(DecodeError::ErrorCode::WIRE_TYPE_MISMATCH,
                    "Unsupported kind for " + fieldLabel(schema, field));
}

} // namespace meetbridge
