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
#include <string>
#include <unordered_map>
#include <vector>

namespace meetbridge {

// Index of a schema inside a SchemaRegistry.
using MessageTypeId = std::uint32_t;

enum class FieldKind {
  String,  // length-delimited UTF-8
  Varint,  // varint, truncated to 32 bits
  Int64,   // varint, read as signed 64-bit
  Fixed64, // 8 little-endian bytes
  Message, // length-delimited nested message
};

struct FieldSpec {
  std::string name;
  std::uint32_t number = 0;
  FieldKind kind = FieldKind::Varint;
  bool repeated = false;
  // Only meaningful for FieldKind::Message.
  MessageTypeId message_type = 0;
};

struct MessageSchema {
  std::string name;
  std::vector<FieldSpec> fields;

  // Returns nullptr when the field number is not part of this schema.
  const FieldSpec *findField(std::uint32_t number) const;

private:
  friend class SchemaRegistry;
  std::unordered_map<std::uint32_t, std::size_t> index_;
};

/**
 * Table of message schemas, resolved once at initialization time.
 *
 * Schemas are first declared (which assigns their MessageTypeId) and then
 * defined, so that nested and mutually recursive message fields can refer
 * to each other by id instead of by name.
 *
 *   SchemaRegistry reg;
 *   auto outer = reg.declare("Outer");
 *   auto inner = reg.declare("Inner");
 *   reg.define(inner, {{"text", 1, FieldKind::String}});
 *   reg.define(outer, {{"inner", 1, FieldKind::Message, false, inner}});
 *   reg.validate();
 */
class SchemaRegistry {
public:
  MessageTypeId declare(std::string name);

  /// Throws std::invalid_argument on an unknown id, a redefinition, or a
  /// duplicate field number.
  void define(MessageTypeId id, std::vector<FieldSpec> fields);

  /// Throws std::invalid_argument if a schema is declared but never
  /// defined, or a message field names an id outside the registry.
  void validate() const;

  bool contains(MessageTypeId id) const noexcept {
    return id < schemas_.size();
  }
  std::size_t size() const noexcept { return schemas_.size(); }

  /// Throws DecodeError(UNKNOWN_MESSAGE_TYPE) for an id outside the table.
  const MessageSchema &schema(MessageTypeId id) const;

private:
  std::vector<MessageSchema> schemas_;
  std::vector<bool> defined_;
};

} // namespace meetbridge
