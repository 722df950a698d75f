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

#include "meetbridge/message_schema.h"

#include <stdexcept>

#include "meetbridge/decode_error.h"

namespace meetbridge {

const FieldSpec *MessageSchema::findField(std::uint32_t number) const {
  auto it = index_.find(number);
  return it == index_.end() ? nullptr : &fields[it->second];
}

MessageTypeId SchemaRegistry::declare(std::string name) {
  MessageSchema schema;
  schema.name = std::move(name);
  schemas_.push_back(std::move(schema));
  defined_.push_back(false);
  return static_cast<MessageTypeId>(schemas_.size() - 1);
}

void SchemaRegistry::define(MessageTypeId id, std::vector<FieldSpec> fields) {
  if (!contains(id)) {
    throw std::invalid_argument("SchemaRegistry::define: unknown id " +
                                std::to_string(id));
  }
  if (defined_[id]) {
    throw std::invalid_argument("SchemaRegistry::define: " +
                                schemas_[id].name + " is already defined");
  }

  MessageSchema &schema = schemas_[id];
  schema.fields = std::move(fields);
  schema.index_.clear();
  for (std::size_t i = 0; i < schema.fields.size(); ++i) {
    const auto number = schema.fields[i].number;
    if (number == 0) {
      throw std::invalid_argument("SchemaRegistry::define: field " +
                                  schema.fields[i].name + " in " +
                                  schema.name + " has number 0");
    }
    if (!schema.index_.emplace(number, i).second) {
      throw std::invalid_argument("SchemaRegistry::define: duplicate field "
                                  "number " +
                                  std::to_string(number) + " in " +
                                  schema.name);
    }
  }
  defined_[id] = true;
}

void SchemaRegistry::validate() const {
  for (std::size_t id = 0; id < schemas_.size(); ++id) {
    if (!defined_[id]) {
      throw std::invalid_argument("SchemaRegistry: " + schemas_[id].name +
                                  " is declared but not defined");
    }
    for (const auto &field : schemas_[id].fields) {
      if (field.kind == FieldKind::Message && !contains(field.message_type)) {
        throw std::invalid_argument("SchemaRegistry: field " + field.name +
                                    " in " + schemas_[id].name +
                                    " refers to unknown message id " +
                                    std::to_string(field.message_type));
      }
    }
  }
}

const MessageSchema &SchemaRegistry::schema(MessageTypeId id) const {
  if (!contains(id)) {
    throw DecodeError(DecodeError::ErrorCode::UNKNOWN_MESSAGE_TYPE,
                      "Unknown message type id " + std::to_string(id));
  }
  return schemas_[id];
}

} // namespace meetbridge
