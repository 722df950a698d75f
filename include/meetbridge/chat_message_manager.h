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

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

#include "meetbridge/control_message.h"

namespace meetbridge {

/// Chat messages are immutable once observed. Collection events replay
/// history, so each message id is forwarded once.
///
/// Ids are remembered only after the caller delivered the message, so a
/// message dropped on a closed transport goes out again when replayed.
/// At most `capacity` ids are kept; the oldest is forgotten first.
class ChatMessageManager {
public:
  static constexpr std::size_t kDefaultCapacity = 4096;

  explicit ChatMessageManager(std::size_t capacity = kDefaultCapacity);

  /// True when `message` has not been forwarded yet.
  bool isNew(const ChatMessageRecord &message) const;

  /// Record `message` as forwarded.
  void markForwarded(const ChatMessageRecord &message);

  std::size_t size() const noexcept { return seen_.size(); }
  std::size_t capacity() const noexcept { return capacity_; }
  void clear();

private:
  std::size_t capacity_;
  std::unordered_set<std::string> seen_;
  std::deque<std::string> order_;
};

} // namespace meetbridge
