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

#include "meetbridge/chat_message_manager.h"

namespace meetbridge {

ChatMessageManager::ChatMessageManager(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ChatMessageManager::isNew(const ChatMessageRecord &message) const {
  return seen_.find(message.message_id) == seen_.end();
}

void ChatMessageManager::markForwarded(const ChatMessageRecord &message) {
  if (!seen_.insert(message.message_id).second) {
    return;
  }
  order_.push_back(message.message_id);
  while (order_.size() > capacity_) {
    seen_.erase(order_.front());
    order_.pop_front();
  }
}

void ChatMessageManager::clear() {
  seen_.clear();
  order_.clear();
}

} // namespace meetbridge
