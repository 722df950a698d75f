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

#include "meetbridge/caption_manager.h"

namespace meetbridge {

CaptionManager::CaptionManager(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool CaptionManager::apply(const CaptionRecord &caption) {
  auto it = captions_.find(caption.caption_id);
  if (it == captions_.end()) {
    captions_.emplace(caption.caption_id, caption);
    order_.push_back(caption.caption_id);
    while (order_.size() > capacity_) {
      captions_.erase(order_.front());
      order_.pop_front();
    }
    return true;
  }
  if (caption.version < it->second.version) {
    return false;
  }
  it->second = caption;
  return true;
}

const CaptionRecord *CaptionManager::caption(std::int64_t caption_id) const {
  auto it = captions_.find(caption_id);
  return it == captions_.end() ? nullptr : &it->second;
}

void CaptionManager::clear() {
  captions_.clear();
  order_.clear();
}

} // namespace meetbridge
