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
#include <cstdint>
#include <deque>
#include <unordered_map>

#include "meetbridge/control_message.h"

namespace meetbridge {

/**
 * Latest caption per caption id.
 *
 * The platform keeps rewriting a caption while the speaker talks, bumping
 * its version. A record whose version is lower than the stored one is
 * stale and is dropped; equal or higher versions replace it.
 *
 * At most `capacity` captions are kept; the one first seen longest ago is
 * evicted.
 */
class CaptionManager {
public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit CaptionManager(std::size_t capacity = kDefaultCapacity);

  /// Returns true when `caption` was stored and should be forwarded.
  bool apply(const CaptionRecord &caption);

  const CaptionRecord *caption(std::int64_t caption_id) const;
  std::size_t size() const noexcept { return captions_.size(); }
  std::size_t capacity() const noexcept { return capacity_; }
  void clear();

private:
  std::size_t capacity_;
  std::unordered_map<std::int64_t, CaptionRecord> captions_;
  std::deque<std::int64_t> order_;
};

} // namespace meetbridge
