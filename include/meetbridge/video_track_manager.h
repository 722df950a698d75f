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
#include <unordered_map>

namespace meetbridge {

struct VideoTrackRecord {
  std::string track_id;
  std::string stream_id;
  bool is_screen_share = false;
  /// Monotonic ms of the first upsert; kept across later upserts.
  std::int64_t first_seen_at_ms = 0;
};

/**
 * Tracks the remote video tracks currently alive and picks the one to
 * relay.
 *
 * Screen shares win over cameras; within a class the most recently first
 * seen track wins, and equal timestamps resolve to the earlier inserted
 * track. The selection is cached until the next upsert or delete.
 */
class VideoTrackManager {
public:
  void upsert(const std::string &track_id, const std::string &stream_id,
              bool is_screen_share, std::int64_t now_ms);
  void upsert(const std::string &track_id, const std::string &stream_id,
              bool is_screen_share);

  /// Returns false when the track was not known.
  bool remove(const std::string &track_id);

  std::optional<VideoTrackRecord> selectActiveVideoTrack() const;

  /// Stream id of the selected track, empty when none.
  std::string activeStreamId() const;

  const VideoTrackRecord *track(const std::string &track_id) const;
  std::size_t size() const noexcept { return tracks_.size(); }
  void clear();

private:
  struct Entry {
    VideoTrackRecord record;
    std::uint64_t sequence = 0;
  };

  std::unordered_map<std::string, Entry> tracks_;
  std::uint64_t next_sequence_ = 0;

  mutable bool cache_valid_ = false;
  mutable std::optional<VideoTrackRecord> cached_;
};

} // namespace meetbridge
