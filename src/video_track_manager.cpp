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

#include "meetbridge/video_track_manager.h"

#include <chrono>

namespace meetbridge {

void VideoTrackManager::upsert(const std::string &track_id,
                               const std::string &stream_id,
                               bool is_screen_share, std::int64_t now_ms) {
  cache_valid_ = false;

  auto it = tracks_.find(track_id);
  if (it != tracks_.end()) {
    it->second.record.stream_id = stream_id;
    it->second.record.is_screen_share = is_screen_share;
    return;
  }

  Entry entry;
  entry.record.track_id = track_id;
  entry.record.stream_id = stream_id;
  entry.record.is_screen_share = is_screen_share;
  entry.record.first_seen_at_ms = now_ms;
  entry.sequence = next_sequence_++;
  tracks_.emplace(track_id, std::move(entry));
}

void VideoTrackManager::upsert(const std::string &track_id,
                               const std::string &stream_id,
                               bool is_screen_share) {
  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now().time_since_epoch())
                       .count();
  upsert(track_id, stream_id, is_screen_share, now);
}

bool VideoTrackManager::remove(const std::string &track_id) {
  cache_valid_ = false;
  return tracks_.erase(track_id) > 0;
}

void VideoTrackManager::clear() {
  cache_valid_ = false;
  tracks_.clear();
}

std::optional<VideoTrackRecord>
VideoTrackManager::selectActiveVideoTrack() const {
  if (cache_valid_) {
    return cached_;
  }

  const Entry *best_screen = nullptr;
  const Entry *best_camera = nullptr;
  auto better = [](const Entry *current, const Entry &candidate) {
    if (current == nullptr) {
      return true;
    }
    if (candidate.record.first_seen_at_ms != current->record.first_seen_at_ms) {
      return candidate.record.first_seen_at_ms >
             current->record.first_seen_at_ms;
    }
    return candidate.sequence < current->sequence;
  };

  for (const auto &kv : tracks_) {
    const Entry &entry = kv.second;
    const Entry *&slot =
        entry.record.is_screen_share ? best_screen : best_camera;
    if (better(slot, entry)) {
      slot = &entry;
    }
  }

  const Entry *winner = best_screen ? best_screen : best_camera;
  cached_ = winner ? std::optional<VideoTrackRecord>(winner->record)
                   : std::nullopt;
  cache_valid_ = true;
  return cached_;
}

std::string VideoTrackManager::activeStreamId() const {
  auto selected = selectActiveVideoTrack();
  return selected ? selected->stream_id : std::string();
}

const VideoTrackRecord *
VideoTrackManager::track(const std::string &track_id) const {
  auto it = tracks_.find(track_id);
  return it == tracks_.end() ? nullptr : &it->second.record;
}

} // namespace meetbridge
