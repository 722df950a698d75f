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
#include <memory>
#include <string>
#include <vector>

#include "meetbridge/audio_attribution.h"
#include "meetbridge/frame_pipeline.h"
#include "meetbridge/media_frame.h"

namespace meetbridge {

using VideoFrameSource = FrameSource<VideoFrame>;
using AudioFrameSource = FrameSource<AudioFrame>;

enum class TrackKind {
  Audio,
  Video,
  /// All remote audio mixed into one track, excluding the bot's own.
  MixedAudio,
};

/**
 * A remote track became available on a peer connection.
 */
struct TrackEvent {
  std::string track_id;
  TrackKind kind = TrackKind::Audio;
  /// Ids of the media streams the track belongs to; the first one is the
  /// platform's stream id for the track.
  std::vector<std::string> stream_ids;
  /// Receiver whose contributing sources attribute this track's audio.
  std::string receiver_id;
  /// Set for Video.
  std::shared_ptr<VideoFrameSource> video;
  /// Set for Audio and MixedAudio.
  std::shared_ptr<AudioFrameSource> audio;
};

/**
 * Entry points the integration layer calls when it intercepts platform
 * events. Every call must be made on the bridge's io_context thread.
 *
 * Default no-ops.
 */
class RtcEventObserver {
public:
  virtual ~RtcEventObserver() = default;

  virtual void onPeerConnectionCreated() {}

  virtual void onDataChannelCreated(const std::string & /*label*/) {}

  /// One message on a data channel; `label` names the channel.
  virtual void onDataChannelMessage(const std::string & /*label*/,
                                    const std::vector<std::uint8_t> & /*data*/) {
  }

  virtual void onTrackAdded(const TrackEvent & /*event*/) {}

  virtual void onTrackEnded(const std::string & /*track_id*/) {}

  /// Latest contributing-source readings for one receiver.
  virtual void
  onContributingSources(const std::string & /*receiver_id*/,
                        const std::vector<ContributingSource> & /*sources*/) {}

  /// Body of an intercepted HTTP response.
  virtual void onNetworkResponse(const std::string & /*url*/,
                                 const std::string & /*body*/) {}
};

} // namespace meetbridge
