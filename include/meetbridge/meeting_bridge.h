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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "meetbridge/audio_activity_monitor.h"
#include "meetbridge/audio_attribution.h"
#include "meetbridge/bridge_options.h"
#include "meetbridge/caption_manager.h"
#include "meetbridge/chat_message_manager.h"
#include "meetbridge/frame_pipeline.h"
#include "meetbridge/media_channel.h"
#include "meetbridge/message_decoder.h"
#include "meetbridge/message_schema.h"
#include "meetbridge/participant_store.h"
#include "meetbridge/periodic_task.h"
#include "meetbridge/rtc_observer.h"
#include "meetbridge/transport.h"
#include "meetbridge/ui_automation.h"
#include "meetbridge/video_track_manager.h"

namespace meetbridge {

/// Data channel labels the platform opens.
constexpr const char *kCollectionsChannel = "collections";
constexpr const char *kCaptionsChannel = "captions";
constexpr const char *kMediaDirectorChannel = "media-director";

/// Response whose body is a base64 UserInfoListResponse with the roster.
constexpr const char *kSyncMeetingSpaceCollectionsUrl =
    "https://meet.google.com/$rpc/"
    "google.rtc.meetings.v1.MeetingSpaceService/SyncMeetingSpaceCollections";

/**
 * One bot session inside a meeting.
 *
 * MeetingBridge owns every piece of session state: the schema registry and
 * decoder, the participant store, video track selection, receiver readings,
 * caption and chat normalizers, the outbound MediaChannel, the periodic
 * monitors and the per-track frame pipelines. The integration layer feeds it
 * through the RtcEventObserver interface and drives media sending with
 * enableMediaSending() / disableMediaSending().
 *
 * Everything runs on `io`. The Transport and the optional UiAutomation must
 * outlive the bridge.
 */
class MeetingBridge : public RtcEventObserver,
                      public ParticipantStoreDelegate,
                      public MediaChannelDelegate {
public:
  /// Monotonic time source in microseconds.
  using Clock = std::function<std::int64_t()>;

  MeetingBridge(boost::asio::io_context &io, Transport &transport,
                UiAutomation *ui, BridgeOptions options = BridgeOptions{});
  ~MeetingBridge() override;

  MeetingBridge(const MeetingBridge &) = delete;
  MeetingBridge &operator=(const MeetingBridge &) = delete;

  void enableMediaSending();
  void disableMediaSending();

  /// A message the backend sent back over the transport. JSON is logged;
  /// other kinds and short messages are ignored.
  void onChannelMessage(const std::vector<std::uint8_t> &data);

  /// Forward one chunk from the page's container encoder. Gated like any
  /// other media.
  bool sendEncodedMediaChunk(std::vector<std::uint8_t> data);

  /**
   * Stop the monitors and cancel every frame pipeline. Safe to call more
   * than once; the destructor calls it.
   */
  void teardown();

  /// Replace the clock used for video timestamps and frame-rate limits.
  void setClock(Clock clock) { clock_ = std::move(clock); }

  // ---------------------------------------------------------------
  // RtcEventObserver
  // ---------------------------------------------------------------

  void onPeerConnectionCreated() override;
  void onDataChannelCreated(const std::string &label) override;
  void onDataChannelMessage(const std::string &label,
                            const std::vector<std::uint8_t> &data) override;
  void onTrackAdded(const TrackEvent &event) override;
  void onTrackEnded(const std::string &track_id) override;
  void
  onContributingSources(const std::string &receiver_id,
                        const std::vector<ContributingSource> &sources) override;
  void onNetworkResponse(const std::string &url,
                         const std::string &body) override;

  // ---------------------------------------------------------------
  // Periodic checks, also run by the monitors
  // ---------------------------------------------------------------

  void checkAudioActivity();
  void checkMemoryUsage();
  void checkNeededInteractions();

  // ---------------------------------------------------------------
  // Accessors
  // ---------------------------------------------------------------

  const BridgeOptions &options() const noexcept { return options_; }
  const ParticipantStore &participants() const noexcept { return store_; }
  const VideoTrackManager &videoTracks() const noexcept { return tracks_; }
  const MediaChannel &channel() const noexcept { return channel_; }
  const CaptionManager &captions() const noexcept { return captions_; }
  const AudioActivityMonitor &audioActivity() const noexcept {
    return activity_;
  }
  bool monitorsRunning() const noexcept;
  std::size_t activePipelineCount() const noexcept;

protected:
  // ParticipantStoreDelegate
  void onUsersUpdated(const RosterDiff &diff) override;
  void
  onDeviceOutputsUpdated(const std::vector<DeviceOutput> &outputs) override;

  // MediaChannelDelegate
  void onMediaSendingEnabled() override;
  void onMediaSendingDisabling() override;
  void onMediaSendingDisabled() override;

private:
  struct VideoTrackState {
    std::string stream_id;
    std::int64_t frame_interval_us = 0;
    std::optional<std::int64_t> last_sent_us;
  };

  struct AudioTrackState {
    std::string receiver_id;
    std::optional<AudioFormat> last_format;
  };

  void handleCollectionsMessage(const std::vector<std::uint8_t> &data);
  void handleCaptionsMessage(const std::vector<std::uint8_t> &data);
  void handleRosterResponse(const std::string &body);
  void reportError(const std::string &message);

  bool isScreenShareStream(const std::string &stream_id) const;

  void addVideoTrack(const TrackEvent &event);
  void addAudioTrack(const TrackEvent &event);
  void addMixedAudioTrack(const TrackEvent &event);
  void cancelPipelines(const std::string &track_id);

  void relayVideoFrame(VideoTrackState &state, VideoFrame &frame);
  void relayParticipantAudio(AudioTrackState &state, AudioFrame &frame);
  void relayMixedAudio(AudioFrame &frame);

  void startMonitors();
  void stopMonitors();

  boost::asio::io_context &io_;
  UiAutomation *ui_;
  BridgeOptions options_;
  Clock clock_;

  SchemaRegistry registry_;
  MessageDecoder decoder_;
  ParticipantStore store_;
  VideoTrackManager tracks_;
  ReceiverRegistry receivers_;
  CaptionManager captions_;
  ChatMessageManager chat_;
  AudioActivityMonitor activity_;
  MediaChannel channel_;

  PeriodicTask audio_activity_task_;
  PeriodicTask memory_usage_task_;
  PeriodicTask needed_interactions_task_;

  std::unordered_map<std::string,
                     std::shared_ptr<FramePipeline<VideoFrame>>>
      video_pipelines_;
  std::unordered_map<std::string,
                     std::shared_ptr<FramePipeline<AudioFrame>>>
      audio_pipelines_;

  bool torn_down_ = false;
};

} // namespace meetbridge
