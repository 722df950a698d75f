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

#include "meetbridge/meeting_bridge.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "meet_proto_converter.h"
#include "memory_usage.h"
#include "meetbridge/decode_error.h"
#include "meetbridge/meet_schema.h"
#include "payload_codec.h"

namespace meetbridge {

namespace {

std::int64_t steadyNowUs() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

bool allZero(const std::vector<float> &samples) {
  return std::all_of(samples.begin(), samples.end(),
                     [](float s) { return s == 0.0f; });
}

} // namespace

MeetingBridge::MeetingBridge(boost::asio::io_context &io, Transport &transport,
                             UiAutomation *ui, BridgeOptions options)
    : io_(io), ui_(ui), options_(std::move(options)), clock_(&steadyNowUs),
      registry_(buildMeetSchemaRegistry()), decoder_(registry_),
      activity_(options_.silence_threshold),
      channel_(io, transport,
               std::chrono::milliseconds(options_.media_disable_grace_ms)),
      audio_activity_task_(io, "audio-activity"),
      memory_usage_task_(io, "memory-usage"),
      needed_interactions_task_(io, "needed-interactions") {
  store_.setDelegate(this);
  channel_.setDelegate(this);
}

MeetingBridge::~MeetingBridge() {
  teardown();
  channel_.setDelegate(nullptr);
  store_.setDelegate(nullptr);
}

void MeetingBridge::enableMediaSending() {
  if (torn_down_) {
    std::cerr << "[MeetingBridge] enableMediaSending after teardown ignored"
              << std::endl;
    return;
  }
  channel_.enableMediaSending();
}

void MeetingBridge::disableMediaSending() { channel_.disableMediaSending(); }

void MeetingBridge::onChannelMessage(const std::vector<std::uint8_t> &data) {
  channel_.handleInbound(data.data(), data.size());
}

bool MeetingBridge::sendEncodedMediaChunk(std::vector<std::uint8_t> data) {
  return channel_.send(WireMessage(wire::EncodedMediaChunk{std::move(data)}));
}

void MeetingBridge::teardown() {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;
  stopMonitors();
  channel_.shutdown();
  for (auto &entry : video_pipelines_) {
    entry.second->cancel();
  }
  for (auto &entry : audio_pipelines_) {
    entry.second->cancel();
  }
  video_pipelines_.clear();
  audio_pipelines_.clear();
  std::cout << "[MeetingBridge] torn down" << std::endl;
}

bool MeetingBridge::monitorsRunning() const noexcept {
  return audio_activity_task_.running() || memory_usage_task_.running() ||
         needed_interactions_task_.running();
}

std::size_t MeetingBridge::activePipelineCount() const noexcept {
  return video_pipelines_.size() + audio_pipelines_.size();
}

// ------------------------------------------------------------------
// Platform events
// ------------------------------------------------------------------

void MeetingBridge::onPeerConnectionCreated() {
  std::cout << "[MeetingBridge] peer connection created" << std::endl;
}

void MeetingBridge::onDataChannelCreated(const std::string &label) {
  std::cout << "[MeetingBridge] data channel created: " << label << std::endl;
}

void MeetingBridge::onDataChannelMessage(
    const std::string &label, const std::vector<std::uint8_t> &data) {
  if (label == kCollectionsChannel) {
    handleCollectionsMessage(data);
  } else if (label == kCaptionsChannel) {
    if (options_.collect_captions) {
      handleCaptionsMessage(data);
    }
  } else if (label == kMediaDirectorChannel) {
    std::cout << "[MeetingBridge] media-director message (" << data.size()
              << " bytes)" << std::endl;
  }
}

void MeetingBridge::handleCollectionsMessage(
    const std::vector<std::uint8_t> &data) {
  CollectionUpdate update;
  try {
    const auto inflated = inflatePayload(data.data(), data.size());
    const DecodedMessage event =
        decoder_.decode(toTypeId(MeetMessage::CollectionEvent), inflated);
    update = fromCollectionEvent(event);
  } catch (const DecodeError &e) {
    reportError(std::string("Error decoding collections message: ") +
                e.what());
    return;
  }

  if (update.has_device_outputs) {
    store_.applyDeviceOutputs(update.device_outputs);
  }
  for (const auto &message : update.chat_messages) {
    if (chat_.isNew(message) &&
        channel_.sendJson(control::ChatMessage{message})) {
      chat_.markForwarded(message);
    }
  }
  for (const auto &device : update.devices) {
    store_.applySingleDevice(device);
  }
}

void MeetingBridge::handleCaptionsMessage(
    const std::vector<std::uint8_t> &data) {
  std::optional<CaptionRecord> caption;
  try {
    const DecodedMessage wrapper =
        decoder_.decode(toTypeId(MeetMessage::CaptionWrapper), data);
    caption = fromCaptionWrapper(wrapper);
  } catch (const DecodeError &e) {
    reportError(std::string("Error decoding captions message: ") + e.what());
    return;
  }
  if (caption && captions_.apply(*caption)) {
    channel_.sendCaptionUpdate(*caption);
  }
}

void MeetingBridge::onNetworkResponse(const std::string &url,
                                      const std::string &body) {
  if (url == kSyncMeetingSpaceCollectionsUrl) {
    handleRosterResponse(body);
  }
}

void MeetingBridge::handleRosterResponse(const std::string &body) {
  std::vector<RawDevice> roster;
  try {
    const auto bytes = base64Decode(body);
    const DecodedMessage response =
        decoder_.decode(toTypeId(MeetMessage::UserInfoListResponse), bytes);
    roster = fromUserInfoListResponse(response);
  } catch (const DecodeError &e) {
    reportError(std::string("Error decoding roster response: ") + e.what());
    return;
  }
  if (!roster.empty()) {
    store_.applyFullRoster(roster);
  }
}

void MeetingBridge::onContributingSources(
    const std::string &receiver_id,
    const std::vector<ContributingSource> &sources) {
  receivers_.update(receiver_id, sources);
}

void MeetingBridge::reportError(const std::string &message) {
  std::cerr << "[MeetingBridge] " << message << std::endl;
  channel_.sendJson(control::Error{message});
}

// ------------------------------------------------------------------
// Store notifications
// ------------------------------------------------------------------

void MeetingBridge::onUsersUpdated(const RosterDiff &diff) {
  control::UsersUpdate update;
  update.new_users = diff.joined;
  update.removed_users = diff.left;
  update.updated_users = diff.updated;
  channel_.sendJson(update);
}

void MeetingBridge::onDeviceOutputsUpdated(
    const std::vector<DeviceOutput> &outputs) {
  channel_.sendJson(control::DeviceOutputsUpdate{outputs});
}

// ------------------------------------------------------------------
// Tracks
// ------------------------------------------------------------------

void MeetingBridge::onTrackAdded(const TrackEvent &event) {
  if (torn_down_) {
    return;
  }
  cancelPipelines(event.track_id);
  switch (event.kind) {
  case TrackKind::Video:
    addVideoTrack(event);
    break;
  case TrackKind::Audio:
    addAudioTrack(event);
    break;
  case TrackKind::MixedAudio:
    addMixedAudioTrack(event);
    break;
  }
}

void MeetingBridge::onTrackEnded(const std::string &track_id) {
  if (tracks_.remove(track_id)) {
    std::cout << "[MeetingBridge] video track ended: " << track_id
              << std::endl;
  }
  cancelPipelines(track_id);
}

bool MeetingBridge::isScreenShareStream(const std::string &stream_id) const {
  if (stream_id.empty()) {
    return false;
  }
  for (const auto &device : store_.currentScreenShareDevices()) {
    const DeviceOutput *output =
        store_.deviceOutput(device.device_id, OutputType::VIDEO);
    if (output != nullptr && output->stream_id == stream_id) {
      return true;
    }
  }
  return false;
}

void MeetingBridge::addVideoTrack(const TrackEvent &event) {
  const std::string stream_id =
      event.stream_ids.empty() ? std::string() : event.stream_ids.front();
  if (stream_id.empty()) {
    std::cerr << "[MeetingBridge] video track " << event.track_id
              << " has no stream id, not relaying" << std::endl;
    return;
  }

  const bool screen_share = isScreenShareStream(stream_id);
  tracks_.upsert(event.track_id, stream_id, screen_share, clock_() / 1000);
  std::cout << "[MeetingBridge] video track added: " << event.track_id
            << " stream=" << stream_id
            << (screen_share ? " (screen share)" : "") << std::endl;

  if (!event.video) {
    return;
  }
  const int fps =
      screen_share ? options_.screen_share_fps : options_.camera_fps;
  auto state = std::make_shared<VideoTrackState>();
  state->stream_id = stream_id;
  state->frame_interval_us = 1000000 / fps;

  auto pipeline = std::make_shared<FramePipeline<VideoFrame>>(
      io_, "video:" + event.track_id, event.video,
      [this, state](VideoFrame &frame) { relayVideoFrame(*state, frame); });
  video_pipelines_[event.track_id] = pipeline;
  pipeline->start();
}

void MeetingBridge::addAudioTrack(const TrackEvent &event) {
  if (!options_.send_per_participant_audio || !event.audio) {
    return;
  }
  auto state = std::make_shared<AudioTrackState>();
  state->receiver_id = event.receiver_id;

  auto pipeline = std::make_shared<FramePipeline<AudioFrame>>(
      io_, "audio:" + event.track_id, event.audio,
      [this, state](AudioFrame &frame) {
        relayParticipantAudio(*state, frame);
      });
  audio_pipelines_[event.track_id] = pipeline;
  pipeline->start();
}

void MeetingBridge::addMixedAudioTrack(const TrackEvent &event) {
  if (!event.audio) {
    return;
  }
  auto pipeline = std::make_shared<FramePipeline<AudioFrame>>(
      io_, "mixed-audio:" + event.track_id, event.audio,
      [this](AudioFrame &frame) { relayMixedAudio(frame); });
  audio_pipelines_[event.track_id] = pipeline;
  pipeline->start();
}

void MeetingBridge::cancelPipelines(const std::string &track_id) {
  auto video = video_pipelines_.find(track_id);
  if (video != video_pipelines_.end()) {
    video->second->cancel();
    video_pipelines_.erase(video);
  }
  auto audio = audio_pipelines_.find(track_id);
  if (audio != audio_pipelines_.end()) {
    audio->second->cancel();
    audio_pipelines_.erase(audio);
  }
}

void MeetingBridge::relayVideoFrame(VideoTrackState &state,
                                    VideoFrame &frame) {
  if (state.stream_id != tracks_.activeStreamId()) {
    return;
  }
  const std::int64_t now_us = clock_();
  if (state.last_sent_us &&
      now_us - *state.last_sent_us < state.frame_interval_us) {
    return;
  }

  wire::Video video;
  video.timestamp_us = now_us;
  video.stream_id = state.stream_id;
  video.width = frame.width();
  video.height = frame.height();
  video.frame = frame.data();
  channel_.send(WireMessage(std::move(video)));
  state.last_sent_us = now_us;
}

void MeetingBridge::relayParticipantAudio(AudioTrackState &state,
                                          AudioFrame &frame) {
  std::vector<float> mono = frame.downmixToMono();

  const AudioFormat format = frame.describe();
  if (!state.last_format || *state.last_format != format) {
    state.last_format = format;
    channel_.sendJson(control::AudioFormatUpdate{format});
  }

  if (allZero(mono)) {
    return;
  }

  const Device *speaker =
      loudestParticipant(receivers_.sources(state.receiver_id), store_);
  if (speaker == nullptr || speaker->device_id.empty()) {
    return;
  }

  wire::PerParticipantAudio audio;
  audio.participant_id = speaker->device_id;
  audio.samples = std::move(mono);
  channel_.send(WireMessage(std::move(audio)));
}

void MeetingBridge::relayMixedAudio(AudioFrame &frame) {
  std::vector<float> mono = frame.downmixToMono();
  activity_.feed(mono);
  if (!options_.send_mixed_audio) {
    return;
  }
  wire::MixedAudio audio;
  audio.samples = std::move(mono);
  channel_.send(WireMessage(std::move(audio)));
}

// ------------------------------------------------------------------
// Media sending hooks
// ------------------------------------------------------------------

void MeetingBridge::onMediaSendingEnabled() {
  if (ui_ != nullptr) {
    // The participant list has to be open before the chat panel.
    if (auto missing = ui_->prepareMeetingView(options_.recording_view)) {
      reportError(*missing);
    }
    if (ui_->openChatPanel()) {
      channel_.sendJson(control::ChatStatusChange{"ready_to_send"});
    } else {
      reportError("Failed to find chat input in openChatPanel");
    }
  }
  startMonitors();
}

void MeetingBridge::onMediaSendingDisabling() {
  if (ui_ != nullptr) {
    ui_->restoreMeetingView();
  }
}

void MeetingBridge::onMediaSendingDisabled() { stopMonitors(); }

void MeetingBridge::startMonitors() {
  audio_activity_task_.start(
      std::chrono::milliseconds(options_.audio_activity_interval_ms),
      [this]() { checkAudioActivity(); });
  memory_usage_task_.start(
      std::chrono::milliseconds(options_.memory_usage_interval_ms),
      [this]() { checkMemoryUsage(); });
  needed_interactions_task_.start(
      std::chrono::milliseconds(options_.needed_interactions_interval_ms),
      [this]() { checkNeededInteractions(); });
}

void MeetingBridge::stopMonitors() {
  audio_activity_task_.stop();
  memory_usage_task_.stop();
  needed_interactions_task_.stop();
}

void MeetingBridge::checkAudioActivity() {
  if (auto status = activity_.check()) {
    channel_.sendJson(*status);
  }
}

void MeetingBridge::checkMemoryUsage() {
  if (auto peak = peakResidentBytes()) {
    channel_.sendJson(control::MemoryUsage{*peak});
  }
}

void MeetingBridge::checkNeededInteractions() {
  if (ui_ == nullptr) {
    return;
  }
  switch (ui_->acceptRecordingNotice()) {
  case NoticeResult::NotPresent:
    break;
  case NoticeResult::Accepted:
    channel_.sendJson(control::UiInteraction{
        "Automatically accepted recording notification"});
    break;
  case NoticeResult::ButtonMissing:
    channel_.sendJson(control::Error{"Found recording dialog but could not "
                                     "find button to accept recording "
                                     "notification"});
    break;
  case NoticeResult::ClickFailed:
    channel_.sendJson(control::Error{
        "Error clicking button to accept recording notification"});
    break;
  }

  if (ui_->removedFromMeeting()) {
    channel_.sendJson(control::MeetingStatusChange{"removed_from_meeting"});
  }
}

} // namespace meetbridge
