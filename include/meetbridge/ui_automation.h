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

#include <optional>
#include <string>

namespace meetbridge {

/**
 * Meeting layout the recording is made in.
 */
enum class RecordingView {
  SpeakerView,
  GalleryView,
};

/**
 * Outcome of looking for a recording/transcription consent notice.
 */
enum class NoticeResult {
  /// No notice on screen.
  NotPresent,
  Accepted,
  /// Notice found but no accept button in it.
  ButtonMissing,
  /// Accept button found but clicking it failed.
  ClickFailed,
};

/**
 * Meeting page automation supplied by the integration layer.
 *
 * Implementations locate and click controls in the meeting UI. All calls
 * are made on the bridge's io_context thread.
 */
class UiAutomation {
public:
  virtual ~UiAutomation() = default;

  /// Accept a "being recorded / transcribed" notice if one is showing.
  virtual NoticeResult acceptRecordingNotice() = 0;

  /// True when the page says the bot was removed or the meeting ended.
  virtual bool removedFromMeeting() = 0;

  /// Open the chat panel. Returns false if the chat input was not found.
  /// Called after prepareMeetingView().
  virtual bool openChatPanel() = 0;

  /**
   * Arrange the page for recording: hide chrome and, in gallery view,
   * open the participant list. Runs before the chat panel is opened.
   *
   * @return  A description of what could not be found, or std::nullopt on
   *          success.
   */
  virtual std::optional<std::string> prepareMeetingView(RecordingView view) = 0;

  /// Undo prepareMeetingView().
  virtual void restoreMeetingView() = 0;
};

} // namespace meetbridge
