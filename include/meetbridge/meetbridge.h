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

#include "audio_activity_monitor.h"
#include "audio_attribution.h"
#include "bridge_options.h"
#include "caption_manager.h"
#include "chat_message_manager.h"
#include "control_message.h"
#include "decode_error.h"
#include "device.h"
#include "frame_pipeline.h"
#include "media_channel.h"
#include "media_frame.h"
#include "meet_schema.h"
#include "meeting_bridge.h"
#include "message_decoder.h"
#include "message_schema.h"
#include "participant_store.h"
#include "periodic_task.h"
#include "rtc_observer.h"
#include "transport.h"
#include "ui_automation.h"
#include "video_track_manager.h"
#include "wire_message.h"
