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

#include "meetbridge/decode_error.h"

namespace meetbridge {

DecodeError::DecodeError(ErrorCode code, const std::string &message)
    : std::runtime_error(message.empty() ? std::string(defaultMessageFor(code))
                                         : message),
      code_(code) {}

const char *DecodeError::defaultMessageFor(ErrorCode code) {
  switch (code) {
  case ErrorCode::SHORT_READ:
    return "Buffer ended before the field was complete";
  case ErrorCode::INVALID_TAG:
    return "Invalid field tag";
  case ErrorCode::WIRE_TYPE_MISMATCH:
    return "Wire type does not match the declared field kind";
  case ErrorCode::NESTING_TOO_DEEP:
    return "Nested messages exceed the maximum depth";
  case ErrorCode::UNKNOWN_MESSAGE_TYPE:
    return "Unknown message type";
  case ErrorCode::INVALID_PAYLOAD_ENCODING:
    return "Payload encoding is invalid";
  }

  // Should be unreachable if all enum values are covered.
  return "";
}

} // namespace meetbridge
