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
#include <stdexcept>
#include <string>

namespace meetbridge {

/**
 * Raised when an inbound platform payload cannot be turned into a record.
 *
 * A DecodeError always concerns exactly one message. Callers at the
 * observer boundary catch it, report it on the JSON Error channel and keep
 * processing subsequent messages.
 */
class DecodeError : public std::runtime_error {
public:
  enum class ErrorCode : std::uint32_t {
    SHORT_READ = 1,
    INVALID_TAG = 2,
    WIRE_TYPE_MISMATCH = 3,
    NESTING_TOO_DEEP = 4,
    UNKNOWN_MESSAGE_TYPE = 5,
    INVALID_PAYLOAD_ENCODING = 6,
  };

  /**
   * @param code     Failure category.
   * @param message  Human-readable detail. When empty, the default message
   *                 for `code` is used.
   */
  explicit DecodeError(ErrorCode code, const std::string &message = {});

  ErrorCode code() const noexcept { return code_; }

  static const char *defaultMessageFor(ErrorCode code);

private:
  ErrorCode code_;
};

} // namespace meetbridge
