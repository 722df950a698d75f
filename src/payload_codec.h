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
#include <string>
#include <vector>

namespace meetbridge {

// Upper bound for one inflated collections payload.
constexpr std::size_t kMaxInflatedPayloadBytes = 64 * 1024 * 1024;

/// Standard base64 with optional padding; ASCII whitespace is ignored.
/// Throws DecodeError(INVALID_PAYLOAD_ENCODING) on any other character.
std::vector<std::uint8_t> base64Decode(const std::string &encoded);

/// Inflate a zlib stream (RFC 1950). Throws
/// DecodeError(INVALID_PAYLOAD_ENCODING) on a corrupt or truncated stream,
/// or when the output would exceed `max_output`.
std::vector<std::uint8_t>
inflatePayload(const std::uint8_t *data, std::size_t size,
               std::size_t max_output = kMaxInflatedPayloadBytes);

} // namespace meetbridge
