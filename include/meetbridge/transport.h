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
#include <vector>

namespace meetbridge {

/**
 * Ordered binary channel to the recording backend, supplied by the
 * integration layer (typically a local websocket).
 *
 * send() is only called on the bridge's io_context thread. An
 * implementation may throw std::runtime_error when a write fails.
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual bool isOpen() const = 0;
  virtual void send(const std::vector<std::uint8_t> &message) = 0;
};

} // namespace meetbridge
