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

#include <string>
#include <unordered_map>
#include <vector>

namespace meetbridge {

class ParticipantStore;
struct Device;

/// One RTP contributing source as last reported by a receiver. The source
/// id doubles as the stream id the platform announces in device outputs.
struct ContributingSource {
  std::string source_id;
  double audio_level = 0.0;
};

/// Latest contributing-source readings per receiver.
class ReceiverRegistry {
public:
  void update(const std::string &receiver_id,
              std::vector<ContributingSource> sources);

  /// Empty when the receiver was never polled.
  const std::vector<ContributingSource> &
  sources(const std::string &receiver_id) const;

  void remove(const std::string &receiver_id);
  void clear() { readings_.clear(); }

private:
  std::unordered_map<std::string, std::vector<ContributingSource>> readings_;
};

/**
 * Resolve the loudest known participant among `sources`.
 *
 * Sources whose id does not map to a device are dropped; the rest are
 * stably sorted by level, loudest first. Returns nullptr when nothing
 * resolves. The pointer refers into `store`.
 */
const Device *loudestParticipant(const std::vector<ContributingSource> &sources,
                                 const ParticipantStore &store);

} // namespace meetbridge
