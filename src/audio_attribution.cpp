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

#include "meetbridge/audio_attribution.h"

#include <algorithm>

#include "meetbridge/participant_store.h"

namespace meetbridge {

namespace {
const std::vector<ContributingSource> kNoSources;
}

void ReceiverRegistry::update(const std::string &receiver_id,
                              std::vector<ContributingSource> sources) {
  readings_[receiver_id] = std::move(sources);
}

const std::vector<ContributingSource> &
ReceiverRegistry::sources(const std::string &receiver_id) const {
  auto it = readings_.find(receiver_id);
  return it == readings_.end() ? kNoSources : it->second;
}

void ReceiverRegistry::remove(const std::string &receiver_id) {
  readings_.erase(receiver_id);
}

const Device *loudestParticipant(const std::vector<ContributingSource> &sources,
                                 const ParticipantStore &store) {
  struct Candidate {
    double level;
    const Device *device;
  };

  std::vector<Candidate> resolved;
  resolved.reserve(sources.size());
  for (const auto &source : sources) {
    if (const Device *device = store.deviceByStreamId(source.source_id)) {
      resolved.push_back({source.audio_level, device});
    }
  }
  if (resolved.empty()) {
    return nullptr;
  }

  std::stable_sort(resolved.begin(), resolved.end(),
                   [](const Candidate &a, const Candidate &b) {
                     return a.level > b.level;
                   });
  return resolved.front().device;
}

} // namespace meetbridge
