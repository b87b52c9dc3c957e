/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "lifecycle.h"
#include <algorithm>

namespace paneflow {
namespace sched {

std::optional<ExecutionPhase> next_phase(ExecutionPhase phase) {
    switch (phase) {
    case ExecutionPhase::Preparing:
        return ExecutionPhase::Reflowing;
    case ExecutionPhase::Reflowing:
        return ExecutionPhase::Presenting;
    case ExecutionPhase::Presenting:
        return std::nullopt;
    }
    return std::nullopt;
}

const LifecycleEvent& LifecycleLog::append(LifecycleEvent event) {
    event.event_seq = next_seq_++;
    events_.push_back(std::move(event));
    while (events_.size() > capacity_) {
        events_.pop_front();
        ++evicted_;
    }
    return events_.back();
}

std::vector<LifecycleEvent> LifecycleLog::recent(size_t limit) const {
    size_t n = (limit == 0) ? events_.size() : std::min(limit, events_.size());
    return std::vector<LifecycleEvent>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

std::vector<LifecycleEvent> LifecycleLog::since(uint64_t event_seq) const {
    auto first = std::upper_bound(events_.begin(), events_.end(), event_seq,
                                  [](uint64_t seq, const LifecycleEvent& e) {
                                      return seq < e.event_seq;
                                  });
    return std::vector<LifecycleEvent>(first, events_.end());
}

} // namespace sched
} // namespace paneflow
