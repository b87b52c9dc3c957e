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

#pragma once
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Phase that follows `phase` in the forward order
 * Preparing -> Reflowing -> Presenting. Presenting has no successor
 * phase; it leaves through complete().
 */
std::optional<ExecutionPhase> next_phase(ExecutionPhase phase);

inline bool is_immediate_successor(ExecutionPhase from, ExecutionPhase to) {
    auto next = next_phase(from);
    return next && *next == to;
}

/**
 * Bounded, append-only log of lifecycle events.
 *
 * Sequence numbers are assigned here and are strictly increasing for the
 * lifetime of the log, eviction included. Oldest events are evicted once
 * the capacity is reached.
 */
class LifecycleLog {
public:
    explicit LifecycleLog(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    /**
     * Stamp `event` with the next sequence number and append it.
     * @return the stored event
     */
    const LifecycleEvent& append(LifecycleEvent event);

    /**
     * Most recent `limit` events, oldest first. 0 returns every retained event.
     */
    std::vector<LifecycleEvent> recent(size_t limit) const;

    /**
     * Retained events with event_seq strictly greater than `event_seq`.
     */
    std::vector<LifecycleEvent> since(uint64_t event_seq) const;

    size_t size() const { return events_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t last_seq() const { return next_seq_ - 1; }
    uint64_t evicted() const { return evicted_; }

private:
    size_t capacity_;
    uint64_t next_seq_ = 1;
    uint64_t evicted_ = 0;
    std::deque<LifecycleEvent> events_;
};

} // namespace sched
} // namespace paneflow
