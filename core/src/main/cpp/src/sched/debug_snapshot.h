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
#include <mutex>
#include <optional>
#include <vector>
#include "invariants.h"
#include "snapshot.h"
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Point-in-time view bundled for telemetry and triage. Never mutated
 * after creation; stale as soon as the scheduler runs again.
 */
struct DebugSnapshot {
    GateState gate;
    SchedulerSnapshot scheduler;
    std::vector<LifecycleEvent> lifecycle_events;   // oldest first
    InvariantReport invariants;
    InvariantTelemetry invariant_telemetry;

    /**
     * Active transactions whose current phase is at least `threshold_ms` old.
     */
    std::vector<StalledTransaction> stalled_transactions(uint64_t now_ms,
                                                         uint64_t threshold_ms) const;
};

/**
 * Process-wide holder of the most recently published debug snapshot,
 * read by introspection surfaces on other threads.
 */
class DebugSnapshotStore {
public:
    static DebugSnapshotStore& global();

    void publish(const DebugSnapshot& snapshot);
    std::optional<DebugSnapshot> latest() const;
    uint64_t publish_count() const;
    void clear();

private:
    DebugSnapshotStore() = default;

    mutable std::mutex mutex_;
    std::optional<DebugSnapshot> latest_;
    uint64_t publish_count_ = 0;
};

} // namespace sched
} // namespace paneflow
