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

#include "debug_snapshot.h"

namespace paneflow {
namespace sched {

std::vector<StalledTransaction> DebugSnapshot::stalled_transactions(uint64_t now_ms,
                                                                    uint64_t threshold_ms) const {
    std::vector<StalledTransaction> out;
    for (const auto& pane : scheduler.panes) {
        if (!pane.active_seq || !pane.phase_started_at_ms) {
            continue;
        }
        uint64_t started = *pane.phase_started_at_ms;
        uint64_t age_ms = now_ms > started ? now_ms - started : 0;
        if (age_ms < threshold_ms) {
            continue;
        }
        StalledTransaction st;
        st.pane_id = pane.pane_id;
        st.intent_seq = *pane.active_seq;
        st.active_phase = pane.active_phase;
        st.age_ms = age_ms;
        st.latest_seq = pane.latest_seq;
        out.push_back(st);
    }
    return out;
}

// ========== Global store ==========

DebugSnapshotStore& DebugSnapshotStore::global() {
    static DebugSnapshotStore instance;
    return instance;
}

void DebugSnapshotStore::publish(const DebugSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = snapshot;
    ++publish_count_;
}

std::optional<DebugSnapshot> DebugSnapshotStore::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

uint64_t DebugSnapshotStore::publish_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publish_count_;
}

void DebugSnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_.reset();
    publish_count_ = 0;
}

} // namespace sched
} // namespace paneflow
