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
#include <optional>
#include <vector>
#include "metrics.h"
#include "scheduler_config.h"
#include "types.h"

namespace paneflow {
namespace sched {

// One transaction-table row, copied out of the live table
struct PaneSnapshot {
    PaneId pane_id = 0;
    std::optional<IntentSeq> latest_seq;
    std::optional<IntentSeq> pending_seq;
    std::optional<WorkClass> pending_class;
    std::optional<IntentSeq> active_seq;
    std::optional<ExecutionPhase> active_phase;
    std::optional<uint64_t> phase_started_at_ms;
    uint32_t consecutive_deferrals = 0;
    uint32_t aging_credit = 0;
};

struct SchedulerSnapshot {
    SchedulerConfig config;
    SchedulerMetrics metrics;
    size_t pending_total = 0;
    size_t active_total = 0;
    std::vector<PaneSnapshot> panes;    // sorted by pane_id
};

/** Resolved kill-switch state: active = control_plane_enabled && !emergency_disable */
struct GateState {
    bool control_plane_enabled = true;
    bool emergency_disable = false;
    bool legacy_fallback_enabled = true;
    bool active = true;
};

// Active transaction that has not left its phase for a while
struct StalledTransaction {
    PaneId pane_id = 0;
    IntentSeq intent_seq = 0;
    std::optional<ExecutionPhase> active_phase;
    uint64_t age_ms = 0;
    std::optional<IntentSeq> latest_seq;
};

} // namespace sched
} // namespace paneflow
