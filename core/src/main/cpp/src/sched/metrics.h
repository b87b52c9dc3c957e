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
#include <functional>
#include <string>

namespace paneflow {
namespace sched {

// Metric types
enum class MetricType {
    Counter,
    Gauge
};

/**
 * Scheduler counters. Plain fields: the owning tick is the only writer,
 * snapshots carry copies.
 */
struct SchedulerMetrics {
    // Rounds
    uint64_t frames = 0;
    uint64_t suppressed_frames = 0;

    // Admission
    uint64_t superseded_intents = 0;
    uint64_t rejected_out_of_order = 0;
    uint64_t suppressed_by_gate = 0;
    uint64_t overload_rejected = 0;
    uint64_t overload_evicted = 0;
    uint64_t dropped_after_deferrals = 0;

    // Selection
    uint64_t forced_background_runs = 0;
    uint64_t over_budget_runs = 0;
    uint64_t input_guardrail_frames = 0;
    uint64_t input_guardrail_deferrals = 0;
    uint64_t storm_events_detected = 0;
    uint64_t storm_picks_throttled = 0;
    uint64_t domain_budget_throttled = 0;

    // Transactions
    uint64_t cancelled_active = 0;
    uint64_t completed_active = 0;
    uint64_t completion_rejected = 0;

    // Last frame
    uint32_t last_frame_budget_units = 0;
    uint32_t last_effective_budget_units = 0;
    uint32_t last_input_backlog = 0;
    uint32_t last_frame_spent_units = 0;
    uint32_t last_frame_scheduled = 0;

    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;

    /**
     * Emit every counter and last-frame gauge with a "paneflow_" prefix.
     */
    void export_metrics(ExportFunc func) const;

    void reset() { *this = SchedulerMetrics(); }
};

} // namespace sched
} // namespace paneflow
