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

#include "metrics.h"

namespace paneflow {
namespace sched {

void SchedulerMetrics::export_metrics(ExportFunc func) const {
    auto counter = [&func](const char* name, uint64_t value) {
        func(std::string("paneflow_") + name, MetricType::Counter, std::to_string(value));
    };
    auto gauge = [&func](const char* name, uint32_t value) {
        func(std::string("paneflow_") + name, MetricType::Gauge, std::to_string(value));
    };

    // Export counters
    counter("frames", frames);
    counter("suppressed_frames", suppressed_frames);
    counter("superseded_intents", superseded_intents);
    counter("rejected_out_of_order", rejected_out_of_order);
    counter("suppressed_by_gate", suppressed_by_gate);
    counter("overload_rejected", overload_rejected);
    counter("overload_evicted", overload_evicted);
    counter("dropped_after_deferrals", dropped_after_deferrals);
    counter("forced_background_runs", forced_background_runs);
    counter("over_budget_runs", over_budget_runs);
    counter("input_guardrail_frames", input_guardrail_frames);
    counter("input_guardrail_deferrals", input_guardrail_deferrals);
    counter("storm_events_detected", storm_events_detected);
    counter("storm_picks_throttled", storm_picks_throttled);
    counter("domain_budget_throttled", domain_budget_throttled);
    counter("cancelled_active", cancelled_active);
    counter("completed_active", completed_active);
    counter("completion_rejected", completion_rejected);

    // Export last-frame gauges
    gauge("last_frame_budget_units", last_frame_budget_units);
    gauge("last_effective_budget_units", last_effective_budget_units);
    gauge("last_input_backlog", last_input_backlog);
    gauge("last_frame_spent_units", last_frame_spent_units);
    gauge("last_frame_scheduled", last_frame_scheduled);
}

} // namespace sched
} // namespace paneflow
