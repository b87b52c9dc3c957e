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

#include "tick_driver.h"
#include "../util/log.h"

namespace paneflow {
namespace sched {

TickDriver::TickDriver(ResizeScheduler& scheduler, ReflowExecutor& executor,
                       const TickDriverOptions& options)
    : scheduler_(scheduler)
    , executor_(executor)
    , options_(options)
    , watchdog_(options.watchdog)
    , ladder_(options.degradation) {
}

bool TickDriver::step(InFlight& item, uint64_t now_ms, TickReport& report) {
    const ScheduledWork& work = item.work;

    if (scheduler_.cancel_if_superseded(work.pane_id)) {
        ++report.abandoned;
        return false;
    }

    if (executor_.run_phase(work, item.phase) == PhaseStatus::Pending) {
        return true;
    }

    std::optional<ExecutionPhase> next = next_phase(item.phase);
    if (!next) {
        if (scheduler_.complete(work.pane_id, work.intent_seq)) {
            ++report.completed;
        } else {
            ++report.abandoned;
        }
        return false;
    }

    if (!scheduler_.mark_phase(work.pane_id, work.intent_seq, *next, now_ms)) {
        ++report.abandoned;
        return false;
    }
    item.phase = *next;
    ++report.phases_advanced;
    return true;
}

TickReport TickDriver::tick(uint32_t budget_units, uint32_t input_backlog, uint64_t now_ms) {
    TickReport report;
    report.frame = scheduler_.schedule_frame_with_backlog(budget_units, input_backlog);
    for (const auto& work : report.frame.scheduled) {
        in_flight_.push_back(InFlight{work, ExecutionPhase::Preparing});
    }

    std::vector<InFlight> still_running;
    still_running.reserve(in_flight_.size());
    for (auto& item : in_flight_) {
        if (step(item, now_ms, report)) {
            still_running.push_back(item);
        }
    }
    in_flight_.swap(still_running);
    report.in_flight = in_flight_.size();

    // ========== Health ==========

    DebugSnapshot dbg = scheduler_.debug_snapshot(options_.snapshot_event_limit);
    report.watchdog = watchdog_.evaluate(dbg, now_ms);

    DegradationSignals signals = DegradationSignals::from_watchdog(report.watchdog);
    signals.stormed_tabs = scheduler_.stormed_tabs();
    report.degradation = ladder_.evaluate(signals);

    if (report.watchdog.sustained_critical && options_.engage_safe_mode_on_sustained_critical &&
        !scheduler_.gate().emergency_disable) {
        error() << "tick: engaging safe mode, " << report.watchdog.stalled_critical
                << " transaction(s) stalled >= " << report.watchdog.critical_threshold_ms << "ms";
        scheduler_.set_emergency_disable(true);
        report.safe_mode_engaged = true;
        dbg.gate = scheduler_.gate();
    }

    if (std::optional<std::string> line = report.watchdog.warning_line()) {
        warn() << *line;
    }
    if (std::optional<std::string> line = report.degradation.warning_line()) {
        debug() << *line;
    }

    if (options_.publish_snapshots) {
        DebugSnapshotStore::global().publish(dbg);
    }
    return report;
}

} // namespace sched
} // namespace paneflow
