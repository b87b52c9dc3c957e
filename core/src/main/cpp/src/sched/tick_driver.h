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
#include <vector>
#include "degradation.h"
#include "resize_scheduler.h"
#include "watchdog.h"

namespace paneflow {
namespace sched {

enum class PhaseStatus {
    Done,       // phase work finished, advance the transaction
    Pending     // still running, ask again next tick
};

/**
 * Render-side work for one phase of a resize transaction. Implemented by
 * the embedding terminal; the driver only sequences calls.
 */
class ReflowExecutor {
public:
    virtual ~ReflowExecutor() = default;
    virtual PhaseStatus run_phase(const ScheduledWork& work, ExecutionPhase phase) = 0;
};

struct TickDriverOptions {
    WatchdogConfig watchdog;
    DegradationConfig degradation;
    size_t snapshot_event_limit = 64;
    bool engage_safe_mode_on_sustained_critical = true;
    bool publish_snapshots = true;
};

struct TickReport {
    FrameResult frame;
    size_t phases_advanced = 0;
    size_t completed = 0;
    size_t abandoned = 0;            // cancelled by supersession or refused by the scheduler
    size_t in_flight = 0;
    bool safe_mode_engaged = false;
    WatchdogAssessment watchdog;
    DegradationAssessment degradation;
};

/**
 * One render-loop tick: schedule, run one phase per in-flight
 * transaction, then assess health and publish the debug snapshot.
 */
class TickDriver {
public:
    TickDriver(ResizeScheduler& scheduler, ReflowExecutor& executor,
               const TickDriverOptions& options = TickDriverOptions());

    TickReport tick(uint32_t budget_units, uint32_t input_backlog, uint64_t now_ms);

    size_t in_flight() const { return in_flight_.size(); }
    const Watchdog& watchdog() const { return watchdog_; }
    const DegradationLadder& ladder() const { return ladder_; }

private:
    struct InFlight {
        ScheduledWork work;
        ExecutionPhase phase;
    };

    // false once the transaction has left the driver
    bool step(InFlight& item, uint64_t now_ms, TickReport& report);

    ResizeScheduler& scheduler_;
    ReflowExecutor& executor_;
    TickDriverOptions options_;
    Watchdog watchdog_;
    DegradationLadder ladder_;
    std::vector<InFlight> in_flight_;
};

} // namespace sched
} // namespace paneflow
