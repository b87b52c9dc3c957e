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

#include <iostream>
#include <map>
#include <set>
#include <random>
#include "../src/util/log.h"
#include "../src/util/logmanager.h"
#include "../src/sched/snapshot_json.h"
#include "../src/sched/tick_driver.h"

using namespace paneflow;
using namespace paneflow::sched;
using namespace std;

/**
 * Stand-in renderer. Panes marked with stall() hang in Reflowing until
 * release() is called; everything else finishes each phase at once.
 */
class DemoExecutor : public ReflowExecutor {
public:
    PhaseStatus run_phase(const ScheduledWork& work, ExecutionPhase phase) override {
        if (phase == ExecutionPhase::Reflowing && stalled_.count(work.pane_id) > 0 && !released_) {
            return PhaseStatus::Pending;
        }
        ++phases_run_;
        return PhaseStatus::Done;
    }

    void stall(PaneId pane) { stalled_.insert(pane); }
    void release() { released_ = true; }
    uint64_t phases_run() const { return phases_run_; }

private:
    set<PaneId> stalled_;
    bool released_ = false;
    uint64_t phases_run_ = 0;
};

int main() {
    initLoggingFromEnv();
    LogManager log_manager(LogManager::pathFromEnv());
    if (!log_manager.path().empty() && !log_manager.start()) {
        return 1;
    }

    cout << "=== Resize Storm Demo ===\n\n";

    SchedulerConfig config = SchedulerConfig::remote_heavy();
    ResizeScheduler scheduler(config);
    DemoExecutor executor;

    TickDriverOptions options;
    options.watchdog.warning_threshold_ms = 40;
    options.watchdog.critical_threshold_ms = 120;
    options.watchdog.sustained_critical_evaluations = 4;
    TickDriver driver(scheduler, executor, options);

    // Tab 1 holds four local panes, tab 2 three panes on one SSH host
    // and tab 3 two panes behind a mux server.
    struct DemoPane {
        PaneId id;
        TabId tab;
        Domain domain;
    };
    vector<DemoPane> panes = {
        {1, 1, Domain::local()}, {2, 1, Domain::local()},
        {3, 1, Domain::local()}, {4, 1, Domain::local()},
        {11, 2, Domain::remote("build-01")}, {12, 2, Domain::remote("build-01")},
        {13, 2, Domain::remote("build-01")},
        {21, 3, Domain::multiplexed("edge-01:9001")}, {22, 3, Domain::multiplexed("edge-01:9001")},
    };
    executor.stall(12);

    mt19937 gen(7);
    uniform_int_distribution<uint32_t> units(1, 3);
    bernoulli_distribution drag(0.6);
    map<PaneId, IntentSeq> seqs;

    uint64_t now = 1000;
    size_t completed = 0;
    size_t abandoned = 0;
    DegradationTier worst = DegradationTier::FullQuality;

    for (int tick = 0; tick < 60; ++tick) {
        now += 16;

        // The operator drags a split for the first 30 ticks
        if (tick < 30) {
            for (const auto& p : panes) {
                if (!drag(gen)) {
                    continue;
                }
                ResizeIntent intent;
                intent.pane_id = p.id;
                intent.intent_seq = ++seqs[p.id];
                intent.work_class = p.domain.kind == DomainKind::Local ? WorkClass::Interactive
                                                                       : WorkClass::Background;
                intent.work_units = units(gen);
                intent.submitted_at_ms = now;
                intent.domain = p.domain;
                intent.tab_id = p.tab;
                scheduler.submit(intent);
            }
        }
        if (tick == 40) {
            executor.release();
        }

        uint32_t input_backlog = tick < 30 ? static_cast<uint32_t>(tick % 3) : 0;
        TickReport report = driver.tick(config.frame_budget_units, input_backlog, now);
        completed += report.completed;
        abandoned += report.abandoned;
        if (report.degradation.tier > worst) {
            worst = report.degradation.tier;
        }

        if (tick % 10 == 0 || report.safe_mode_engaged) {
            cout << "tick " << tick << ": scheduled " << report.frame.scheduled.size()
                 << ", in flight " << report.in_flight
                 << ", watchdog " << to_string(report.watchdog.severity)
                 << ", tier " << to_string(report.degradation.tier) << "\n";
        }
    }

    const SchedulerMetrics& m = scheduler.metrics();
    cout << "\nCompleted transactions:  " << completed << "\n";
    cout << "Abandoned transactions:  " << abandoned << "\n";
    cout << "Coalesced intents:       " << m.superseded_intents << "\n";
    cout << "Storms detected:         " << m.storm_events_detected << "\n";
    cout << "Storm picks throttled:   " << m.storm_picks_throttled << "\n";
    cout << "Domain throttled:        " << m.domain_budget_throttled << "\n";
    cout << "Forced background runs:  " << m.forced_background_runs << "\n";
    cout << "Phases executed:         " << executor.phases_run() << "\n";
    cout << "Worst degradation tier:  " << to_string(worst) << "\n\n";

    DebugSnapshot dbg = scheduler.debug_snapshot(8);
    cout << "Invariant report: " << (dbg.invariants.is_clean() ? "clean" : "VIOLATIONS") << "\n";
    cout << "Last watchdog assessment:\n"
         << to_json(evaluate_watchdog(dbg, now, options.watchdog)) << "\n";
    return dbg.invariants.is_clean() ? 0 : 2;
}
