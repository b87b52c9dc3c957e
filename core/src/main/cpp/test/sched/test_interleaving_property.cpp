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

#include <gtest/gtest.h>
#include <map>
#include <random>
#include "sched/resize_scheduler.h"
#include "sched_test_util.h"

using namespace paneflow::sched;
using namespace paneflow::sched::testing_util;

/**
 * Random interleavings of submit / schedule_frame / mark_phase / complete
 * with the invariant auditor checked along the way.
 */
class InterleavingTest : public ::testing::Test {
protected:
    static constexpr PaneId kPanes = 6;
    static constexpr int kSteps = 2000;

    struct Trace {
        uint64_t commits = 0;
        uint64_t frames = 0;
        uint64_t over_budget_frames = 0;
    };

    static SchedulerConfig config_for(uint32_t seed) {
        SchedulerConfig cfg;
        cfg.max_lifecycle_events = kSteps * 8;
        cfg.storm_window_ms = 40;
        cfg.storm_threshold_intents = 3;
        cfg.domain_budget_enabled = (seed % 2) == 0;
        cfg.allow_single_oversubscription = (seed % 3) != 0;
        return cfg;
    }

    static Domain domain_of(PaneId pane) {
        switch (pane % 3) {
            case 0:  return Domain::local();
            case 1:  return Domain::remote("host-" + std::to_string(pane % 2));
            default: return Domain::multiplexed("edge");
        }
    }

    static Trace run(uint32_t seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> op_dist(0, 99);
        std::uniform_int_distribution<PaneId> pane_dist(1, kPanes);
        std::uniform_int_distribution<uint32_t> units_dist(1, 4);
        std::uniform_int_distribution<uint32_t> budget_dist(0, 6);
        std::uniform_int_distribution<uint32_t> backlog_dist(0, 2);
        std::uniform_int_distribution<uint64_t> tick_dist(0, 15);

        ResizeScheduler s(config_for(seed));
        std::map<PaneId, IntentSeq> submitted;
        std::map<PaneId, std::pair<IntentSeq, ExecutionPhase>> running;
        uint64_t now = 1000;
        Trace trace;

        for (int step = 0; step < kSteps; ++step) {
            now += tick_dist(rng);
            int op = op_dist(rng);
            PaneId pane = pane_dist(rng);

            if (op < 40) {
                // Mostly fresh sequences, sometimes a stale replay
                IntentSeq seq = submitted[pane] + 1;
                if (op < 4 && submitted[pane] > 0) {
                    seq = submitted[pane];
                }
                WorkClass cls = (op % 4 == 0) ? WorkClass::Background : WorkClass::Interactive;
                SubmitOutcome out = s.submit(intent(pane, seq, now, cls, units_dist(rng),
                                                    domain_of(pane), TabId{pane % 2}));
                if (out.is_accepted()) {
                    submitted[pane] = seq;
                } else if (out.status == SubmitStatus::Rejected) {
                    EXPECT_TRUE(out.reason == RejectReason::OutOfOrder ||
                                out.reason == RejectReason::Overload);
                }
            } else if (op < 60) {
                FrameResult frame = s.schedule_frame_with_backlog(budget_dist(rng), backlog_dist(rng));
                ++trace.frames;
                uint32_t in_budget = 0;
                size_t over = 0;
                for (const auto& w : frame.scheduled) {
                    if (w.over_budget) {
                        ++over;
                    } else {
                        in_budget += w.work_units;
                    }
                    EXPECT_EQ(running.count(w.pane_id), 0u) << "pane " << w.pane_id << " picked twice";
                    running[w.pane_id] = {w.intent_seq, ExecutionPhase::Preparing};
                }
                EXPECT_LE(over, 1u);
                EXPECT_LE(in_budget, frame.effective_budget_units);
                if (over > 0) {
                    ++trace.over_budget_frames;
                    EXPECT_EQ(frame.input_reserved_units, 0u);
                }
            } else if (op < 85) {
                auto it = running.find(pane);
                if (it == running.end()) {
                    continue;
                }
                IntentSeq seq = it->second.first;
                std::optional<ExecutionPhase> next = next_phase(it->second.second);
                if (next) {
                    if (s.mark_phase(pane, seq, *next, now)) {
                        it->second.second = *next;
                    } else {
                        running.erase(it);
                    }
                } else {
                    bool committed = s.complete(pane, seq);
                    if (committed) {
                        // Only the newest intent ever reaches the screen
                        EXPECT_EQ(seq, submitted[pane]);
                        ++trace.commits;
                    }
                    running.erase(it);
                }
            } else if (op < 95) {
                if (s.cancel_if_superseded(pane)) {
                    running.erase(pane);
                }
            } else if (op < 97) {
                s.set_emergency_disable(!s.gate().emergency_disable);
            } else {
                InvariantReport report = check_snapshot_invariants(s.snapshot());
                EXPECT_TRUE(report.is_clean()) << "seed " << seed << " step " << step << ": "
                    << (report.violations.empty() ? "" : report.violations.front().message);
            }

            // Single flight
            SchedulerSnapshot snap = s.snapshot();
            EXPECT_LE(snap.active_total, static_cast<size_t>(kPanes));
            for (const auto& row : snap.panes) {
                if (row.active_seq && row.pending_seq) {
                    EXPECT_GT(*row.pending_seq, *row.active_seq);
                }
            }
        }

        std::vector<LifecycleEvent> events = s.lifecycle_events();
        InvariantReport report = check_lifecycle_invariants(events);
        EXPECT_TRUE(report.is_clean()) << "seed " << seed << ": "
            << (report.violations.empty() ? "" : report.violations.front().message);
        for (size_t i = 1; i < events.size(); ++i) {
            EXPECT_LT(events[i - 1].event_seq, events[i].event_seq);
        }
        for (const auto& ev : events) {
            EXPECT_EQ(ev.stage, implied_stage(ev.detail));
        }
        EXPECT_TRUE(check_snapshot_invariants(s.snapshot()).is_clean());
        return trace;
    }
};

TEST_F(InterleavingTest, RandomTracesStayConsistent) {
    uint64_t commits = 0;
    uint64_t frames = 0;
    for (uint32_t seed : {1u, 7u, 42u, 1234u, 90001u, 424242u}) {
        SCOPED_TRACE(seed);
        Trace t = run(seed);
        commits += t.commits;
        frames += t.frames;
    }
    // The generator must actually exercise the pipeline
    EXPECT_GT(frames, 0u);
    EXPECT_GT(commits, 0u);
}
