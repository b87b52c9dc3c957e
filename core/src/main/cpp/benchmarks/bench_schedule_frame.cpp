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
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include "../src/util/log.h"
#include "../src/sched/resize_scheduler.h"

using namespace paneflow;
using namespace paneflow::sched;
using namespace std;

/**
 * Scheduling cost per frame with many panes under sustained resize
 * pressure. Every admitted transaction is committed right away so the
 * table stays busy.
 */
class ScheduleFrameBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        original_level_ = logLevel;
        logLevel = LOG_WARNING;
    }

    void TearDown() override {
        logLevel = original_level_;
    }

    struct Result {
        double ns_per_frame;
        double ns_per_submit;
        uint64_t scheduled;
    };

    static Result run(SchedulerConfig cfg, size_t panes, int frames) {
        cfg.max_pending_panes = panes * 2;
        cfg.storm_threshold_intents = 0;
        ResizeScheduler s(cfg);
        mt19937 gen(99);
        uniform_int_distribution<uint32_t> units(1, 4);
        vector<IntentSeq> seqs(panes + 1, 0);

        chrono::nanoseconds submit_time{0};
        chrono::nanoseconds frame_time{0};
        uint64_t submits = 0;
        uint64_t scheduled = 0;
        uint64_t now = 0;

        for (int f = 0; f < frames; ++f) {
            now += 16;
            auto start = chrono::high_resolution_clock::now();
            for (PaneId p = 1; p <= panes; p += 3) {
                ResizeIntent intent;
                intent.pane_id = p;
                intent.intent_seq = ++seqs[p];
                intent.work_class = (p % 5 == 0) ? WorkClass::Background : WorkClass::Interactive;
                intent.work_units = units(gen);
                intent.submitted_at_ms = now;
                intent.domain = (p % 4 == 0) ? Domain::remote("host-" + to_string(p % 7)) : Domain::local();
                intent.tab_id = p / 8;
                s.submit(intent);
                ++submits;
            }
            submit_time += chrono::high_resolution_clock::now() - start;

            start = chrono::high_resolution_clock::now();
            FrameResult frame = s.schedule_frame_with_backlog(32, static_cast<uint32_t>(f % 2));
            frame_time += chrono::high_resolution_clock::now() - start;

            for (const auto& w : frame.scheduled) {
                s.mark_phase(w.pane_id, w.intent_seq, ExecutionPhase::Reflowing, now);
                s.mark_phase(w.pane_id, w.intent_seq, ExecutionPhase::Presenting, now);
                s.complete(w.pane_id, w.intent_seq);
            }
            scheduled += frame.scheduled.size();
        }

        Result r;
        r.ns_per_frame = static_cast<double>(frame_time.count()) / frames;
        r.ns_per_submit = submits ? static_cast<double>(submit_time.count()) / submits : 0.0;
        r.scheduled = scheduled;
        return r;
    }

    int original_level_;
};

TEST_F(ScheduleFrameBenchmark, ScalesWithPaneCount) {
    const int frames = 2000;
    cout << "\nschedule_frame cost (" << frames << " frames, budget 32):\n";
    cout << setw(8) << "panes" << setw(16) << "ns/frame" << setw(16) << "ns/submit"
         << setw(12) << "scheduled" << "\n";

    for (size_t panes : {16u, 64u, 256u, 1024u}) {
        Result r = run(SchedulerConfig(), panes, frames);
        cout << setw(8) << panes << setw(16) << fixed << setprecision(0) << r.ns_per_frame
             << setw(16) << r.ns_per_submit << setw(12) << r.scheduled << "\n";
        EXPECT_GT(r.scheduled, 0u);
    }
}

TEST_F(ScheduleFrameBenchmark, DomainBudgetOverhead) {
    const int frames = 2000;
    const size_t panes = 256;

    Result plain = run(SchedulerConfig(), panes, frames);
    SchedulerConfig domains;
    domains.domain_budget_enabled = true;
    Result fair = run(domains, panes, frames);

    cout << "\nDomain budgets at " << panes << " panes:\n";
    cout << "  off: " << fixed << setprecision(0) << plain.ns_per_frame << " ns/frame\n";
    cout << "  on:  " << fair.ns_per_frame << " ns/frame\n";
    EXPECT_GT(fair.scheduled, 0u);
}
