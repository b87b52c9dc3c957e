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
#include "sched/resize_scheduler.h"
#include "sched_test_util.h"

using namespace paneflow::sched;
using namespace paneflow::sched::testing_util;

class FrameSchedulerTest : public ::testing::Test {
protected:
    SchedulerConfig config = quiet_config();
};

// ===== Ordering and budget =====

TEST_F(FrameSchedulerTest, InteractiveBeforeBackground) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background));
    s.submit(intent(2, 1, 200, WorkClass::Interactive));
    s.submit(intent(3, 1, 150, WorkClass::Interactive));

    FrameResult frame = s.schedule_frame(8);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{3, 2, 1}));
    EXPECT_EQ(frame.budget_spent_units, 3u);
    EXPECT_EQ(frame.pending_after, 0u);
    EXPECT_EQ(s.active_total(), 3u);
}

TEST_F(FrameSchedulerTest, TiesBreakBySequenceThenPane) {
    ResizeScheduler s(config);
    s.submit(intent(5, 2, 100));
    s.submit(intent(4, 2, 100));
    s.submit(intent(6, 1, 100));

    FrameResult frame = s.schedule_frame(8);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{6, 4, 5}));
}

TEST_F(FrameSchedulerTest, BudgetLimitsPicks) {
    config.allow_single_oversubscription = false;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 3));
    s.submit(intent(2, 1, 101, WorkClass::Interactive, 3));
    s.submit(intent(3, 1, 102, WorkClass::Interactive, 1));

    FrameResult frame = s.schedule_frame(4);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1, 3}));
    EXPECT_EQ(frame.budget_spent_units, 4u);
    EXPECT_EQ(frame.pending_after, 1u);
    EXPECT_EQ(s.snapshot().panes[1].consecutive_deferrals, 1u);
}

TEST_F(FrameSchedulerTest, SingleOversubscriptionOnEmptyFrame) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 10));
    s.submit(intent(2, 1, 101, WorkClass::Interactive, 10));

    FrameResult frame = s.schedule_frame(4);
    ASSERT_EQ(frame.scheduled.size(), 1u);
    EXPECT_TRUE(frame.scheduled[0].over_budget);
    EXPECT_EQ(frame.budget_spent_units, 10u);
    EXPECT_EQ(s.metrics().over_budget_runs, 1u);
}

TEST_F(FrameSchedulerTest, NoOversubscriptionOnceWorkScheduled) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 2));
    s.submit(intent(2, 1, 101, WorkClass::Interactive, 10));

    FrameResult frame = s.schedule_frame(4);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1}));
    EXPECT_EQ(s.metrics().over_budget_runs, 0u);
}

TEST_F(FrameSchedulerTest, OversubscriptionDisabled) {
    config.allow_single_oversubscription = false;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 10));

    FrameResult frame = s.schedule_frame(4);
    EXPECT_TRUE(frame.scheduled.empty());
    EXPECT_EQ(frame.pending_after, 1u);
}

TEST_F(FrameSchedulerTest, ZeroBudgetNormalizedToOne) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100));
    s.submit(intent(2, 1, 100));

    FrameResult frame = s.schedule_frame(0);
    EXPECT_EQ(frame.frame_budget_units, 1u);
    EXPECT_EQ(frame.scheduled.size(), 1u);
}

TEST_F(FrameSchedulerTest, DefaultBudgetFromConfig) {
    config.frame_budget_units = 2;
    config.allow_single_oversubscription = false;
    ResizeScheduler s(config);
    for (PaneId p = 1; p <= 4; ++p) {
        s.submit(intent(p, 1, 100));
    }
    FrameResult frame = s.schedule_frame();
    EXPECT_EQ(frame.frame_budget_units, 2u);
    EXPECT_EQ(frame.scheduled.size(), 2u);
}

TEST_F(FrameSchedulerTest, ActiveTransactionsAreNotRepicked) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100));
    ASSERT_EQ(s.schedule_frame(8).scheduled.size(), 1u);

    // Newer intent waits until the in-flight one is cancelled or completes
    s.submit(intent(1, 2, 110));
    EXPECT_TRUE(s.schedule_frame(8).scheduled.empty());

    EXPECT_TRUE(s.cancel_if_superseded(1));
    FrameResult frame = s.schedule_frame(8);
    ASSERT_EQ(frame.scheduled.size(), 1u);
    EXPECT_EQ(frame.scheduled[0].intent_seq, 2u);
}

TEST_F(FrameSchedulerTest, FrameMetricsAndStartEvents) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background, 2));
    s.schedule_frame(6);

    const SchedulerMetrics& m = s.metrics();
    EXPECT_EQ(m.frames, 1u);
    EXPECT_EQ(m.last_frame_budget_units, 6u);
    EXPECT_EQ(m.last_effective_budget_units, 6u);
    EXPECT_EQ(m.last_frame_spent_units, 2u);
    EXPECT_EQ(m.last_frame_scheduled, 1u);

    auto events = s.lifecycle_events();
    ASSERT_EQ(events.size(), 2u);
    const LifecycleEvent& started = events[1];
    EXPECT_EQ(started.stage, LifecycleStage::Preparing);
    EXPECT_EQ(started.detail.kind, DetailKind::TransactionStarted);
    EXPECT_EQ(started.detail.work_class, WorkClass::Background);
    EXPECT_EQ(started.detail.work_units, 2u);
    EXPECT_EQ(started.frame_seq, 1u);
    EXPECT_EQ(started.active_seq, 1u);
    EXPECT_FALSE(started.pending_seq.has_value());
}

// ===== Input guardrail =====

TEST_F(FrameSchedulerTest, InputReserveShrinksBudget) {
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 2;
    config.input_reserve_units = 3;
    ResizeScheduler s(config);
    for (PaneId p = 1; p <= 6; ++p) {
        s.submit(intent(p, 1, 100));
    }

    FrameResult frame = s.schedule_frame_with_backlog(5, 2);
    EXPECT_EQ(frame.input_reserved_units, 3u);
    EXPECT_EQ(frame.effective_budget_units, 2u);
    EXPECT_EQ(frame.scheduled.size(), 2u);
    EXPECT_EQ(s.metrics().input_guardrail_frames, 1u);
    EXPECT_EQ(s.metrics().input_guardrail_deferrals, 4u);
}

TEST_F(FrameSchedulerTest, BacklogBelowThresholdReservesNothing) {
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 2;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100));

    FrameResult frame = s.schedule_frame_with_backlog(5, 1);
    EXPECT_EQ(frame.input_reserved_units, 0u);
    EXPECT_EQ(frame.effective_budget_units, 5u);
    EXPECT_EQ(frame.input_backlog, 1u);
    EXPECT_EQ(s.metrics().input_guardrail_frames, 0u);
}

TEST_F(FrameSchedulerTest, ReserveBlocksOversubscription) {
    config.allow_single_oversubscription = true;
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 1;
    config.input_reserve_units = 8;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 2));

    // Reserve clamps to leave one unit; the 2-unit pane may not run over it
    FrameResult frame = s.schedule_frame_with_backlog(4, 3);
    EXPECT_EQ(frame.input_reserved_units, 3u);
    EXPECT_EQ(frame.effective_budget_units, 1u);
    EXPECT_TRUE(frame.scheduled.empty());
    EXPECT_EQ(s.metrics().input_guardrail_deferrals, 1u);
}

TEST_F(FrameSchedulerTest, ReserveLeavesOneUnitForResizeWork) {
    config.max_deferrals_before_force = 2;
    config.max_deferrals_before_drop = 3;
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 1;
    config.input_reserve_units = 2;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background, 1));

    FrameResult frame = s.schedule_frame_with_backlog(2, 5);
    EXPECT_EQ(frame.input_reserved_units, 1u);
    EXPECT_EQ(frame.effective_budget_units, 1u);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1}));
    ASSERT_TRUE(run_to_completion(s, 1, 1, 110));

    // Sustained backlog never starves the pane into a deferral drop
    for (IntentSeq seq = 2; seq <= 20; ++seq) {
        s.submit(intent(1, seq, 100 + seq * 10, WorkClass::Background, 1));
        FrameResult next = s.schedule_frame_with_backlog(2, 5);
        ASSERT_EQ(picked_panes(next), (std::vector<PaneId>{1}));
        ASSERT_TRUE(run_to_completion(s, 1, seq, 105 + seq * 10));
    }
    EXPECT_EQ(s.metrics().dropped_after_deferrals, 0u);
    EXPECT_EQ(s.pending_total(), 0u);
}

TEST_F(FrameSchedulerTest, SingleUnitBudgetSkipsReserve) {
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 1;
    config.input_reserve_units = 2;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100));

    FrameResult frame = s.schedule_frame_with_backlog(1, 5);
    EXPECT_EQ(frame.input_reserved_units, 0u);
    EXPECT_EQ(frame.effective_budget_units, 1u);
    EXPECT_EQ(frame.scheduled.size(), 1u);
    EXPECT_EQ(s.metrics().input_guardrail_frames, 0u);
}

// ===== Aging, forcing and dropping =====

TEST_F(FrameSchedulerTest, DeferredWorkAccruesAgingCredit) {
    config.allow_single_oversubscription = false;
    config.aging_credit_per_frame = 10;
    config.max_aging_credit = 25;
    config.max_deferrals_before_force = 10;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 5));
    s.submit(intent(2, 1, 100, WorkClass::Background, 5));

    for (int i = 0; i < 3; ++i) {
        s.schedule_frame(1);
    }
    auto panes = s.snapshot().panes;
    EXPECT_EQ(panes[0].consecutive_deferrals, 3u);
    EXPECT_EQ(panes[0].aging_credit, 15u);    // interactive accrues half
    EXPECT_EQ(panes[1].aging_credit, 25u);    // capped
}

TEST_F(FrameSchedulerTest, AgingCreditOrdersWithinClass) {
    config.allow_single_oversubscription = false;
    config.max_deferrals_before_force = 10;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background, 2));
    s.schedule_frame(1);                 // pane 1 deferred once
    s.submit(intent(2, 1, 50, WorkClass::Background, 1));

    // Older submit time loses to accrued credit
    FrameResult frame = s.schedule_frame(2);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1}));
}

TEST_F(FrameSchedulerTest, StarvedBackgroundIsForced) {
    config.allow_single_oversubscription = false;
    config.max_deferrals_before_force = 2;
    ResizeScheduler s(config);
    s.submit(intent(9, 1, 100, WorkClass::Background));

    PaneId next = 1;
    for (int frame = 0; frame < 2; ++frame) {
        s.submit(intent(next++, 1, 100));
        s.submit(intent(next++, 1, 100));
        FrameResult r = s.schedule_frame(2);
        for (const auto& w : r.scheduled) {
            EXPECT_NE(w.pane_id, 9u);
        }
    }

    s.submit(intent(next++, 1, 100));
    s.submit(intent(next++, 1, 100));
    FrameResult r = s.schedule_frame(2);
    ASSERT_FALSE(r.scheduled.empty());
    EXPECT_EQ(r.scheduled[0].pane_id, 9u);
    EXPECT_TRUE(r.scheduled[0].forced_by_starvation);
    EXPECT_EQ(s.metrics().forced_background_runs, 1u);
}

TEST_F(FrameSchedulerTest, ForcedPickMayRunOverBudget) {
    config.allow_single_oversubscription = false;
    config.max_deferrals_before_force = 1;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background, 6));
    EXPECT_TRUE(s.schedule_frame(4).scheduled.empty());

    FrameResult r = s.schedule_frame(4);
    ASSERT_EQ(r.scheduled.size(), 1u);
    EXPECT_TRUE(r.scheduled[0].forced_by_starvation);
    EXPECT_TRUE(r.scheduled[0].over_budget);
}

TEST_F(FrameSchedulerTest, OverdeferredIntentDropped) {
    config.allow_single_oversubscription = false;
    config.max_deferrals_before_force = 2;
    config.max_deferrals_before_drop = 3;
    config.input_guardrail_enabled = true;
    config.input_backlog_threshold = 1;
    config.input_reserve_units = 4;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 3));

    // Pane wider than the unit left after the reserve: forced work may not
    // run over budget while input is reserved
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(s.schedule_frame_with_backlog(4, 5).scheduled.empty());
    }
    EXPECT_EQ(s.pending_total(), 1u);

    s.schedule_frame_with_backlog(4, 5);
    EXPECT_EQ(s.pending_total(), 0u);
    EXPECT_EQ(s.metrics().dropped_after_deferrals, 1u);

    auto events = s.lifecycle_events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().detail.kind, DetailKind::PendingDropped);
    EXPECT_EQ(events.back().detail.drop_reason, DropReason::DeferralTimeout);
}

// ===== Suppressed frames =====

TEST_F(FrameSchedulerTest, InactiveGateYieldsEmptyFrame) {
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100));
    s.set_emergency_disable(true);

    FrameResult frame = s.schedule_frame_with_backlog(8, 3);
    EXPECT_TRUE(frame.scheduled.empty());
    EXPECT_EQ(frame.pending_after, 1u);
    EXPECT_EQ(s.metrics().suppressed_frames, 1u);
    EXPECT_EQ(s.metrics().frames, 0u);
    EXPECT_EQ(s.metrics().last_input_backlog, 3u);
}

// ===== Storm and domain throttles =====

TEST_F(FrameSchedulerTest, StormedTabCappedPerFrame) {
    config.storm_window_ms = 50;
    config.storm_threshold_intents = 3;
    config.max_storm_picks_per_tab = 1;
    ResizeScheduler s(config);
    for (PaneId p = 1; p <= 4; ++p) {
        s.submit(intent(p, 1, 100 + p, WorkClass::Interactive, 1, Domain::local(), TabId(7)));
    }
    s.submit(intent(10, 1, 104, WorkClass::Interactive, 1, Domain::local(), TabId(8)));

    EXPECT_EQ(s.metrics().storm_events_detected, 1u);
    EXPECT_EQ(s.stormed_tabs(), 1u);

    FrameResult frame = s.schedule_frame(8);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1, 10}));
    EXPECT_EQ(s.metrics().storm_picks_throttled, 3u);
}

TEST_F(FrameSchedulerTest, StormClearsOnceWindowPasses) {
    config.storm_window_ms = 50;
    config.storm_threshold_intents = 2;
    config.max_storm_picks_per_tab = 1;
    config.max_deferrals_before_force = 10;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 1, Domain::local(), TabId(3)));
    s.submit(intent(2, 1, 100, WorkClass::Interactive, 1, Domain::local(), TabId(3)));
    EXPECT_EQ(s.schedule_frame(8).scheduled.size(), 1u);

    // A late arrival on another tab moves the clock past the window
    s.submit(intent(9, 1, 500, WorkClass::Interactive, 1, Domain::local(), TabId(4)));
    FrameResult frame = s.schedule_frame(8);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{2, 9}));
    EXPECT_EQ(s.stormed_tabs(), 0u);
}

TEST_F(FrameSchedulerTest, DomainSharesCapPicks) {
    config.domain_budget_enabled = true;
    ResizeScheduler s(config);
    for (PaneId p = 1; p <= 3; ++p) {
        s.submit(intent(p, 1, 100, WorkClass::Interactive, 1, Domain::local()));
    }
    for (PaneId p = 11; p <= 13; ++p) {
        s.submit(intent(p, 1, 100, WorkClass::Interactive, 1, Domain::remote("db")));
    }

    // 6 units split 4:2
    FrameResult frame = s.schedule_frame(6);
    EXPECT_EQ(picked_panes(frame), (std::vector<PaneId>{1, 2, 3, 11, 12}));
    EXPECT_EQ(s.metrics().domain_budget_throttled, 1u);
}

TEST_F(FrameSchedulerTest, ForcedPickBypassesThrottles) {
    config.domain_budget_enabled = true;
    config.max_deferrals_before_force = 1;
    ResizeScheduler s(config);
    s.submit(intent(1, 1, 100, WorkClass::Background, 1, Domain::multiplexed("mux0")));
    s.submit(intent(2, 1, 100, WorkClass::Interactive, 1, Domain::local()));
    s.submit(intent(3, 1, 100, WorkClass::Interactive, 1, Domain::local()));

    // mux share is floor(4 * 1 / 5) = 0
    FrameResult first = s.schedule_frame(4);
    EXPECT_EQ(picked_panes(first), (std::vector<PaneId>{2, 3}));

    s.submit(intent(4, 1, 110, WorkClass::Interactive, 1, Domain::local()));
    FrameResult second = s.schedule_frame(4);
    ASSERT_FALSE(second.scheduled.empty());
    EXPECT_EQ(second.scheduled[0].pane_id, 1u);
    EXPECT_TRUE(second.scheduled[0].forced_by_starvation);
}
