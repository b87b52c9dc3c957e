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
#include "sched/watchdog.h"
#include "sched/resize_scheduler.h"
#include "sched_test_util.h"

using namespace paneflow::sched;
using namespace paneflow::sched::testing_util;

class WatchdogTest : public ::testing::Test {
protected:
    // Snapshot with one in-flight transaction per entry of `phase_started`
    static DebugSnapshot snapshot_with(const std::vector<uint64_t>& phase_started) {
        DebugSnapshot dbg;
        PaneId id = 1;
        for (uint64_t started : phase_started) {
            PaneSnapshot p;
            p.pane_id = id++;
            p.latest_seq = 1;
            p.active_seq = 1;
            p.active_phase = ExecutionPhase::Reflowing;
            p.phase_started_at_ms = started;
            dbg.scheduler.panes.push_back(p);
        }
        dbg.scheduler.active_total = phase_started.size();
        return dbg;
    }
};

// ===== Classification =====

TEST_F(WatchdogTest, HealthyWithoutStalls) {
    DebugSnapshot dbg = snapshot_with({9000, 9500});
    WatchdogAssessment a = evaluate_watchdog(dbg, 10000);
    EXPECT_EQ(a.severity, WatchdogSeverity::Healthy);
    EXPECT_EQ(a.stalled_total, 0u);
    EXPECT_EQ(a.recommended_action, "none");
    EXPECT_FALSE(a.warning_line().has_value());
}

TEST_F(WatchdogTest, WarningAtThreshold) {
    // Exactly 2000ms in phase counts as stalled
    DebugSnapshot dbg = snapshot_with({8000});
    WatchdogAssessment a = evaluate_watchdog(dbg, 10000);
    EXPECT_EQ(a.severity, WatchdogSeverity::Warning);
    EXPECT_EQ(a.stalled_total, 1u);
    EXPECT_EQ(a.stalled_critical, 0u);
    EXPECT_EQ(a.recommended_action, "monitor_stalled_transactions");
    ASSERT_EQ(a.sample_stalled.size(), 1u);
    EXPECT_EQ(a.sample_stalled[0].age_ms, 2000u);
    EXPECT_EQ(*a.warning_line(), "Resize watchdog warning: 1 stalled transaction(s) >= 2000ms");
}

TEST_F(WatchdogTest, ManyWarningsEscalateToCritical) {
    DebugSnapshot dbg = snapshot_with({7000, 7100, 7200, 7300});
    WatchdogAssessment a = evaluate_watchdog(dbg, 10000);
    EXPECT_EQ(a.severity, WatchdogSeverity::Critical);
    EXPECT_EQ(a.stalled_total, 4u);
    EXPECT_EQ(a.stalled_critical, 0u);
    EXPECT_FALSE(a.safe_mode_recommended);
}

TEST_F(WatchdogTest, CriticalStallRecommendsSafeModeAtLimit) {
    DebugSnapshot one = snapshot_with({1000});
    WatchdogAssessment a = evaluate_watchdog(one, 10000);
    EXPECT_EQ(a.severity, WatchdogSeverity::Critical);
    EXPECT_FALSE(a.safe_mode_recommended);
    EXPECT_EQ(a.recommended_action, "enable_safe_mode_fallback");

    DebugSnapshot two = snapshot_with({1000, 1500, 9000});
    WatchdogAssessment b = evaluate_watchdog(two, 10000);
    EXPECT_EQ(b.severity, WatchdogSeverity::Critical);
    EXPECT_EQ(b.stalled_critical, 2u);
    EXPECT_EQ(b.stalled_total, 2u);
    EXPECT_TRUE(b.safe_mode_recommended);
    // Samples come from the critical set
    EXPECT_EQ(b.sample_stalled.size(), 2u);
    EXPECT_EQ(*b.warning_line(),
              "Resize watchdog CRITICAL: 2 stalled transaction(s) >= 8000ms; "
              "recommend safe-mode fallback with legacy path enabled");
}

TEST_F(WatchdogTest, SafeModeActiveOverridesStalls) {
    DebugSnapshot dbg = snapshot_with({0, 0, 0});
    dbg.gate.emergency_disable = true;
    dbg.gate.active = false;
    WatchdogAssessment a = evaluate_watchdog(dbg, 10000);
    EXPECT_EQ(a.severity, WatchdogSeverity::SafeModeActive);
    EXPECT_TRUE(a.safe_mode_active);
    EXPECT_FALSE(a.safe_mode_recommended);
    EXPECT_EQ(a.recommended_action, "safe_mode_active_monitor_and_recover");
    EXPECT_EQ(*a.warning_line(), "Resize watchdog: safe-mode active (3 stalled >= 2000ms)");
}

TEST_F(WatchdogTest, SampleLimit) {
    DebugSnapshot dbg = snapshot_with(std::vector<uint64_t>(12, 0));
    WatchdogAssessment a = evaluate_watchdog(dbg, 10000);
    EXPECT_EQ(a.stalled_critical, 12u);
    EXPECT_EQ(a.sample_stalled.size(), 8u);
}

TEST_F(WatchdogTest, IdleRowsAreIgnored) {
    DebugSnapshot dbg;
    PaneSnapshot p;
    p.pane_id = 1;
    p.latest_seq = 4;
    p.pending_seq = 4;
    p.phase_started_at_ms = 0;
    dbg.scheduler.panes.push_back(p);
    EXPECT_EQ(evaluate_watchdog(dbg, 100000).severity, WatchdogSeverity::Healthy);
}

TEST_F(WatchdogTest, ClockBehindPhaseStartIsNotStalled) {
    DebugSnapshot dbg = snapshot_with({50000});
    EXPECT_EQ(evaluate_watchdog(dbg, 10000).severity, WatchdogSeverity::Healthy);
}

TEST_F(WatchdogTest, LiveSchedulerStall) {
    ResizeScheduler s(quiet_config());
    s.submit(intent(1, 1, 100));
    s.schedule_frame(4);
    ASSERT_TRUE(s.mark_phase(1, 1, ExecutionPhase::Reflowing, 200));

    EXPECT_EQ(evaluate_watchdog(s.debug_snapshot(), 2199).severity, WatchdogSeverity::Healthy);
    WatchdogAssessment a = evaluate_watchdog(s.debug_snapshot(), 2200);
    EXPECT_EQ(a.severity, WatchdogSeverity::Warning);
    ASSERT_EQ(a.sample_stalled.size(), 1u);
    EXPECT_EQ(a.sample_stalled[0].pane_id, 1u);
    EXPECT_EQ(*a.sample_stalled[0].active_phase, ExecutionPhase::Reflowing);
}

// ===== Sustained critical =====

TEST_F(WatchdogTest, SustainedCriticalEscalates) {
    Watchdog wd;
    DebugSnapshot dbg = snapshot_with({0});

    WatchdogAssessment first = wd.evaluate(dbg, 9000);
    EXPECT_EQ(first.severity, WatchdogSeverity::Critical);
    EXPECT_FALSE(first.sustained_critical);
    EXPECT_EQ(wd.evaluate(dbg, 9100).severity, WatchdogSeverity::Critical);

    WatchdogAssessment third = wd.evaluate(dbg, 9200);
    EXPECT_EQ(wd.critical_streak(), 3u);
    EXPECT_EQ(third.severity, WatchdogSeverity::SafeModeActive);
    EXPECT_TRUE(third.sustained_critical);
    EXPECT_FALSE(third.safe_mode_active);
    EXPECT_NE(third.warning_line()->find("after sustained critical stalls"), std::string::npos);
}

TEST_F(WatchdogTest, StreakResetsOnRecovery) {
    WatchdogConfig cfg;
    cfg.sustained_critical_evaluations = 2;
    Watchdog wd(cfg);

    DebugSnapshot stalled = snapshot_with({0});
    DebugSnapshot calm = snapshot_with({});
    wd.evaluate(stalled, 9000);
    EXPECT_EQ(wd.critical_streak(), 1u);
    EXPECT_EQ(wd.evaluate(calm, 9100).severity, WatchdogSeverity::Healthy);
    EXPECT_EQ(wd.critical_streak(), 0u);
    EXPECT_EQ(wd.evaluate(stalled, 9200).severity, WatchdogSeverity::Critical);

    wd.reset();
    EXPECT_EQ(wd.critical_streak(), 0u);
}

TEST_F(WatchdogTest, InvalidConfigRejected) {
    WatchdogConfig cfg;
    cfg.critical_threshold_ms = cfg.warning_threshold_ms - 1;
    EXPECT_FALSE(cfg.validate());
    EXPECT_THROW(Watchdog{cfg}, std::invalid_argument);

    WatchdogConfig zero;
    zero.sustained_critical_evaluations = 0;
    EXPECT_THROW(Watchdog{zero}, std::invalid_argument);
}

TEST_F(WatchdogTest, ZeroWarningLimitRejected) {
    WatchdogConfig cfg;
    cfg.warning_stalled_limit = 0;
    EXPECT_FALSE(cfg.validate());
    EXPECT_THROW(Watchdog{cfg}, std::invalid_argument);

    // Unvalidated config: a zero limit must not turn an idle scheduler critical
    ResizeScheduler s;
    WatchdogAssessment idle = evaluate_watchdog(s.debug_snapshot(), 1000, cfg);
    EXPECT_EQ(idle.severity, WatchdogSeverity::Healthy);
    EXPECT_EQ(idle.stalled_total, 0u);

    WatchdogAssessment one = evaluate_watchdog(snapshot_with({1000}), 1000 + cfg.warning_threshold_ms, cfg);
    EXPECT_EQ(one.severity, WatchdogSeverity::Warning);
}

TEST_F(WatchdogTest, SeverityNames) {
    EXPECT_STREQ(to_string(WatchdogSeverity::Healthy), "healthy");
    EXPECT_STREQ(to_string(WatchdogSeverity::SafeModeActive), "safe_mode_active");
}
