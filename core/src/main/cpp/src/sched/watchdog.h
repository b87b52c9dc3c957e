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
#include <string>
#include <vector>
#include "config.h"
#include "debug_snapshot.h"
#include "snapshot.h"

namespace paneflow {
namespace sched {

enum class WatchdogSeverity {
    Healthy,
    Warning,
    Critical,
    SafeModeActive
};

struct WatchdogConfig {
    uint64_t warning_threshold_ms   = watchdog::kWarningThresholdMs;
    uint64_t critical_threshold_ms  = watchdog::kCriticalThresholdMs;
    size_t warning_stalled_limit    = watchdog::kWarningStalledLimit;
    size_t critical_stalled_limit   = watchdog::kCriticalStalledLimit;
    uint32_t sustained_critical_evaluations = watchdog::kSustainedCriticalEvaluations;
    size_t sample_limit             = watchdog::kSampleLimit;

    bool validate() const {
        if (warning_threshold_ms == 0) return false;
        if (critical_threshold_ms < warning_threshold_ms) return false;
        if (warning_stalled_limit == 0) return false;
        if (critical_stalled_limit == 0) return false;
        if (sustained_critical_evaluations == 0) return false;
        return true;
    }
};

struct WatchdogAssessment {
    WatchdogSeverity severity = WatchdogSeverity::Healthy;
    uint64_t evaluated_at_ms = 0;
    size_t stalled_total = 0;            // at or beyond the warning threshold
    size_t stalled_critical = 0;         // at or beyond the critical threshold
    uint64_t warning_threshold_ms = 0;
    uint64_t critical_threshold_ms = 0;
    size_t critical_stalled_limit = 0;
    bool safe_mode_recommended = false;
    bool safe_mode_active = false;
    bool sustained_critical = false;
    bool legacy_fallback_enabled = false;
    std::string recommended_action;
    std::vector<StalledTransaction> sample_stalled;

    /** Operator-facing status line; empty when Healthy */
    std::optional<std::string> warning_line() const;
};

/**
 * Classify in-flight stalls in a snapshot. Pure: the same snapshot and
 * clock always produce the same assessment.
 */
WatchdogAssessment evaluate_watchdog(const DebugSnapshot& snapshot, uint64_t now_ms,
                                     const WatchdogConfig& config = WatchdogConfig());

/**
 * Watchdog with memory: escalates to SafeModeActive once Critical has
 * been observed on enough consecutive evaluations.
 */
class Watchdog {
public:
    explicit Watchdog(const WatchdogConfig& config = WatchdogConfig());

    WatchdogAssessment evaluate(const DebugSnapshot& snapshot, uint64_t now_ms);

    uint32_t critical_streak() const { return critical_streak_; }
    const WatchdogConfig& config() const { return config_; }
    void reset() { critical_streak_ = 0; }

private:
    WatchdogConfig config_;
    uint32_t critical_streak_ = 0;
};

const char* to_string(WatchdogSeverity s);

} // namespace sched
} // namespace paneflow
