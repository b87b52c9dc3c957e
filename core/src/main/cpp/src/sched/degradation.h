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
#include "watchdog.h"

namespace paneflow {
namespace sched {

/**
 * Ordered degradation tiers. Quality is traded first, correctness
 * guards come second, availability last.
 */
enum class DegradationTier {
    FullQuality = 0,
    QualityReduced = 1,
    CorrectnessGuarded = 2,
    EmergencyCompatibility = 3      // synchronous legacy path, scheduler bypassed
};

struct DegradationSignals {
    size_t stalled_total = 0;
    size_t stalled_critical = 0;
    uint64_t warning_threshold_ms = watchdog::kWarningThresholdMs;
    uint64_t critical_threshold_ms = watchdog::kCriticalThresholdMs;
    size_t critical_stalled_limit = watchdog::kCriticalStalledLimit;
    bool safe_mode_recommended = false;
    bool safe_mode_active = false;
    bool legacy_fallback_enabled = false;
    size_t stormed_tabs = 0;
    bool sustained_storm = false;

    /** Signals carried by a watchdog assessment, storm state left clear */
    static DegradationSignals from_watchdog(const WatchdogAssessment& assessment);
};

struct DegradationAssessment {
    DegradationTier tier = DegradationTier::FullQuality;
    uint32_t tier_rank = 0;
    std::string trigger_condition;
    std::string recovery_rule;
    std::string recommended_action;
    std::vector<std::string> quality_reductions;
    std::vector<std::string> correctness_guards;
    std::vector<std::string> availability_changes;
    DegradationSignals signals;

    std::optional<std::string> warning_line() const;
};

struct DegradationConfig {
    uint32_t recovery_streak            = degradation::kRecoveryStreak;
    uint32_t sustained_storm_evaluations = degradation::kSustainedStormEvaluations;

    bool validate() const {
        return recovery_streak > 0 && sustained_storm_evaluations > 0;
    }
};

/** Pure mapping from current signals to a tier */
DegradationAssessment evaluate_degradation_ladder(const DegradationSignals& signals);

/**
 * Ladder with anti-flap memory. Escalation is immediate; a lower tier is
 * only adopted after it has been evaluated `recovery_streak` times in a
 * row. Storm activity counts as sustained once tabs stay stormed for
 * `sustained_storm_evaluations` consecutive evaluations.
 */
class DegradationLadder {
public:
    explicit DegradationLadder(const DegradationConfig& config = DegradationConfig());

    DegradationAssessment evaluate(DegradationSignals signals);

    DegradationTier current() const { return current_; }
    uint32_t recovery_count() const { return recovery_count_; }

private:
    DegradationConfig config_;
    DegradationTier current_ = DegradationTier::FullQuality;
    uint32_t recovery_count_ = 0;
    uint32_t storm_streak_ = 0;
};

inline uint32_t rank(DegradationTier tier) { return static_cast<uint32_t>(tier); }

const char* to_string(DegradationTier tier);

} // namespace sched
} // namespace paneflow
