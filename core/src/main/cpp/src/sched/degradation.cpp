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

#include "degradation.h"
#include "../util/log.h"
#include <sstream>
#include <stdexcept>

namespace paneflow {
namespace sched {

namespace {

DegradationTier select_tier(const DegradationSignals& s) {
    if (s.safe_mode_active) {
        return DegradationTier::EmergencyCompatibility;
    }
    if (s.safe_mode_recommended || s.stalled_critical > 0) {
        return DegradationTier::CorrectnessGuarded;
    }
    if (s.stalled_total > 0 || s.sustained_storm) {
        return DegradationTier::QualityReduced;
    }
    return DegradationTier::FullQuality;
}

std::string trigger_for(DegradationTier tier, const DegradationSignals& s) {
    std::ostringstream out;
    switch (tier) {
        case DegradationTier::FullQuality:
            out << "no_active_resize_stall_signals";
            break;
        case DegradationTier::QualityReduced:
            if (s.stalled_total > 0) {
                out << "warning_stalls_detected:" << s.stalled_total << "@"
                    << s.warning_threshold_ms << "ms";
            } else {
                out << "sustained_storm_activity:" << s.stormed_tabs << "_tabs";
            }
            break;
        case DegradationTier::CorrectnessGuarded:
            if (s.safe_mode_recommended) {
                out << "safe_mode_recommended:" << s.stalled_critical << "_critical_stalls>="
                    << s.critical_stalled_limit;
            } else {
                out << "critical_stalls_detected:" << s.stalled_critical << "@"
                    << s.critical_threshold_ms << "ms";
            }
            break;
        case DegradationTier::EmergencyCompatibility:
            out << "safe_mode_active_emergency_disable";
            break;
    }
    return out.str();
}

const char* recovery_rule_for(DegradationTier tier) {
    switch (tier) {
        case DegradationTier::FullQuality:
            return "stay_full_quality_while_warning_and_critical_stalls_remain_zero";
        case DegradationTier::QualityReduced:
            return "return_to_full_quality_after_warning_stalls_clear";
        case DegradationTier::CorrectnessGuarded:
            return "return_to_quality_reduced_after_critical_stalls_clear_and_safe_mode_not_recommended";
        case DegradationTier::EmergencyCompatibility:
            return "return_to_correctness_guarded_after_safe_mode_disabled_and_critical_stalls_clear";
    }
    return "";
}

const char* action_for(DegradationTier tier) {
    switch (tier) {
        case DegradationTier::FullQuality:            return "none";
        case DegradationTier::QualityReduced:         return "reduce_visual_quality_preserve_correctness";
        case DegradationTier::CorrectnessGuarded:     return "enforce_correctness_guards_prepare_emergency_compatibility";
        case DegradationTier::EmergencyCompatibility: return "run_emergency_compatibility_mode";
    }
    return "none";
}

// Build the assessment for `tier`, which may sit above the tier the
// signals alone select while the ladder is recovering.
DegradationAssessment assess(DegradationTier tier, const DegradationSignals& signals) {
    DegradationAssessment out;
    out.tier = tier;
    out.tier_rank = rank(tier);
    out.trigger_condition = trigger_for(tier, signals);
    out.recovery_rule = recovery_rule_for(tier);
    out.recommended_action = action_for(tier);
    out.signals = signals;

    if (tier >= DegradationTier::QualityReduced) {
        out.quality_reductions = {
            "reduce_batch_sizes_and_overscan",
            "defer_noncritical_background_reflow",
            "prioritize_viewport_first_updates",
        };
    }
    if (tier >= DegradationTier::CorrectnessGuarded) {
        out.correctness_guards = {
            "enforce_atomic_present_commit_barriers",
            "prefer_last_good_frame_rollbacks_on_commit_failure",
            "suppress_speculative_resize_paths",
        };
    }
    if (tier >= DegradationTier::EmergencyCompatibility) {
        out.availability_changes = {
            "enable_safe_mode_control_plane_killswitch",
            "activate_legacy_compatibility_fallback_when_available",
            "pause_nonessential_resize_work",
        };
    }
    return out;
}

} // namespace

DegradationSignals DegradationSignals::from_watchdog(const WatchdogAssessment& assessment) {
    DegradationSignals s;
    s.stalled_total = assessment.stalled_total;
    s.stalled_critical = assessment.stalled_critical;
    s.warning_threshold_ms = assessment.warning_threshold_ms;
    s.critical_threshold_ms = assessment.critical_threshold_ms;
    s.critical_stalled_limit = assessment.critical_stalled_limit;
    s.safe_mode_recommended = assessment.safe_mode_recommended;
    s.safe_mode_active = assessment.safe_mode_active;
    s.legacy_fallback_enabled = assessment.legacy_fallback_enabled;
    return s;
}

std::optional<std::string> DegradationAssessment::warning_line() const {
    std::ostringstream line;
    switch (tier) {
        case DegradationTier::FullQuality:
            return std::nullopt;
        case DegradationTier::QualityReduced:
            line << "Resize degradation ladder: quality-reduced tier active ("
                 << signals.stalled_total << " stalled >= " << signals.warning_threshold_ms << "ms)";
            break;
        case DegradationTier::CorrectnessGuarded:
            line << "Resize degradation ladder: correctness-guarded tier active ("
                 << signals.stalled_critical << " critical stalled >= "
                 << signals.critical_threshold_ms << "ms)";
            break;
        case DegradationTier::EmergencyCompatibility:
            line << "Resize degradation ladder: emergency compatibility tier active"
                 << (signals.legacy_fallback_enabled ? " with legacy fallback" : "");
            break;
    }
    return line.str();
}

DegradationAssessment evaluate_degradation_ladder(const DegradationSignals& signals) {
    return assess(select_tier(signals), signals);
}

// ========== DegradationLadder ==========

DegradationLadder::DegradationLadder(const DegradationConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("DegradationLadder: invalid DegradationConfig");
    }
}

DegradationAssessment DegradationLadder::evaluate(DegradationSignals signals) {
    storm_streak_ = signals.stormed_tabs > 0 ? storm_streak_ + 1 : 0;
    if (storm_streak_ >= config_.sustained_storm_evaluations) {
        signals.sustained_storm = true;
    }

    DegradationTier target = select_tier(signals);

    if (target >= current_) {
        if (target > current_) {
            warn() << "degradation ladder: " << to_string(current_) << " -> "
                   << to_string(target) << " (" << trigger_for(target, signals) << ")";
        }
        current_ = target;
        recovery_count_ = 0;
        return assess(current_, signals);
    }

    ++recovery_count_;
    if (recovery_count_ >= config_.recovery_streak) {
        info() << "degradation ladder: " << to_string(current_) << " -> "
               << to_string(target) << " after " << recovery_count_ << " calm evaluations";
        current_ = target;
        recovery_count_ = 0;
        return assess(current_, signals);
    }

    DegradationAssessment held = assess(current_, signals);
    std::ostringstream trigger;
    trigger << "holding_" << to_string(current_) << "_recovery:" << recovery_count_
            << "/" << config_.recovery_streak;
    held.trigger_condition = trigger.str();
    return held;
}

const char* to_string(DegradationTier tier) {
    switch (tier) {
        case DegradationTier::FullQuality:            return "full_quality";
        case DegradationTier::QualityReduced:         return "quality_reduced";
        case DegradationTier::CorrectnessGuarded:     return "correctness_guarded";
        case DegradationTier::EmergencyCompatibility: return "emergency_compatibility";
    }
    return "unknown";
}

} // namespace sched
} // namespace paneflow
