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

#include "watchdog.h"
#include "../util/log.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace paneflow {
namespace sched {

namespace {

const char* action_for(WatchdogSeverity severity) {
    switch (severity) {
        case WatchdogSeverity::Healthy:        return "none";
        case WatchdogSeverity::Warning:        return "monitor_stalled_transactions";
        case WatchdogSeverity::Critical:       return "enable_safe_mode_fallback";
        case WatchdogSeverity::SafeModeActive: return "safe_mode_active_monitor_and_recover";
    }
    return "none";
}

} // namespace

std::optional<std::string> WatchdogAssessment::warning_line() const {
    std::ostringstream line;
    switch (severity) {
        case WatchdogSeverity::Healthy:
            return std::nullopt;
        case WatchdogSeverity::Warning:
            line << "Resize watchdog warning: " << stalled_total
                 << " stalled transaction(s) >= " << warning_threshold_ms << "ms";
            break;
        case WatchdogSeverity::Critical:
            line << "Resize watchdog CRITICAL: " << stalled_critical
                 << " stalled transaction(s) >= " << critical_threshold_ms
                 << "ms; recommend safe-mode fallback"
                 << (legacy_fallback_enabled ? " with legacy path enabled" : "");
            break;
        case WatchdogSeverity::SafeModeActive:
            line << "Resize watchdog: safe-mode active (" << stalled_total
                 << " stalled >= " << warning_threshold_ms << "ms)";
            if (sustained_critical) {
                line << " after sustained critical stalls";
            }
            break;
    }
    return line.str();
}

WatchdogAssessment evaluate_watchdog(const DebugSnapshot& snapshot, uint64_t now_ms,
                                     const WatchdogConfig& config) {
    std::vector<StalledTransaction> warning =
        snapshot.stalled_transactions(now_ms, config.warning_threshold_ms);
    std::vector<StalledTransaction> critical =
        snapshot.stalled_transactions(now_ms, config.critical_threshold_ms);

    WatchdogAssessment out;
    out.evaluated_at_ms = now_ms;
    out.stalled_total = warning.size();
    out.stalled_critical = critical.size();
    out.warning_threshold_ms = config.warning_threshold_ms;
    out.critical_threshold_ms = config.critical_threshold_ms;
    out.critical_stalled_limit = config.critical_stalled_limit;
    out.safe_mode_active = snapshot.gate.emergency_disable;
    out.safe_mode_recommended = !out.safe_mode_active &&
                                critical.size() >= config.critical_stalled_limit;
    out.legacy_fallback_enabled = snapshot.gate.legacy_fallback_enabled;

    if (out.safe_mode_active) {
        out.severity = WatchdogSeverity::SafeModeActive;
    } else if (!critical.empty() || (config.warning_stalled_limit > 0 &&
                                     warning.size() >= config.warning_stalled_limit)) {
        out.severity = WatchdogSeverity::Critical;
    } else if (!warning.empty()) {
        out.severity = WatchdogSeverity::Warning;
    } else {
        out.severity = WatchdogSeverity::Healthy;
    }
    out.recommended_action = action_for(out.severity);

    const std::vector<StalledTransaction>& source = critical.empty() ? warning : critical;
    size_t take = std::min(source.size(), config.sample_limit);
    out.sample_stalled.assign(source.begin(), source.begin() + static_cast<std::ptrdiff_t>(take));
    return out;
}

// ========== Watchdog ==========

Watchdog::Watchdog(const WatchdogConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("Watchdog: invalid WatchdogConfig");
    }
}

WatchdogAssessment Watchdog::evaluate(const DebugSnapshot& snapshot, uint64_t now_ms) {
    WatchdogAssessment out = evaluate_watchdog(snapshot, now_ms, config_);

    if (out.severity != WatchdogSeverity::Critical) {
        if (critical_streak_ > 0) {
            info() << "watchdog: critical streak of " << critical_streak_ << " cleared ("
                   << to_string(out.severity) << ")";
        }
        critical_streak_ = 0;
        return out;
    }

    ++critical_streak_;
    if (critical_streak_ >= config_.sustained_critical_evaluations) {
        out.severity = WatchdogSeverity::SafeModeActive;
        out.sustained_critical = true;
        out.recommended_action = action_for(out.severity);
        error() << "watchdog: critical for " << critical_streak_
                << " consecutive evaluations, " << out.stalled_critical
                << " stalled >= " << out.critical_threshold_ms << "ms";
    } else {
        warn() << "watchdog: critical evaluation " << critical_streak_ << "/"
               << config_.sustained_critical_evaluations;
    }
    return out;
}

const char* to_string(WatchdogSeverity s) {
    switch (s) {
        case WatchdogSeverity::Healthy:        return "healthy";
        case WatchdogSeverity::Warning:        return "warning";
        case WatchdogSeverity::Critical:       return "critical";
        case WatchdogSeverity::SafeModeActive: return "safe_mode_active";
    }
    return "unknown";
}

} // namespace sched
} // namespace paneflow
