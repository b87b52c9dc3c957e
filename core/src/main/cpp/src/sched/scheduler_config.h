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
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults

namespace paneflow {
namespace sched {

/**
 * Runtime configuration for one ResizeScheduler instance.
 * Immutable once the scheduler is constructed; the kill-switch can be
 * toggled at runtime through the scheduler's gate instead.
 */
struct SchedulerConfig {
    // Control-plane gate
    bool control_plane_enabled      = true;
    bool emergency_disable          = false;
    bool legacy_fallback_enabled    = true;

    // Frame budget
    uint32_t frame_budget_units     = frame::kDefaultBudgetUnits;
    bool allow_single_oversubscription = true;

    // Input-latency guardrail
    bool input_guardrail_enabled    = true;
    uint32_t input_backlog_threshold = guardrail::kInputBacklogThreshold;
    uint32_t input_reserve_units    = guardrail::kInputReserveUnits;

    // Starvation and aging
    uint32_t max_deferrals_before_force = starvation::kMaxDeferralsBeforeForce;
    uint32_t max_deferrals_before_drop  = starvation::kMaxDeferralsBeforeDrop;
    uint32_t aging_credit_per_frame = priority::kAgingCreditPerFrame;
    uint32_t max_aging_credit       = priority::kMaxAgingCredit;

    // Overload admission
    size_t max_pending_panes        = frame::kMaxPendingPanes;

    // Storm detection
    uint64_t storm_window_ms        = storm::kWindowMs;
    uint32_t storm_threshold_intents = storm::kThresholdIntents;
    uint32_t max_storm_picks_per_tab = storm::kMaxPicksPerTab;

    // Domain fairness
    bool domain_budget_enabled      = false;

    // Lifecycle log
    size_t max_lifecycle_events     = lifecycle::kMaxEvents;

    /**
     * Create config with defaults, optionally reading from environment.
     * Malformed numeric overrides throw std::invalid_argument.
     */
    static SchedulerConfig defaults() {
        SchedulerConfig cfg;

        if (const char* env = std::getenv("PANEFLOW_FRAME_BUDGET_UNITS")) {
            cfg.frame_budget_units = static_cast<uint32_t>(std::stoul(env));
        }

        if (const char* env = std::getenv("PANEFLOW_EMERGENCY_DISABLE")) {
            cfg.emergency_disable = parse_flag(env);
        }

        if (const char* env = std::getenv("PANEFLOW_LEGACY_FALLBACK")) {
            cfg.legacy_fallback_enabled = parse_flag(env);
        }

        if (const char* env = std::getenv("PANEFLOW_DOMAIN_BUDGET")) {
            cfg.domain_budget_enabled = parse_flag(env);
        }

        if (const char* env = std::getenv("PANEFLOW_STORM_WINDOW_MS")) {
            cfg.storm_window_ms = std::stoull(env);
        }

        if (const char* env = std::getenv("PANEFLOW_STORM_THRESHOLD")) {
            cfg.storm_threshold_intents = static_cast<uint32_t>(std::stoul(env));
        }

        if (const char* env = std::getenv("PANEFLOW_MAX_PENDING_PANES")) {
            cfg.max_pending_panes = std::stoull(env);
        }

        if (const char* env = std::getenv("PANEFLOW_MAX_LIFECYCLE_EVENTS")) {
            cfg.max_lifecycle_events = std::stoull(env);
        }

        return cfg;
    }

    /**
     * Create config for hosts dominated by SSH and mux panes
     */
    static SchedulerConfig remote_heavy() {
        SchedulerConfig cfg;
        cfg.domain_budget_enabled = true;
        cfg.storm_window_ms = 100;            // Remote jitter spreads bursts out
        cfg.storm_threshold_intents = 6;
        cfg.max_storm_picks_per_tab = 1;
        cfg.max_deferrals_before_force = 2;
        return cfg;
    }

    /**
     * Create config that favors input echo over resize throughput
     */
    static SchedulerConfig low_latency() {
        SchedulerConfig cfg;
        cfg.frame_budget_units = 4;
        cfg.input_reserve_units = 2;
        cfg.allow_single_oversubscription = false;
        return cfg;
    }

    /**
     * Create config with the kill-switch engaged and legacy fallback on
     */
    static SchedulerConfig safe_mode() {
        SchedulerConfig cfg;
        cfg.emergency_disable = true;
        cfg.legacy_fallback_enabled = true;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (frame_budget_units == 0) {
            return false;
        }
        if (max_lifecycle_events == 0) {
            return false;
        }
        if (max_pending_panes == 0) {
            return false;
        }
        if (max_deferrals_before_force == 0) {
            // Every deferred pane would be forced immediately
            return false;
        }
        if (max_deferrals_before_drop != 0 &&
            max_deferrals_before_drop <= max_deferrals_before_force) {
            // Starved work must get a forced run before it can be dropped
            return false;
        }
        if (storm_threshold_intents > 0 && max_storm_picks_per_tab == 0) {
            return false;
        }
        if (aging_credit_per_frame > max_aging_credit) {
            return false;
        }
        return true;
    }

    static bool parse_flag(const std::string& value) {
        return value == "1" || value == "true" || value == "on" || value == "yes";
    }
};

} // namespace sched
} // namespace paneflow
