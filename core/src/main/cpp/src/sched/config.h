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
#include <cstddef>

namespace paneflow {
namespace sched {

// Frame budget and admission
namespace frame {
    constexpr uint32_t kDefaultBudgetUnits = 8;
    constexpr size_t kMaxPendingPanes = 128;              // Overload admission bound
}

// Deferral aging
namespace priority {
    constexpr uint32_t kAgingCreditPerFrame = 5;          // Interactive panes accrue half
    constexpr uint32_t kMaxAgingCredit = 80;
}

// Starvation escalation and drop policy
namespace starvation {
    constexpr uint32_t kMaxDeferralsBeforeForce = 3;
    constexpr uint32_t kMaxDeferralsBeforeDrop = 12;      // 0 disables dropping
}

// Input-latency guardrail
namespace guardrail {
    constexpr uint32_t kInputBacklogThreshold = 1;
    constexpr uint32_t kInputReserveUnits = 2;
}

// Per-tab storm detection
namespace storm {
    constexpr uint64_t kWindowMs = 50;
    constexpr uint32_t kThresholdIntents = 4;
    constexpr uint32_t kMaxPicksPerTab = 2;
}

// Domain fairness weights (local panes are cheapest to reflow)
namespace domain {
    constexpr uint32_t kLocalWeight = 4;
    constexpr uint32_t kRemoteWeight = 2;
    constexpr uint32_t kMultiplexedWeight = 1;
}

// Lifecycle event log
namespace lifecycle {
    constexpr size_t kMaxEvents = 256;
}

// Stall watchdog
namespace watchdog {
    constexpr uint64_t kWarningThresholdMs = 2000;
    constexpr uint64_t kCriticalThresholdMs = 8000;
    constexpr size_t kWarningStalledLimit = 4;            // This many warnings escalate to critical
    constexpr size_t kCriticalStalledLimit = 2;           // Safe mode recommended at this count
    constexpr uint32_t kSustainedCriticalEvaluations = 3;
    constexpr size_t kSampleLimit = 8;
}

// Degradation ladder anti-flap window
namespace degradation {
    constexpr uint32_t kRecoveryStreak = 3;
    constexpr uint32_t kSustainedStormEvaluations = 2;
}

} // namespace sched
} // namespace paneflow
