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
#include "snapshot.h"
#include "types.h"

namespace paneflow {
namespace sched {

enum class ViolationSeverity {
    Warning,
    Error,
    Critical
};

enum class ViolationKind {
    // Snapshot checks
    PendingCountMismatch,
    ActiveCountMismatch,
    PendingActiveOverlap,       // same sequence both queued and in flight
    DuplicatePaneRow,
    IntentSequenceRegression,   // active or pending above latest_seq
    StalePendingIntent,         // pending not newer than the active sequence
    ActivePhaseMismatch,        // phase set without active sequence or vice versa
    QueueDepthOverflow,

    // Lifecycle checks
    EventSequenceRegression,
    StageDetailMismatch,
    ConcurrentPaneTransaction,
    IllegalPhaseTransition,
    StaleCommit
};

struct InvariantViolation {
    ViolationSeverity severity = ViolationSeverity::Error;
    ViolationKind kind = ViolationKind::PendingCountMismatch;
    std::optional<PaneId> pane_id;
    std::optional<IntentSeq> intent_seq;
    std::string message;
};

/**
 * Result of an invariant pass. Checks never throw; every evaluated
 * condition is counted as passed or failed.
 */
struct InvariantReport {
    std::vector<InvariantViolation> violations;
    uint64_t checks_passed = 0;
    uint64_t checks_failed = 0;

    bool is_clean() const { return violations.empty(); }
    bool has_errors() const;
    bool has_critical() const;
    size_t count(ViolationKind kind) const;

    void merge(const InvariantReport& other);

    /**
     * Count one evaluated condition; records a violation when `ok` is false.
     * @return ok
     */
    bool expect(bool ok, ViolationSeverity severity, ViolationKind kind,
                std::optional<PaneId> pane_id, std::optional<IntentSeq> intent_seq,
                const std::string& message);
};

/** Running totals over every report produced by a scheduler */
struct InvariantTelemetry {
    uint64_t reports = 0;
    uint64_t clean_reports = 0;
    uint64_t total_violations = 0;
    uint64_t warnings = 0;
    uint64_t errors = 0;
    uint64_t critical = 0;
    uint64_t checks_passed = 0;
    uint64_t checks_failed = 0;

    void absorb(const InvariantReport& report);
};

/**
 * Consistency of a point-in-time table snapshot: aggregate counts match
 * the rows, no sequence is both pending and active, sequences never run
 * ahead of latest_seq, row ids are unique.
 */
InvariantReport check_snapshot_invariants(const SchedulerSnapshot& snapshot);

/**
 * Consistency of a lifecycle event log (oldest first): event sequence
 * strictly increases, every stage matches its detail tag, and each pane's
 * transactions follow the phase state machine. Panes whose history starts
 * mid-transaction (evicted prefix) are validated from their first
 * unambiguous event on.
 */
InvariantReport check_lifecycle_invariants(const std::vector<LifecycleEvent>& events);

const char* to_string(ViolationSeverity s);
const char* to_string(ViolationKind k);

} // namespace sched
} // namespace paneflow
