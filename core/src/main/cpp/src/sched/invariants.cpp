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

#include "invariants.h"
#include "lifecycle.h"
#include <map>
#include <set>
#include <sstream>

namespace paneflow {
namespace sched {

// ========== InvariantReport ==========

bool InvariantReport::has_errors() const {
    for (const auto& v : violations) {
        if (v.severity != ViolationSeverity::Warning) {
            return true;
        }
    }
    return false;
}

bool InvariantReport::has_critical() const {
    for (const auto& v : violations) {
        if (v.severity == ViolationSeverity::Critical) {
            return true;
        }
    }
    return false;
}

size_t InvariantReport::count(ViolationKind kind) const {
    size_t n = 0;
    for (const auto& v : violations) {
        if (v.kind == kind) {
            ++n;
        }
    }
    return n;
}

void InvariantReport::merge(const InvariantReport& other) {
    violations.insert(violations.end(), other.violations.begin(), other.violations.end());
    checks_passed += other.checks_passed;
    checks_failed += other.checks_failed;
}

bool InvariantReport::expect(bool ok, ViolationSeverity severity, ViolationKind kind,
                             std::optional<PaneId> pane_id, std::optional<IntentSeq> intent_seq,
                             const std::string& message) {
    if (ok) {
        ++checks_passed;
        return true;
    }
    ++checks_failed;
    InvariantViolation v;
    v.severity = severity;
    v.kind = kind;
    v.pane_id = pane_id;
    v.intent_seq = intent_seq;
    v.message = message;
    violations.push_back(std::move(v));
    return false;
}

void InvariantTelemetry::absorb(const InvariantReport& report) {
    ++reports;
    if (report.is_clean()) {
        ++clean_reports;
    }
    total_violations += report.violations.size();
    for (const auto& v : report.violations) {
        switch (v.severity) {
        case ViolationSeverity::Warning:  ++warnings; break;
        case ViolationSeverity::Error:    ++errors; break;
        case ViolationSeverity::Critical: ++critical; break;
        }
    }
    checks_passed += report.checks_passed;
    checks_failed += report.checks_failed;
}

// ========== Snapshot invariants ==========

namespace {

std::string describe(const char* what, PaneId pane, std::optional<IntentSeq> a,
                     std::optional<IntentSeq> b) {
    std::ostringstream oss;
    oss << what << " (pane " << pane;
    if (a) oss << ", " << *a;
    if (b) oss << " vs " << *b;
    oss << ")";
    return oss.str();
}

} // namespace

InvariantReport check_snapshot_invariants(const SchedulerSnapshot& snapshot) {
    InvariantReport report;
    std::set<PaneId> seen;
    size_t pending_rows = 0;
    size_t active_rows = 0;

    for (const auto& row : snapshot.panes) {
        report.expect(seen.insert(row.pane_id).second,
                      ViolationSeverity::Error, ViolationKind::DuplicatePaneRow,
                      row.pane_id, std::nullopt,
                      describe("duplicate pane row", row.pane_id, std::nullopt, std::nullopt));

        if (row.pending_seq) ++pending_rows;
        if (row.active_seq) ++active_rows;

        if (row.pending_seq && row.active_seq) {
            report.expect(*row.pending_seq != *row.active_seq,
                          ViolationSeverity::Critical, ViolationKind::PendingActiveOverlap,
                          row.pane_id, row.active_seq,
                          describe("sequence both pending and active", row.pane_id,
                                   row.pending_seq, std::nullopt));
            report.expect(*row.pending_seq > *row.active_seq,
                          ViolationSeverity::Error, ViolationKind::StalePendingIntent,
                          row.pane_id, row.pending_seq,
                          describe("pending intent not newer than active", row.pane_id,
                                   row.pending_seq, row.active_seq));
        }

        if (row.active_seq) {
            bool ok = row.latest_seq && *row.active_seq <= *row.latest_seq;
            report.expect(ok, ViolationSeverity::Critical, ViolationKind::IntentSequenceRegression,
                          row.pane_id, row.active_seq,
                          describe("active sequence ahead of latest", row.pane_id,
                                   row.active_seq, row.latest_seq));
        }
        if (row.pending_seq) {
            bool ok = row.latest_seq && *row.pending_seq <= *row.latest_seq;
            report.expect(ok, ViolationSeverity::Critical, ViolationKind::IntentSequenceRegression,
                          row.pane_id, row.pending_seq,
                          describe("pending sequence ahead of latest", row.pane_id,
                                   row.pending_seq, row.latest_seq));
        }

        report.expect(row.active_seq.has_value() == row.active_phase.has_value(),
                      ViolationSeverity::Error, ViolationKind::ActivePhaseMismatch,
                      row.pane_id, row.active_seq,
                      describe("active phase and sequence disagree", row.pane_id,
                               row.active_seq, std::nullopt));
    }

    {
        std::ostringstream oss;
        oss << "pending_total " << snapshot.pending_total << " but " << pending_rows << " pending rows";
        report.expect(snapshot.pending_total == pending_rows,
                      ViolationSeverity::Error, ViolationKind::PendingCountMismatch,
                      std::nullopt, std::nullopt, oss.str());
    }
    {
        std::ostringstream oss;
        oss << "active_total " << snapshot.active_total << " but " << active_rows << " active rows";
        report.expect(snapshot.active_total == active_rows,
                      ViolationSeverity::Error, ViolationKind::ActiveCountMismatch,
                      std::nullopt, std::nullopt, oss.str());
    }
    {
        std::ostringstream oss;
        oss << "pending_total " << snapshot.pending_total << " exceeds max_pending_panes "
            << snapshot.config.max_pending_panes;
        report.expect(snapshot.pending_total <= snapshot.config.max_pending_panes,
                      ViolationSeverity::Warning, ViolationKind::QueueDepthOverflow,
                      std::nullopt, std::nullopt, oss.str());
    }

    return report;
}

// ========== Lifecycle invariants ==========

InvariantReport check_lifecycle_invariants(const std::vector<LifecycleEvent>& events) {
    InvariantReport report;

    // Per-pane in-flight phase as reconstructed from the log. A pane missing
    // from the map has an unknown state; nullopt means known idle.
    std::map<PaneId, std::optional<ExecutionPhase>> track;
    std::optional<uint64_t> prev_seq;

    for (const auto& ev : events) {
        if (prev_seq) {
            std::ostringstream oss;
            oss << "event_seq " << ev.event_seq << " follows " << *prev_seq;
            report.expect(ev.event_seq > *prev_seq,
                          ViolationSeverity::Critical, ViolationKind::EventSequenceRegression,
                          ev.pane_id, ev.intent_seq, oss.str());
        }
        prev_seq = ev.event_seq;

        {
            std::ostringstream oss;
            oss << "stage " << to_string(ev.stage) << " does not match detail "
                << to_string(ev.detail.kind);
            report.expect(ev.stage == implied_stage(ev.detail),
                          ViolationSeverity::Error, ViolationKind::StageDetailMismatch,
                          ev.pane_id, ev.intent_seq, oss.str());
        }

        auto known = track.find(ev.pane_id);
        bool is_known = known != track.end();

        switch (ev.detail.kind) {
        case DetailKind::TransactionStarted:
            if (is_known) {
                report.expect(!known->second.has_value(),
                              ViolationSeverity::Critical, ViolationKind::ConcurrentPaneTransaction,
                              ev.pane_id, ev.intent_seq,
                              describe("transaction started while another is in flight",
                                       ev.pane_id, ev.intent_seq, std::nullopt));
            }
            track[ev.pane_id] = ExecutionPhase::Preparing;
            break;

        case DetailKind::PhaseAdvanced:
            if (is_known) {
                bool ok = known->second && is_immediate_successor(*known->second, ev.detail.phase);
                std::ostringstream oss;
                oss << "illegal phase transition to " << to_string(ev.detail.phase)
                    << " (pane " << ev.pane_id << ")";
                report.expect(ok, ViolationSeverity::Error, ViolationKind::IllegalPhaseTransition,
                              ev.pane_id, ev.intent_seq, oss.str());
            }
            track[ev.pane_id] = ev.detail.phase;
            break;

        case DetailKind::ActiveCancelledBySupersession:
            if (is_known) {
                report.expect(known->second.has_value(),
                              ViolationSeverity::Error, ViolationKind::IllegalPhaseTransition,
                              ev.pane_id, ev.intent_seq,
                              describe("cancellation without an in-flight transaction",
                                       ev.pane_id, ev.intent_seq, std::nullopt));
            }
            report.expect(ev.detail.superseded_by_seq > ev.intent_seq,
                          ViolationSeverity::Error, ViolationKind::IllegalPhaseTransition,
                          ev.pane_id, ev.intent_seq,
                          describe("cancelled by a sequence that is not newer",
                                   ev.pane_id, ev.intent_seq, ev.detail.superseded_by_seq));
            track[ev.pane_id] = std::nullopt;
            break;

        case DetailKind::ActiveCompleted:
            if (is_known) {
                bool ok = known->second && *known->second == ExecutionPhase::Presenting;
                report.expect(ok, ViolationSeverity::Error, ViolationKind::IllegalPhaseTransition,
                              ev.pane_id, ev.intent_seq,
                              describe("completion outside the presenting phase",
                                       ev.pane_id, ev.intent_seq, std::nullopt));
            }
            if (ev.latest_seq) {
                report.expect(*ev.latest_seq == ev.intent_seq,
                              ViolationSeverity::Critical, ViolationKind::StaleCommit,
                              ev.pane_id, ev.intent_seq,
                              describe("committed a superseded sequence",
                                       ev.pane_id, ev.intent_seq, ev.latest_seq));
            }
            track[ev.pane_id] = std::nullopt;
            break;

        case DetailKind::IntentQueued:
        case DetailKind::PendingDropped:
        case DetailKind::CompletionRejected:
            break;
        }
    }

    return report;
}

// ========== String conversions ==========

const char* to_string(ViolationSeverity s) {
    switch (s) {
    case ViolationSeverity::Warning:  return "warning";
    case ViolationSeverity::Error:    return "error";
    case ViolationSeverity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(ViolationKind k) {
    switch (k) {
    case ViolationKind::PendingCountMismatch:      return "pending_count_mismatch";
    case ViolationKind::ActiveCountMismatch:       return "active_count_mismatch";
    case ViolationKind::PendingActiveOverlap:      return "pending_active_overlap";
    case ViolationKind::DuplicatePaneRow:          return "duplicate_pane_row";
    case ViolationKind::IntentSequenceRegression:  return "intent_sequence_regression";
    case ViolationKind::StalePendingIntent:        return "stale_pending_intent";
    case ViolationKind::ActivePhaseMismatch:       return "active_phase_mismatch";
    case ViolationKind::QueueDepthOverflow:        return "queue_depth_overflow";
    case ViolationKind::EventSequenceRegression:   return "event_sequence_regression";
    case ViolationKind::StageDetailMismatch:       return "stage_detail_mismatch";
    case ViolationKind::ConcurrentPaneTransaction: return "concurrent_pane_transaction";
    case ViolationKind::IllegalPhaseTransition:    return "illegal_phase_transition";
    case ViolationKind::StaleCommit:               return "stale_commit";
    }
    return "unknown";
}

} // namespace sched
} // namespace paneflow
