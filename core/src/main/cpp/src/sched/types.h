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
#include <optional>
#include <string>
#include <vector>

namespace paneflow {
namespace sched {

using PaneId = uint64_t;
using TabId = uint64_t;
using IntentSeq = uint64_t;

enum class WorkClass {
    Interactive,    // Operator-driven, latency sensitive
    Background      // Automation-driven, throughput oriented
};

enum class DomainKind {
    Local,
    Remote,         // SSH-backed pane
    Multiplexed     // Pane hosted by a remote mux server
};

/**
 * Grouping key for fairness and storm accounting. Carries no
 * connection state.
 */
struct Domain {
    DomainKind kind = DomainKind::Local;
    std::string name;   // host or endpoint; empty for Local

    static Domain local() { return Domain{}; }
    static Domain remote(const std::string& host) { return Domain{DomainKind::Remote, host}; }
    static Domain multiplexed(const std::string& endpoint) {
        return Domain{DomainKind::Multiplexed, endpoint};
    }

    /** Stable key: "local", "ssh:<host>" or "mux:<endpoint>" */
    std::string key() const;

    /** Relative share of the frame budget when domain budgets are on */
    uint32_t weight() const;

    bool operator==(const Domain& o) const { return kind == o.kind && name == o.name; }
    bool operator!=(const Domain& o) const { return !(*this == o); }
};

struct ResizeIntent {
    PaneId pane_id = 0;
    IntentSeq intent_seq = 0;
    WorkClass work_class = WorkClass::Interactive;
    uint32_t work_units = 1;
    uint64_t submitted_at_ms = 0;
    Domain domain;
    std::optional<TabId> tab_id;

    uint32_t normalized_work_units() const { return work_units == 0 ? 1 : work_units; }
};

enum class ExecutionPhase {
    Preparing,
    Reflowing,
    Presenting
};

enum class LifecycleStage {
    Queued,
    Preparing,
    Reflowing,
    Presenting,
    Completed,
    Cancelled,
    Failed
};

enum class DropReason {
    QueueCapacity,      // Evicted to admit an interactive intent
    DeferralTimeout     // Deferred too many consecutive frames
};

enum class DetailKind {
    IntentQueued,
    TransactionStarted,
    PhaseAdvanced,
    ActiveCancelledBySupersession,
    PendingDropped,
    ActiveCompleted,
    CompletionRejected
};

/**
 * Tagged payload of a lifecycle event. Only the fields belonging to
 * `kind` are meaningful.
 */
struct LifecycleDetail {
    DetailKind kind = DetailKind::IntentQueued;

    // IntentQueued
    std::optional<IntentSeq> replaced_pending_seq;

    // TransactionStarted
    WorkClass work_class = WorkClass::Interactive;
    uint32_t work_units = 0;
    bool over_budget = false;
    bool forced_by_starvation = false;

    // PhaseAdvanced
    ExecutionPhase phase = ExecutionPhase::Preparing;

    // ActiveCancelledBySupersession
    IntentSeq superseded_by_seq = 0;

    // PendingDropped
    DropReason drop_reason = DropReason::QueueCapacity;

    // CompletionRejected
    std::optional<IntentSeq> rejected_active_seq;
    std::optional<IntentSeq> rejected_latest_seq;

    static LifecycleDetail intent_queued(std::optional<IntentSeq> replaced);
    static LifecycleDetail transaction_started(WorkClass cls, uint32_t units,
                                               bool over_budget, bool forced);
    static LifecycleDetail phase_advanced(ExecutionPhase phase);
    static LifecycleDetail cancelled_by_supersession(IntentSeq superseded_by);
    static LifecycleDetail pending_dropped(DropReason reason);
    static LifecycleDetail active_completed();
    static LifecycleDetail completion_rejected(std::optional<IntentSeq> active,
                                               std::optional<IntentSeq> latest);
};

struct LifecycleEvent {
    uint64_t event_seq = 0;
    uint64_t frame_seq = 0;
    PaneId pane_id = 0;
    IntentSeq intent_seq = 0;
    std::optional<uint64_t> observed_at_ms;
    std::optional<IntentSeq> latest_seq;
    std::optional<IntentSeq> pending_seq;
    std::optional<IntentSeq> active_seq;
    LifecycleStage stage = LifecycleStage::Queued;
    LifecycleDetail detail;
};

struct ScheduledWork {
    PaneId pane_id = 0;
    IntentSeq intent_seq = 0;
    WorkClass work_class = WorkClass::Interactive;
    uint32_t work_units = 0;
    bool over_budget = false;
    bool forced_by_starvation = false;
};

/** Outcome of one scheduling round */
struct FrameResult {
    uint32_t frame_budget_units = 0;
    uint32_t effective_budget_units = 0;
    uint32_t input_reserved_units = 0;
    uint32_t input_backlog = 0;
    uint32_t budget_spent_units = 0;
    std::vector<ScheduledWork> scheduled;
    size_t pending_after = 0;
};

enum class SubmitStatus {
    Accepted,
    SuppressedByKillSwitch,
    Rejected
};

enum class RejectReason {
    None,
    OutOfOrder,     // intent_seq not above the pane's latest_seq
    Overload        // pending queue full and nothing evictable
};

struct SubmitOutcome {
    SubmitStatus status = SubmitStatus::Accepted;
    RejectReason reason = RejectReason::None;
    bool legacy_fallback = false;
    std::optional<IntentSeq> replaced_pending_seq;

    static SubmitOutcome accepted(std::optional<IntentSeq> replaced) {
        SubmitOutcome o;
        o.replaced_pending_seq = replaced;
        return o;
    }
    static SubmitOutcome suppressed(bool legacy_fallback) {
        SubmitOutcome o;
        o.status = SubmitStatus::SuppressedByKillSwitch;
        o.legacy_fallback = legacy_fallback;
        return o;
    }
    static SubmitOutcome rejected(RejectReason reason) {
        SubmitOutcome o;
        o.status = SubmitStatus::Rejected;
        o.reason = reason;
        return o;
    }

    bool is_accepted() const { return status == SubmitStatus::Accepted; }
};

// Stage implied by a detail tag; the auditor holds every event to this
LifecycleStage implied_stage(const LifecycleDetail& detail);
LifecycleStage stage_of(ExecutionPhase phase);

const char* to_string(WorkClass c);
const char* to_string(DomainKind k);
const char* to_string(ExecutionPhase p);
const char* to_string(LifecycleStage s);
const char* to_string(DropReason r);
const char* to_string(DetailKind k);
const char* to_string(SubmitStatus s);
const char* to_string(RejectReason r);

} // namespace sched
} // namespace paneflow
