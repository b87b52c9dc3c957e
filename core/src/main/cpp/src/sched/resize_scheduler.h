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
#include <vector>
#include "debug_snapshot.h"
#include "domain_budget.h"
#include "invariants.h"
#include "lifecycle.h"
#include "metrics.h"
#include "scheduler_config.h"
#include "snapshot.h"
#include "storm_detector.h"
#include "transaction_table.h"
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Resize admission and sequencing engine.
 *
 * Owned by a single control loop which calls submit(), schedule_frame(),
 * mark_phase() and complete() in that order within a tick. Holds no
 * lock and is not safe for concurrent mutation; other threads only see
 * the copies returned by snapshot() and debug_snapshot().
 *
 * Usage:
 *   ResizeScheduler scheduler(SchedulerConfig::defaults());
 *   scheduler.submit(intent);
 *   FrameResult frame = scheduler.schedule_frame_with_backlog(8, input_backlog);
 *   for (const auto& work : frame.scheduled) {
 *       scheduler.mark_phase(work.pane_id, work.intent_seq, ExecutionPhase::Reflowing, now);
 *       scheduler.mark_phase(work.pane_id, work.intent_seq, ExecutionPhase::Presenting, now);
 *       scheduler.complete(work.pane_id, work.intent_seq);
 *   }
 */
class ResizeScheduler {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit ResizeScheduler(const SchedulerConfig& config = SchedulerConfig());

    const SchedulerConfig& config() const { return config_; }

    // ========== Control-plane gate ==========

    GateState gate() const { return gate_; }
    bool gate_active() const { return gate_.active; }
    void set_control_plane_enabled(bool enabled);
    void set_emergency_disable(bool emergency_disable);

    // ========== Admission ==========

    /**
     * Admit a resize intent into the pane's pending slot.
     *
     * Suppressed while the gate is inactive, rejected when the sequence
     * does not advance the pane or the pending queue is full. Never starts
     * a transaction.
     */
    SubmitOutcome submit(const ResizeIntent& intent);

    /**
     * Forget a closed pane. Any pending or in-flight work is discarded
     * without lifecycle events.
     * @return false if the pane was unknown
     */
    bool remove_pane(PaneId pane_id);

    // ========== Scheduling ==========

    /** Schedule with the configured frame budget and no input backlog */
    FrameResult schedule_frame();

    /** Schedule with an explicit budget and no input backlog */
    FrameResult schedule_frame(uint32_t budget_units);

    /**
     * Select this tick's work. Starts a transaction (phase Preparing) for
     * every admitted pick; deferred candidates age toward forced admission.
     * @param budget_units frame budget, normalized to at least 1
     * @param input_backlog pending input events, drives the input reserve
     */
    FrameResult schedule_frame_with_backlog(uint32_t budget_units, uint32_t input_backlog);

    // ========== Lifecycle ==========

    bool is_superseded(PaneId pane_id) const;

    /**
     * Phase-boundary supersession check: cancels the in-flight
     * transaction when a newer intent exists.
     * @return true if a transaction was cancelled
     */
    bool cancel_if_superseded(PaneId pane_id);

    /**
     * Advance the in-flight transaction to the immediate successor phase.
     * @return false if the transaction was cancelled by supersession, or
     *         `seq` is not the active sequence, or `target` is not the next phase
     */
    bool mark_phase(PaneId pane_id, IntentSeq seq, ExecutionPhase target, uint64_t now_ms);

    /**
     * Commit the in-flight transaction. Requires phase Presenting and
     * seq == latest_seq; any mismatch is recorded as Failed.
     */
    bool complete(PaneId pane_id, IntentSeq seq);

    // ========== Introspection ==========

    size_t pending_total() const { return table_.pending_total(); }
    size_t active_total() const { return table_.active_total(); }
    const SchedulerMetrics& metrics() const { return metrics_; }
    const InvariantTelemetry& invariant_telemetry() const { return invariant_telemetry_; }
    size_t stormed_tabs() const { return storm_.stormed_tabs(); }

    /** Highest timestamp observed through submit() and mark_phase() */
    uint64_t clock_ms() const { return clock_ms_; }

    SchedulerSnapshot snapshot() const;

    /** Most recent `limit` lifecycle events, oldest first; 0 returns all */
    std::vector<LifecycleEvent> lifecycle_events(size_t limit = 0) const;

    /** Retained events newer than `event_seq` */
    std::vector<LifecycleEvent> lifecycle_events_since(uint64_t event_seq) const;

    /**
     * Bundle gate, table, recent events and an invariant pass over them.
     * The pass is folded into the cumulative invariant telemetry.
     */
    DebugSnapshot debug_snapshot(size_t event_limit = 0);

private:
    struct Candidate {
        PaneId pane_id;
        IntentSeq intent_seq;
        WorkClass work_class;
        uint32_t work_units;
        uint64_t waiting_since_ms;
        uint32_t aging_credit;
        bool forced;
        Domain domain;
        std::optional<TabId> tab_id;
    };

    std::vector<Candidate> collect_candidates() const;
    void drop_overdeferred();
    void apply_deferral_aging(const std::vector<PaneId>& deferred);
    bool cancel_superseded(PaneTransaction& row);
    void evict_pending(PaneTransaction& row, DropReason reason);
    void emit(PaneId pane_id, IntentSeq intent_seq, std::optional<uint64_t> observed_at_ms,
              const LifecycleDetail& detail);
    void observe_clock(uint64_t at_ms);
    void resolve_gate();

    SchedulerConfig config_;
    GateState gate_;
    TransactionTable table_;
    StormDetector storm_;
    DomainBudget domain_budget_;
    LifecycleLog log_;
    SchedulerMetrics metrics_;
    InvariantTelemetry invariant_telemetry_;
    uint64_t clock_ms_ = 0;
};

} // namespace sched
} // namespace paneflow
