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

#include "resize_scheduler.h"
#include "../util/log.h"
#include <stdexcept>

namespace paneflow {
namespace sched {

ResizeScheduler::ResizeScheduler(const SchedulerConfig& config)
    : config_(config)
    , storm_(config.storm_window_ms, config.storm_threshold_intents)
    , log_(config.max_lifecycle_events) {
    if (!config_.validate()) {
        severe() << "ResizeScheduler: invalid configuration (budget=" << config_.frame_budget_units
                 << ", force=" << config_.max_deferrals_before_force
                 << ", drop=" << config_.max_deferrals_before_drop << ")";
        throw std::invalid_argument("ResizeScheduler: invalid SchedulerConfig");
    }
    resolve_gate();
    debug() << "ResizeScheduler: budget=" << config_.frame_budget_units
            << " domain_budget=" << config_.domain_budget_enabled
            << " storm=" << config_.storm_threshold_intents << "@" << config_.storm_window_ms << "ms"
            << " gate_active=" << gate_.active;
}

// ========== Control-plane gate ==========

void ResizeScheduler::resolve_gate() {
    gate_.control_plane_enabled = config_.control_plane_enabled;
    gate_.emergency_disable = config_.emergency_disable;
    gate_.legacy_fallback_enabled = config_.legacy_fallback_enabled;
    gate_.active = gate_.control_plane_enabled && !gate_.emergency_disable;
}

void ResizeScheduler::set_control_plane_enabled(bool enabled) {
    gate_.control_plane_enabled = enabled;
    gate_.active = gate_.control_plane_enabled && !gate_.emergency_disable;
    info() << "ResizeScheduler: control plane " << (enabled ? "enabled" : "disabled")
           << " (gate_active=" << gate_.active << ")";
}

void ResizeScheduler::set_emergency_disable(bool emergency_disable) {
    gate_.emergency_disable = emergency_disable;
    gate_.active = gate_.control_plane_enabled && !gate_.emergency_disable;
    if (emergency_disable) {
        warn() << "ResizeScheduler: emergency kill-switch engaged (legacy_fallback="
               << gate_.legacy_fallback_enabled << ")";
    } else {
        info() << "ResizeScheduler: emergency kill-switch released";
    }
}

// ========== Admission ==========

SubmitOutcome ResizeScheduler::submit(const ResizeIntent& submitted) {
    if (!gate_.active) {
        ++metrics_.suppressed_by_gate;
        debug() << "submit: pane " << submitted.pane_id << " seq " << submitted.intent_seq
                << " suppressed by gate";
        return SubmitOutcome::suppressed(gate_.legacy_fallback_enabled);
    }

    ResizeIntent intent = submitted;
    intent.work_units = intent.normalized_work_units();

    const PaneTransaction* existing = table_.find(intent.pane_id);
    if (existing && existing->latest_seq && intent.intent_seq <= *existing->latest_seq) {
        ++metrics_.rejected_out_of_order;
        debug() << "submit: pane " << intent.pane_id << " seq " << intent.intent_seq
                << " rejected, latest is " << *existing->latest_seq;
        return SubmitOutcome::rejected(RejectReason::OutOfOrder);
    }

    bool needs_slot = !existing || !existing->has_pending();
    if (needs_slot && table_.pending_total() >= config_.max_pending_panes) {
        std::optional<PaneId> victim;
        if (intent.work_class == WorkClass::Interactive) {
            victim = table_.oldest_background_pending();
        }
        if (!victim) {
            ++metrics_.overload_rejected;
            debug() << "submit: pane " << intent.pane_id << " seq " << intent.intent_seq
                    << " rejected, " << table_.pending_total() << " panes pending";
            return SubmitOutcome::rejected(RejectReason::Overload);
        }
        PaneTransaction* victim_row = table_.find(*victim);
        if (victim_row) {
            ++metrics_.overload_evicted;
            evict_pending(*victim_row, DropReason::QueueCapacity);
        }
    }

    observe_clock(intent.submitted_at_ms);

    PaneTransaction& row = table_.get_or_create(intent.pane_id);
    std::optional<IntentSeq> replaced = table_.set_pending(row, intent);
    if (replaced) {
        ++metrics_.superseded_intents;
    }

    if (intent.tab_id && storm_.record(*intent.tab_id, intent.submitted_at_ms)) {
        ++metrics_.storm_events_detected;
        info() << "storm detected on tab " << *intent.tab_id << ": "
               << storm_.window_count(*intent.tab_id) << " intents within "
               << config_.storm_window_ms << "ms";
    }

    emit(intent.pane_id, intent.intent_seq, intent.submitted_at_ms,
         LifecycleDetail::intent_queued(replaced));

    if (row.is_superseded()) {
        trace() << "submit: pane " << row.pane_id << " active seq " << *row.active_seq
                << " superseded by " << intent.intent_seq;
    }
    return SubmitOutcome::accepted(replaced);
}

bool ResizeScheduler::remove_pane(PaneId pane_id) {
    bool removed = table_.remove(pane_id);
    if (removed) {
        debug() << "remove_pane: pane " << pane_id << " dropped";
    }
    return removed;
}

void ResizeScheduler::evict_pending(PaneTransaction& row, DropReason reason) {
    std::optional<ResizeIntent> dropped = table_.take_pending(row);
    if (!dropped) {
        return;
    }
    row.consecutive_deferrals = 0;
    row.aging_credit = 0;
    warn() << "pending intent dropped: pane " << row.pane_id << " seq " << dropped->intent_seq
           << " (" << to_string(reason) << ")";
    emit(row.pane_id, dropped->intent_seq, std::nullopt, LifecycleDetail::pending_dropped(reason));
}

// ========== Lifecycle ==========

bool ResizeScheduler::is_superseded(PaneId pane_id) const {
    const PaneTransaction* row = table_.find(pane_id);
    return row && row->is_superseded();
}

bool ResizeScheduler::cancel_if_superseded(PaneId pane_id) {
    PaneTransaction* row = table_.find(pane_id);
    return row && cancel_superseded(*row);
}

bool ResizeScheduler::cancel_superseded(PaneTransaction& row) {
    if (!row.is_superseded()) {
        return false;
    }
    IntentSeq cancelled = *row.active_seq;
    IntentSeq superseded_by = *row.latest_seq;
    table_.clear_active(row);
    ++metrics_.cancelled_active;
    warn() << "pane " << row.pane_id << " seq " << cancelled
           << " cancelled, superseded by " << superseded_by;
    emit(row.pane_id, cancelled, std::nullopt,
         LifecycleDetail::cancelled_by_supersession(superseded_by));
    return true;
}

bool ResizeScheduler::mark_phase(PaneId pane_id, IntentSeq seq, ExecutionPhase target,
                                 uint64_t now_ms) {
    PaneTransaction* row = table_.find(pane_id);
    if (!row) {
        return false;
    }
    if (cancel_superseded(*row)) {
        return false;
    }
    if (!row->active_seq || *row->active_seq != seq || !row->active_phase ||
        !is_immediate_successor(*row->active_phase, target)) {
        debug() << "mark_phase: pane " << pane_id << " seq " << seq << " -> "
                << to_string(target) << " ignored";
        return false;
    }

    observe_clock(now_ms);
    table_.advance_active(*row, target, now_ms);
    emit(pane_id, seq, now_ms, LifecycleDetail::phase_advanced(target));
    return true;
}

bool ResizeScheduler::complete(PaneId pane_id, IntentSeq seq) {
    PaneTransaction* row = table_.find(pane_id);
    if (!row) {
        return false;
    }
    if (cancel_superseded(*row)) {
        return false;
    }

    bool ok = row->active_seq && *row->active_seq == seq &&
              row->active_phase && *row->active_phase == ExecutionPhase::Presenting &&
              row->latest_seq && *row->latest_seq == seq;
    if (!ok) {
        ++metrics_.completion_rejected;
        warn() << "complete: pane " << pane_id << " seq " << seq << " rejected"
               << " (active=" << (row->active_seq ? static_cast<long long>(*row->active_seq) : -1LL)
               << ", phase=" << (row->active_phase ? to_string(*row->active_phase) : "none") << ")";
        emit(pane_id, seq, std::nullopt,
             LifecycleDetail::completion_rejected(row->active_seq, row->latest_seq));
        return false;
    }

    table_.clear_active(*row);
    row->consecutive_deferrals = 0;
    ++metrics_.completed_active;
    emit(pane_id, seq, std::nullopt, LifecycleDetail::active_completed());
    return true;
}

void ResizeScheduler::emit(PaneId pane_id, IntentSeq intent_seq,
                           std::optional<uint64_t> observed_at_ms, const LifecycleDetail& detail) {
    LifecycleEvent ev;
    ev.frame_seq = metrics_.frames;
    ev.pane_id = pane_id;
    ev.intent_seq = intent_seq;
    ev.observed_at_ms = observed_at_ms;
    if (const PaneTransaction* row = table_.find(pane_id)) {
        ev.latest_seq = row->latest_seq;
        if (row->pending) {
            ev.pending_seq = row->pending->intent_seq;
        }
        ev.active_seq = row->active_seq;
    }
    ev.stage = implied_stage(detail);
    ev.detail = detail;
    log_.append(std::move(ev));
}

void ResizeScheduler::observe_clock(uint64_t at_ms) {
    if (at_ms > clock_ms_) {
        clock_ms_ = at_ms;
    }
}

// ========== Introspection ==========

SchedulerSnapshot ResizeScheduler::snapshot() const {
    SchedulerSnapshot snap;
    snap.config = config_;
    snap.metrics = metrics_;
    snap.pending_total = table_.pending_total();
    snap.active_total = table_.active_total();
    snap.panes = table_.snapshot_rows();
    return snap;
}

std::vector<LifecycleEvent> ResizeScheduler::lifecycle_events(size_t limit) const {
    return log_.recent(limit);
}

std::vector<LifecycleEvent> ResizeScheduler::lifecycle_events_since(uint64_t event_seq) const {
    return log_.since(event_seq);
}

DebugSnapshot ResizeScheduler::debug_snapshot(size_t event_limit) {
    DebugSnapshot dbg;
    dbg.gate = gate_;
    dbg.scheduler = snapshot();
    dbg.lifecycle_events = log_.recent(event_limit);
    dbg.invariants = check_snapshot_invariants(dbg.scheduler);
    dbg.invariants.merge(check_lifecycle_invariants(dbg.lifecycle_events));
    invariant_telemetry_.absorb(dbg.invariants);
    dbg.invariant_telemetry = invariant_telemetry_;
    if (!dbg.invariants.is_clean()) {
        error() << "debug_snapshot: " << dbg.invariants.violations.size()
                << " invariant violation(s), first: " << dbg.invariants.violations.front().message;
    }
    return dbg;
}

} // namespace sched
} // namespace paneflow
