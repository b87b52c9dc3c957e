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

#include "types.h"
#include "config.h"

namespace paneflow {
namespace sched {

std::string Domain::key() const {
    switch (kind) {
    case DomainKind::Local:
        return "local";
    case DomainKind::Remote:
        return "ssh:" + name;
    case DomainKind::Multiplexed:
        return "mux:" + name;
    }
    return "local";
}

uint32_t Domain::weight() const {
    switch (kind) {
    case DomainKind::Local:
        return domain::kLocalWeight;
    case DomainKind::Remote:
        return domain::kRemoteWeight;
    case DomainKind::Multiplexed:
        return domain::kMultiplexedWeight;
    }
    return domain::kMultiplexedWeight;
}

// ========== Lifecycle detail factories ==========

LifecycleDetail LifecycleDetail::intent_queued(std::optional<IntentSeq> replaced) {
    LifecycleDetail d;
    d.kind = DetailKind::IntentQueued;
    d.replaced_pending_seq = replaced;
    return d;
}

LifecycleDetail LifecycleDetail::transaction_started(WorkClass cls, uint32_t units,
                                                     bool over_budget, bool forced) {
    LifecycleDetail d;
    d.kind = DetailKind::TransactionStarted;
    d.work_class = cls;
    d.work_units = units;
    d.over_budget = over_budget;
    d.forced_by_starvation = forced;
    return d;
}

LifecycleDetail LifecycleDetail::phase_advanced(ExecutionPhase phase) {
    LifecycleDetail d;
    d.kind = DetailKind::PhaseAdvanced;
    d.phase = phase;
    return d;
}

LifecycleDetail LifecycleDetail::cancelled_by_supersession(IntentSeq superseded_by) {
    LifecycleDetail d;
    d.kind = DetailKind::ActiveCancelledBySupersession;
    d.superseded_by_seq = superseded_by;
    return d;
}

LifecycleDetail LifecycleDetail::pending_dropped(DropReason reason) {
    LifecycleDetail d;
    d.kind = DetailKind::PendingDropped;
    d.drop_reason = reason;
    return d;
}

LifecycleDetail LifecycleDetail::active_completed() {
    LifecycleDetail d;
    d.kind = DetailKind::ActiveCompleted;
    return d;
}

LifecycleDetail LifecycleDetail::completion_rejected(std::optional<IntentSeq> active,
                                                     std::optional<IntentSeq> latest) {
    LifecycleDetail d;
    d.kind = DetailKind::CompletionRejected;
    d.rejected_active_seq = active;
    d.rejected_latest_seq = latest;
    return d;
}

LifecycleStage stage_of(ExecutionPhase phase) {
    switch (phase) {
    case ExecutionPhase::Preparing:
        return LifecycleStage::Preparing;
    case ExecutionPhase::Reflowing:
        return LifecycleStage::Reflowing;
    case ExecutionPhase::Presenting:
        return LifecycleStage::Presenting;
    }
    return LifecycleStage::Preparing;
}

LifecycleStage implied_stage(const LifecycleDetail& detail) {
    switch (detail.kind) {
    case DetailKind::IntentQueued:
        return LifecycleStage::Queued;
    case DetailKind::TransactionStarted:
        return LifecycleStage::Preparing;
    case DetailKind::PhaseAdvanced:
        return stage_of(detail.phase);
    case DetailKind::ActiveCancelledBySupersession:
    case DetailKind::PendingDropped:
        return LifecycleStage::Cancelled;
    case DetailKind::ActiveCompleted:
        return LifecycleStage::Completed;
    case DetailKind::CompletionRejected:
        return LifecycleStage::Failed;
    }
    return LifecycleStage::Failed;
}

// ========== String conversions ==========

const char* to_string(WorkClass c) {
    switch (c) {
    case WorkClass::Interactive: return "interactive";
    case WorkClass::Background:  return "background";
    }
    return "unknown";
}

const char* to_string(DomainKind k) {
    switch (k) {
    case DomainKind::Local:       return "local";
    case DomainKind::Remote:      return "ssh";
    case DomainKind::Multiplexed: return "mux";
    }
    return "unknown";
}

const char* to_string(ExecutionPhase p) {
    switch (p) {
    case ExecutionPhase::Preparing:  return "preparing";
    case ExecutionPhase::Reflowing:  return "reflowing";
    case ExecutionPhase::Presenting: return "presenting";
    }
    return "unknown";
}

const char* to_string(LifecycleStage s) {
    switch (s) {
    case LifecycleStage::Queued:     return "queued";
    case LifecycleStage::Preparing:  return "preparing";
    case LifecycleStage::Reflowing:  return "reflowing";
    case LifecycleStage::Presenting: return "presenting";
    case LifecycleStage::Completed:  return "completed";
    case LifecycleStage::Cancelled:  return "cancelled";
    case LifecycleStage::Failed:     return "failed";
    }
    return "unknown";
}

const char* to_string(DropReason r) {
    switch (r) {
    case DropReason::QueueCapacity:   return "queue_capacity";
    case DropReason::DeferralTimeout: return "deferral_timeout";
    }
    return "unknown";
}

const char* to_string(DetailKind k) {
    switch (k) {
    case DetailKind::IntentQueued:                  return "intent_queued";
    case DetailKind::TransactionStarted:            return "transaction_started";
    case DetailKind::PhaseAdvanced:                 return "phase_advanced";
    case DetailKind::ActiveCancelledBySupersession: return "active_cancelled_by_supersession";
    case DetailKind::PendingDropped:                return "pending_dropped";
    case DetailKind::ActiveCompleted:               return "active_completed";
    case DetailKind::CompletionRejected:            return "completion_rejected";
    }
    return "unknown";
}

const char* to_string(SubmitStatus s) {
    switch (s) {
    case SubmitStatus::Accepted:               return "accepted";
    case SubmitStatus::SuppressedByKillSwitch: return "suppressed_by_kill_switch";
    case SubmitStatus::Rejected:               return "rejected";
    }
    return "unknown";
}

const char* to_string(RejectReason r) {
    switch (r) {
    case RejectReason::None:       return "none";
    case RejectReason::OutOfOrder: return "out_of_order";
    case RejectReason::Overload:   return "overload";
    }
    return "unknown";
}

} // namespace sched
} // namespace paneflow
