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

#include "transaction_table.h"

namespace paneflow {
namespace sched {

const PaneTransaction* TransactionTable::find(PaneId pane_id) const {
    auto it = rows_.find(pane_id);
    return it == rows_.end() ? nullptr : &it->second;
}

PaneTransaction* TransactionTable::find(PaneId pane_id) {
    auto it = rows_.find(pane_id);
    return it == rows_.end() ? nullptr : &it->second;
}

PaneTransaction& TransactionTable::get_or_create(PaneId pane_id) {
    auto it = rows_.find(pane_id);
    if (it == rows_.end()) {
        PaneTransaction row;
        row.pane_id = pane_id;
        it = rows_.emplace(pane_id, row).first;
    }
    return it->second;
}

bool TransactionTable::remove(PaneId pane_id) {
    auto it = rows_.find(pane_id);
    if (it == rows_.end()) {
        return false;
    }
    if (it->second.has_pending()) --pending_total_;
    if (it->second.is_active()) --active_total_;
    rows_.erase(it);
    return true;
}

std::optional<IntentSeq> TransactionTable::set_pending(PaneTransaction& row,
                                                        const ResizeIntent& intent) {
    std::optional<IntentSeq> replaced;
    if (row.pending) {
        replaced = row.pending->intent_seq;
    } else {
        ++pending_total_;
    }
    row.pending = intent;
    row.latest_seq = intent.intent_seq;
    return replaced;
}

std::optional<ResizeIntent> TransactionTable::take_pending(PaneTransaction& row) {
    if (!row.pending) {
        return std::nullopt;
    }
    std::optional<ResizeIntent> taken = std::move(row.pending);
    row.pending.reset();
    --pending_total_;
    return taken;
}

void TransactionTable::start_active(PaneTransaction& row, IntentSeq seq, uint64_t started_at_ms) {
    if (!row.active_seq) {
        ++active_total_;
    }
    row.active_seq = seq;
    row.active_phase = ExecutionPhase::Preparing;
    row.phase_started_at_ms = started_at_ms;
    row.consecutive_deferrals = 0;
    row.aging_credit = 0;
}

void TransactionTable::advance_active(PaneTransaction& row, ExecutionPhase phase, uint64_t at_ms) {
    row.active_phase = phase;
    row.phase_started_at_ms = at_ms;
}

void TransactionTable::clear_active(PaneTransaction& row) {
    if (row.active_seq) {
        --active_total_;
    }
    row.active_seq.reset();
    row.active_phase.reset();
    row.phase_started_at_ms.reset();
}

std::optional<PaneId> TransactionTable::oldest_background_pending() const {
    std::optional<PaneId> victim;
    uint64_t victim_at = 0;
    // rows_ is ordered by pane id, so ties keep the lowest id
    for (const auto& entry : rows_) {
        const PaneTransaction& row = entry.second;
        if (!row.pending || row.pending->work_class != WorkClass::Background) {
            continue;
        }
        if (!victim || row.pending->submitted_at_ms < victim_at) {
            victim = row.pane_id;
            victim_at = row.pending->submitted_at_ms;
        }
    }
    return victim;
}

std::vector<PaneSnapshot> TransactionTable::snapshot_rows() const {
    std::vector<PaneSnapshot> out;
    out.reserve(rows_.size());
    for (const auto& entry : rows_) {
        const PaneTransaction& row = entry.second;
        PaneSnapshot s;
        s.pane_id = row.pane_id;
        s.latest_seq = row.latest_seq;
        if (row.pending) {
            s.pending_seq = row.pending->intent_seq;
            s.pending_class = row.pending->work_class;
        }
        s.active_seq = row.active_seq;
        s.active_phase = row.active_phase;
        s.phase_started_at_ms = row.phase_started_at_ms;
        s.consecutive_deferrals = row.consecutive_deferrals;
        s.aging_credit = row.aging_credit;
        out.push_back(s);
    }
    return out;
}

} // namespace sched
} // namespace paneflow
