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
#include <map>
#include <optional>
#include <vector>
#include "snapshot.h"
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Transaction record for one pane.
 *
 * `pending` holds the newest admitted intent that has not started yet;
 * a newer submit replaces it. `active_seq` names the single in-flight
 * transaction. Both may be set at once only while the pending intent
 * supersedes the active one.
 */
struct PaneTransaction {
    PaneId pane_id = 0;
    std::optional<IntentSeq> latest_seq;
    std::optional<ResizeIntent> pending;
    std::optional<IntentSeq> active_seq;
    std::optional<ExecutionPhase> active_phase;
    std::optional<uint64_t> phase_started_at_ms;
    uint32_t consecutive_deferrals = 0;
    uint32_t aging_credit = 0;

    bool has_pending() const { return pending.has_value(); }
    bool is_active() const { return active_seq.has_value(); }
    bool is_superseded() const {
        return active_seq && latest_seq && *latest_seq > *active_seq;
    }
};

/**
 * Flat table of pane rows keyed by pane id, the single owner of all
 * transaction state. Pending and active totals are maintained by the
 * mutators below, so rows must not be edited around them.
 */
class TransactionTable {
public:
    const PaneTransaction* find(PaneId pane_id) const;
    PaneTransaction* find(PaneId pane_id);
    PaneTransaction& get_or_create(PaneId pane_id);

    /**
     * Remove a closed pane's row.
     * @return false if the pane had no row
     */
    bool remove(PaneId pane_id);

    /**
     * Store `intent` as the row's pending intent and raise latest_seq.
     * @return sequence of the pending intent that was replaced, if any
     */
    std::optional<IntentSeq> set_pending(PaneTransaction& row, const ResizeIntent& intent);

    /**
     * Remove and return the row's pending intent.
     */
    std::optional<ResizeIntent> take_pending(PaneTransaction& row);

    /**
     * Start the single in-flight transaction in phase Preparing.
     */
    void start_active(PaneTransaction& row, IntentSeq seq, uint64_t started_at_ms);

    void advance_active(PaneTransaction& row, ExecutionPhase phase, uint64_t at_ms);
    void clear_active(PaneTransaction& row);

    /**
     * Pane holding the oldest Background pending intent (by submit time,
     * then pane id). Used as the overload eviction victim.
     */
    std::optional<PaneId> oldest_background_pending() const;

    size_t pending_total() const { return pending_total_; }
    size_t active_total() const { return active_total_; }
    size_t size() const { return rows_.size(); }

    const std::map<PaneId, PaneTransaction>& rows() const { return rows_; }
    std::map<PaneId, PaneTransaction>& rows() { return rows_; }

    /**
     * Copy every row, sorted by pane id.
     */
    std::vector<PaneSnapshot> snapshot_rows() const;

private:
    std::map<PaneId, PaneTransaction> rows_;
    size_t pending_total_ = 0;
    size_t active_total_ = 0;
};

} // namespace sched
} // namespace paneflow
