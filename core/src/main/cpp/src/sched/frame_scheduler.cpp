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

// Frame selection half of ResizeScheduler: candidate ordering, storm and
// domain throttles, input guardrail, starvation escalation.

#include "resize_scheduler.h"
#include "../util/log.h"
#include <algorithm>
#include <map>

namespace paneflow {
namespace sched {

FrameResult ResizeScheduler::schedule_frame() {
    return schedule_frame_with_backlog(config_.frame_budget_units, 0);
}

FrameResult ResizeScheduler::schedule_frame(uint32_t budget_units) {
    return schedule_frame_with_backlog(budget_units, 0);
}

std::vector<ResizeScheduler::Candidate> ResizeScheduler::collect_candidates() const {
    std::vector<Candidate> out;
    out.reserve(table_.pending_total());
    for (const auto& entry : table_.rows()) {
        const PaneTransaction& row = entry.second;
        // Single flight: a pane with work in flight waits for it to finish or be cancelled
        if (!row.pending || row.is_active()) {
            continue;
        }
        const ResizeIntent& intent = *row.pending;
        Candidate c;
        c.pane_id = row.pane_id;
        c.intent_seq = intent.intent_seq;
        c.work_class = intent.work_class;
        c.work_units = intent.normalized_work_units();
        c.waiting_since_ms = intent.submitted_at_ms;
        c.aging_credit = row.aging_credit;
        c.forced = row.consecutive_deferrals >= config_.max_deferrals_before_force;
        c.domain = intent.domain;
        c.tab_id = intent.tab_id;
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        if (a.forced != b.forced) return a.forced;
        if (a.work_class != b.work_class) return a.work_class == WorkClass::Interactive;
        if (a.aging_credit != b.aging_credit) return a.aging_credit > b.aging_credit;
        if (a.waiting_since_ms != b.waiting_since_ms) return a.waiting_since_ms < b.waiting_since_ms;
        if (a.intent_seq != b.intent_seq) return a.intent_seq < b.intent_seq;
        return a.pane_id < b.pane_id;
    });
    return out;
}

void ResizeScheduler::drop_overdeferred() {
    if (config_.max_deferrals_before_drop == 0) {
        return;
    }
    for (auto& entry : table_.rows()) {
        PaneTransaction& row = entry.second;
        if (row.pending && row.consecutive_deferrals >= config_.max_deferrals_before_drop) {
            ++metrics_.dropped_after_deferrals;
            evict_pending(row, DropReason::DeferralTimeout);
        }
    }
}

void ResizeScheduler::apply_deferral_aging(const std::vector<PaneId>& deferred) {
    for (PaneId pane_id : deferred) {
        PaneTransaction* row = table_.find(pane_id);
        if (!row || !row->pending) {
            continue;
        }
        ++row->consecutive_deferrals;
        uint32_t boost = row->pending->work_class == WorkClass::Interactive
            ? config_.aging_credit_per_frame / 2
            : config_.aging_credit_per_frame;
        row->aging_credit = std::min(row->aging_credit + boost, config_.max_aging_credit);
    }
}

FrameResult ResizeScheduler::schedule_frame_with_backlog(uint32_t budget_units,
                                                         uint32_t input_backlog) {
    FrameResult result;
    uint32_t budget = std::max<uint32_t>(budget_units, 1);
    result.frame_budget_units = budget;
    result.input_backlog = input_backlog;

    if (!gate_.active) {
        ++metrics_.suppressed_frames;
        metrics_.last_input_backlog = input_backlog;
        result.effective_budget_units = budget;
        result.pending_after = table_.pending_total();
        trace() << "schedule_frame: suppressed by gate";
        return result;
    }

    ++metrics_.frames;
    storm_.expire(clock_ms_);
    drop_overdeferred();

    // Input guardrail: keep part of the frame for input echo. At least one
    // unit always stays with resize work so forced panes can make progress.
    uint32_t reserved = 0;
    if (config_.input_guardrail_enabled && input_backlog >= config_.input_backlog_threshold &&
        budget > 1) {
        reserved = std::min(std::max<uint32_t>(config_.input_reserve_units, 1), budget - 1);
        ++metrics_.input_guardrail_frames;
    }
    uint32_t effective = budget - reserved;

    std::vector<Candidate> candidates = collect_candidates();

    if (config_.domain_budget_enabled) {
        std::vector<Domain> present;
        present.reserve(candidates.size());
        for (const auto& c : candidates) {
            present.push_back(c.domain);
        }
        domain_budget_.plan(effective, present);
    }

    std::map<TabId, uint32_t> tab_picks;
    std::vector<PaneId> deferred;
    uint32_t spent = 0;
    bool over_budget_served = false;
    uint64_t storm_throttled = 0;
    uint64_t domain_throttled = 0;

    for (const Candidate& c : candidates) {
        std::string domain_key = c.domain.key();

        // Forced candidates bypass both throttles
        if (!c.forced) {
            if (c.tab_id && storm_.is_stormed(*c.tab_id) &&
                tab_picks[*c.tab_id] >= config_.max_storm_picks_per_tab) {
                ++metrics_.storm_picks_throttled;
                ++storm_throttled;
                deferred.push_back(c.pane_id);
                continue;
            }
            if (config_.domain_budget_enabled && !domain_budget_.can_take(domain_key, c.work_units)) {
                ++metrics_.domain_budget_throttled;
                ++domain_throttled;
                deferred.push_back(c.pane_id);
                continue;
            }
        }

        uint32_t remaining = effective > spent ? effective - spent : 0;
        bool over_budget = c.work_units > remaining;
        if (over_budget) {
            bool may_oversubscribe = !over_budget_served && reserved == 0 &&
                ((config_.allow_single_oversubscription && result.scheduled.empty()) || c.forced);
            if (!may_oversubscribe) {
                uint32_t remaining_total = budget > spent ? budget - spent : 0;
                if (reserved > 0 && c.work_units <= remaining_total) {
                    ++metrics_.input_guardrail_deferrals;
                }
                deferred.push_back(c.pane_id);
                continue;
            }
            over_budget_served = true;
            ++metrics_.over_budget_runs;
        }

        PaneTransaction* row = table_.find(c.pane_id);
        if (!row) {
            continue;
        }
        std::optional<ResizeIntent> intent = table_.take_pending(*row);
        if (!intent) {
            continue;
        }
        table_.start_active(*row, intent->intent_seq, intent->submitted_at_ms);

        spent += c.work_units;
        if (c.forced) {
            ++metrics_.forced_background_runs;
        }
        if (c.tab_id) {
            ++tab_picks[*c.tab_id];
        }
        if (config_.domain_budget_enabled) {
            domain_budget_.take(domain_key, c.work_units);
        }

        ScheduledWork work;
        work.pane_id = c.pane_id;
        work.intent_seq = c.intent_seq;
        work.work_class = c.work_class;
        work.work_units = c.work_units;
        work.over_budget = over_budget;
        work.forced_by_starvation = c.forced;
        result.scheduled.push_back(work);

        trace() << "schedule_frame: pane " << c.pane_id << " seq " << c.intent_seq
                << " units=" << c.work_units << " domain=" << domain_key
                << (c.forced ? " forced" : "") << (over_budget ? " over_budget" : "");

        emit(c.pane_id, c.intent_seq, intent->submitted_at_ms,
             LifecycleDetail::transaction_started(c.work_class, c.work_units, over_budget, c.forced));
    }

    apply_deferral_aging(deferred);

    metrics_.last_frame_budget_units = budget;
    metrics_.last_effective_budget_units = effective;
    metrics_.last_input_backlog = input_backlog;
    metrics_.last_frame_spent_units = spent;
    metrics_.last_frame_scheduled = static_cast<uint32_t>(result.scheduled.size());

    result.effective_budget_units = effective;
    result.input_reserved_units = reserved;
    result.budget_spent_units = spent;
    result.pending_after = table_.pending_total();

    if (!deferred.empty()) {
        debug() << "schedule_frame " << metrics_.frames << ": scheduled "
                << result.scheduled.size() << ", deferred " << deferred.size()
                << " (storm " << storm_throttled << ", domain " << domain_throttled
                << "), spent " << spent << "/" << effective;
    }
    return result;
}

} // namespace sched
} // namespace paneflow
