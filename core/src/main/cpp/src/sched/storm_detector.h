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
#include <deque>
#include <unordered_map>
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Per-tab sliding window of intent arrival times.
 *
 * A tab is stormed while its window holds at least `threshold` arrivals.
 * A zero window or zero threshold disables detection entirely.
 */
class StormDetector {
public:
    StormDetector(uint64_t window_ms, uint32_t threshold)
        : window_ms_(window_ms), threshold_(threshold) {}

    bool enabled() const { return window_ms_ > 0 && threshold_ > 0; }

    /**
     * Record an arrival for a tab.
     * @return true when this arrival moved the tab into the storm state
     */
    bool record(TabId tab, uint64_t at_ms);

    /**
     * Drop arrivals that fell out of the window ending at `now_ms` and
     * clear the storm state of tabs that calmed down.
     */
    void expire(uint64_t now_ms);

    bool is_stormed(TabId tab) const;
    size_t window_count(TabId tab) const;
    size_t stormed_tabs() const;

private:
    struct TabWindow {
        std::deque<uint64_t> arrivals;
        bool in_storm = false;
    };

    void prune(TabWindow& w, uint64_t now_ms) const;

    uint64_t window_ms_;
    uint32_t threshold_;
    std::unordered_map<TabId, TabWindow> tabs_;
};

} // namespace sched
} // namespace paneflow
