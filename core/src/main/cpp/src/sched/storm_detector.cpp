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

#include "storm_detector.h"
#include <algorithm>

namespace paneflow {
namespace sched {

void StormDetector::prune(TabWindow& w, uint64_t now_ms) const {
    uint64_t cutoff = now_ms > window_ms_ ? now_ms - window_ms_ : 0;
    // Arrivals are not guaranteed to be ordered (remote clocks jitter)
    w.arrivals.erase(std::remove_if(w.arrivals.begin(), w.arrivals.end(),
                                    [cutoff](uint64_t t) { return t < cutoff; }),
                     w.arrivals.end());
}

bool StormDetector::record(TabId tab, uint64_t at_ms) {
    if (!enabled()) {
        return false;
    }

    TabWindow& w = tabs_[tab];
    prune(w, at_ms);
    w.arrivals.push_back(at_ms);

    bool stormed = w.arrivals.size() >= threshold_;
    bool newly = stormed && !w.in_storm;
    w.in_storm = stormed;
    return newly;
}

void StormDetector::expire(uint64_t now_ms) {
    if (!enabled()) {
        return;
    }
    for (auto it = tabs_.begin(); it != tabs_.end();) {
        prune(it->second, now_ms);
        it->second.in_storm = it->second.arrivals.size() >= threshold_;
        if (it->second.arrivals.empty()) {
            it = tabs_.erase(it);
        } else {
            ++it;
        }
    }
}

bool StormDetector::is_stormed(TabId tab) const {
    if (!enabled()) {
        return false;
    }
    auto it = tabs_.find(tab);
    return it != tabs_.end() && it->second.in_storm;
}

size_t StormDetector::window_count(TabId tab) const {
    auto it = tabs_.find(tab);
    return it == tabs_.end() ? 0 : it->second.arrivals.size();
}

size_t StormDetector::stormed_tabs() const {
    size_t n = 0;
    for (const auto& entry : tabs_) {
        if (entry.second.in_storm) {
            ++n;
        }
    }
    return n;
}

} // namespace sched
} // namespace paneflow
