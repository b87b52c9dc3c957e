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
#include <string>
#include <vector>
#include "types.h"

namespace paneflow {
namespace sched {

/**
 * Per-frame partition of the resize budget across domains.
 *
 * Each domain present among the frame's candidates receives
 * floor(effective * weight / total_weight) units. Shares are not
 * rounded up: a low-weight domain may get nothing in a tight frame and
 * then relies on starvation escalation for progress.
 */
class DomainBudget {
public:
    /**
     * Recompute shares for a new frame and clear spent units.
     * @param effective_units budget left after the input reserve
     * @param present domains of this frame's candidates (duplicates allowed)
     */
    void plan(uint32_t effective_units, const std::vector<Domain>& present);

    bool can_take(const std::string& key, uint32_t units) const;
    void take(const std::string& key, uint32_t units);

    uint32_t share(const std::string& key) const;
    uint32_t spent(const std::string& key) const;
    const std::map<std::string, uint32_t>& shares() const { return shares_; }

private:
    std::map<std::string, uint32_t> shares_;
    std::map<std::string, uint32_t> spent_;
};

} // namespace sched
} // namespace paneflow
