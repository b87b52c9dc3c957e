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

#include "domain_budget.h"

namespace paneflow {
namespace sched {

void DomainBudget::plan(uint32_t effective_units, const std::vector<Domain>& present) {
    shares_.clear();
    spent_.clear();

    std::map<std::string, uint32_t> weights;
    for (const auto& d : present) {
        weights.emplace(d.key(), d.weight());
    }

    uint64_t total_weight = 0;
    for (const auto& entry : weights) {
        total_weight += entry.second;
    }
    if (total_weight == 0) {
        return;
    }

    for (const auto& entry : weights) {
        uint64_t share = static_cast<uint64_t>(effective_units) * entry.second / total_weight;
        shares_[entry.first] = static_cast<uint32_t>(share);
    }
}

bool DomainBudget::can_take(const std::string& key, uint32_t units) const {
    auto it = shares_.find(key);
    if (it == shares_.end()) {
        // Domains that were not planned are not capped
        return true;
    }
    return static_cast<uint64_t>(spent(key)) + units <= it->second;
}

void DomainBudget::take(const std::string& key, uint32_t units) {
    spent_[key] += units;
}

uint32_t DomainBudget::share(const std::string& key) const {
    auto it = shares_.find(key);
    return it == shares_.end() ? 0 : it->second;
}

uint32_t DomainBudget::spent(const std::string& key) const {
    auto it = spent_.find(key);
    return it == spent_.end() ? 0 : it->second;
}

} // namespace sched
} // namespace paneflow
