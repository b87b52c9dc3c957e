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
#include <string>
#include "debug_snapshot.h"
#include "degradation.h"
#include "scheduler_config.h"
#include "watchdog.h"

namespace paneflow {
namespace sched {

// JSON renderings for operator tooling. Optional fields are written as null.
std::string to_json(const DebugSnapshot& snapshot);
std::string to_json(const WatchdogAssessment& assessment);
std::string to_json(const DegradationAssessment& assessment);

std::string config_to_json(const SchedulerConfig& config);

/**
 * Overlay the fields present in `json` onto `config`. Unknown keys are
 * ignored. `config` is left untouched unless every field applies.
 * @return false on a parse error, a non-object document, a mistyped
 *         field, or an overlay that fails SchedulerConfig::validate()
 */
bool config_from_json(const std::string& json, SchedulerConfig& config);

} // namespace sched
} // namespace paneflow
