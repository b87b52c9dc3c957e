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

#include <gtest/gtest.h>
#include <map>
#include "sched/resize_scheduler.h"
#include "sched_test_util.h"

using namespace paneflow::sched;
using namespace paneflow::sched::testing_util;

class MetricsExportTest : public ::testing::Test {
protected:
    struct Exported {
        MetricType type;
        std::string value;
    };

    static std::map<std::string, Exported> collect(const SchedulerMetrics& m) {
        std::map<std::string, Exported> out;
        m.export_metrics([&out](const std::string& name, MetricType type, const std::string& value) {
            out[name] = Exported{type, value};
        });
        return out;
    }
};

TEST_F(MetricsExportTest, EveryFieldIsExported) {
    auto exported = collect(SchedulerMetrics());
    EXPECT_EQ(exported.size(), 23u);
    for (const auto& entry : exported) {
        EXPECT_EQ(entry.first.rfind("paneflow_", 0), 0u) << entry.first;
        EXPECT_EQ(entry.second.value, "0") << entry.first;
    }
}

TEST_F(MetricsExportTest, CountersAndGauges) {
    ResizeScheduler s(quiet_config());
    s.submit(intent(1, 1, 100));
    s.submit(intent(1, 2, 101));
    s.submit(intent(2, 1, 101, WorkClass::Background, 3));
    s.schedule_frame(2);

    auto exported = collect(s.metrics());
    EXPECT_EQ(exported.at("paneflow_frames").type, MetricType::Counter);
    EXPECT_EQ(exported.at("paneflow_frames").value, "1");
    EXPECT_EQ(exported.at("paneflow_superseded_intents").value, "1");
    EXPECT_EQ(exported.at("paneflow_last_frame_budget_units").type, MetricType::Gauge);
    EXPECT_EQ(exported.at("paneflow_last_frame_budget_units").value, "2");
    EXPECT_EQ(exported.at("paneflow_last_frame_scheduled").value, "1");
    EXPECT_EQ(exported.at("paneflow_last_frame_spent_units").value, "1");
}

TEST_F(MetricsExportTest, GaugesTrackLastFrameOnly) {
    ResizeScheduler s(quiet_config());
    s.submit(intent(1, 1, 100, WorkClass::Interactive, 2));
    s.submit(intent(2, 1, 100, WorkClass::Interactive, 2));
    s.schedule_frame(4);
    EXPECT_EQ(s.metrics().last_frame_scheduled, 2u);
    EXPECT_EQ(s.metrics().last_frame_spent_units, 4u);

    s.schedule_frame(3);
    EXPECT_EQ(s.metrics().frames, 2u);
    EXPECT_EQ(s.metrics().last_frame_scheduled, 0u);
    EXPECT_EQ(s.metrics().last_frame_spent_units, 0u);
    EXPECT_EQ(s.metrics().last_frame_budget_units, 3u);
}

TEST_F(MetricsExportTest, Reset) {
    SchedulerMetrics m;
    m.frames = 9;
    m.last_input_backlog = 3;
    m.reset();
    EXPECT_EQ(m.frames, 0u);
    EXPECT_EQ(m.last_input_backlog, 0u);
}
