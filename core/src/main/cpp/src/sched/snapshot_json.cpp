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

#include "snapshot_json.h"
#include "../util/log.h"

#include "rapidjson/document.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"

namespace paneflow {
namespace sched {

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_optional(JsonWriter& writer, const char* key, const std::optional<uint64_t>& value) {
    writer.Key(key);
    if (value) {
        writer.Uint64(*value);
    } else {
        writer.Null();
    }
}

void write_strings(JsonWriter& writer, const char* key, const std::vector<std::string>& values) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& v : values) {
        writer.String(v.c_str());
    }
    writer.EndArray();
}

void write_config(JsonWriter& writer, const SchedulerConfig& config) {
    writer.StartObject();
    writer.Key("control_plane_enabled");
    writer.Bool(config.control_plane_enabled);
    writer.Key("emergency_disable");
    writer.Bool(config.emergency_disable);
    writer.Key("legacy_fallback_enabled");
    writer.Bool(config.legacy_fallback_enabled);
    writer.Key("frame_budget_units");
    writer.Uint(config.frame_budget_units);
    writer.Key("allow_single_oversubscription");
    writer.Bool(config.allow_single_oversubscription);
    writer.Key("input_guardrail_enabled");
    writer.Bool(config.input_guardrail_enabled);
    writer.Key("input_backlog_threshold");
    writer.Uint(config.input_backlog_threshold);
    writer.Key("input_reserve_units");
    writer.Uint(config.input_reserve_units);
    writer.Key("max_deferrals_before_force");
    writer.Uint(config.max_deferrals_before_force);
    writer.Key("max_deferrals_before_drop");
    writer.Uint(config.max_deferrals_before_drop);
    writer.Key("aging_credit_per_frame");
    writer.Uint(config.aging_credit_per_frame);
    writer.Key("max_aging_credit");
    writer.Uint(config.max_aging_credit);
    writer.Key("max_pending_panes");
    writer.Uint64(config.max_pending_panes);
    writer.Key("storm_window_ms");
    writer.Uint64(config.storm_window_ms);
    writer.Key("storm_threshold_intents");
    writer.Uint(config.storm_threshold_intents);
    writer.Key("max_storm_picks_per_tab");
    writer.Uint(config.max_storm_picks_per_tab);
    writer.Key("domain_budget_enabled");
    writer.Bool(config.domain_budget_enabled);
    writer.Key("max_lifecycle_events");
    writer.Uint64(config.max_lifecycle_events);
    writer.EndObject();
}

void write_metrics(JsonWriter& writer, const SchedulerMetrics& metrics) {
    writer.StartObject();
    metrics.export_metrics([&writer](const std::string& name, MetricType, const std::string& value) {
        writer.Key(name.c_str());
        writer.Uint64(std::stoull(value));
    });
    writer.EndObject();
}

void write_detail(JsonWriter& writer, const LifecycleDetail& detail) {
    writer.StartObject();
    writer.Key("kind");
    writer.String(to_string(detail.kind));
    switch (detail.kind) {
        case DetailKind::IntentQueued:
            write_optional(writer, "replaced_pending_seq", detail.replaced_pending_seq);
            break;
        case DetailKind::TransactionStarted:
            writer.Key("work_class");
            writer.String(to_string(detail.work_class));
            writer.Key("work_units");
            writer.Uint(detail.work_units);
            writer.Key("over_budget");
            writer.Bool(detail.over_budget);
            writer.Key("forced_by_starvation");
            writer.Bool(detail.forced_by_starvation);
            break;
        case DetailKind::PhaseAdvanced:
            writer.Key("phase");
            writer.String(to_string(detail.phase));
            break;
        case DetailKind::ActiveCancelledBySupersession:
            writer.Key("superseded_by_seq");
            writer.Uint64(detail.superseded_by_seq);
            break;
        case DetailKind::PendingDropped:
            writer.Key("reason");
            writer.String(to_string(detail.drop_reason));
            break;
        case DetailKind::ActiveCompleted:
            break;
        case DetailKind::CompletionRejected:
            write_optional(writer, "active_seq", detail.rejected_active_seq);
            write_optional(writer, "latest_seq", detail.rejected_latest_seq);
            break;
    }
    writer.EndObject();
}

void write_stalled(JsonWriter& writer, const std::vector<StalledTransaction>& stalled) {
    writer.StartArray();
    for (const auto& st : stalled) {
        writer.StartObject();
        writer.Key("pane_id");
        writer.Uint64(st.pane_id);
        writer.Key("intent_seq");
        writer.Uint64(st.intent_seq);
        writer.Key("active_phase");
        if (st.active_phase) {
            writer.String(to_string(*st.active_phase));
        } else {
            writer.Null();
        }
        writer.Key("age_ms");
        writer.Uint64(st.age_ms);
        write_optional(writer, "latest_seq", st.latest_seq);
        writer.EndObject();
    }
    writer.EndArray();
}

} // namespace

std::string to_json(const DebugSnapshot& snapshot) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    // Gate
    writer.Key("gate");
    writer.StartObject();
    writer.Key("control_plane_enabled");
    writer.Bool(snapshot.gate.control_plane_enabled);
    writer.Key("emergency_disable");
    writer.Bool(snapshot.gate.emergency_disable);
    writer.Key("legacy_fallback_enabled");
    writer.Bool(snapshot.gate.legacy_fallback_enabled);
    writer.Key("active");
    writer.Bool(snapshot.gate.active);
    writer.EndObject();

    // Scheduler
    const SchedulerSnapshot& sched = snapshot.scheduler;
    writer.Key("scheduler");
    writer.StartObject();
    writer.Key("config");
    write_config(writer, sched.config);
    writer.Key("metrics");
    write_metrics(writer, sched.metrics);
    writer.Key("pending_total");
    writer.Uint64(sched.pending_total);
    writer.Key("active_total");
    writer.Uint64(sched.active_total);
    writer.Key("panes");
    writer.StartArray();
    for (const auto& pane : sched.panes) {
        writer.StartObject();
        writer.Key("pane_id");
        writer.Uint64(pane.pane_id);
        write_optional(writer, "latest_seq", pane.latest_seq);
        write_optional(writer, "pending_seq", pane.pending_seq);
        writer.Key("pending_class");
        if (pane.pending_class) {
            writer.String(to_string(*pane.pending_class));
        } else {
            writer.Null();
        }
        write_optional(writer, "active_seq", pane.active_seq);
        writer.Key("active_phase");
        if (pane.active_phase) {
            writer.String(to_string(*pane.active_phase));
        } else {
            writer.Null();
        }
        write_optional(writer, "phase_started_at_ms", pane.phase_started_at_ms);
        writer.Key("consecutive_deferrals");
        writer.Uint(pane.consecutive_deferrals);
        writer.Key("aging_credit");
        writer.Uint(pane.aging_credit);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    // Lifecycle events
    writer.Key("lifecycle_events");
    writer.StartArray();
    for (const auto& ev : snapshot.lifecycle_events) {
        writer.StartObject();
        writer.Key("event_seq");
        writer.Uint64(ev.event_seq);
        writer.Key("frame_seq");
        writer.Uint64(ev.frame_seq);
        writer.Key("pane_id");
        writer.Uint64(ev.pane_id);
        writer.Key("intent_seq");
        writer.Uint64(ev.intent_seq);
        write_optional(writer, "observed_at_ms", ev.observed_at_ms);
        write_optional(writer, "latest_seq", ev.latest_seq);
        write_optional(writer, "pending_seq", ev.pending_seq);
        write_optional(writer, "active_seq", ev.active_seq);
        writer.Key("stage");
        writer.String(to_string(ev.stage));
        writer.Key("detail");
        write_detail(writer, ev.detail);
        writer.EndObject();
    }
    writer.EndArray();

    // Invariants
    writer.Key("invariants");
    writer.StartObject();
    writer.Key("checks_passed");
    writer.Uint64(snapshot.invariants.checks_passed);
    writer.Key("checks_failed");
    writer.Uint64(snapshot.invariants.checks_failed);
    writer.Key("violations");
    writer.StartArray();
    for (const auto& v : snapshot.invariants.violations) {
        writer.StartObject();
        writer.Key("severity");
        writer.String(to_string(v.severity));
        writer.Key("kind");
        writer.String(to_string(v.kind));
        write_optional(writer, "pane_id", v.pane_id);
        write_optional(writer, "intent_seq", v.intent_seq);
        writer.Key("message");
        writer.String(v.message.c_str());
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    const InvariantTelemetry& tel = snapshot.invariant_telemetry;
    writer.Key("invariant_telemetry");
    writer.StartObject();
    writer.Key("reports");
    writer.Uint64(tel.reports);
    writer.Key("clean_reports");
    writer.Uint64(tel.clean_reports);
    writer.Key("total_violations");
    writer.Uint64(tel.total_violations);
    writer.Key("warnings");
    writer.Uint64(tel.warnings);
    writer.Key("errors");
    writer.Uint64(tel.errors);
    writer.Key("critical");
    writer.Uint64(tel.critical);
    writer.EndObject();

    writer.EndObject();
    return buffer.GetString();
}

std::string to_json(const WatchdogAssessment& assessment) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("severity");
    writer.String(to_string(assessment.severity));
    writer.Key("evaluated_at_ms");
    writer.Uint64(assessment.evaluated_at_ms);
    writer.Key("stalled_total");
    writer.Uint64(assessment.stalled_total);
    writer.Key("stalled_critical");
    writer.Uint64(assessment.stalled_critical);
    writer.Key("warning_threshold_ms");
    writer.Uint64(assessment.warning_threshold_ms);
    writer.Key("critical_threshold_ms");
    writer.Uint64(assessment.critical_threshold_ms);
    writer.Key("critical_stalled_limit");
    writer.Uint64(assessment.critical_stalled_limit);
    writer.Key("safe_mode_recommended");
    writer.Bool(assessment.safe_mode_recommended);
    writer.Key("safe_mode_active");
    writer.Bool(assessment.safe_mode_active);
    writer.Key("sustained_critical");
    writer.Bool(assessment.sustained_critical);
    writer.Key("legacy_fallback_enabled");
    writer.Bool(assessment.legacy_fallback_enabled);
    writer.Key("recommended_action");
    writer.String(assessment.recommended_action.c_str());
    writer.Key("sample_stalled");
    write_stalled(writer, assessment.sample_stalled);
    writer.Key("warning_line");
    std::optional<std::string> line = assessment.warning_line();
    if (line) {
        writer.String(line->c_str());
    } else {
        writer.Null();
    }
    writer.EndObject();
    return buffer.GetString();
}

std::string to_json(const DegradationAssessment& assessment) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("tier");
    writer.String(to_string(assessment.tier));
    writer.Key("tier_rank");
    writer.Uint(assessment.tier_rank);
    writer.Key("trigger_condition");
    writer.String(assessment.trigger_condition.c_str());
    writer.Key("recovery_rule");
    writer.String(assessment.recovery_rule.c_str());
    writer.Key("recommended_action");
    writer.String(assessment.recommended_action.c_str());
    write_strings(writer, "quality_reductions", assessment.quality_reductions);
    write_strings(writer, "correctness_guards", assessment.correctness_guards);
    write_strings(writer, "availability_changes", assessment.availability_changes);

    const DegradationSignals& s = assessment.signals;
    writer.Key("signals");
    writer.StartObject();
    writer.Key("stalled_total");
    writer.Uint64(s.stalled_total);
    writer.Key("stalled_critical");
    writer.Uint64(s.stalled_critical);
    writer.Key("warning_threshold_ms");
    writer.Uint64(s.warning_threshold_ms);
    writer.Key("critical_threshold_ms");
    writer.Uint64(s.critical_threshold_ms);
    writer.Key("critical_stalled_limit");
    writer.Uint64(s.critical_stalled_limit);
    writer.Key("safe_mode_recommended");
    writer.Bool(s.safe_mode_recommended);
    writer.Key("safe_mode_active");
    writer.Bool(s.safe_mode_active);
    writer.Key("legacy_fallback_enabled");
    writer.Bool(s.legacy_fallback_enabled);
    writer.Key("stormed_tabs");
    writer.Uint64(s.stormed_tabs);
    writer.Key("sustained_storm");
    writer.Bool(s.sustained_storm);
    writer.EndObject();

    writer.EndObject();
    return buffer.GetString();
}

std::string config_to_json(const SchedulerConfig& config) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.SetIndent(' ', 2);
    write_config(writer, config);
    return buffer.GetString();
}

bool config_from_json(const std::string& json, SchedulerConfig& config) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    // Check for parse errors
    if (doc.HasParseError()) {
        error() << "config JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }

    if (!doc.IsObject()) {
        error() << "config JSON: expected an object";
        return false;
    }

    // Overlay onto a copy; the caller's config changes only if the result is valid
    SchedulerConfig overlay = config;
    bool mistyped = false;
    auto skip = [&mistyped](const char* key, const char* expected) {
        warn() << "config JSON: \"" << key << "\" is not " << expected << ", ignored";
        mistyped = true;
    };

    auto read_bool = [&doc, &skip](const char* key, bool& field) {
        if (!doc.HasMember(key)) return;
        if (doc[key].IsBool()) {
            field = doc[key].GetBool();
        } else {
            skip(key, "a boolean");
        }
    };
    auto read_uint = [&doc, &skip](const char* key, uint32_t& field) {
        if (!doc.HasMember(key)) return;
        if (doc[key].IsUint()) {
            field = doc[key].GetUint();
        } else {
            skip(key, "an unsigned 32-bit integer");
        }
    };
    auto read_uint64 = [&doc, &skip](const char* key, uint64_t& field) {
        if (!doc.HasMember(key)) return;
        if (doc[key].IsUint64()) {
            field = doc[key].GetUint64();
        } else {
            skip(key, "an unsigned integer");
        }
    };
    auto read_size = [&doc, &skip](const char* key, size_t& field) {
        if (!doc.HasMember(key)) return;
        if (doc[key].IsUint64()) {
            field = static_cast<size_t>(doc[key].GetUint64());
        } else {
            skip(key, "an unsigned integer");
        }
    };

    read_bool("control_plane_enabled", overlay.control_plane_enabled);
    read_bool("emergency_disable", overlay.emergency_disable);
    read_bool("legacy_fallback_enabled", overlay.legacy_fallback_enabled);
    read_uint("frame_budget_units", overlay.frame_budget_units);
    read_bool("allow_single_oversubscription", overlay.allow_single_oversubscription);
    read_bool("input_guardrail_enabled", overlay.input_guardrail_enabled);
    read_uint("input_backlog_threshold", overlay.input_backlog_threshold);
    read_uint("input_reserve_units", overlay.input_reserve_units);
    read_uint("max_deferrals_before_force", overlay.max_deferrals_before_force);
    read_uint("max_deferrals_before_drop", overlay.max_deferrals_before_drop);
    read_uint("aging_credit_per_frame", overlay.aging_credit_per_frame);
    read_uint("max_aging_credit", overlay.max_aging_credit);
    read_size("max_pending_panes", overlay.max_pending_panes);
    read_uint64("storm_window_ms", overlay.storm_window_ms);
    read_uint("storm_threshold_intents", overlay.storm_threshold_intents);
    read_uint("max_storm_picks_per_tab", overlay.max_storm_picks_per_tab);
    read_bool("domain_budget_enabled", overlay.domain_budget_enabled);
    read_size("max_lifecycle_events", overlay.max_lifecycle_events);

    if (mistyped) {
        return false;
    }
    if (!overlay.validate()) {
        error() << "config JSON: resulting SchedulerConfig is invalid";
        return false;
    }
    config = overlay;
    return true;
}

} // namespace sched
} // namespace paneflow
