// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * event/telemetry_event.hpp
 *
 * Application Insights v2 envelope. All members are values, so copying an event yields a
 * fully independent payload.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace beacon {

// Ordered key/value bags attached to an event. Merging uses overwrite-on-collision.
using PropertyBag = std::map<std::string, std::string>;
using MetricBag = std::map<std::string, double>;

enum class EventBaseType {
    EventData,
    ExceptionData,
};

std::string_view event_base_type_to_string(EventBaseType type);

struct ExceptionRecord {
    int id = 0;
    int outer_id = 0;
    std::string type_name;
    std::string message;
    bool has_full_stack = false;
    std::string stack;

    bool operator==(const ExceptionRecord&) const = default;
};

struct EventBaseData {
    int ver = 2;
    std::optional<std::string> name;
    std::optional<std::string> handled_at;
    PropertyBag properties;
    std::optional<MetricBag> measurements;
    std::vector<ExceptionRecord> exceptions;

    bool operator==(const EventBaseData&) const = default;
};

struct TelemetryEvent {
    std::string name;
    std::string timestamp;
    std::string instrumentation_key;
    std::map<std::string, std::string> tags;
    EventBaseType base_type = EventBaseType::EventData;
    EventBaseData base_data;

    // Overwrites existing keys.
    void merge_properties(const PropertyBag& properties);

    bool operator==(const TelemetryEvent&) const = default;
};

// JSON serialization
void to_json(nlohmann::json& j, const ExceptionRecord& record);
void from_json(const nlohmann::json& j, ExceptionRecord& record);
void to_json(nlohmann::json& j, const TelemetryEvent& event);
void from_json(const nlohmann::json& j, TelemetryEvent& event);

}  // namespace beacon
