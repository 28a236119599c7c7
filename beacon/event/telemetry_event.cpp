// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/event/telemetry_event.hpp>

#include <nlohmann/json.hpp>

#include <beacon/common/assert.hpp>

using json = nlohmann::json;

namespace beacon {

std::string_view event_base_type_to_string(EventBaseType type) {
    switch (type) {
        case EventBaseType::EventData: return "EventData";
        case EventBaseType::ExceptionData: return "ExceptionData";
        default: return "<unknown>";
    }
}

void TelemetryEvent::merge_properties(const PropertyBag& properties) {
    for (const auto& [key, value] : properties) {
        base_data.properties[key] = value;
    }
}

void to_json(json& j, const ExceptionRecord& record) {
    j = json{
        {"id", record.id},
        {"outerId", record.outer_id},
        {"typeName", record.type_name},
        {"message", record.message},
        {"hasFullStack", record.has_full_stack},
    };
    if (!record.stack.empty()) {
        j["stack"] = record.stack;
    }
}

void from_json(const json& j, ExceptionRecord& record) {
    j.at("id").get_to(record.id);
    j.at("outerId").get_to(record.outer_id);
    j.at("typeName").get_to(record.type_name);
    j.at("message").get_to(record.message);
    j.at("hasFullStack").get_to(record.has_full_stack);
    record.stack = j.value("stack", std::string());
}

void to_json(json& j, const TelemetryEvent& event) {
    json base_data = {
        {"ver", event.base_data.ver},
        {"properties", event.base_data.properties},
    };
    if (event.base_data.name) {
        base_data["name"] = *event.base_data.name;
    }
    if (event.base_data.handled_at) {
        base_data["handledAt"] = *event.base_data.handled_at;
    }
    // Measurements are only transmitted when there is at least one
    if (event.base_data.measurements && !event.base_data.measurements->empty()) {
        base_data["measurements"] = *event.base_data.measurements;
    }
    if (event.base_type == EventBaseType::ExceptionData) {
        base_data["exceptions"] = event.base_data.exceptions;
    }

    j = json{
        {"name", event.name},
        {"time", event.timestamp},
        {"iKey", event.instrumentation_key},
        {"tags", event.tags},
        {"data",
         {
             {"baseType", event_base_type_to_string(event.base_type)},
             {"baseData", std::move(base_data)},
         }},
    };
}

void from_json(const json& j, TelemetryEvent& event) {
    j.at("name").get_to(event.name);
    j.at("time").get_to(event.timestamp);
    j.at("iKey").get_to(event.instrumentation_key);
    event.tags = j.value("tags", std::map<std::string, std::string>());

    const json& data = j.at("data");
    std::string base_type = data.at("baseType").get<std::string>();
    if (base_type == "EventData") {
        event.base_type = EventBaseType::EventData;
    } else if (base_type == "ExceptionData") {
        event.base_type = EventBaseType::ExceptionData;
    } else {
        BEACON_THROW("Unknown event baseType '{}'", base_type);
    }

    const json& base_data = data.at("baseData");
    event.base_data = EventBaseData{};
    event.base_data.ver = base_data.value("ver", 2);
    if (base_data.contains("name")) {
        event.base_data.name = base_data.at("name").get<std::string>();
    }
    if (base_data.contains("handledAt")) {
        event.base_data.handled_at = base_data.at("handledAt").get<std::string>();
    }
    event.base_data.properties = base_data.value("properties", PropertyBag());
    if (base_data.contains("measurements")) {
        event.base_data.measurements = base_data.at("measurements").get<MetricBag>();
    }
    if (base_data.contains("exceptions")) {
        event.base_data.exceptions = base_data.at("exceptions").get<std::vector<ExceptionRecord>>();
    }
}

}  // namespace beacon
