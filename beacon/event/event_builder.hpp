// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <beacon/config/telemetry_config.hpp>
#include <beacon/event/exception_info.hpp>
#include <beacon/event/telemetry_event.hpp>
#include <beacon/pii/pii_redactor.hpp>

namespace beacon {

inline constexpr const char* kEventEnvelopeName = "Microsoft.ApplicationInsights.Event";
inline constexpr const char* kSdkVersion = "2.0.1.33027";

// Builds telemetry payloads. The identity (instrumentation key, session id, user id) and
// the time-dependent fields are captured once, on the first successful call to
// base_event(), and every event handed out afterwards is a copy of that template.
class EventBuilder {
public:
    EventBuilder(std::shared_ptr<const ConfigProvider> config, std::shared_ptr<const PiiRedactor> redactor);

    TelemetryEvent base_event();

    TelemetryEvent custom_event(
        const std::string& name, const PropertyBag& properties = {}, const MetricBag& metrics = {});

    TelemetryEvent exception_event(
        const ExceptionInfo& exception, const std::string& error_bucket = "", const PropertyBag& properties = {});

private:
    TelemetryEvent build_template() const;

    std::shared_ptr<const ConfigProvider> config_;
    std::shared_ptr<const PiiRedactor> redactor_;

    std::mutex template_mutex_;
    std::optional<TelemetryEvent> template_;
};

// Name of the effective OS user, or an empty string when it cannot be determined.
std::string current_username();

// ISO-8601 UTC with 100ns precision, e.g. "2025-03-04T05:06:07.1234567Z".
std::string format_utc_timestamp(std::chrono::system_clock::time_point time);

// English day name ("Monday") of `time` in UTC.
std::string utc_day_of_week(std::chrono::system_clock::time_point time);

}  // namespace beacon
