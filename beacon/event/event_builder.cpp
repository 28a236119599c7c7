// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/event/event_builder.hpp>

#include <pwd.h>
#include <unistd.h>

#include <array>
#include <cstdlib>
#include <ctime>
#include <utility>
#include <vector>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>
#include <beacon/common/string_utils.hpp>

#ifndef BEACON_VERSION_STRING
#define BEACON_VERSION_STRING "0.0.0"
#endif

namespace beacon {

namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string new_session_id() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace

std::string current_username() {
    std::vector<char> buffer(16384);
    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (getpwuid_r(geteuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result != nullptr &&
        result->pw_name != nullptr) {
        return result->pw_name;
    }

    const char* user_env = std::getenv("USER");
    if (user_env != nullptr) {
        return user_env;
    }
    return "";
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point time) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
    long long ticks = (since_epoch % 1'000'000'000LL) / 100;  // 100ns units
    if (ticks < 0) {
        ticks += 10'000'000LL;
    }
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:07d}Z", to_utc_tm(time), ticks);
}

std::string utc_day_of_week(std::chrono::system_clock::time_point time) {
    static constexpr std::array<const char*, 7> day_names = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
    return day_names.at(to_utc_tm(time).tm_wday);
}

EventBuilder::EventBuilder(std::shared_ptr<const ConfigProvider> config, std::shared_ptr<const PiiRedactor> redactor) :
    config_(std::move(config)), redactor_(std::move(redactor)) {
    BEACON_FATAL(config_ != nullptr, "EventBuilder requires a configuration provider");
    BEACON_FATAL(redactor_ != nullptr, "EventBuilder requires a PII redactor");
}

TelemetryEvent EventBuilder::build_template() const {
    std::string instrumentation_key = config_->get_string(ConfigKey::ApplicationInsightsKey);
    BEACON_FATAL(
        !is_blank(instrumentation_key),
        "No Application Insights key configured. Set {} in the configuration file or BEACON_APPLICATION_INSIGHTS_KEY.",
        config_key_name(ConfigKey::ApplicationInsightsKey));

    auto now = std::chrono::system_clock::now();
    std::string username = redactor_->redact(current_username());

    TelemetryEvent event;
    event.name = kEventEnvelopeName;
    event.timestamp = format_utc_timestamp(now);
    event.instrumentation_key = std::move(instrumentation_key);
    event.tags = {
        {"ai.user.id", username},
        {"ai.session.id", new_session_id()},
        {"ai.application.ver", BEACON_VERSION_STRING},
        {"ai.internal.sdkVersion", kSdkVersion},
    };
    event.base_type = EventBaseType::EventData;
    event.base_data.properties = {
        {"DayOfWeek", utc_day_of_week(now)},
        {"Username", username},
    };

    log_debug(tt::LogAlways, "[EventBuilder] Initialized telemetry session {}", event.tags.at("ai.session.id"));
    return event;
}

TelemetryEvent EventBuilder::base_event() {
    std::lock_guard<std::mutex> lock(template_mutex_);
    if (!template_) {
        // A failed build leaves the template empty so the next caller retries
        template_ = build_template();
    }
    return *template_;
}

TelemetryEvent EventBuilder::custom_event(
    const std::string& name, const PropertyBag& properties, const MetricBag& metrics) {
    TelemetryEvent event = base_event();
    event.base_data.name = name;
    event.merge_properties(properties);
    if (!metrics.empty()) {
        event.base_data.measurements = metrics;
    }
    return event;
}

TelemetryEvent EventBuilder::exception_event(
    const ExceptionInfo& exception, const std::string& error_bucket, const PropertyBag& properties) {
    TelemetryEvent event = base_event();
    event.base_type = EventBaseType::ExceptionData;
    event.base_data.handled_at = "UserCode";

    if (!is_blank(error_bucket)) {
        event.base_data.properties["ErrorBucket"] = error_bucket;
    }
    event.base_data.properties["Message"] = exception.message;
    event.base_data.properties["HResult"] = format_hresult(exception.hresult);
    event.merge_properties(properties);

    event.base_data.exceptions.push_back(ExceptionRecord{
        .id = 0,
        .outer_id = 0,
        .type_name = exception.type_name,
        .message = exception.message,
        .has_full_stack = !exception.stack.empty(),
        .stack = exception.stack,
    });
    return event;
}

}  // namespace beacon
