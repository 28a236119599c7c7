// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/telemetry_service.hpp>

#include <chrono>
#include <utility>

#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>

namespace beacon {

TelemetryService::TelemetryService(
    std::shared_ptr<const ConfigProvider> config,
    std::shared_ptr<HttpTransport> transport,
    std::string url,
    StatusIndicator::Sink status_sink) :
    config_(std::move(config)) {
    BEACON_FATAL(config_ != nullptr, "TelemetryService requires a configuration provider");
    redactor_ = std::make_shared<PiiRedactor>(config_);
    builder_ = std::make_unique<EventBuilder>(config_, redactor_);
    dispatcher_ = std::make_unique<DeliveryDispatcher>(std::move(transport), std::move(url), std::move(status_sink));
}

void TelemetryService::show_reminder_once() {
    if (config_->get_bool(ConfigKey::SuppressTelemetryReminder) || reminder_shown_.exchange(true)) {
        return;
    }
    log_warning(
        tt::LogAlways,
        "Telemetry is currently enabled. It can be disabled by setting {} in the configuration file or "
        "BEACON_DISABLE_TELEMETRY=1. Stop seeing this message by setting {} or BEACON_SUPPRESS_TELEMETRY_REMINDER=1.",
        config_key_name(ConfigKey::DisableTelemetry),
        config_key_name(ConfigKey::SuppressTelemetryReminder));
}

void TelemetryService::emit(
    std::string_view description,
    const std::function<TelemetryEvent()>& build_event,
    std::optional<bool> run_synchronously) noexcept {
    try {
        if (config_->get_bool(ConfigKey::DisableTelemetry)) {
            log_debug(tt::LogAlways, "[TelemetryService] Telemetry has been disabled via configuration. Skipping {}.",
                description);
            return;
        }
        show_reminder_once();

        bool synchronous = run_synchronously.value_or(config_->get_bool(ConfigKey::DefaultNoStatus));
        std::chrono::seconds timeout(config_->get_int(ConfigKey::WebRequestTimeoutSec));

        TelemetryEvent event = build_event();
        dispatcher_->send_and_report(event, synchronous, timeout);
        log_debug(tt::LogAlways, "[TelemetryService] Sent {}", description);
    } catch (const std::exception& e) {
        log_warning(
            tt::LogAlways,
            "[TelemetryService] Encountered a problem while trying to record {}: {}",
            description,
            e.what());
    } catch (...) {
        log_warning(
            tt::LogAlways,
            "[TelemetryService] Encountered a problem of unknown type while trying to record {}",
            description);
    }
}

void TelemetryService::emit_event(
    const std::string& name,
    const PropertyBag& properties,
    const MetricBag& metrics,
    std::optional<bool> run_synchronously) noexcept {
    emit(
        "telemetry event",
        [&]() { return builder_->custom_event(name, properties, metrics); },
        run_synchronously);
}

void TelemetryService::emit_exception(
    const ExceptionInfo& exception,
    const std::string& error_bucket,
    const PropertyBag& properties,
    std::optional<bool> run_synchronously) noexcept {
    emit(
        "telemetry exception",
        [&]() { return builder_->exception_event(exception, error_bucket, properties); },
        run_synchronously);
}

}  // namespace beacon
