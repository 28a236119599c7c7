// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <beacon/config/telemetry_config.hpp>
#include <beacon/delivery/delivery_dispatcher.hpp>
#include <beacon/delivery/http_transport.hpp>
#include <beacon/delivery/status_indicator.hpp>
#include <beacon/event/event_builder.hpp>
#include <beacon/event/exception_info.hpp>
#include <beacon/event/telemetry_event.hpp>
#include <beacon/pii/pii_redactor.hpp>

namespace beacon {

/**
 * Entry point for reporting telemetry. A host constructs one instance at startup and passes it
 * by reference to every call site; the session identity lives as long as the instance.
 *
 * Emission is best-effort: nothing here ever throws to the caller. Delivery failures are
 * logged (error level for the diagnostic, warning level for the swallowed failure) and the
 * caller continues normally.
 */
class TelemetryService {
public:
    explicit TelemetryService(
        std::shared_ptr<const ConfigProvider> config,
        std::shared_ptr<HttpTransport> transport = std::make_shared<HttplibTransport>(),
        std::string url = kIngestionUrl,
        StatusIndicator::Sink status_sink = StatusIndicator::stderr_sink());

    TelemetryService(const TelemetryService&) = delete;
    TelemetryService& operator=(const TelemetryService&) = delete;

    /**
     * Report a custom event.
     * @param name Event name
     * @param properties Extra string properties, overriding the defaults on key collision
     * @param metrics Numeric measurements; omitted from the payload when empty
     * @param run_synchronously Send on the calling thread. Defaults to the DefaultNoStatus setting
     */
    void emit_event(
        const std::string& name,
        const PropertyBag& properties = {},
        const MetricBag& metrics = {},
        std::optional<bool> run_synchronously = std::nullopt) noexcept;

    /**
     * Report a failure.
     * @param exception Failure description, see ExceptionInfo::from_exception()
     * @param error_bucket Optional grouping key, attached as the ErrorBucket property when non-blank
     * @param properties Extra string properties
     * @param run_synchronously Send on the calling thread. Defaults to the DefaultNoStatus setting
     */
    void emit_exception(
        const ExceptionInfo& exception,
        const std::string& error_bucket = "",
        const PropertyBag& properties = {},
        std::optional<bool> run_synchronously = std::nullopt) noexcept;

    // True once the telemetry reminder has been logged by this instance.
    bool reminder_shown() const { return reminder_shown_.load(); }

private:
    void emit(
        std::string_view description,
        const std::function<TelemetryEvent()>& build_event,
        std::optional<bool> run_synchronously) noexcept;

    void show_reminder_once();

    std::shared_ptr<const ConfigProvider> config_;
    std::shared_ptr<const PiiRedactor> redactor_;
    std::unique_ptr<EventBuilder> builder_;
    std::unique_ptr<DeliveryDispatcher> dispatcher_;
    std::atomic<bool> reminder_shown_{false};
};

}  // namespace beacon
