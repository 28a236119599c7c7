// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/delivery/delivery_dispatcher.hpp>

#include <future>
#include <utility>

#include <nlohmann/json.hpp>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>
#include <beacon/delivery/error_normalizer.hpp>

using json = nlohmann::json;

namespace beacon {

DeliveryDispatcher::DeliveryDispatcher(
    std::shared_ptr<HttpTransport> transport, std::string url, StatusIndicator::Sink status_sink) :
    transport_(std::move(transport)), url_(std::move(url)), status_sink_(std::move(status_sink)) {
    BEACON_FATAL(transport_ != nullptr, "DeliveryDispatcher requires an HTTP transport");
}

HttpRequest DeliveryDispatcher::make_request(
    const std::string& url, const TelemetryEvent& event, std::chrono::seconds timeout) {
    BEACON_FATAL(timeout.count() > 0, "Request timeout must be positive, got {}s", timeout.count());

    json j = event;
    HttpRequest request;
    request.url = url;
    request.method = "POST";
    request.headers.emplace("Content-Type", kJsonContentType);
    // Invalid UTF-8 in caller-supplied text must not cost the whole event
    request.body = j.dump(-1, ' ', false, json::error_handler_t::replace);
    request.timeout = timeout;
    return request;
}

IsolatedOutcome DeliveryDispatcher::run_isolated(std::shared_ptr<HttpTransport> transport, HttpRequest request) {
    try {
        return transport->execute(request);
    } catch (const TransportFailure& e) {
        // Live exceptions stay on this side; only the serialized record goes back
        log_debug(tt::LogAlways, "[DeliveryDispatcher] Isolated send failed: {}", e.what());
        return SerializedDeliveryError{serialize_delivery_error(extract_delivery_error(e))};
    }
}

HttpResponse DeliveryDispatcher::send(const TelemetryEvent& event, bool synchronous, std::chrono::seconds timeout) {
    HttpRequest request = make_request(url_, event, timeout);

    if (synchronous) {
        log_debug(tt::LogAlways, "[DeliveryDispatcher] Sending telemetry synchronously to {}", url_);
        return transport_->execute(request);
    }

    log_debug(tt::LogAlways, "[DeliveryDispatcher] Sending telemetry from background task to {}", url_);
    std::future<IsolatedOutcome> future =
        std::async(std::launch::async, &DeliveryDispatcher::run_isolated, transport_, std::move(request));

    StatusIndicator indicator("Sending telemetry data", status_sink_);
    wait_with_animation(future, indicator);

    IsolatedOutcome outcome = future.get();
    if (auto* failure = std::get_if<SerializedDeliveryError>(&outcome)) {
        throw IsolatedUnitFailure(std::move(failure->json));
    }
    return std::get<HttpResponse>(std::move(outcome));
}

HttpResponse DeliveryDispatcher::send_and_report(
    const TelemetryEvent& event, bool synchronous, std::chrono::seconds timeout) {
    try {
        return send(event, synchronous, timeout);
    } catch (...) {
        // normalize_failure() rethrows anything it does not recognize
        std::string diagnostic = normalize_failure(std::current_exception());
        log_error(tt::LogAlways, "{}", diagnostic);
        throw TelemetryDeliveryError(diagnostic);
    }
}

}  // namespace beacon
