// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include <beacon/delivery/delivery_error.hpp>
#include <beacon/delivery/http_transport.hpp>
#include <beacon/delivery/status_indicator.hpp>
#include <beacon/event/telemetry_event.hpp>

namespace beacon {

inline constexpr const char* kIngestionUrl = "https://dc.services.visualstudio.com/v2/track";
inline constexpr const char* kJsonContentType = "application/json; charset=UTF-8";

// DeliveryError in its JSON form, as produced inside the isolated delivery task.
struct SerializedDeliveryError {
    std::string json;
};

// What the isolated delivery task hands back to the waiting caller.
using IsolatedOutcome = std::variant<HttpResponse, SerializedDeliveryError>;

class DeliveryDispatcher {
public:
    explicit DeliveryDispatcher(
        std::shared_ptr<HttpTransport> transport,
        std::string url = kIngestionUrl,
        StatusIndicator::Sink status_sink = StatusIndicator::stderr_sink());

    // Single attempt, no retries. Synchronous mode throws TransportFailure; asynchronous mode
    // runs the request on a separate task, waits for it with a spinner, and throws
    // IsolatedUnitFailure. Exceptions of any other type escape unchanged.
    HttpResponse send(const TelemetryEvent& event, bool synchronous, std::chrono::seconds timeout);

    // send(), with failures normalized, logged at error level and rethrown as one
    // TelemetryDeliveryError. Unrecognized failures are rethrown unchanged.
    HttpResponse send_and_report(const TelemetryEvent& event, bool synchronous, std::chrono::seconds timeout);

    static HttpRequest make_request(const std::string& url, const TelemetryEvent& event, std::chrono::seconds timeout);

    // Body of the isolated task. Everything it needs is passed by value.
    static IsolatedOutcome run_isolated(std::shared_ptr<HttpTransport> transport, HttpRequest request);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string url_;
    StatusIndicator::Sink status_sink_;
};

}  // namespace beacon
