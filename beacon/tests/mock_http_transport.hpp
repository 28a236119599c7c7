// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <gmock/gmock.h>

#include <beacon/config/telemetry_config.hpp>
#include <beacon/delivery/delivery_error.hpp>
#include <beacon/delivery/http_transport.hpp>

namespace beacon::test {

class MockHttpTransport : public HttpTransport {
public:
    MOCK_METHOD(HttpResponse, execute, (const HttpRequest& request), (override));
};

inline HttpResponse make_response(int status, std::string reason, std::string body = "", HttpHeaders headers = {}) {
    return HttpResponse{
        .status = status, .reason = std::move(reason), .headers = std::move(headers), .body = std::move(body)};
}

// Failure as raised by HttplibTransport for a non-2xx status
inline TransportFailure make_status_failure(const HttpResponse& response) {
    return TransportFailure(
        "Response status code does not indicate success: " + std::to_string(response.status) + " (" +
            response.reason + ").",
        response);
}

inline std::shared_ptr<TelemetryConfig> make_test_config() {
    return std::make_shared<TelemetryConfig>(TelemetrySettings{
        .suppress_telemetry_reminder = true,
        .application_insights_key = "00000000-1111-2222-3333-444444444444",
    });
}

}  // namespace beacon::test
