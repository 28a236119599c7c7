// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <beacon/delivery/http_transport.hpp>

namespace beacon {

// Normalized failure record. This is the only failure representation that crosses the
// isolated delivery task boundary, in its JSON form.
struct DeliveryError {
    std::string message;
    std::optional<int> status_code;
    std::optional<std::string> status_description;
    std::optional<std::string> inner_message;
    std::optional<std::string> raw_response_body;
    std::optional<std::string> request_id;

    bool operator==(const DeliveryError&) const = default;
};

void to_json(nlohmann::json& j, const DeliveryError& error);
void from_json(const nlohmann::json& j, DeliveryError& error);

std::string serialize_delivery_error(const DeliveryError& error);

// Inverse of serialize_delivery_error(). Text that is not a JSON object is kept as the
// message of an otherwise empty record.
DeliveryError deserialize_delivery_error(std::string_view serialized);

// Live transport failure raised on the synchronous path.
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string& message, std::optional<HttpResponse> response = std::nullopt);

    const std::optional<HttpResponse>& response() const { return response_; }

    std::optional<int> status_code() const;
    std::optional<std::string> status_description() const;

    // Error-detail payload sent back by the endpoint (its response body), if any.
    std::optional<std::string> error_details() const;

    // Throws std::runtime_error when no response was received.
    std::string read_response_body() const;

    std::optional<std::string> request_id() const;

private:
    std::optional<HttpResponse> response_;
};

// Field extraction shared by the isolated task and the normalizer. A failure to read the raw
// body is logged as a warning and leaves raw_response_body empty.
DeliveryError extract_delivery_error(const TransportFailure& failure);

// Failure handed back by the isolated delivery task. Carries the serialized DeliveryError.
class IsolatedUnitFailure : public std::runtime_error {
public:
    explicit IsolatedUnitFailure(std::string serialized_error);

    const std::string& serialized_error() const { return serialized_error_; }

private:
    std::string serialized_error_;
};

// The single failure raised by DeliveryDispatcher::send_and_report(); what() is the
// normalized multi-line diagnostic.
class TelemetryDeliveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace beacon
