// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/delivery/delivery_error.hpp>

#include <array>
#include <utility>

#include <nlohmann/json.hpp>
#include <tt-logger/tt-logger.hpp>

using json = nlohmann::json;

namespace beacon {

namespace {

// Correlation id headers, checked in order
constexpr std::array<const char*, 3> kRequestIdHeaders = {"Request-Id", "X-Request-Id", "X-Ms-Request-Id"};

template <typename T>
void set_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

// Invalid UTF-8 sequences (e.g. a Latin-1 error page) become U+FFFD
std::string to_valid_utf8(std::string_view text) {
    std::string dumped = json(std::string(text)).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(dumped).get<std::string>();
}

std::optional<std::string> optional_valid_utf8(const std::optional<std::string>& text) {
    if (!text) {
        return std::nullopt;
    }
    return to_valid_utf8(*text);
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->template get<T>();
    } else {
        value.reset();
    }
}

}  // namespace

void to_json(json& j, const DeliveryError& error) {
    j = json{{"message", error.message}};
    set_optional(j, "statusCode", error.status_code);
    set_optional(j, "statusDescription", error.status_description);
    set_optional(j, "innerMessage", error.inner_message);
    set_optional(j, "rawContent", error.raw_response_body);
    set_optional(j, "requestId", error.request_id);
}

void from_json(const json& j, DeliveryError& error) {
    error.message = j.value("message", std::string());
    get_optional(j, "statusCode", error.status_code);
    get_optional(j, "statusDescription", error.status_description);
    get_optional(j, "innerMessage", error.inner_message);
    get_optional(j, "rawContent", error.raw_response_body);
    get_optional(j, "requestId", error.request_id);
}

std::string serialize_delivery_error(const DeliveryError& error) {
    json j = error;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

DeliveryError deserialize_delivery_error(std::string_view serialized) {
    try {
        json j = json::parse(serialized);
        if (j.is_object()) {
            return j.get<DeliveryError>();
        }
    } catch (const json::exception& e) {
        log_debug(tt::LogAlways, "Delivery failure payload is not a serialized record: {}", e.what());
    }
    return DeliveryError{.message = std::string(serialized)};
}

TransportFailure::TransportFailure(const std::string& message, std::optional<HttpResponse> response) :
    std::runtime_error(message), response_(std::move(response)) {}

std::optional<int> TransportFailure::status_code() const {
    if (!response_) {
        return std::nullopt;
    }
    return response_->status;
}

std::optional<std::string> TransportFailure::status_description() const {
    if (!response_) {
        return std::nullopt;
    }
    return response_->reason;
}

std::optional<std::string> TransportFailure::error_details() const {
    if (!response_ || response_->body.empty()) {
        return std::nullopt;
    }
    return response_->body;
}

std::string TransportFailure::read_response_body() const {
    if (!response_) {
        throw std::runtime_error("No response was received from the server");
    }
    return response_->body;
}

std::optional<std::string> TransportFailure::request_id() const {
    if (!response_) {
        return std::nullopt;
    }
    for (const char* header : kRequestIdHeaders) {
        auto it = response_->headers.find(header);
        if (it != response_->headers.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::nullopt;
}

DeliveryError extract_delivery_error(const TransportFailure& failure) {
    DeliveryError error{
        .message = to_valid_utf8(failure.what()),
        .status_code = failure.status_code(),
        .status_description = optional_valid_utf8(failure.status_description()),
        .inner_message = optional_valid_utf8(failure.error_details()),
        .request_id = optional_valid_utf8(failure.request_id()),
    };

    try {
        std::string body = to_valid_utf8(failure.read_response_body());
        // Already reported through inner_message
        if (body != error.inner_message) {
            error.raw_response_body = std::move(body);
        }
    } catch (const std::exception& e) {
        // Never let this mask the original delivery failure
        log_warning(tt::LogAlways, "Unable to retrieve the raw HTTP response body: {}", e.what());
    }
    return error;
}

IsolatedUnitFailure::IsolatedUnitFailure(std::string serialized_error) :
    std::runtime_error(serialized_error), serialized_error_(std::move(serialized_error)) {}

}  // namespace beacon
