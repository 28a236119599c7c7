// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <beacon/delivery/delivery_error.hpp>

namespace beacon {

// Builds the multi-line diagnostic for a delivery failure. Accepts a live TransportFailure or
// an IsolatedUnitFailure (whose payload is deserialized first). Any other exception is logged
// at error level and rethrown unchanged.
std::string normalize_failure(const std::exception_ptr& failure);

// Renders an already extracted record:
//   <message>
//   <status code> | <status description>
//   <inner message, decoded if it is JSON>
//   <raw response body>
//   RequestId: <id>
std::string format_diagnostic(const DeliveryError& error);

// Column-aligned rendering of an array of objects; `key : value` lines for an object; compact
// JSON for anything else.
std::string render_table(const nlohmann::json& value);

}  // namespace beacon
