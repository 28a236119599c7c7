// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <beacon/config/telemetry_config.hpp>

namespace beacon {

// Hashes free-text identifiers (user names, machine names) before they are attached to an
// event. The DisablePiiProtection flag is consulted on every call so hosts may toggle it at
// runtime.
class PiiRedactor {
public:
    explicit PiiRedactor(std::shared_ptr<const ConfigProvider> config);

    // Returns `plain_text` unchanged when PII protection is disabled, otherwise the uppercase
    // hex SHA-512 digest of its bytes. A null pointer is treated as the empty string.
    std::string redact(std::string_view plain_text) const;
    std::string redact(const char* plain_text) const;

private:
    std::shared_ptr<const ConfigProvider> config_;
};

// Uppercase hex SHA-512 digest (128 characters).
std::string sha512_hex(std::string_view data);

}  // namespace beacon
