// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

// Telemetry Options
//
// Reads an optional JSON file and env vars and sets up the configuration object
// consulted by every telemetry call (enable switch, PII protection, endpoint key,
// request timeout).
//

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

enum class ConfigKey {
    DisableTelemetry,
    DisablePiiProtection,
    SuppressTelemetryReminder,
    ApplicationInsightsKey,
    WebRequestTimeoutSec,
    DefaultNoStatus,
};

std::string_view config_key_name(ConfigKey key);
std::optional<ConfigKey> config_key_from_name(std::string_view name);

// Narrow read interface consumed by the telemetry components. Implementations must be
// safe to read from multiple threads.
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    virtual bool get_bool(ConfigKey key) const = 0;
    virtual int get_int(ConfigKey key) const = 0;
    virtual std::string get_string(ConfigKey key) const = 0;
};

struct TelemetrySettings {
    bool disable_telemetry = false;
    bool disable_pii_protection = false;
    bool suppress_telemetry_reminder = false;
    std::string application_insights_key;
    int web_request_timeout_sec = 30;
    bool default_no_status = false;
};

class TelemetryConfig : public ConfigProvider {
public:
    explicit TelemetryConfig(TelemetrySettings settings = {});

    // Defaults, then $BEACON_CONFIG_FILE (if set), then BEACON_* env var overrides.
    static std::shared_ptr<TelemetryConfig> from_environment();

    // Overlay values from a JSON object keyed by configuration name.
    void load_file(const std::filesystem::path& path);
    void apply_environment();

    void set(ConfigKey key, bool value);
    void set(ConfigKey key, int value);
    void set(ConfigKey key, const std::string& value);
    void set(ConfigKey key, const char* value) { set(key, std::string(value)); }

    bool get_bool(ConfigKey key) const override;
    int get_int(ConfigKey key) const override;
    std::string get_string(ConfigKey key) const override;

    TelemetrySettings settings() const;

private:
    mutable std::mutex mutex_;
    TelemetrySettings settings_;
};

}  // namespace beacon
