// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/config/telemetry_config.hpp>

#include <array>
#include <cstdlib>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>
#include <beacon/common/string_utils.hpp>

using json = nlohmann::json;

namespace beacon {

// Set this var to point at a JSON configuration file.
constexpr auto BEACON_CONFIG_FILE_ENV_VAR = "BEACON_CONFIG_FILE";

namespace {

constexpr std::array<std::pair<ConfigKey, std::string_view>, 6> kKeyNames = {{
    {ConfigKey::DisableTelemetry, "DisableTelemetry"},
    {ConfigKey::DisablePiiProtection, "DisablePiiProtection"},
    {ConfigKey::SuppressTelemetryReminder, "SuppressTelemetryReminder"},
    {ConfigKey::ApplicationInsightsKey, "ApplicationInsightsKey"},
    {ConfigKey::WebRequestTimeoutSec, "WebRequestTimeoutSec"},
    {ConfigKey::DefaultNoStatus, "DefaultNoStatus"},
}};

bool parse_bool(std::string_view name, std::string_view value) {
    for (auto truthy : {"1", "true", "yes", "on"}) {
        if (ascii_caseless_comp(value, truthy)) {
            return true;
        }
    }
    for (auto falsy : {"0", "false", "no", "off"}) {
        if (ascii_caseless_comp(value, falsy)) {
            return false;
        }
    }
    BEACON_THROW("Env var {} has invalid boolean value '{}'", name, value);
}

int parse_int(std::string_view name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // Reported below
    }
    BEACON_THROW("Env var {} has invalid integer value '{}'", name, value);
}

}  // namespace

std::string_view config_key_name(ConfigKey key) {
    for (const auto& [k, name] : kKeyNames) {
        if (k == key) {
            return name;
        }
    }
    return "<unknown>";
}

std::optional<ConfigKey> config_key_from_name(std::string_view name) {
    for (const auto& [key, key_name] : kKeyNames) {
        if (ascii_caseless_comp(key_name, name)) {
            return key;
        }
    }
    return std::nullopt;
}

TelemetryConfig::TelemetryConfig(TelemetrySettings settings) : settings_(std::move(settings)) {}

std::shared_ptr<TelemetryConfig> TelemetryConfig::from_environment() {
    auto config = std::make_shared<TelemetryConfig>();

    const char* config_file_str = std::getenv(BEACON_CONFIG_FILE_ENV_VAR);
    if (config_file_str != nullptr && *config_file_str != '\0') {
        config->load_file(config_file_str);
    }

    // ENV Can Override
    config->apply_environment();
    return config;
}

void TelemetryConfig::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        BEACON_THROW("Failed to open configuration file: {}", path.string());
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        BEACON_THROW("Failed to parse configuration file {}: {}", path.string(), e.what());
    }
    BEACON_FATAL(j.is_object(), "Configuration file {} must contain a JSON object", path.string());

    for (const auto& [name, value] : j.items()) {
        std::optional<ConfigKey> key = config_key_from_name(name);
        if (!key) {
            log_warning(tt::LogAlways, "Ignoring unknown configuration key '{}' in {}", name, path.string());
            continue;
        }

        switch (*key) {
            case ConfigKey::ApplicationInsightsKey:
                BEACON_FATAL(value.is_string(), "Configuration key {} must be a string", name);
                set(*key, value.get<std::string>());
                break;
            case ConfigKey::WebRequestTimeoutSec:
                BEACON_FATAL(value.is_number_integer(), "Configuration key {} must be an integer", name);
                set(*key, value.get<int>());
                break;
            default:
                BEACON_FATAL(value.is_boolean(), "Configuration key {} must be a boolean", name);
                set(*key, value.get<bool>());
                break;
        }
    }
    log_debug(tt::LogAlways, "Loaded telemetry configuration from {}", path.string());
}

void TelemetryConfig::apply_environment() {
    if (const char* str = std::getenv("BEACON_DISABLE_TELEMETRY")) {
        set(ConfigKey::DisableTelemetry, parse_bool("BEACON_DISABLE_TELEMETRY", str));
    }
    if (const char* str = std::getenv("BEACON_DISABLE_PII_PROTECTION")) {
        set(ConfigKey::DisablePiiProtection, parse_bool("BEACON_DISABLE_PII_PROTECTION", str));
    }
    if (const char* str = std::getenv("BEACON_SUPPRESS_TELEMETRY_REMINDER")) {
        set(ConfigKey::SuppressTelemetryReminder, parse_bool("BEACON_SUPPRESS_TELEMETRY_REMINDER", str));
    }
    if (const char* str = std::getenv("BEACON_APPLICATION_INSIGHTS_KEY")) {
        set(ConfigKey::ApplicationInsightsKey, std::string(str));
    }
    if (const char* str = std::getenv("BEACON_WEB_REQUEST_TIMEOUT_SEC")) {
        set(ConfigKey::WebRequestTimeoutSec, parse_int("BEACON_WEB_REQUEST_TIMEOUT_SEC", str));
    }
    if (const char* str = std::getenv("BEACON_DEFAULT_NO_STATUS")) {
        set(ConfigKey::DefaultNoStatus, parse_bool("BEACON_DEFAULT_NO_STATUS", str));
    }
}

void TelemetryConfig::set(ConfigKey key, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (key) {
        case ConfigKey::DisableTelemetry: settings_.disable_telemetry = value; break;
        case ConfigKey::DisablePiiProtection: settings_.disable_pii_protection = value; break;
        case ConfigKey::SuppressTelemetryReminder: settings_.suppress_telemetry_reminder = value; break;
        case ConfigKey::DefaultNoStatus: settings_.default_no_status = value; break;
        default: BEACON_THROW("Configuration key {} is not a boolean", config_key_name(key));
    }
}

void TelemetryConfig::set(ConfigKey key, int value) {
    BEACON_FATAL(
        key == ConfigKey::WebRequestTimeoutSec, "Configuration key {} is not an integer", config_key_name(key));
    BEACON_FATAL(value > 0, "WebRequestTimeoutSec must be positive, got {}", value);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.web_request_timeout_sec = value;
}

void TelemetryConfig::set(ConfigKey key, const std::string& value) {
    BEACON_FATAL(
        key == ConfigKey::ApplicationInsightsKey, "Configuration key {} is not a string", config_key_name(key));
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.application_insights_key = value;
}

bool TelemetryConfig::get_bool(ConfigKey key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (key) {
        case ConfigKey::DisableTelemetry: return settings_.disable_telemetry;
        case ConfigKey::DisablePiiProtection: return settings_.disable_pii_protection;
        case ConfigKey::SuppressTelemetryReminder: return settings_.suppress_telemetry_reminder;
        case ConfigKey::DefaultNoStatus: return settings_.default_no_status;
        default: BEACON_THROW("Configuration key {} is not a boolean", config_key_name(key));
    }
}

int TelemetryConfig::get_int(ConfigKey key) const {
    BEACON_FATAL(
        key == ConfigKey::WebRequestTimeoutSec, "Configuration key {} is not an integer", config_key_name(key));
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.web_request_timeout_sec;
}

std::string TelemetryConfig::get_string(ConfigKey key) const {
    BEACON_FATAL(
        key == ConfigKey::ApplicationInsightsKey, "Configuration key {} is not a string", config_key_name(key));
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.application_insights_key;
}

TelemetrySettings TelemetryConfig::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

}  // namespace beacon
