// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * beacon_emit.cpp
 * Sends a single telemetry event or exception report from the command line.
 *
 *   beacon_emit --event Startup --property Mode=batch --metric DurationMs=12.5
 *   beacon_emit --exception-message "disk full" --error-bucket IO --sync
 */

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/string_utils.hpp>
#include <beacon/config/telemetry_config.hpp>
#include <beacon/event/exception_info.hpp>
#include <beacon/telemetry_service.hpp>

static std::pair<std::string, std::string> split_key_value(const std::string& option, const std::string& text) {
    size_t pos = text.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::invalid_argument(fmt::format("--{} expects key=value, got '{}'", option, text));
    }
    return {beacon::trim(text.substr(0, pos)), text.substr(pos + 1)};
}

static beacon::PropertyBag parse_properties(const std::vector<std::string>& values) {
    beacon::PropertyBag properties;
    for (const auto& value : values) {
        auto [key, text] = split_key_value("property", value);
        properties[key] = text;
    }
    return properties;
}

static beacon::MetricBag parse_metrics(const std::vector<std::string>& values) {
    beacon::MetricBag metrics;
    for (const auto& value : values) {
        auto [key, text] = split_key_value("metric", value);
        size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(text, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size()) {
            throw std::invalid_argument(fmt::format("--metric {} has non-numeric value '{}'", key, text));
        }
        metrics[key] = number;
    }
    return metrics;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("beacon_emit", "Send a telemetry event");

    options.add_options()("e,event", "Name of the custom event to send", cxxopts::value<std::string>())(
        "property", "Event property as key=value (repeatable)", cxxopts::value<std::vector<std::string>>())(
        "metric", "Event measurement as key=number (repeatable)", cxxopts::value<std::vector<std::string>>())(
        "exception-message",
        "Send an exception report with this message instead of a custom event",
        cxxopts::value<std::string>())(
        "exception-type", "Type name recorded for --exception-message", cxxopts::value<std::string>()->default_value(
                                                                            "std::runtime_error"))(
        "error-bucket", "Grouping key for --exception-message", cxxopts::value<std::string>()->default_value(""))(
        "sync", "Send on the calling thread without a progress indicator", cxxopts::value<bool>()->default_value(
                                                                                "false"))(
        "async", "Send from a background task while showing a progress indicator", cxxopts::value<bool>()->default_value(
                                                                                       "false"))(
        "c,config", "JSON configuration file (overrides BEACON_CONFIG_FILE)", cxxopts::value<std::string>())(
        "timeout", "Request timeout in seconds", cxxopts::value<int>())(
        "disable-pii", "Send user names in clear text", cxxopts::value<bool>()->default_value("false"))(
        "h,help", "Print usage");

    std::shared_ptr<beacon::TelemetryConfig> config;
    std::string event_name;
    std::optional<std::string> exception_message;
    std::string exception_type;
    std::string error_bucket;
    beacon::PropertyBag properties;
    beacon::MetricBag metrics;
    std::optional<bool> run_synchronously;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (result["sync"].as<bool>() && result["async"].as<bool>()) {
            throw std::invalid_argument("--sync and --async are mutually exclusive");
        }
        if (result["sync"].as<bool>()) {
            run_synchronously = true;
        } else if (result["async"].as<bool>()) {
            run_synchronously = false;
        }

        if (result.count("event")) {
            event_name = result["event"].as<std::string>();
        }
        if (result.count("exception-message")) {
            exception_message = result["exception-message"].as<std::string>();
        }
        if (event_name.empty() && !exception_message) {
            throw std::invalid_argument("One of --event or --exception-message is required");
        }
        exception_type = result["exception-type"].as<std::string>();
        error_bucket = result["error-bucket"].as<std::string>();

        if (result.count("property")) {
            properties = parse_properties(result["property"].as<std::vector<std::string>>());
        }
        if (result.count("metric")) {
            metrics = parse_metrics(result["metric"].as<std::vector<std::string>>());
        }

        // Defaults, file, environment, then command line
        if (result.count("config")) {
            config = std::make_shared<beacon::TelemetryConfig>();
            config->load_file(result["config"].as<std::string>());
            config->apply_environment();
        } else {
            config = beacon::TelemetryConfig::from_environment();
        }
        if (result.count("timeout")) {
            config->set(beacon::ConfigKey::WebRequestTimeoutSec, result["timeout"].as<int>());
        }
        if (result["disable-pii"].as<bool>()) {
            config->set(beacon::ConfigKey::DisablePiiProtection, true);
        }
    } catch (const std::exception& e) {
        log_error(tt::LogAlways, "{}", e.what());
        std::cerr << options.help() << std::endl;
        return 1;
    }

    beacon::TelemetryService telemetry(config);
    if (exception_message) {
        beacon::ExceptionInfo info{.type_name = exception_type, .message = *exception_message};
        log_info(tt::LogAlways, "Reporting exception {}: {}", info.type_name, info.message);
        telemetry.emit_exception(info, error_bucket, properties, run_synchronously);
    } else {
        log_info(tt::LogAlways, "Reporting event {}", event_name);
        telemetry.emit_event(event_name, properties, metrics, run_synchronously);
    }

    // Telemetry is best-effort; delivery problems have already been logged
    return 0;
}
