// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/delivery/error_normalizer.hpp>

#include <algorithm>
#include <typeinfo>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>
#include <beacon/common/string_utils.hpp>

using json = nlohmann::json;

namespace beacon {

namespace {

std::string cell_text(const json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return "";
    }
    return cell_text(*it);
}

std::string right_trimmed(std::string line) {
    line.erase(line.find_last_not_of(' ') + 1);
    return line;
}

std::string render_object_table(const json& rows) {
    // Columns in first-seen order across all rows
    std::vector<std::string> columns;
    for (const auto& row : rows) {
        for (const auto& [key, _] : row.items()) {
            if (std::find(columns.begin(), columns.end(), key) == columns.end()) {
                columns.push_back(key);
            }
        }
    }

    std::vector<size_t> widths;
    for (const auto& column : columns) {
        size_t width = column.size();
        for (const auto& row : rows) {
            width = std::max(width, string_field(row, column.c_str()).size());
        }
        widths.push_back(width);
    }

    std::vector<std::string> lines;
    std::string header;
    std::string separator;
    for (size_t i = 0; i < columns.size(); i++) {
        header += fmt::format("{:<{}} ", columns[i], widths[i]);
        separator += fmt::format("{} ", std::string(widths[i], '-'));
    }
    lines.push_back(right_trimmed(header));
    lines.push_back(right_trimmed(separator));
    for (const auto& row : rows) {
        std::string line;
        for (size_t i = 0; i < columns.size(); i++) {
            line += fmt::format("{:<{}} ", string_field(row, columns[i].c_str()), widths[i]);
        }
        lines.push_back(right_trimmed(line));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

std::string render_key_value_list(const json& object) {
    size_t key_width = 0;
    for (const auto& [key, _] : object.items()) {
        key_width = std::max(key_width, key.size());
    }
    std::vector<std::string> lines;
    for (const auto& [key, value] : object.items()) {
        lines.push_back(right_trimmed(fmt::format("{:<{}} : {}", key, key_width, cell_text(value))));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

void append_inner_message(std::vector<std::string>& lines, const std::string& inner_message) {
    json inner;
    try {
        inner = json::parse(inner_message);
    } catch (const json::parse_error&) {
        // Not JSON; report it as-is
        lines.push_back(trim(inner_message));
        return;
    }

    if (inner.is_string()) {
        lines.push_back(trim(inner.get<std::string>()));
    } else if (inner.is_object() && !is_blank(string_field(inner, "message"))) {
        lines.push_back(
            fmt::format("{} | {}", trim(string_field(inner, "message")), trim(string_field(inner, "documentation_url"))));
        if (inner.contains("details")) {
            lines.push_back(render_table(inner.at("details")));
        }
    } else {
        lines.push_back(inner.dump());
    }
}

}  // namespace

std::string render_table(const json& value) {
    if (value.is_array() && !value.empty() &&
        std::all_of(value.begin(), value.end(), [](const json& row) { return row.is_object(); })) {
        return render_object_table(value);
    }
    if (value.is_object()) {
        return render_key_value_list(value);
    }
    return cell_text(value);
}

std::string format_diagnostic(const DeliveryError& error) {
    std::vector<std::string> lines;
    lines.push_back(error.message);

    if (error.status_code) {
        lines.push_back(fmt::format("{} | {}", *error.status_code, trim(error.status_description.value_or(""))));
    }

    if (error.inner_message) {
        append_inner_message(lines, *error.inner_message);
    }

    if (error.raw_response_body && !is_blank(*error.raw_response_body)) {
        lines.push_back(*error.raw_response_body);
    }

    if (error.request_id) {
        lines.push_back(fmt::format("RequestId: {}", *error.request_id));
    }

    return fmt::format("{}", fmt::join(lines, "\n"));
}

std::string normalize_failure(const std::exception_ptr& failure) {
    BEACON_FATAL(failure != nullptr, "normalize_failure() called without a failure");

    try {
        std::rethrow_exception(failure);
    } catch (const TransportFailure& e) {
        return format_diagnostic(extract_delivery_error(e));
    } catch (const IsolatedUnitFailure& e) {
        return format_diagnostic(deserialize_delivery_error(e.serialized_error()));
    } catch (const std::exception& e) {
        log_error(
            tt::LogAlways,
            "Unrecognized telemetry delivery failure ({}): {}",
            beacon::assert::detail::demangle(typeid(e).name()),
            e.what());
        throw;
    } catch (...) {
        log_error(tt::LogAlways, "Unrecognized telemetry delivery failure of non-standard type");
        throw;
    }
}

}  // namespace beacon
