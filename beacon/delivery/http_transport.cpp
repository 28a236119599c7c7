// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/delivery/http_transport.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>
#include <httplib.h>
#include <tt-logger/tt-logger.hpp>

#include <beacon/common/assert.hpp>
#include <beacon/delivery/delivery_error.hpp>

namespace beacon {

namespace {

// "https://host:port/a/b" -> {"https://host:port", "/a/b"}
std::pair<std::string, std::string> split_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    BEACON_FATAL(scheme_end != std::string::npos, "URL has no scheme: {}", url);
    size_t path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

bool is_success_status(int status) { return status >= 200 && status < 300; }

}  // namespace

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const noexcept {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

HttpResponse HttplibTransport::execute(const HttpRequest& request) {
    auto [origin, path] = split_url(request.url);

    httplib::Client client(origin);
    auto timeout_seconds = static_cast<time_t>(request.timeout.count());
    client.set_connection_timeout(timeout_seconds, 0);
    client.set_read_timeout(timeout_seconds, 0);
    client.set_write_timeout(timeout_seconds, 0);

    httplib::Request http_request;
    http_request.method = request.method;
    http_request.path = path;
    for (const auto& [name, value] : request.headers) {
        http_request.headers.emplace(name, value);
    }
    http_request.body = request.body;

    log_debug(tt::LogAlways, "[HttplibTransport] {} {} ({} bytes)", request.method, request.url, request.body.size());
    httplib::Result result = client.send(http_request);
    if (!result) {
        throw TransportFailure(
            fmt::format("{} {} failed: {}", request.method, request.url, httplib::to_string(result.error())));
    }

    HttpResponse response;
    response.status = result->status;
    response.reason = result->reason.empty() ? httplib::status_message(result->status) : result->reason;
    for (const auto& [name, value] : result->headers) {
        response.headers.emplace(name, value);
    }
    response.body = result->body;

    if (!is_success_status(response.status)) {
        std::string message = fmt::format(
            "Response status code does not indicate success: {} ({}).", response.status, response.reason);
        throw TransportFailure(message, std::move(response));
    }
    return response;
}

}  // namespace beacon
