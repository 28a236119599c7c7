// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace beacon {

struct CaseInsensitiveLess {
    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

using HttpHeaders = std::multimap<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string url;
    std::string method = "POST";
    HttpHeaders headers;
    std::string body;
    std::chrono::seconds timeout{30};
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    HttpHeaders headers;
    std::string body;
};

// Performs one HTTP exchange. Implementations return the response for 2xx statuses and throw
// beacon::TransportFailure for anything else (non-2xx status, connection error, timeout).
// Instances are shared with the isolated delivery task and must be usable from any thread.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// cpp-httplib backed transport. A new client is created per request, so no connection
// state is shared between concurrent sends.
class HttplibTransport : public HttpTransport {
public:
    HttpResponse execute(const HttpRequest& request) override;
};

}  // namespace beacon
