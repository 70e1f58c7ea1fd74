#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wincloud/wc_status.hpp"

namespace wincloud {

enum class HttpMethod {
    Get,
    Head,
    Post,
    Put,
    Delete
};

std::string_view ToString(HttpMethod method);

// GET, HEAD, PUT and DELETE may be repeated after a timeout.
bool IsIdempotent(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<std::uint8_t> body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status_code = 0;
    std::vector<std::uint8_t> body;
};

// One request/response exchange. Returns Ok whenever an HTTP status was
// received, whatever its value; NetworkUnavailable, NetworkTimeout or
// TransportError otherwise, with a description in |out_error|.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual WcStatus Perform(const HttpRequest& request, HttpResponse& out_response, std::string& out_error) = 0;
};

}  // namespace wincloud
