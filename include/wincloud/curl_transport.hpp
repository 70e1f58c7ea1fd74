#pragma once

#include <mutex>
#include <string>

#include <curl/curl.h>

#include "wincloud/http_transport.hpp"

namespace wincloud {

struct CurlTransportOptions {
    bool verify_tls = true;
    std::string user_agent = "wincloud/1.0.0";
};

// libcurl transport. One easy handle is kept for the lifetime of the object
// so keep-alive connections are reused between calls.
class CurlTransport final : public IHttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    WcStatus Perform(const HttpRequest& request, HttpResponse& out_response, std::string& out_error) override;

private:
    CurlTransportOptions options_;
    CURL* handle_ = nullptr;
    std::mutex mutex_;
};

}  // namespace wincloud
