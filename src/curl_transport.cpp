#include "wincloud/curl_transport.hpp"

#include <cstdlib>
#include <utility>

#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "CurlTransport";

std::once_flag g_curl_init_once;
CURLcode g_curl_init_result = CURLE_OK;

void GlobalInit() {
    std::call_once(g_curl_init_once, [] {
        g_curl_init_result = curl_global_init(CURL_GLOBAL_ALL);
        if (g_curl_init_result == CURLE_OK) {
            std::atexit(curl_global_cleanup);
        }
    });
}

std::size_t WriteBodyCallback(char* contents, const std::size_t size, const std::size_t nmemb, void* userp) {
    const std::size_t real_size = size * nmemb;
    auto* body = static_cast<std::vector<std::uint8_t>*>(userp);
    const auto* begin = reinterpret_cast<const std::uint8_t*>(contents);
    body->insert(body->end(), begin, begin + real_size);
    return real_size;
}

class HeaderList {
public:
    ~HeaderList() {
        if (list_ != nullptr) {
            curl_slist_free_all(list_);
        }
    }

    bool Append(const std::string& line) {
        curl_slist* next = curl_slist_append(list_, line.c_str());
        if (next == nullptr) {
            return false;
        }
        list_ = next;
        return true;
    }

    curl_slist* get() const {
        return list_;
    }

private:
    curl_slist* list_ = nullptr;
};

WcStatus StatusFromCurl(const CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return WcStatus::NetworkTimeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
            return WcStatus::NetworkUnavailable;
        default:
            return WcStatus::TransportError;
    }
}

}  // namespace

CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options)) {
    GlobalInit();
    if (g_curl_init_result != CURLE_OK) {
        LogError(kComponent, std::string("curl_global_init failed: ") + curl_easy_strerror(g_curl_init_result));
        return;
    }
    handle_ = curl_easy_init();
    if (handle_ == nullptr) {
        LogError(kComponent, "curl_easy_init failed");
    }
}

CurlTransport::~CurlTransport() {
    if (handle_ != nullptr) {
        curl_easy_cleanup(handle_);
    }
}

WcStatus CurlTransport::Perform(const HttpRequest& request, HttpResponse& out_response, std::string& out_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ == nullptr) {
        out_error = "curl handle unavailable";
        return WcStatus::TransportError;
    }

    // Keeps the connection cache, drops every option of the previous request.
    curl_easy_reset(handle_);

    HeaderList headers;
    for (const auto& header : request.headers) {
        if (!headers.Append(header.first + ": " + header.second)) {
            out_error = "could not build request headers";
            return WcStatus::TransportError;
        }
    }
    // Suppresses libcurl's 100-continue round trip for large bodies.
    if ((request.method == HttpMethod::Post || request.method == HttpMethod::Put) && !headers.Append("Expect:")) {
        out_error = "could not build request headers";
        return WcStatus::TransportError;
    }

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, static_cast<void*>(&response.body));
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers.get());

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Head:
            curl_easy_setopt(handle_, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::Post:
        case HttpMethod::Put:
            curl_easy_setopt(handle_, CURLOPT_POST, 1L);
            curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            if (request.method == HttpMethod::Put) {
                curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, "PUT");
            }
            break;
        case HttpMethod::Delete:
            curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    const CURLcode res = curl_easy_perform(handle_);
    if (res != CURLE_OK) {
        out_error = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        LogDebug(kComponent, std::string(ToString(request.method)) + " " + request.url + " failed: " + out_error);
        return StatusFromCurl(res);
    }

    long status_code = 0;
    if (curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status_code) != CURLE_OK) {
        out_error = "could not read response code";
        return WcStatus::TransportError;
    }
    response.status_code = status_code;
    out_response = std::move(response);
    return WcStatus::Ok;
}

}  // namespace wincloud
