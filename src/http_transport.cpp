#include "wincloud/http_transport.hpp"

namespace wincloud {

std::string_view ToString(const HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Head:
            return "HEAD";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Delete:
            return "DELETE";
    }
    return "GET";
}

bool IsIdempotent(const HttpMethod method) {
    return method != HttpMethod::Post;
}

}  // namespace wincloud
