#pragma once

#include <cstddef>
#include <string>

#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr std::size_t kDefaultChunkSize = 5U * 1024U * 1024U;
// Upper bound on network.max_retries; backoff doubles per attempt.
constexpr int kMaxRetries = 10;

struct ClientConfig {
    std::string server_url = "https://localhost:8443";
    std::string api_version = "v1";
    int compression_level = 6;
    int local_percentage = 10;
    int timeout_seconds = 30;
    int health_timeout_seconds = 5;
    int max_retries = 3;
    int backoff_base_ms = 1000;
    std::size_t chunk_size = kDefaultChunkSize;
    bool verify_tls = true;
    // Empty selects the per-user default key file.
    std::string key_path;
    std::string client_version = "1.0.0";
};

// $HOME/.wincloud/config.json (%USERPROFILE% on Windows).
std::string DefaultConfigPath();

// Overlays the values found in |path| onto |in_out_config|. Keys that are not
// recognized are ignored. With |allow_missing| an absent file leaves the
// config untouched.
WcStatus LoadClientConfig(const std::string& path, bool allow_missing, ClientConfig& in_out_config);

WcStatus ValidateClientConfig(const ClientConfig& config);

}  // namespace wincloud
