#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "wincloud/client_config.hpp"
#include "wincloud/http_transport.hpp"
#include "wincloud/wc_status.hpp"

namespace wincloud {

struct TransferOptions {
    std::string server_url = "https://localhost:8443";
    std::string api_version = "v1";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds health_timeout{5000};
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    // Payloads at or above this size are sent in chunks of this size.
    std::size_t chunk_size = kDefaultChunkSize;
    std::string client_version = "1.0.0";
    // Empty derives one from the host.
    std::string device_id;

    static TransferOptions FromConfig(const ClientConfig& config);
};

struct TransferResult {
    WcStatus status = WcStatus::Ok;
    std::string message;

    bool ok() const {
        return status == WcStatus::Ok;
    }
};

struct UploadResult {
    WcStatus status = WcStatus::Ok;
    std::string message;
    std::string archive_id;
    std::vector<std::string> file_ids;

    bool ok() const {
        return status == WcStatus::Ok;
    }
};

struct DownloadResult {
    WcStatus status = WcStatus::Ok;
    std::string message;
    std::vector<std::uint8_t> data;

    bool ok() const {
        return status == WcStatus::Ok;
    }
};

struct UploadSession {
    std::string upload_id;
    std::size_t chunk_index = 0;
    std::uint64_t total_size = 0;
    std::size_t chunk_size = 0;
};

// Client for the remote store's REST API. Every call returns a structured
// result; transient failures (429/500/502/503/504, connection loss, timeouts
// on idempotent methods) are retried with exponential backoff.
class TransferClient {
public:
    TransferClient(std::shared_ptr<IHttpTransport> transport, TransferOptions options);

    bool Health();
    TransferResult Authenticate();
    UploadResult Upload(const std::vector<std::uint8_t>& data);
    DownloadResult Download(const std::string& archive_id);
    TransferResult Delete(const std::string& archive_id);

    bool has_token() const {
        return !token_.empty();
    }

    const std::string& device_id() const {
        return device_id_;
    }

    const TransferOptions& options() const {
        return options_;
    }

    // First 16 hex characters of SHA-256 over the host name and machine id.
    static std::string DeriveDeviceId();

private:
    WcStatus Send(const HttpRequest& request, HttpResponse& out_response, std::string& out_message);
    WcStatus EnsureToken(std::string& out_message);
    std::string ApiUrl(const std::string& path) const;
    void AddAuthHeader(HttpRequest& request) const;

    UploadResult UploadSingle(const std::vector<std::uint8_t>& data);
    UploadResult UploadChunked(const std::vector<std::uint8_t>& data);
    WcStatus SendChunk(
        const std::vector<std::uint8_t>& data,
        UploadSession& session,
        std::string& out_message);

    std::shared_ptr<IHttpTransport> transport_;
    TransferOptions options_;
    std::string device_id_;
    std::string token_;
};

}  // namespace wincloud
