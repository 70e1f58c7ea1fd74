#include "wincloud/transfer_client.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <thread>
#include <utility>

#ifdef _WIN32
#include <cstdlib>
#else
#include <unistd.h>
#endif

#include "wincloud/crypto_manager.hpp"
#include "wincloud/json_value.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "TransferClient";
constexpr std::size_t kDeviceIdLength = 16;

bool IsSuccess(const long code) {
    return code >= 200 && code < 300;
}

bool IsRetryableStatus(const long code) {
    return code == 429 || code == 500 || code == 502 || code == 503 || code == 504;
}

std::string HostName() {
#ifdef _WIN32
    const char* name = std::getenv("COMPUTERNAME");
    return name != nullptr ? std::string(name) : std::string();
#else
    std::array<char, 256> buffer{};
    if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
        return std::string();
    }
    return std::string(buffer.data());
#endif
}

std::string MachineId() {
#ifdef _WIN32
    return std::string();
#else
    std::ifstream in("/etc/machine-id");
    std::string id;
    if (in) {
        std::getline(in, id);
    }
    return id;
#endif
}

WcStatus ParseBody(const HttpResponse& response, JsonValue& out_root) {
    const std::string_view text(reinterpret_cast<const char*>(response.body.data()), response.body.size());
    if (Json::Parse(text, out_root) != WcStatus::Ok || out_root.type != JsonValue::Type::Object) {
        return WcStatus::ProtocolError;
    }
    return WcStatus::Ok;
}

WcStatus ParseArchiveReply(const HttpResponse& response, UploadResult& out_result) {
    JsonValue root;
    if (ParseBody(response, root) != WcStatus::Ok) {
        out_result.message = "server reply is not a JSON object";
        return WcStatus::ProtocolError;
    }
    const JsonValue* archive_id = root.Find("archive_id");
    if (archive_id == nullptr || archive_id->type != JsonValue::Type::String || archive_id->string_value.empty()) {
        out_result.message = "server reply has no archive_id";
        return WcStatus::ProtocolError;
    }
    out_result.archive_id = archive_id->string_value;
    out_result.file_ids.clear();
    const JsonValue* file_ids = root.Find("file_ids");
    if (file_ids != nullptr && file_ids->type == JsonValue::Type::Array) {
        for (const auto& item : file_ids->array_value) {
            if (item.type == JsonValue::Type::String) {
                out_result.file_ids.push_back(item.string_value);
            }
        }
    }
    return WcStatus::Ok;
}

std::string DescribeHttpFailure(const HttpRequest& request, const long code) {
    return std::string(ToString(request.method)) + " " + request.url + " returned HTTP " + std::to_string(code);
}

}  // namespace

TransferOptions TransferOptions::FromConfig(const ClientConfig& config) {
    TransferOptions options;
    options.server_url = config.server_url;
    options.api_version = config.api_version;
    options.timeout = std::chrono::seconds(config.timeout_seconds);
    options.health_timeout = std::chrono::seconds(config.health_timeout_seconds);
    options.max_retries = config.max_retries;
    options.backoff_base = std::chrono::milliseconds(config.backoff_base_ms);
    options.chunk_size = config.chunk_size;
    options.client_version = config.client_version;
    return options;
}

TransferClient::TransferClient(std::shared_ptr<IHttpTransport> transport, TransferOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    while (!options_.server_url.empty() && options_.server_url.back() == '/') {
        options_.server_url.pop_back();
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = kDefaultChunkSize;
    }
    device_id_ = options_.device_id.empty() ? DeriveDeviceId() : options_.device_id;
}

std::string TransferClient::DeriveDeviceId() {
    const std::string machine = HostName() + "-" + MachineId();
    const std::string digest =
        CryptoManager::HashHex(reinterpret_cast<const std::uint8_t*>(machine.data()), machine.size());
    return digest.substr(0, kDeviceIdLength);
}

std::string TransferClient::ApiUrl(const std::string& path) const {
    return options_.server_url + "/api/" + options_.api_version + path;
}

void TransferClient::AddAuthHeader(HttpRequest& request) const {
    request.headers.emplace_back("Authorization", "Bearer " + token_);
}

WcStatus TransferClient::Send(const HttpRequest& request, HttpResponse& out_response, std::string& out_message) {
    if (!transport_) {
        out_message = "no transport configured";
        return WcStatus::TransportError;
    }

    const int attempts = std::min(std::max(0, options_.max_retries), kMaxRetries) + 1;
    WcStatus last = WcStatus::TransportError;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        HttpResponse response;
        std::string error;
        const WcStatus status = transport_->Perform(request, response, error);

        if (status == WcStatus::Ok) {
            const long code = response.status_code;
            if (IsSuccess(code)) {
                out_response = std::move(response);
                return WcStatus::Ok;
            }
            if (code == 401 || code == 403) {
                token_.clear();
                out_message = DescribeHttpFailure(request, code);
                return WcStatus::AuthRejected;
            }
            if (!IsRetryableStatus(code)) {
                out_message = DescribeHttpFailure(request, code);
                return WcStatus::ServerRejected;
            }
            last = WcStatus::ServerUnavailable;
            out_message = DescribeHttpFailure(request, code);
        } else if (status == WcStatus::NetworkUnavailable) {
            last = status;
            out_message = "cannot connect to server: " + error;
        } else if (status == WcStatus::NetworkTimeout) {
            out_message = "request timed out: " + error;
            if (!IsIdempotent(request.method)) {
                return status;
            }
            last = status;
        } else {
            out_message = "transport failure: " + error;
            return status;
        }

        if (attempt < attempts) {
            const auto delay = options_.backoff_base * (1LL << std::min(attempt - 1, kMaxRetries));
            LogWarning(
                kComponent,
                out_message + "; retry " + std::to_string(attempt) + "/" + std::to_string(attempts - 1) + " in " +
                    std::to_string(delay.count()) + " ms");
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
    }
    return last;
}

bool TransferClient::Health() {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = ApiUrl("/health");
    request.timeout = options_.health_timeout;

    HttpResponse response;
    std::string message;
    const WcStatus status = Send(request, response, message);
    if (status != WcStatus::Ok) {
        LogError(kComponent, "Server health check failed: " + message);
        return false;
    }
    if (response.status_code != 200) {
        LogWarning(kComponent, "Server returned status " + std::to_string(response.status_code));
        return false;
    }
    LogInfo(kComponent, "Server connection successful");
    return true;
}

TransferResult TransferClient::Authenticate() {
    JsonValue payload = JsonValue::MakeObject();
    payload.Set("user_id", JsonValue::MakeString(device_id_));
    payload.Set("client_version", JsonValue::MakeString(options_.client_version));
    const std::string body = Json::Serialize(payload);

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = ApiUrl("/auth");
    request.timeout = options_.timeout;
    request.headers.emplace_back("Content-Type", "application/json");
    request.body.assign(body.begin(), body.end());

    TransferResult result;
    HttpResponse response;
    result.status = Send(request, response, result.message);
    if (result.status != WcStatus::Ok) {
        LogError(kComponent, "Authentication failed: " + result.message);
        return result;
    }

    JsonValue root;
    const JsonValue* token = nullptr;
    if (ParseBody(response, root) == WcStatus::Ok) {
        token = root.Find("token");
    }
    if (token == nullptr || token->type != JsonValue::Type::String || token->string_value.empty()) {
        result.status = WcStatus::ProtocolError;
        result.message = "authentication reply has no token";
        LogError(kComponent, result.message);
        return result;
    }
    token_ = token->string_value;
    LogInfo(kComponent, "Authentication successful");
    return result;
}

WcStatus TransferClient::EnsureToken(std::string& out_message) {
    if (!token_.empty()) {
        return WcStatus::Ok;
    }
    const TransferResult auth = Authenticate();
    if (!auth.ok()) {
        out_message = "authentication required: " + auth.message;
    }
    return auth.status;
}

UploadResult TransferClient::Upload(const std::vector<std::uint8_t>& data) {
    LogInfo(kComponent, "Uploading cloud data: " + std::to_string(data.size()) + " bytes");
    UploadResult result;
    result.status = EnsureToken(result.message);
    if (result.status != WcStatus::Ok) {
        return result;
    }
    result = data.size() < options_.chunk_size ? UploadSingle(data) : UploadChunked(data);
    if (result.ok()) {
        LogInfo(kComponent, "Upload successful: " + result.archive_id);
    } else {
        LogError(kComponent, "Upload failed: " + result.message);
    }
    return result;
}

UploadResult TransferClient::UploadSingle(const std::vector<std::uint8_t>& data) {
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = ApiUrl("/archives/upload");
    request.timeout = options_.timeout * 2;
    AddAuthHeader(request);
    request.headers.emplace_back("Content-Type", "application/octet-stream");
    request.body = data;

    UploadResult result;
    HttpResponse response;
    result.status = Send(request, response, result.message);
    if (result.status != WcStatus::Ok) {
        return result;
    }
    result.status = ParseArchiveReply(response, result);
    return result;
}

UploadResult TransferClient::UploadChunked(const std::vector<std::uint8_t>& data) {
    UploadSession session;
    session.total_size = static_cast<std::uint64_t>(data.size());
    session.chunk_size = options_.chunk_size;

    UploadResult result;
    while (static_cast<std::uint64_t>(session.chunk_index) * session.chunk_size < session.total_size) {
        result.status = SendChunk(data, session, result.message);
        if (result.status != WcStatus::Ok) {
            return result;
        }
    }

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = ApiUrl("/archives/upload") + "/finalize/" + session.upload_id;
    request.timeout = options_.timeout;
    AddAuthHeader(request);

    HttpResponse response;
    result.status = Send(request, response, result.message);
    if (result.status != WcStatus::Ok) {
        result.message = "failed to finalize upload: " + result.message;
        return result;
    }
    result.status = ParseArchiveReply(response, result);
    return result;
}

WcStatus TransferClient::SendChunk(
    const std::vector<std::uint8_t>& data,
    UploadSession& session,
    std::string& out_message) {
    const std::size_t begin = session.chunk_index * session.chunk_size;
    const std::size_t end = std::min(begin + session.chunk_size, data.size());

    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = ApiUrl("/archives/upload");
    request.timeout = options_.timeout * 2;
    AddAuthHeader(request);
    request.headers.emplace_back("Content-Type", "application/octet-stream");
    request.headers.emplace_back("X-Chunk-Index", std::to_string(session.chunk_index));
    request.headers.emplace_back("X-Total-Size", std::to_string(session.total_size));
    request.headers.emplace_back("X-Chunk-Size", std::to_string(end - begin));
    if (!session.upload_id.empty()) {
        request.headers.emplace_back("X-Upload-Id", session.upload_id);
    }
    request.body.assign(
        data.begin() + static_cast<std::ptrdiff_t>(begin),
        data.begin() + static_cast<std::ptrdiff_t>(end));

    HttpResponse response;
    const WcStatus status = Send(request, response, out_message);
    if (status != WcStatus::Ok) {
        out_message = "chunk " + std::to_string(session.chunk_index) + " upload failed: " + out_message;
        return status;
    }

    if (session.upload_id.empty()) {
        JsonValue root;
        const JsonValue* upload_id = nullptr;
        if (ParseBody(response, root) == WcStatus::Ok) {
            upload_id = root.Find("upload_id");
        }
        if (upload_id == nullptr || upload_id->type != JsonValue::Type::String || upload_id->string_value.empty()) {
            out_message = "server did not assign an upload id";
            return WcStatus::ProtocolError;
        }
        session.upload_id = upload_id->string_value;
    }

    ++session.chunk_index;
    LogInfo(
        kComponent,
        "Uploaded chunk " + std::to_string(session.chunk_index) + ": " + std::to_string(end) + "/" +
            std::to_string(session.total_size) + " bytes");
    return WcStatus::Ok;
}

DownloadResult TransferClient::Download(const std::string& archive_id) {
    LogInfo(kComponent, "Downloading cloud data: " + archive_id);
    DownloadResult result;
    result.status = EnsureToken(result.message);
    if (result.status != WcStatus::Ok) {
        return result;
    }

    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = ApiUrl("/archives/" + archive_id + "/download");
    request.timeout = options_.timeout * 3;
    AddAuthHeader(request);

    HttpResponse response;
    result.status = Send(request, response, result.message);
    if (result.status != WcStatus::Ok) {
        LogError(kComponent, "Download failed: " + result.message);
        return result;
    }
    result.data = std::move(response.body);
    LogInfo(kComponent, "Download successful: " + std::to_string(result.data.size()) + " bytes");
    return result;
}

TransferResult TransferClient::Delete(const std::string& archive_id) {
    TransferResult result;
    result.status = EnsureToken(result.message);
    if (result.status != WcStatus::Ok) {
        return result;
    }

    HttpRequest request;
    request.method = HttpMethod::Delete;
    request.url = ApiUrl("/archives/" + archive_id);
    request.timeout = options_.timeout;
    AddAuthHeader(request);

    HttpResponse response;
    result.status = Send(request, response, result.message);
    if (result.status != WcStatus::Ok) {
        LogError(kComponent, "Delete failed: " + result.message);
        return result;
    }
    LogInfo(kComponent, "Archive deleted: " + archive_id);
    return result;
}

}  // namespace wincloud
