#include "wincloud/transfer_client.hpp"

#include <memory>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "wincloud/log.hpp"

using wincloud::HttpMethod;
using wincloud::TransferClient;
using wincloud::TransferOptions;
using wincloud::WcStatus;
using wincloud_test::FakeRemoteStore;
using wincloud_test::RandomBytes;
using wincloud_test::RecordedRequest;

namespace {

TransferOptions TestOptions(const std::size_t chunk_size = 1024U * 1024U) {
    TransferOptions options;
    options.server_url = std::string(FakeRemoteStore::kBaseUrl) + "/";
    options.backoff_base = std::chrono::milliseconds(0);
    options.chunk_size = chunk_size;
    options.device_id = "0123456789abcdef";
    return options;
}

std::string HeaderOf(const RecordedRequest& request, const std::string& name) {
    const auto it = request.headers.find(name);
    return it == request.headers.end() ? std::string() : it->second;
}

}  // namespace

int main() {
    wincloud::SetLogLevel(wincloud::LogLevel::Off);
    const std::string upload_path = "/api/v1/archives/upload";

    {
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions());
        if (!WC_CHECK(client.device_id() == "0123456789abcdef" && !client.has_token())) {
            return 1;
        }
        if (!WC_CHECK(client.Health())) {
            return 1;
        }
        const auto auth = client.Authenticate();
        if (!WC_CHECK(auth.ok() && client.has_token())) {
            return 1;
        }
        const auto requests = store->requests();
        if (!WC_CHECK(requests.size() == 2 && requests[0].path == "/api/v1/health" && requests[1].path == "/api/v1/auth")) {
            return 1;
        }
        if (!WC_CHECK(requests[1].method == HttpMethod::Post && requests[1].body_size > 0 &&
                   HeaderOf(requests[1], "Content-Type") == "application/json")) {
            return 1;
        }
    }

    {
        const std::string derived = TransferClient::DeriveDeviceId();
        if (!WC_CHECK(derived.size() == 16 && derived.find_first_not_of("0123456789abcdef") == std::string::npos)) {
            return 1;
        }
        if (!WC_CHECK(TransferClient::DeriveDeviceId() == derived)) {
            return 1;
        }
    }

    {
        // Upload authenticates on demand and uses one request below the chunk size.
        auto store = std::make_shared<FakeRemoteStore>();
        store->set_file_id_count(2);
        TransferClient client(store, TestOptions());
        const auto data = RandomBytes(4000, 31U);
        const auto upload = client.Upload(data);
        if (!WC_CHECK(upload.ok() && upload.archive_id == "arc-1")) {
            return 1;
        }
        if (!WC_CHECK(upload.file_ids.size() == 2 && upload.file_ids[1] == "arc-1-f1")) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests("/api/v1/auth") == 1 && store->CountRequests(upload_path) == 1)) {
            return 1;
        }
        const auto requests = store->requests();
        if (!WC_CHECK(HeaderOf(requests.back(), "Authorization") == "Bearer token-1" &&
                   HeaderOf(requests.back(), "X-Chunk-Index").empty())) {
            return 1;
        }
        if (!WC_CHECK(store->ArchiveBytes("arc-1") == data)) {
            return 1;
        }

        const auto download = client.Download("arc-1");
        if (!WC_CHECK(download.ok() && download.data == data)) {
            return 1;
        }
        const auto removed = client.Delete("arc-1");
        if (!WC_CHECK(removed.ok() && !store->HasArchive("arc-1"))) {
            return 1;
        }
        const auto gone = client.Download("arc-1");
        if (!WC_CHECK(gone.status == WcStatus::ServerRejected && !gone.message.empty())) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests("/api/v1/archives/arc-1/download") == 2)) {
            return 1;
        }
        if (!WC_CHECK(client.Delete("arc-1").status == WcStatus::ServerRejected)) {
            return 1;
        }
    }

    {
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions(1024));
        const auto data = RandomBytes(3000, 32U);
        const auto upload = client.Upload(data);
        if (!WC_CHECK(upload.ok() && store->ArchiveBytes(upload.archive_id) == data)) {
            return 1;
        }

        std::vector<RecordedRequest> chunks;
        for (const auto& request : store->requests()) {
            if (request.path == upload_path) {
                chunks.push_back(request);
            }
        }
        if (!WC_CHECK(chunks.size() == 3)) {
            return 1;
        }
        const std::vector<std::size_t> sizes = {1024, 1024, 952};
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            if (!WC_CHECK(HeaderOf(chunks[i], "X-Chunk-Index") == std::to_string(i))) {
                return 1;
            }
            if (!WC_CHECK(HeaderOf(chunks[i], "X-Total-Size") == "3000")) {
                return 1;
            }
            if (!WC_CHECK(chunks[i].body_size == sizes[i] &&
                       HeaderOf(chunks[i], "X-Chunk-Size") == std::to_string(sizes[i]))) {
                return 1;
            }
            const std::string upload_id = HeaderOf(chunks[i], "X-Upload-Id");
            if (!WC_CHECK(i == 0 ? upload_id.empty() : upload_id == "up-1")) {
                return 1;
            }
        }
        const auto requests = store->requests();
        if (!WC_CHECK(requests.back().path == upload_path + "/finalize/up-1")) {
            return 1;
        }
    }

    {
        // A payload of exactly one chunk still goes through the chunked protocol.
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions(1024));
        const auto upload = client.Upload(RandomBytes(1024, 33U));
        if (!WC_CHECK(upload.ok() && store->CountRequests(upload_path + "/finalize/") == 1)) {
            return 1;
        }
    }

    {
        auto store = std::make_shared<FakeRemoteStore>();
        store->set_omit_upload_id(true);
        TransferClient client(store, TestOptions(1024));
        const auto upload = client.Upload(RandomBytes(2048, 34U));
        if (!WC_CHECK(upload.status == WcStatus::ProtocolError)) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests(upload_path + "/finalize/") == 0)) {
            return 1;
        }
    }

    {
        // Transient statuses are retried until a success arrives.
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions());
        if (!WC_CHECK(client.Authenticate().ok())) {
            return 1;
        }
        store->FailNextWithStatus(503, 2);
        const auto upload = client.Upload(RandomBytes(100, 35U));
        if (!WC_CHECK(upload.ok() && store->CountRequests(upload_path) == 3)) {
            return 1;
        }

        store->FailNextWithStatus(503, 4);
        const auto exhausted = client.Upload(RandomBytes(100, 36U));
        if (!WC_CHECK(exhausted.status == WcStatus::ServerUnavailable && !exhausted.message.empty())) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests(upload_path) == 3 + 4)) {
            return 1;
        }
        if (!WC_CHECK(wincloud::CategoryOf(exhausted.status) == wincloud::ErrorCategory::TransientNetwork)) {
            return 1;
        }
    }

    {
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions());
        store->FailNextWithTransport(WcStatus::NetworkUnavailable, 2);
        if (!WC_CHECK(client.Health() && store->CountRequests("/api/v1/health") == 3)) {
            return 1;
        }
        store->FailNextWithTransport(WcStatus::NetworkUnavailable, 4);
        if (!WC_CHECK(!client.Health())) {
            return 1;
        }
    }

    {
        auto store = std::make_shared<FakeRemoteStore>();
        TransferClient client(store, TestOptions());
        if (!WC_CHECK(client.Authenticate().ok())) {
            return 1;
        }
        const auto stored = client.Upload(RandomBytes(64, 37U));
        if (!WC_CHECK(stored.ok())) {
            return 1;
        }

        // Rejected credentials are not retried and drop the token.
        store->FailNextWithStatus(401);
        const auto rejected = client.Download(stored.archive_id);
        if (!WC_CHECK(rejected.status == WcStatus::AuthRejected && !client.has_token())) {
            return 1;
        }
        const std::string download_path = "/api/v1/archives/" + stored.archive_id + "/download";
        if (!WC_CHECK(store->CountRequests(download_path) == 1)) {
            return 1;
        }

        // The next call authenticates again.
        const auto retried = client.Download(stored.archive_id);
        if (!WC_CHECK(retried.ok() && client.has_token() && store->CountRequests("/api/v1/auth") == 2)) {
            return 1;
        }

        store->FailNextWithStatus(400);
        if (!WC_CHECK(client.Download(stored.archive_id).status == WcStatus::ServerRejected)) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests(download_path) == 3)) {
            return 1;
        }

        // A timed out GET is retried, a timed out POST is not.
        store->FailNextWithTransport(WcStatus::NetworkTimeout);
        if (!WC_CHECK(client.Download(stored.archive_id).ok() && store->CountRequests(download_path) == 5)) {
            return 1;
        }
        const std::size_t uploads_before = store->CountRequests(upload_path);
        store->FailNextWithTransport(WcStatus::NetworkTimeout);
        const auto timed_out = client.Upload(RandomBytes(64, 38U));
        if (!WC_CHECK(timed_out.status == WcStatus::NetworkTimeout)) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests(upload_path) == uploads_before + 1)) {
            return 1;
        }

        store->FailNextWithTransport(WcStatus::TransportError);
        if (!WC_CHECK(client.Delete(stored.archive_id).status == WcStatus::TransportError)) {
            return 1;
        }
        if (!WC_CHECK(store->HasArchive(stored.archive_id))) {
            return 1;
        }
    }

    {
        // Retry counts past the cap are clamped, so the attempt count stays bounded.
        auto store = std::make_shared<FakeRemoteStore>();
        TransferOptions options = TestOptions();
        options.max_retries = 70;
        TransferClient client(store, options);
        store->FailNextWithStatus(503, wincloud::kMaxRetries + 1);
        if (!WC_CHECK(!client.Health())) {
            return 1;
        }
        if (!WC_CHECK(store->CountRequests("/api/v1/health") == static_cast<std::size_t>(wincloud::kMaxRetries) + 1)) {
            return 1;
        }
        if (!WC_CHECK(client.Health())) {
            return 1;
        }
    }

    {
        TransferClient client(nullptr, TestOptions());
        if (!WC_CHECK(!client.Health())) {
            return 1;
        }
        if (!WC_CHECK(client.Authenticate().status == WcStatus::TransportError)) {
            return 1;
        }
    }

    return 0;
}
