#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "wincloud/archive_manifest.hpp"
#include "wincloud/client_config.hpp"
#include "wincloud/compressor.hpp"
#include "wincloud/crypto_manager.hpp"
#include "wincloud/progress.hpp"
#include "wincloud/transfer_client.hpp"
#include "wincloud/wc_status.hpp"

namespace wincloud {

struct EngineOptions {
    int compression_level = kDefaultCompressionLevel;
    std::uint32_t lzma_preset = kLzmaPreset;
    int local_percentage = 10;
    // Non-empty switches the cloud blob to a PBKDF2 key derived from it.
    std::string password;

    static EngineOptions FromConfig(const ClientConfig& config);
};

struct CreateResult {
    WcStatus status = WcStatus::Ok;
    std::string message;
    std::string archive_path;
    ArchiveManifest manifest;
    // Inputs left out of the archive because they could not be read or compressed.
    std::vector<std::string> skipped;
    std::uint64_t archive_size = 0;
    // Percent saved by the local artifact relative to the original bytes.
    double compression_ratio = 0.0;

    bool ok() const {
        return status == WcStatus::Ok;
    }

    bool uploaded() const {
        return manifest.cloud_archive_id.has_value();
    }
};

struct ExtractResult {
    WcStatus status = WcStatus::Ok;
    std::string message;
    std::string output_dir;
    std::vector<std::string> extracted;

    bool ok() const {
        return status == WcStatus::Ok;
    }
};

// Runs create and extract on a worker thread owned by the engine, one
// operation at a time. Progress is published to progress() and the channel
// is closed when the operation ends.
class ArchiveEngine {
public:
    ArchiveEngine(
        std::shared_ptr<CryptoManager> crypto,
        std::shared_ptr<TransferClient> transfer,
        EngineOptions options);
    ~ArchiveEngine();

    ArchiveEngine(const ArchiveEngine&) = delete;
    ArchiveEngine& operator=(const ArchiveEngine&) = delete;

    // Resolves at once with Busy while another operation is in flight.
    std::future<CreateResult> StartCreate(std::vector<std::string> input_paths, std::string archive_path);

    // An empty |output_dir| extracts next to the archive.
    std::future<ExtractResult> StartExtract(std::string archive_path, std::string output_dir);

    // Observed between files. A request made while idle applies to the next
    // operation.
    void Cancel();

    bool busy() const {
        return busy_.load();
    }

    ProgressChannel& progress() {
        return progress_;
    }

    const EngineOptions& options() const {
        return options_;
    }

private:
    CreateResult RunCreate(const std::vector<std::string>& input_paths, const std::string& archive_path);
    ExtractResult RunExtract(const std::string& archive_path, const std::string& output_dir);

    WcStatus EncryptCloudPayload(
        const std::vector<std::uint8_t>& plaintext,
        std::vector<std::uint8_t>& out_blob,
        std::optional<std::string>& out_salt_hex);
    WcStatus DecryptCloudPayload(
        const ArchiveManifest& manifest,
        const std::vector<std::uint8_t>& blob,
        std::vector<std::uint8_t>& out_plaintext,
        std::string& out_message);

    void Emit(ProgressStage stage, int percent, std::string message);

    bool TryBegin();
    void Finish();
    void Post(std::function<void()> task);
    void WorkerLoop();

    std::shared_ptr<CryptoManager> crypto_;
    std::shared_ptr<TransferClient> transfer_;
    EngineOptions options_;
    ProgressChannel progress_;
    CancellationToken cancel_;
    std::atomic<bool> busy_{false};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace wincloud
