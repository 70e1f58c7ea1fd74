#include "wincloud/archive_engine.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include "wincloud/archive_codec.hpp"
#include "wincloud/file_io.hpp"
#include "wincloud/file_splitter.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "ArchiveEngine";

constexpr int kCompressSpan = 80;
constexpr int kUploadPercent = 80;
constexpr int kWritePercent = 95;
constexpr int kDownloadPercent = 10;
constexpr int kReassembleStart = 20;
constexpr int kReassembleSpan = 70;

double NowSeconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::uint64_t RegularFileSize(const std::string& path) {
    std::error_code ec;
    const std::filesystem::path p = PathFromUtf8(path);
    if (!std::filesystem::is_regular_file(p, ec) || ec) {
        return 0;
    }
    const auto size = std::filesystem::file_size(p, ec);
    return ec ? 0U : static_cast<std::uint64_t>(size);
}

std::string BaseName(const std::string& path) {
    return Utf8FromPath(PathFromUtf8(path).filename());
}

std::string DefaultOutputDir(const std::string& archive_path) {
    const std::filesystem::path parent = PathFromUtf8(archive_path).parent_path();
    return parent.empty() ? std::string(".") : Utf8FromPath(parent);
}

template <typename Result>
std::future<Result> ReadyFuture(Result result) {
    std::promise<Result> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

std::vector<std::uint8_t> Slice(const std::vector<std::uint8_t>& data, const std::uint64_t offset, const std::uint64_t size) {
    const auto begin = data.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(size));
}

}  // namespace

EngineOptions EngineOptions::FromConfig(const ClientConfig& config) {
    EngineOptions options;
    options.compression_level = config.compression_level;
    options.local_percentage = config.local_percentage;
    return options;
}

ArchiveEngine::ArchiveEngine(
    std::shared_ptr<CryptoManager> crypto,
    std::shared_ptr<TransferClient> transfer,
    EngineOptions options)
    : crypto_(std::move(crypto)), transfer_(std::move(transfer)), options_(std::move(options)) {
    worker_ = std::thread([this] { WorkerLoop(); });
}

ArchiveEngine::~ArchiveEngine() {
    cancel_.Cancel();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::future<CreateResult> ArchiveEngine::StartCreate(std::vector<std::string> input_paths, std::string archive_path) {
    if (!TryBegin()) {
        CreateResult busy;
        busy.status = WcStatus::Busy;
        busy.message = "another operation is in progress";
        return ReadyFuture(std::move(busy));
    }

    auto promise = std::make_shared<std::promise<CreateResult>>();
    std::future<CreateResult> future = promise->get_future();
    Post([this, promise, inputs = std::move(input_paths), path = std::move(archive_path)] {
        CreateResult result = RunCreate(inputs, path);
        Finish();
        promise->set_value(std::move(result));
    });
    return future;
}

std::future<ExtractResult> ArchiveEngine::StartExtract(std::string archive_path, std::string output_dir) {
    if (!TryBegin()) {
        ExtractResult busy;
        busy.status = WcStatus::Busy;
        busy.message = "another operation is in progress";
        return ReadyFuture(std::move(busy));
    }

    auto promise = std::make_shared<std::promise<ExtractResult>>();
    std::future<ExtractResult> future = promise->get_future();
    Post([this, promise, path = std::move(archive_path), out_dir = std::move(output_dir)] {
        ExtractResult result = RunExtract(path, out_dir);
        Finish();
        promise->set_value(std::move(result));
    });
    return future;
}

void ArchiveEngine::Cancel() {
    cancel_.Cancel();
    LogInfo(kComponent, "Operation cancelled by user");
}

bool ArchiveEngine::TryBegin() {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        return false;
    }
    progress_.Reset();
    cancel_.Reset();
    return true;
}

// Runs on the worker before the caller's future becomes ready, so a caller
// that has waited may start the next operation right away.
void ArchiveEngine::Finish() {
    progress_.Close();
    busy_.store(false);
}

void ArchiveEngine::Post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void ArchiveEngine::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

void ArchiveEngine::Emit(const ProgressStage stage, const int percent, std::string message) {
    ProgressEvent event;
    event.stage = stage;
    event.percent = percent;
    event.message = std::move(message);
    progress_.Publish(std::move(event));
}

CreateResult ArchiveEngine::RunCreate(const std::vector<std::string>& input_paths, const std::string& archive_path) {
    CreateResult result;
    result.archive_path = archive_path;

    if (input_paths.empty() || archive_path.empty()) {
        result.status = WcStatus::InvalidArgument;
        result.message = "nothing to archive";
        return result;
    }
    if (options_.local_percentage < 0 || options_.local_percentage > 100) {
        result.status = WcStatus::InvalidPercentage;
        result.message = "local percentage must be within 0..100";
        return result;
    }
    if (options_.compression_level < 1 || options_.compression_level > 9 || options_.lzma_preset > 9) {
        result.status = WcStatus::InvalidCompressionLevel;
        result.message = "compression level must be within 1..9";
        return result;
    }
    const Compressor compressor(CompressorOptions{options_.compression_level, options_.lzma_preset});

    LogInfo(kComponent, "Creating archive: " + archive_path);
    LogInfo(kComponent, "Files to compress: " + std::to_string(input_paths.size()));

    std::uint64_t planned_size = 0;
    for (const auto& path : input_paths) {
        planned_size += RegularFileSize(path);
    }

    ArchiveManifest& manifest = result.manifest;
    manifest.created = NowSeconds();
    manifest.compression = Compressor::kPipelineId;

    std::vector<std::uint8_t> local_payload;
    std::vector<std::uint8_t> cloud_payload;
    std::uint64_t processed = 0;

    for (std::size_t i = 0; i < input_paths.size(); ++i) {
        if (cancel_.IsCancelled()) {
            result.status = WcStatus::Cancelled;
            result.message = "operation cancelled";
            return result;
        }

        const std::string& path = input_paths[i];
        const std::string name = BaseName(path);
        const int percent = planned_size == 0 ? 0 : static_cast<int>(processed * kCompressSpan / planned_size);
        Emit(
            ProgressStage::Compressing,
            percent,
            "Compressing: " + name + " (" + std::to_string(i + 1) + "/" + std::to_string(input_paths.size()) + ")");

        std::vector<std::uint8_t> original;
        WcStatus status = ReadFileBytes(path, original);
        if (status != WcStatus::Ok) {
            LogWarning(kComponent, "Skipping unreadable file " + path + ": " + std::string(ToString(status)));
            result.skipped.push_back(path);
            continue;
        }

        CompressedData compressed;
        status = compressor.Compress(original, compressed);
        if (status != WcStatus::Ok) {
            LogError(kComponent, "Failed to compress " + path + ": " + std::string(ToString(status)));
            result.skipped.push_back(path);
            continue;
        }

        SplitResult split;
        status = FileSplitter::Split(compressed.bytes, options_.local_percentage, split);
        if (status != WcStatus::Ok) {
            LogError(kComponent, "Failed to split " + path + ": " + std::string(ToString(status)));
            result.skipped.push_back(path);
            continue;
        }

        FileRecord record;
        record.name = name;
        record.path = path;
        record.size = compressed.original_size;
        record.compressed_size = static_cast<std::uint64_t>(compressed.bytes.size());
        record.local_offset = static_cast<std::uint64_t>(local_payload.size());
        record.local_size = static_cast<std::uint64_t>(split.local_size);
        record.cloud_offset = static_cast<std::uint64_t>(cloud_payload.size());
        record.cloud_size = static_cast<std::uint64_t>(split.cloud_size);
        record.checksum = compressed.checksum;

        local_payload.insert(local_payload.end(), split.local_part.begin(), split.local_part.end());
        cloud_payload.insert(cloud_payload.end(), split.cloud_part.begin(), split.cloud_part.end());
        manifest.files.push_back(std::move(record));
        manifest.total_size += compressed.original_size;
        processed += compressed.original_size;
        LogDebug(
            kComponent,
            name + ": " + std::to_string(compressed.original_size) + " -> " + std::to_string(compressed.bytes.size()) +
                " bytes");
    }

    if (manifest.files.empty()) {
        result.status = WcStatus::FileIOError;
        result.message = "none of the input files could be archived";
        LogError(kComponent, result.message);
        return result;
    }

    Emit(ProgressStage::Uploading, kUploadPercent, "Uploading to cloud server...");
    std::vector<std::uint8_t> cloud_blob;
    std::optional<std::string> salt_hex;
    const WcStatus encrypt_status = EncryptCloudPayload(cloud_payload, cloud_blob, salt_hex);
    SecureWipeBytes(cloud_payload);
    if (encrypt_status != WcStatus::Ok) {
        result.status = encrypt_status;
        result.message = "could not encrypt cloud data: " + std::string(ToString(encrypt_status));
        LogError(kComponent, result.message);
        return result;
    }

    UploadResult upload;
    if (transfer_) {
        upload = transfer_->Upload(cloud_blob);
    } else {
        upload.status = WcStatus::NetworkUnavailable;
        upload.message = "no remote store configured";
    }

    if (upload.ok()) {
        manifest.cloud_archive_id = upload.archive_id;
        manifest.kdf_salt = salt_hex;
        const bool ids_match = upload.file_ids.size() == manifest.files.size();
        if (!ids_match) {
            LogDebug(kComponent, "Server returned " + std::to_string(upload.file_ids.size()) + " file ids for " +
                                     std::to_string(manifest.files.size()) + " files");
        }
        for (std::size_t i = 0; i < manifest.files.size(); ++i) {
            manifest.files[i].cloud_id = ids_match ? upload.file_ids[i] : upload.archive_id + "#" + std::to_string(i);
        }
        LogInfo(kComponent, "Cloud data uploaded successfully: " + upload.archive_id);
    } else {
        LogWarning(kComponent, "Cloud upload failed, archive will be local-only: " + upload.message);
        manifest.cloud_archive_id.reset();
        manifest.cloud_error = upload.message.empty() ? std::string(ToString(upload.status)) : upload.message;
    }

    Emit(ProgressStage::Writing, kWritePercent, "Writing archive file...");
    std::size_t written = 0;
    const WcStatus write_status = ArchiveCodec::WriteArchiveFile(archive_path, manifest, local_payload, written);
    if (write_status != WcStatus::Ok) {
        result.status = write_status;
        result.message = "could not write archive " + archive_path;
        return result;
    }
    LogInfo(kComponent, "Archive file written: " + archive_path);

    result.archive_size = static_cast<std::uint64_t>(written);
    if (manifest.total_size > 0) {
        result.compression_ratio =
            (1.0 - static_cast<double>(result.archive_size) / static_cast<double>(manifest.total_size)) * 100.0;
    }
    result.message = result.uploaded() ? "archive created" : "archive created without cloud part";
    Emit(ProgressStage::Done, 100, "Archive created successfully!");
    LogInfo(
        kComponent,
        "Original size: " + std::to_string(manifest.total_size) + " bytes, archive size: " +
            std::to_string(result.archive_size) + " bytes");
    return result;
}

ExtractResult ArchiveEngine::RunExtract(const std::string& archive_path, const std::string& output_dir) {
    ExtractResult result;
    result.output_dir = output_dir.empty() ? DefaultOutputDir(archive_path) : output_dir;
    LogInfo(kComponent, "Extracting archive: " + archive_path);

    ArchiveManifest manifest;
    std::vector<std::uint8_t> local_payload;
    WcStatus status = ArchiveCodec::ReadArchiveFile(archive_path, manifest, local_payload);
    if (status != WcStatus::Ok) {
        result.status = status;
        result.message = "invalid archive file: " + std::string(ToString(status));
        LogError(kComponent, result.message);
        return result;
    }

    if (!manifest.cloud_archive_id.has_value() || manifest.cloud_archive_id->empty()) {
        result.status = WcStatus::NoCloudData;
        result.message = "no cloud data available";
        LogError(kComponent, result.message);
        return result;
    }

    Emit(ProgressStage::Downloading, kDownloadPercent, "Downloading from cloud...");
    DownloadResult download;
    if (transfer_) {
        download = transfer_->Download(*manifest.cloud_archive_id);
    } else {
        download.status = WcStatus::NetworkUnavailable;
        download.message = "no remote store configured";
    }
    if (!download.ok()) {
        result.status = download.status;
        result.message = "cloud download failed: " + download.message;
        return result;
    }

    std::vector<std::uint8_t> cloud_payload;
    status = DecryptCloudPayload(manifest, download.data, cloud_payload, result.message);
    if (status != WcStatus::Ok) {
        result.status = status;
        LogError(kComponent, result.message);
        return result;
    }
    if (cloud_payload.size() < manifest.CloudPayloadSize()) {
        result.status = WcStatus::MetadataOutOfBounds;
        result.message = "cloud data is shorter than the manifest declares";
        LogError(kComponent, result.message);
        return result;
    }

    const std::size_t total_files = manifest.files.size();
    for (std::size_t i = 0; i < total_files; ++i) {
        if (cancel_.IsCancelled()) {
            result.status = WcStatus::Cancelled;
            result.message = "operation cancelled";
            return result;
        }

        const FileRecord& record = manifest.files[i];
        Emit(
            ProgressStage::Reassembling,
            kReassembleStart + static_cast<int>(i * kReassembleSpan / total_files),
            "Extracting: " + record.name + " (" + std::to_string(i + 1) + "/" + std::to_string(total_files) + ")");

        if (!IsPlainFileName(record.name)) {
            result.status = WcStatus::InvalidPath;
            result.message = "refusing to extract entry with unsafe name: " + record.name;
            LogError(kComponent, result.message);
            return result;
        }

        const std::vector<std::uint8_t> merged = FileSplitter::Merge(
            Slice(local_payload, record.local_offset, record.local_size),
            Slice(cloud_payload, record.cloud_offset, record.cloud_size));

        const Compressor compressor;
        std::vector<std::uint8_t> original;
        status = compressor.Decompress(merged, record.checksum, original);
        if (status != WcStatus::Ok) {
            result.status = status;
            result.message = status == WcStatus::ChecksumMismatch ? "checksum mismatch for " + record.name
                                                                  : "cannot decompress " + record.name;
            LogError(kComponent, result.message);
            return result;
        }

        const std::string output_path = Utf8FromPath(PathFromUtf8(result.output_dir) / PathFromUtf8(record.name));
        status = WriteFileBytesAtomic(output_path, original);
        if (status != WcStatus::Ok) {
            result.status = status;
            result.message = "cannot write " + output_path;
            LogError(kComponent, result.message);
            return result;
        }
        result.extracted.push_back(output_path);
        LogInfo(kComponent, "Extracted: " + record.name);
    }

    result.message = "extracted " + std::to_string(total_files) + " file(s) to " + result.output_dir;
    Emit(ProgressStage::Done, 100, "Extraction completed!");
    return result;
}

WcStatus ArchiveEngine::EncryptCloudPayload(
    const std::vector<std::uint8_t>& plaintext,
    std::vector<std::uint8_t>& out_blob,
    std::optional<std::string>& out_salt_hex) {
    if (options_.password.empty()) {
        out_salt_hex.reset();
        if (!crypto_) {
            return WcStatus::KeyUnavailable;
        }
        return crypto_->Encrypt(plaintext, out_blob);
    }

    DerivedKey derived;
    WcStatus status = CryptoManager::DeriveKeyFromPassword(options_.password, {}, derived);
    if (status != WcStatus::Ok) {
        return status;
    }
    status = CryptoManager::EncryptWithKey(derived.key, plaintext, out_blob);
    SecureWipeArray(derived.key);
    if (status == WcStatus::Ok) {
        out_salt_hex = ToHex(derived.salt);
    }
    return status;
}

WcStatus ArchiveEngine::DecryptCloudPayload(
    const ArchiveManifest& manifest,
    const std::vector<std::uint8_t>& blob,
    std::vector<std::uint8_t>& out_plaintext,
    std::string& out_message) {
    WcStatus status = WcStatus::Ok;
    if (!manifest.kdf_salt.has_value()) {
        status = crypto_ ? crypto_->Decrypt(blob, out_plaintext) : WcStatus::KeyUnavailable;
    } else if (options_.password.empty()) {
        out_message = "archive is protected by a password";
        return WcStatus::KeyUnavailable;
    } else {
        std::vector<std::uint8_t> salt;
        status = ParseHex(*manifest.kdf_salt, salt);
        if (status != WcStatus::Ok || salt.empty()) {
            out_message = "archive has a malformed key salt";
            return WcStatus::InvalidManifest;
        }
        DerivedKey derived;
        status = CryptoManager::DeriveKeyFromPassword(options_.password, salt, derived);
        if (status == WcStatus::Ok) {
            status = CryptoManager::DecryptWithKey(derived.key, blob, out_plaintext);
        }
        SecureWipeArray(derived.key);
    }

    if (status != WcStatus::Ok) {
        out_message = "cannot decrypt cloud data: " + std::string(ToString(status));
    }
    return status;
}

}  // namespace wincloud
