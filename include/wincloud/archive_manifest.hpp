#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "wincloud/compressor.hpp"
#include "wincloud/json_value.hpp"
#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr const char* kManifestVersion = "1.0";

struct FileRecord {
    std::string name;
    std::string path;
    std::uint64_t size = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t local_offset = 0;
    std::uint64_t local_size = 0;
    std::uint64_t cloud_offset = 0;
    std::uint64_t cloud_size = 0;
    std::string checksum;
    std::optional<std::string> cloud_id;
};

struct ArchiveManifest {
    std::string version = kManifestVersion;
    std::vector<FileRecord> files;
    double created = 0.0;
    std::uint64_t total_size = 0;
    std::string compression = Compressor::kPipelineId;
    std::optional<std::string> cloud_archive_id;
    std::optional<std::string> cloud_error;
    // Hex salt; present only when the cloud blob uses a password-derived key.
    std::optional<std::string> kdf_salt;

    std::uint64_t LocalPayloadSize() const;
    std::uint64_t CloudPayloadSize() const;
    std::uint64_t CompressedSize() const;
};

class ManifestJson {
public:
    static JsonValue ToJson(const ArchiveManifest& manifest);
    static WcStatus FromJson(const JsonValue& value, ArchiveManifest& out_manifest);

    // Record sizes must add up and the local and cloud slices must tile their
    // payloads without gaps. |local_payload_size| is checked when given.
    static WcStatus Validate(const ArchiveManifest& manifest, std::optional<std::uint64_t> local_payload_size);
};

}  // namespace wincloud
