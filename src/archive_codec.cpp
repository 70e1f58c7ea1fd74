#include "wincloud/archive_codec.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <utility>

#include "wincloud/file_io.hpp"
#include "wincloud/json_value.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "ArchiveCodec";

bool ReadExact(std::ifstream& in, std::uint8_t* buf, const std::size_t n) {
    in.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
    return static_cast<std::size_t>(in.gcount()) == n;
}

}  // namespace

WcStatus ArchiveCodec::Encode(
    const ArchiveManifest& manifest,
    const std::vector<std::uint8_t>& local_payload,
    std::vector<std::uint8_t>& out_bytes) {
    const WcStatus valid = ManifestJson::Validate(manifest, static_cast<std::uint64_t>(local_payload.size()));
    if (valid != WcStatus::Ok) {
        LogError(kComponent, "refusing to encode inconsistent manifest: " + std::string(ToString(valid)));
        return valid;
    }

    const std::string metadata = Json::Serialize(ManifestJson::ToJson(manifest), 2);
    if (metadata.size() > std::numeric_limits<std::uint32_t>::max()) {
        return WcStatus::InvalidArgument;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(kHeaderSize + metadata.size() + local_payload.size());
    bytes.insert(bytes.end(), kMagic.begin(), kMagic.end());
    AppendLittle32(bytes, static_cast<std::uint32_t>(metadata.size()));
    bytes.insert(bytes.end(), metadata.begin(), metadata.end());
    bytes.insert(bytes.end(), local_payload.begin(), local_payload.end());
    out_bytes = std::move(bytes);
    return WcStatus::Ok;
}

WcStatus ArchiveCodec::Decode(
    const std::vector<std::uint8_t>& bytes,
    ArchiveManifest& out_manifest,
    std::vector<std::uint8_t>& out_local_payload) {
    std::uint32_t metadata_size = 0;
    WcStatus status = ParseHeader(bytes.data(), bytes.size(), bytes.size(), metadata_size);
    if (status != WcStatus::Ok) {
        return status;
    }

    ArchiveManifest manifest;
    status = ParseMetadata(bytes.data() + kHeaderSize, metadata_size, manifest);
    if (status != WcStatus::Ok) {
        return status;
    }

    const std::size_t payload_offset = kHeaderSize + metadata_size;
    status = ManifestJson::Validate(manifest, static_cast<std::uint64_t>(bytes.size() - payload_offset));
    if (status != WcStatus::Ok) {
        return status;
    }

    out_local_payload.assign(bytes.begin() + static_cast<std::ptrdiff_t>(payload_offset), bytes.end());
    out_manifest = std::move(manifest);
    return WcStatus::Ok;
}

WcStatus ArchiveCodec::WriteArchiveFile(
    const std::string& path,
    const ArchiveManifest& manifest,
    const std::vector<std::uint8_t>& local_payload,
    std::size_t& out_bytes_written) {
    std::vector<std::uint8_t> bytes;
    WcStatus status = Encode(manifest, local_payload, bytes);
    if (status != WcStatus::Ok) {
        return status;
    }
    status = WriteFileBytesAtomic(path, bytes);
    if (status != WcStatus::Ok) {
        LogError(kComponent, "could not write archive " + path);
        return status;
    }
    out_bytes_written = bytes.size();
    return WcStatus::Ok;
}

WcStatus ArchiveCodec::ReadArchiveFile(
    const std::string& path,
    ArchiveManifest& out_manifest,
    std::vector<std::uint8_t>& out_local_payload) {
    std::vector<std::uint8_t> bytes;
    const WcStatus status = ReadFileBytes(path, bytes);
    if (status != WcStatus::Ok) {
        return status;
    }
    return Decode(bytes, out_manifest, out_local_payload);
}

WcStatus ArchiveCodec::ReadManifest(const std::string& path, ArchiveManifest& out_manifest) {
    const std::filesystem::path input = PathFromUtf8(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input, ec) || ec) {
        return WcStatus::InvalidPath;
    }
    const auto file_size = std::filesystem::file_size(input, ec);
    if (ec) {
        return WcStatus::FileIOError;
    }

    std::ifstream in(input, std::ios::binary);
    if (!in) {
        return WcStatus::FileIOError;
    }

    std::array<std::uint8_t, kHeaderSize> header{};
    const std::size_t header_read = static_cast<std::size_t>(std::min<std::uintmax_t>(file_size, kHeaderSize));
    if (!ReadExact(in, header.data(), header_read)) {
        return WcStatus::FileIOError;
    }
    std::uint32_t metadata_size = 0;
    WcStatus status = ParseHeader(header.data(), header_read, static_cast<std::uint64_t>(file_size), metadata_size);
    if (status != WcStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> metadata(metadata_size);
    if (!ReadExact(in, metadata.data(), metadata.size())) {
        return WcStatus::FileIOError;
    }
    ArchiveManifest manifest;
    status = ParseMetadata(metadata.data(), metadata.size(), manifest);
    if (status != WcStatus::Ok) {
        return status;
    }
    status = ManifestJson::Validate(manifest, static_cast<std::uint64_t>(file_size) - kHeaderSize - metadata_size);
    if (status != WcStatus::Ok) {
        return status;
    }
    out_manifest = std::move(manifest);
    return WcStatus::Ok;
}

WcStatus ArchiveCodec::ParseHeader(
    const std::uint8_t* data,
    const std::size_t available,
    const std::uint64_t total_size,
    std::uint32_t& out_metadata_size) {
    if (available < kMagicSize) {
        return WcStatus::BadMagic;
    }
    if (std::memcmp(data, kMagic.data(), kMagicSize) != 0) {
        return WcStatus::BadMagic;
    }
    std::size_t pos = kMagicSize;
    std::uint32_t metadata_size = 0;
    if (!ReadLittle32(data, available, pos, metadata_size)) {
        return WcStatus::TruncatedMetadata;
    }
    if (static_cast<std::uint64_t>(metadata_size) > total_size - kHeaderSize) {
        LogWarning(
            kComponent,
            "declared metadata length " + std::to_string(metadata_size) + " exceeds file size " +
                std::to_string(total_size));
        return WcStatus::MetadataOutOfBounds;
    }
    out_metadata_size = metadata_size;
    return WcStatus::Ok;
}

WcStatus ArchiveCodec::ParseMetadata(const std::uint8_t* data, const std::size_t size, ArchiveManifest& out_manifest) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);
    JsonValue root;
    const WcStatus status = Json::Parse(text, root);
    if (status != WcStatus::Ok) {
        return status;
    }
    return ManifestJson::FromJson(root, out_manifest);
}

}  // namespace wincloud
