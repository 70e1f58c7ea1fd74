#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wincloud/archive_manifest.hpp"
#include "wincloud/wc_status.hpp"

namespace wincloud {

// Layout: magic(8) || metadata length N (u32 LE) || manifest JSON(N) || local payload.
class ArchiveCodec {
public:
    static constexpr std::array<char, 8> kMagic = {'W', 'C', 'L', 'O', 'U', 'D', '1', '0'};
    static constexpr std::size_t kMagicSize = kMagic.size();
    static constexpr std::size_t kHeaderSize = kMagicSize + sizeof(std::uint32_t);

    static WcStatus Encode(
        const ArchiveManifest& manifest,
        const std::vector<std::uint8_t>& local_payload,
        std::vector<std::uint8_t>& out_bytes);

    static WcStatus Decode(
        const std::vector<std::uint8_t>& bytes,
        ArchiveManifest& out_manifest,
        std::vector<std::uint8_t>& out_local_payload);

    static WcStatus WriteArchiveFile(
        const std::string& path,
        const ArchiveManifest& manifest,
        const std::vector<std::uint8_t>& local_payload,
        std::size_t& out_bytes_written);

    static WcStatus ReadArchiveFile(
        const std::string& path,
        ArchiveManifest& out_manifest,
        std::vector<std::uint8_t>& out_local_payload);

    // Reads the header and manifest only; the payload is skipped.
    static WcStatus ReadManifest(const std::string& path, ArchiveManifest& out_manifest);

private:
    // |total_size| is the whole artifact's length; the declared metadata must
    // fit inside it.
    static WcStatus ParseHeader(
        const std::uint8_t* data,
        std::size_t available,
        std::uint64_t total_size,
        std::uint32_t& out_metadata_size);
    static WcStatus ParseMetadata(
        const std::uint8_t* data,
        std::size_t size,
        ArchiveManifest& out_manifest);
};

}  // namespace wincloud
