#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr int kDefaultCompressionLevel = 6;
constexpr std::uint32_t kLzmaPreset = 9;

struct CompressorOptions {
    // zlib level for the first stage, 1..9.
    int level = kDefaultCompressionLevel;
    // xz preset for the second stage, 0..9.
    std::uint32_t lzma_preset = kLzmaPreset;
};

struct CompressedData {
    std::vector<std::uint8_t> bytes;
    std::uint64_t original_size = 0;
    std::string checksum;
};

// Stage A: zlib deflate at a tunable level. Stage B: xz/LZMA2 on stage A's
// output. Decompression undoes B, then A.
class Compressor {
public:
    static constexpr const char* kPipelineId = "zlib+lzma2";

    explicit Compressor(const CompressorOptions& options = {});

    WcStatus Compress(const std::vector<std::uint8_t>& input, CompressedData& out_data) const;

    // Fails with ChecksumMismatch when the restored bytes do not hash to
    // |expected_checksum|.
    WcStatus Decompress(
        const std::vector<std::uint8_t>& input,
        const std::string& expected_checksum,
        std::vector<std::uint8_t>& out_bytes) const;

    const CompressorOptions& options() const {
        return options_;
    }

private:
    static WcStatus DeflateStage(const std::vector<std::uint8_t>& input, int level, std::vector<std::uint8_t>& out);
    static WcStatus InflateStage(const std::vector<std::uint8_t>& input, std::vector<std::uint8_t>& out);
    static WcStatus XzEncodeStage(
        const std::vector<std::uint8_t>& input,
        std::uint32_t preset,
        std::vector<std::uint8_t>& out);
    static WcStatus XzDecodeStage(const std::vector<std::uint8_t>& input, std::vector<std::uint8_t>& out);

    CompressorOptions options_;
};

}  // namespace wincloud
