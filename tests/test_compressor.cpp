#include "wincloud/compressor.hpp"

#include <string>
#include <vector>

#include "test_support.hpp"
#include "wincloud/crypto_manager.hpp"

using wincloud::CompressedData;
using wincloud::Compressor;
using wincloud::CompressorOptions;
using wincloud::WcStatus;
using wincloud_test::RandomBytes;
using wincloud_test::TextBytes;

namespace {

// Preset 6 keeps the encoder's memory use modest; the container is identical.
CompressorOptions FastOptions(const int level = 6) {
    CompressorOptions options;
    options.level = level;
    options.lzma_preset = 6;
    return options;
}

bool RoundTrip(const Compressor& compressor, const std::vector<std::uint8_t>& input) {
    CompressedData compressed;
    if (compressor.Compress(input, compressed) != WcStatus::Ok) {
        return false;
    }
    if (compressed.original_size != input.size() || compressed.checksum != wincloud::CryptoManager::HashHex(input)) {
        return false;
    }
    std::vector<std::uint8_t> restored;
    if (compressor.Decompress(compressed.bytes, compressed.checksum, restored) != WcStatus::Ok) {
        return false;
    }
    return restored == input;
}

}  // namespace

int main() {
    {
        const Compressor compressor(FastOptions());
        if (!WC_CHECK(RoundTrip(compressor, {}))) {
            return 1;
        }
        if (!WC_CHECK(RoundTrip(compressor, TextBytes("a")))) {
            return 1;
        }
        if (!WC_CHECK(RoundTrip(compressor, RandomBytes(200000, 11U)))) {
            return 1;
        }
    }

    {
        std::string text;
        for (int i = 0; i < 5000; ++i) {
            text += "line " + std::to_string(i % 17) + " of a repetitive document\n";
        }
        const auto input = TextBytes(text);
        for (const int level : {1, 6, 9}) {
            const Compressor compressor(FastOptions(level));
            CompressedData compressed;
            if (!WC_CHECK(compressor.Compress(input, compressed) == WcStatus::Ok)) {
                return 1;
            }
            if (!WC_CHECK(compressed.bytes.size() < input.size() / 4)) {
                return 1;
            }
            if (!WC_CHECK(RoundTrip(compressor, input))) {
                return 1;
            }
        }
    }

    {
        // Default preset on a small input.
        const Compressor compressor;
        if (!WC_CHECK(compressor.options().lzma_preset == wincloud::kLzmaPreset)) {
            return 1;
        }
        if (!WC_CHECK(RoundTrip(compressor, TextBytes("default pipeline settings")))) {
            return 1;
        }
    }

    {
        const auto input = TextBytes("level check");
        CompressedData compressed;
        if (!WC_CHECK(Compressor(FastOptions(0)).Compress(input, compressed) == WcStatus::InvalidCompressionLevel)) {
            return 1;
        }
        if (!WC_CHECK(Compressor(FastOptions(10)).Compress(input, compressed) == WcStatus::InvalidCompressionLevel)) {
            return 1;
        }
    }

    {
        const Compressor compressor(FastOptions());
        const auto input = RandomBytes(4096, 12U);
        CompressedData compressed;
        if (!WC_CHECK(compressor.Compress(input, compressed) == WcStatus::Ok)) {
            return 1;
        }

        std::vector<std::uint8_t> restored;
        const std::string wrong(64, '0');
        if (!WC_CHECK(compressor.Decompress(compressed.bytes, wrong, restored) == WcStatus::ChecksumMismatch)) {
            return 1;
        }
        if (!WC_CHECK(restored.empty())) {
            return 1;
        }

        if (!WC_CHECK(compressor.Decompress(TextBytes("not an xz stream"), compressed.checksum, restored) ==
                   WcStatus::CorruptInput)) {
            return 1;
        }

        std::vector<std::uint8_t> truncated(compressed.bytes.begin(), compressed.bytes.end() - 10);
        if (!WC_CHECK(compressor.Decompress(truncated, compressed.checksum, restored) == WcStatus::CorruptInput)) {
            return 1;
        }

        std::vector<std::uint8_t> trailing = compressed.bytes;
        trailing.push_back(0x42U);
        if (!WC_CHECK(compressor.Decompress(trailing, compressed.checksum, restored) == WcStatus::CorruptInput)) {
            return 1;
        }
    }

    return 0;
}
