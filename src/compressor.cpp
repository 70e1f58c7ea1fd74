#include "wincloud/compressor.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

#include <lzma.h>
#include <zlib.h>

#include "wincloud/crypto_manager.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "Compressor";
constexpr std::size_t kChunkSize = 64U * 1024U;
constexpr std::size_t kMaxZlibFeed = std::numeric_limits<uInt>::max();

void AppendOutput(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& buffer, const std::size_t have) {
    out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(have));
}

}  // namespace

Compressor::Compressor(const CompressorOptions& options) : options_(options) {}

WcStatus Compressor::Compress(const std::vector<std::uint8_t>& input, CompressedData& out_data) const {
    if (options_.level < 1 || options_.level > 9 || options_.lzma_preset > 9) {
        return WcStatus::InvalidCompressionLevel;
    }

    CompressedData data;
    data.original_size = static_cast<std::uint64_t>(input.size());
    data.checksum = CryptoManager::HashHex(input);

    std::vector<std::uint8_t> stage_a;
    WcStatus status = DeflateStage(input, options_.level, stage_a);
    if (status != WcStatus::Ok) {
        return status;
    }
    status = XzEncodeStage(stage_a, options_.lzma_preset, data.bytes);
    if (status != WcStatus::Ok) {
        return status;
    }

    out_data = std::move(data);
    return WcStatus::Ok;
}

WcStatus Compressor::Decompress(
    const std::vector<std::uint8_t>& input,
    const std::string& expected_checksum,
    std::vector<std::uint8_t>& out_bytes) const {
    std::vector<std::uint8_t> stage_a;
    WcStatus status = XzDecodeStage(input, stage_a);
    if (status != WcStatus::Ok) {
        return status;
    }

    std::vector<std::uint8_t> restored;
    status = InflateStage(stage_a, restored);
    if (status != WcStatus::Ok) {
        return status;
    }

    if (CryptoManager::HashHex(restored) != expected_checksum) {
        return WcStatus::ChecksumMismatch;
    }
    out_bytes = std::move(restored);
    return WcStatus::Ok;
}

WcStatus Compressor::DeflateStage(const std::vector<std::uint8_t>& input, const int level, std::vector<std::uint8_t>& out) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    if (deflateInit(&stream, level) != Z_OK) {
        LogError(kComponent, "deflateInit failed");
        return WcStatus::CompressionError;
    }

    out.clear();
    out.reserve(static_cast<std::size_t>(deflateBound(&stream, static_cast<uLong>(std::min<std::size_t>(input.size(), kMaxZlibFeed)))));
    std::vector<std::uint8_t> buffer(kChunkSize);
    std::size_t offset = 0;
    int flush = Z_NO_FLUSH;
    do {
        const std::size_t n = std::min(kMaxZlibFeed, input.size() - offset);
        stream.next_in = n == 0 ? Z_NULL : const_cast<Bytef*>(input.data() + offset);
        stream.avail_in = static_cast<uInt>(n);
        offset += n;
        flush = offset == input.size() ? Z_FINISH : Z_NO_FLUSH;

        do {
            stream.next_out = buffer.data();
            stream.avail_out = static_cast<uInt>(buffer.size());
            const int ret = deflate(&stream, flush);
            if (ret == Z_STREAM_ERROR) {
                deflateEnd(&stream);
                LogError(kComponent, "deflate failed");
                return WcStatus::CompressionError;
            }
            AppendOutput(out, buffer, buffer.size() - stream.avail_out);
        } while (stream.avail_out == 0);
    } while (flush != Z_FINISH);

    deflateEnd(&stream);
    return WcStatus::Ok;
}

WcStatus Compressor::InflateStage(const std::vector<std::uint8_t>& input, std::vector<std::uint8_t>& out) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.next_in = Z_NULL;
    stream.avail_in = 0;
    if (inflateInit(&stream) != Z_OK) {
        LogError(kComponent, "inflateInit failed");
        return WcStatus::CompressionError;
    }

    out.clear();
    std::vector<std::uint8_t> buffer(kChunkSize);
    std::size_t offset = 0;
    while (true) {
        if (stream.avail_in == 0 && offset < input.size()) {
            const std::size_t n = std::min(kMaxZlibFeed, input.size() - offset);
            stream.next_in = const_cast<Bytef*>(input.data() + offset);
            stream.avail_in = static_cast<uInt>(n);
            offset += n;
        }

        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());
        const int ret = inflate(&stream, Z_NO_FLUSH);
        const std::size_t have = buffer.size() - stream.avail_out;
        AppendOutput(out, buffer, have);

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret == Z_OK) {
            continue;
        }
        if (ret == Z_BUF_ERROR && !(have == 0 && stream.avail_in == 0 && offset >= input.size())) {
            continue;
        }
        inflateEnd(&stream);
        out.clear();
        return WcStatus::CorruptInput;
    }

    const bool trailing = stream.avail_in != 0 || offset != input.size();
    inflateEnd(&stream);
    if (trailing) {
        out.clear();
        return WcStatus::CorruptInput;
    }
    return WcStatus::Ok;
}

WcStatus Compressor::XzEncodeStage(
    const std::vector<std::uint8_t>& input,
    const std::uint32_t preset,
    std::vector<std::uint8_t>& out) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_easy_encoder(&strm, preset, LZMA_CHECK_CRC64) != LZMA_OK) {
        LogError(kComponent, "lzma_easy_encoder failed");
        return WcStatus::CompressionError;
    }

    out.clear();
    std::vector<std::uint8_t> buffer(kChunkSize);
    strm.next_in = input.empty() ? nullptr : input.data();
    strm.avail_in = input.size();
    while (true) {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        const lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
        AppendOutput(out, buffer, buffer.size() - strm.avail_out);
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (ret != LZMA_OK) {
            lzma_end(&strm);
            out.clear();
            LogError(kComponent, "lzma encoder failed with code " + std::to_string(static_cast<int>(ret)));
            return WcStatus::CompressionError;
        }
    }

    lzma_end(&strm);
    return WcStatus::Ok;
}

WcStatus Compressor::XzDecodeStage(const std::vector<std::uint8_t>& input, std::vector<std::uint8_t>& out) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        LogError(kComponent, "lzma_stream_decoder failed");
        return WcStatus::CompressionError;
    }

    out.clear();
    std::vector<std::uint8_t> buffer(kChunkSize);
    strm.next_in = input.empty() ? nullptr : input.data();
    strm.avail_in = input.size();
    while (true) {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        const lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
        AppendOutput(out, buffer, buffer.size() - strm.avail_out);
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (ret != LZMA_OK) {
            lzma_end(&strm);
            out.clear();
            return ret == LZMA_MEM_ERROR ? WcStatus::CompressionError : WcStatus::CorruptInput;
        }
    }

    const bool trailing = strm.avail_in != 0;
    lzma_end(&strm);
    if (trailing) {
        out.clear();
        return WcStatus::CorruptInput;
    }
    return WcStatus::Ok;
}

}  // namespace wincloud
