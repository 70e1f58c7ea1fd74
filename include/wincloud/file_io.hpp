#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "wincloud/wc_status.hpp"

namespace wincloud {

using Bytes = std::vector<std::uint8_t>;

std::filesystem::path PathFromUtf8(const std::string& value);
std::string Utf8FromPath(const std::filesystem::path& value);

WcStatus ReadFileBytes(const std::string& path, Bytes& out_bytes);

// Writes through a sibling temporary file that is renamed over |path|, so a
// failed write never leaves a truncated file behind. Parent directories are
// created as needed. With |owner_only| the temporary file is restricted to
// owner read/write before any data reaches it (no-op on Windows).
WcStatus WriteFileBytesAtomic(
    const std::string& path,
    const std::uint8_t* data,
    std::size_t size,
    bool owner_only = false);

inline WcStatus WriteFileBytesAtomic(const std::string& path, const Bytes& bytes, const bool owner_only = false) {
    return WriteFileBytesAtomic(path, bytes.empty() ? nullptr : bytes.data(), bytes.size(), owner_only);
}

// True for a single path component without separators, drive prefixes or dot
// segments.
bool IsPlainFileName(std::string_view name);

void AppendLittle32(Bytes& out, std::uint32_t value);
bool ReadLittle32(const std::uint8_t* data, std::size_t size, std::size_t& pos, std::uint32_t& value);

std::string ToHex(const std::uint8_t* data, std::size_t size);

inline std::string ToHex(const Bytes& data) {
    return ToHex(data.empty() ? nullptr : data.data(), data.size());
}

WcStatus ParseHex(std::string_view hex, Bytes& out_bytes);

void SecureWipeBytes(Bytes& bytes);

template <std::size_t N>
void SecureWipeArray(std::array<std::uint8_t, N>& bytes) {
    volatile std::uint8_t* ptr = bytes.data();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        ptr[i] = 0U;
    }
}

}  // namespace wincloud
