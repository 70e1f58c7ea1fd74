#include "wincloud/file_io.hpp"

#include <fstream>
#include <system_error>

#include "cryptopp/osrng.h"

namespace wincloud {

namespace {

bool RandomSuffix(std::string& out_suffix) {
    std::array<std::uint8_t, 8> raw{};
    try {
        CryptoPP::AutoSeededRandomPool rng;
        rng.GenerateBlock(raw.data(), raw.size());
    } catch (const CryptoPP::Exception&) {
        return false;
    }
    out_suffix = ToHex(raw.data(), raw.size());
    return true;
}

}  // namespace

std::filesystem::path PathFromUtf8(const std::string& value) {
#ifdef _WIN32
    return std::filesystem::u8path(value);
#else
    return std::filesystem::path(value);
#endif
}

std::string Utf8FromPath(const std::filesystem::path& value) {
#ifdef _WIN32
    return value.generic_u8string();
#else
    return value.generic_string();
#endif
}

WcStatus ReadFileBytes(const std::string& path, Bytes& out_bytes) {
    out_bytes.clear();
    const std::filesystem::path p = PathFromUtf8(path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec) || ec) {
        return WcStatus::InvalidPath;
    }

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) {
        return WcStatus::FileIOError;
    }
    in.seekg(0, std::ios::end);
    const std::streamoff size_off = in.tellg();
    if (size_off < 0) {
        return WcStatus::FileIOError;
    }
    const auto size = static_cast<std::size_t>(size_off);
    in.seekg(0, std::ios::beg);
    out_bytes.resize(size);
    if (size > 0) {
        in.read(reinterpret_cast<char*>(out_bytes.data()), static_cast<std::streamsize>(size));
        if (static_cast<std::size_t>(in.gcount()) != size) {
            out_bytes.clear();
            return WcStatus::FileIOError;
        }
    }
    return WcStatus::Ok;
}

WcStatus WriteFileBytesAtomic(
    const std::string& path,
    const std::uint8_t* data,
    const std::size_t size,
    const bool owner_only) {
    std::error_code ec;
    const std::filesystem::path target = PathFromUtf8(path);
    const auto parent = target.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return WcStatus::FileIOError;
        }
    }

    std::string suffix;
    if (!RandomSuffix(suffix)) {
        return WcStatus::FileIOError;
    }
    std::filesystem::path temp = target;
    temp += ".part-" + suffix;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return WcStatus::FileIOError;
        }
#ifndef _WIN32
        if (owner_only) {
            std::filesystem::permissions(
                temp,
                std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                std::filesystem::perm_options::replace,
                ec);
            if (ec) {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                return WcStatus::FileIOError;
            }
        }
#else
        (void)owner_only;
#endif
        if (size > 0) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(temp, ec);
            return WcStatus::FileIOError;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return WcStatus::FileIOError;
    }
    return WcStatus::Ok;
}

bool IsPlainFileName(const std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        return false;
    }
    if (name.find(':') != std::string_view::npos) {
        return false;
    }
    for (const char ch : name) {
        if (static_cast<unsigned char>(ch) < 0x20U) {
            return false;
        }
    }
    return true;
}

void AppendLittle32(Bytes& out, const std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 16U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 24U) & 0xFFU));
}

bool ReadLittle32(const std::uint8_t* data, const std::size_t size, std::size_t& pos, std::uint32_t& value) {
    if (pos > size || size - pos < 4) {
        return false;
    }
    value = static_cast<std::uint32_t>(
        data[pos] |
        (static_cast<std::uint32_t>(data[pos + 1]) << 8U) |
        (static_cast<std::uint32_t>(data[pos + 2]) << 16U) |
        (static_cast<std::uint32_t>(data[pos + 3]) << 24U));
    pos += 4;
    return true;
}

std::string ToHex(const std::uint8_t* data, const std::size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2U);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHex[(data[i] >> 4U) & 0x0FU]);
        out.push_back(kHex[data[i] & 0x0FU]);
    }
    return out;
}

WcStatus ParseHex(const std::string_view hex, Bytes& out_bytes) {
    if ((hex.size() % 2U) != 0U) {
        return WcStatus::InvalidArgument;
    }

    auto nibble = [](const char ch) -> int {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'a' && ch <= 'f') {
            return 10 + (ch - 'a');
        }
        if (ch >= 'A' && ch <= 'F') {
            return 10 + (ch - 'A');
        }
        return -1;
    };

    out_bytes.clear();
    out_bytes.reserve(hex.size() / 2U);
    for (std::size_t i = 0; i < hex.size(); i += 2U) {
        const int high = nibble(hex[i]);
        const int low = nibble(hex[i + 1U]);
        if (high < 0 || low < 0) {
            SecureWipeBytes(out_bytes);
            return WcStatus::InvalidArgument;
        }
        out_bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return WcStatus::Ok;
}

void SecureWipeBytes(Bytes& bytes) {
    volatile std::uint8_t* ptr = bytes.data();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        ptr[i] = 0U;
    }
    bytes.clear();
}

}  // namespace wincloud
