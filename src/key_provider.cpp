#include "wincloud/key_provider.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include "cryptopp/osrng.h"
#include "wincloud/file_io.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "KeyProvider";

}  // namespace

FileKeyProvider::FileKeyProvider(std::string key_path) : key_path_(std::move(key_path)) {
    if (key_path_.empty()) {
        key_path_ = DefaultKeyPath();
    }
}

std::string FileKeyProvider::DefaultKeyPath() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    std::filesystem::path base = (home != nullptr && *home != '\0') ? PathFromUtf8(home) : std::filesystem::path(".");
    return Utf8FromPath(base / ".wincloud" / ".key");
}

WcStatus FileKeyProvider::LoadKey(KeyBytes& out_key) {
    const std::filesystem::path path = PathFromUtf8(key_path_);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        Bytes stored;
        const WcStatus read_status = ReadFileBytes(key_path_, stored);
        if (read_status != WcStatus::Ok) {
            LogError(kComponent, "Cannot read key file: " + key_path_);
            return WcStatus::KeyUnavailable;
        }
        if (stored.size() != out_key.size()) {
            SecureWipeBytes(stored);
            LogError(kComponent, "Key file has unexpected length: " + key_path_);
            return WcStatus::InvalidKeyLength;
        }
        std::copy(stored.begin(), stored.end(), out_key.begin());
        SecureWipeBytes(stored);
        return WcStatus::Ok;
    }

    KeyBytes generated{};
    try {
        CryptoPP::AutoSeededRandomPool rng;
        rng.GenerateBlock(generated.data(), generated.size());
    } catch (const CryptoPP::Exception& ex) {
        LogError(kComponent, std::string("Key generation failed: ") + ex.what());
        return WcStatus::KeyUnavailable;
    }

    const WcStatus write_status =
        WriteFileBytesAtomic(key_path_, generated.data(), generated.size(), /*owner_only=*/true);
    if (write_status != WcStatus::Ok) {
        SecureWipeArray(generated);
        LogError(kComponent, "Cannot persist key file: " + key_path_);
        return WcStatus::KeyUnavailable;
    }
    LogInfo(kComponent, "Generated new key at " + key_path_);
    out_key = generated;
    SecureWipeArray(generated);
    return WcStatus::Ok;
}

StaticKeyProvider::~StaticKeyProvider() {
    SecureWipeArray(key_);
}

WcStatus StaticKeyProvider::LoadKey(KeyBytes& out_key) {
    out_key = key_;
    return WcStatus::Ok;
}

}  // namespace wincloud
