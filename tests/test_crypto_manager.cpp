#include "wincloud/crypto_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "wincloud/file_io.hpp"
#include "wincloud/key_provider.hpp"
#include "wincloud/log.hpp"

using wincloud::CryptoManager;
using wincloud::DerivedKey;
using wincloud::FileKeyProvider;
using wincloud::KeyBytes;
using wincloud::StaticKeyProvider;
using wincloud::WcStatus;
using wincloud_test::RandomBytes;
using wincloud_test::TempDir;
using wincloud_test::TextBytes;

namespace {

KeyBytes FixedKey(const std::uint8_t seed) {
    KeyBytes key{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<std::uint8_t>(seed + i);
    }
    return key;
}

}  // namespace

int main() {
    wincloud::SetLogLevel(wincloud::LogLevel::Off);

    {
        CryptoManager crypto(std::make_shared<StaticKeyProvider>(FixedKey(1)));
        for (const std::size_t size : {std::size_t{0}, std::size_t{1}, std::size_t{1000}, std::size_t{70000}}) {
            const auto plain = RandomBytes(size, static_cast<std::uint32_t>(size) + 7U);
            std::vector<std::uint8_t> blob;
            if (!WC_CHECK(crypto.Encrypt(plain, blob) == WcStatus::Ok)) {
                return 1;
            }
            if (!WC_CHECK(blob.size() == plain.size() + wincloud::kEnvelopeOverhead)) {
                return 1;
            }
            std::vector<std::uint8_t> restored;
            if (!WC_CHECK(crypto.Decrypt(blob, restored) == WcStatus::Ok && restored == plain)) {
                return 1;
            }
        }
    }

    {
        // Fresh nonce on every call.
        CryptoManager crypto(std::make_shared<StaticKeyProvider>(FixedKey(2)));
        const auto plain = TextBytes("same plaintext");
        std::vector<std::uint8_t> a;
        std::vector<std::uint8_t> b;
        if (!WC_CHECK(crypto.Encrypt(plain, a) == WcStatus::Ok && crypto.Encrypt(plain, b) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(!std::equal(a.begin(), a.begin() + wincloud::kNonceSize, b.begin()))) {
            return 1;
        }
    }

    {
        CryptoManager crypto(std::make_shared<StaticKeyProvider>(FixedKey(3)));
        const auto plain = TextBytes("tamper evident payload");
        std::vector<std::uint8_t> blob;
        if (!WC_CHECK(crypto.Encrypt(plain, blob) == WcStatus::Ok)) {
            return 1;
        }
        for (std::size_t byte = 0; byte < blob.size(); ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                std::vector<std::uint8_t> tampered = blob;
                tampered[byte] ^= static_cast<std::uint8_t>(1U << bit);
                std::vector<std::uint8_t> restored;
                if (!WC_CHECK(crypto.Decrypt(tampered, restored) == WcStatus::AuthenticationFailed)) {
                    return 1;
                }
                if (!WC_CHECK(restored.empty())) {
                    return 1;
                }
            }
        }
    }

    {
        CryptoManager crypto(std::make_shared<StaticKeyProvider>(FixedKey(4)));
        std::vector<std::uint8_t> restored;
        const std::vector<std::uint8_t> short_blob(wincloud::kEnvelopeOverhead - 1, 0U);
        if (!WC_CHECK(crypto.Decrypt(short_blob, restored) == WcStatus::CiphertextTooShort)) {
            return 1;
        }

        std::vector<std::uint8_t> blob;
        if (!WC_CHECK(crypto.Encrypt(TextBytes("k"), blob) == WcStatus::Ok)) {
            return 1;
        }
        CryptoManager other(std::make_shared<StaticKeyProvider>(FixedKey(5)));
        if (!WC_CHECK(other.Decrypt(blob, restored) == WcStatus::AuthenticationFailed)) {
            return 1;
        }
    }

    {
        CryptoManager crypto(nullptr);
        std::vector<std::uint8_t> blob;
        if (!WC_CHECK(crypto.Encrypt(TextBytes("x"), blob) == WcStatus::KeyUnavailable)) {
            return 1;
        }
    }

    {
        DerivedKey first;
        if (!WC_CHECK(CryptoManager::DeriveKeyFromPassword("correct horse", {}, first) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(first.salt.size() == wincloud::kSaltSize)) {
            return 1;
        }
        DerivedKey again;
        if (!WC_CHECK(CryptoManager::DeriveKeyFromPassword("correct horse", first.salt, again) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(again.key == first.key && again.salt == first.salt)) {
            return 1;
        }
        DerivedKey other;
        if (!WC_CHECK(CryptoManager::DeriveKeyFromPassword("wrong horse", first.salt, other) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(other.key != first.key)) {
            return 1;
        }
        DerivedKey empty;
        if (!WC_CHECK(CryptoManager::DeriveKeyFromPassword("", {}, empty) == WcStatus::InvalidArgument)) {
            return 1;
        }

        std::vector<std::uint8_t> blob;
        std::vector<std::uint8_t> restored;
        if (!WC_CHECK(CryptoManager::EncryptWithKey(first.key, TextBytes("pw"), blob) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(CryptoManager::DecryptWithKey(again.key, blob, restored) == WcStatus::Ok && restored == TextBytes("pw"))) {
            return 1;
        }
        if (!WC_CHECK(CryptoManager::DecryptWithKey(other.key, blob, restored) == WcStatus::AuthenticationFailed)) {
            return 1;
        }
    }

    {
        if (!WC_CHECK(CryptoManager::HashHex(TextBytes("abc")) ==
                   "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad")) {
            return 1;
        }
        if (!WC_CHECK(CryptoManager::HashHex(std::vector<std::uint8_t>()) ==
                   "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855")) {
            return 1;
        }
    }

    {
        const auto dir = TempDir("wincloud_key_provider");
        const std::string key_path = wincloud::Utf8FromPath(dir / "nested" / ".key");
        FileKeyProvider provider(key_path);
        KeyBytes first{};
        if (!WC_CHECK(provider.LoadKey(first) == WcStatus::Ok)) {
            return 1;
        }
        std::error_code ec;
        if (!WC_CHECK(std::filesystem::file_size(dir / "nested" / ".key", ec) == wincloud::kKeyByteCount && !ec)) {
            return 1;
        }
#ifndef _WIN32
        const auto perms = std::filesystem::status(dir / "nested" / ".key", ec).permissions();
        if (!WC_CHECK((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
                   std::filesystem::perms::none)) {
            return 1;
        }
        const std::string secret_path = wincloud::Utf8FromPath(dir / "secret.bin");
        if (!WC_CHECK(wincloud::WriteFileBytesAtomic(secret_path, TextBytes("secret"), true) == WcStatus::Ok)) {
            return 1;
        }
        const auto secret_perms = std::filesystem::status(dir / "secret.bin", ec).permissions();
        if (!WC_CHECK(secret_perms == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write))) {
            return 1;
        }
#endif
        std::size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir / "nested", ec)) {
            (void)entry;
            ++entries;
        }
        if (!WC_CHECK(entries == 1)) {
            return 1;
        }
        KeyBytes second{};
        if (!WC_CHECK(FileKeyProvider(key_path).LoadKey(second) == WcStatus::Ok && second == first)) {
            return 1;
        }

        const std::string bad_path = wincloud::Utf8FromPath(dir / "short.key");
        {
            std::ofstream out(dir / "short.key", std::ios::binary);
            out << "too short";
        }
        KeyBytes bad{};
        if (!WC_CHECK(FileKeyProvider(bad_path).LoadKey(bad) == WcStatus::InvalidKeyLength)) {
            return 1;
        }
        if (!WC_CHECK(std::filesystem::file_size(dir / "short.key", ec) == 9)) {
            return 1;
        }
    }

    return 0;
}
