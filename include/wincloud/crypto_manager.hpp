#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "wincloud/key_provider.hpp"
#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kEnvelopeOverhead = kNonceSize + kTagSize;
constexpr std::size_t kSaltSize = 16;
constexpr unsigned int kPbkdf2Iterations = 100000;

struct DerivedKey {
    KeyBytes key{};
    std::vector<std::uint8_t> salt;
};

// AES-256-GCM envelope: nonce(12) || tag(16) || ciphertext.
class CryptoManager {
public:
    explicit CryptoManager(std::shared_ptr<IKeyProvider> key_provider);
    ~CryptoManager();

    CryptoManager(const CryptoManager&) = delete;
    CryptoManager& operator=(const CryptoManager&) = delete;

    // Loads the provider key once; later calls reuse it.
    WcStatus EnsureKey();

    WcStatus Encrypt(const std::vector<std::uint8_t>& plaintext, std::vector<std::uint8_t>& out_blob);
    WcStatus Decrypt(const std::vector<std::uint8_t>& blob, std::vector<std::uint8_t>& out_plaintext);

    static WcStatus EncryptWithKey(
        const KeyBytes& key,
        const std::vector<std::uint8_t>& plaintext,
        std::vector<std::uint8_t>& out_blob);

    static WcStatus DecryptWithKey(
        const KeyBytes& key,
        const std::vector<std::uint8_t>& blob,
        std::vector<std::uint8_t>& out_plaintext);

    // PBKDF2-HMAC-SHA256. An empty |salt| draws a fresh random one, which is
    // returned in |out_key.salt| and must be stored next to the ciphertext.
    static WcStatus DeriveKeyFromPassword(
        std::string_view password,
        const std::vector<std::uint8_t>& salt,
        DerivedKey& out_key);

    // Hex SHA-256; independent of any key.
    static std::string HashHex(const std::uint8_t* data, std::size_t size);
    static std::string HashHex(const std::vector<std::uint8_t>& data);

private:
    std::shared_ptr<IKeyProvider> key_provider_;
    KeyBytes key_{};
    bool key_loaded_ = false;
};

}  // namespace wincloud
