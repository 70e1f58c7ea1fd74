#include "wincloud/crypto_manager.hpp"

#include <algorithm>
#include <utility>

#include "cryptopp/aes.h"
#include "cryptopp/gcm.h"
#include "cryptopp/misc.h"
#include "cryptopp/osrng.h"
#include "cryptopp/pwdbased.h"
#include "cryptopp/sha.h"
#include "wincloud/file_io.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "CryptoManager";

void WipeVector(std::vector<std::uint8_t>& bytes) {
    if (!bytes.empty()) {
        CryptoPP::memset_z(bytes.data(), 0, bytes.size());
    }
    bytes.clear();
}

}  // namespace

CryptoManager::CryptoManager(std::shared_ptr<IKeyProvider> key_provider)
    : key_provider_(std::move(key_provider)) {}

CryptoManager::~CryptoManager() {
    SecureWipeArray(key_);
}

WcStatus CryptoManager::EnsureKey() {
    if (key_loaded_) {
        return WcStatus::Ok;
    }
    if (!key_provider_) {
        return WcStatus::KeyUnavailable;
    }
    const WcStatus status = key_provider_->LoadKey(key_);
    if (status != WcStatus::Ok) {
        SecureWipeArray(key_);
        return status;
    }
    key_loaded_ = true;
    LogDebug(kComponent, "Key loaded from " + std::string(key_provider_->Name()) + " provider");
    return WcStatus::Ok;
}

WcStatus CryptoManager::Encrypt(const std::vector<std::uint8_t>& plaintext, std::vector<std::uint8_t>& out_blob) {
    const WcStatus key_status = EnsureKey();
    if (key_status != WcStatus::Ok) {
        return key_status;
    }
    return EncryptWithKey(key_, plaintext, out_blob);
}

WcStatus CryptoManager::Decrypt(const std::vector<std::uint8_t>& blob, std::vector<std::uint8_t>& out_plaintext) {
    const WcStatus key_status = EnsureKey();
    if (key_status != WcStatus::Ok) {
        return key_status;
    }
    return DecryptWithKey(key_, blob, out_plaintext);
}

WcStatus CryptoManager::EncryptWithKey(
    const KeyBytes& key,
    const std::vector<std::uint8_t>& plaintext,
    std::vector<std::uint8_t>& out_blob) {
    std::array<std::uint8_t, kNonceSize> nonce{};
    std::vector<std::uint8_t> blob(kEnvelopeOverhead + plaintext.size());
    try {
        CryptoPP::AutoSeededRandomPool rng;
        rng.GenerateBlock(nonce.data(), nonce.size());

        CryptoPP::GCM<CryptoPP::AES>::Encryption enc;
        enc.SetKeyWithIV(key.data(), key.size(), nonce.data(), nonce.size());
        enc.EncryptAndAuthenticate(
            plaintext.empty() ? nullptr : blob.data() + kEnvelopeOverhead,
            blob.data() + kNonceSize,
            kTagSize,
            nonce.data(),
            static_cast<int>(nonce.size()),
            nullptr,
            0,
            plaintext.empty() ? nullptr : plaintext.data(),
            plaintext.size());
    } catch (const CryptoPP::Exception& ex) {
        WipeVector(blob);
        LogError(kComponent, std::string("Encryption failed: ") + ex.what());
        return WcStatus::CryptoError;
    }

    std::copy(nonce.begin(), nonce.end(), blob.begin());
    out_blob = std::move(blob);
    return WcStatus::Ok;
}

WcStatus CryptoManager::DecryptWithKey(
    const KeyBytes& key,
    const std::vector<std::uint8_t>& blob,
    std::vector<std::uint8_t>& out_plaintext) {
    out_plaintext.clear();
    if (blob.size() < kEnvelopeOverhead) {
        return WcStatus::CiphertextTooShort;
    }

    const std::uint8_t* nonce = blob.data();
    const std::uint8_t* tag = blob.data() + kNonceSize;
    const std::uint8_t* ciphertext = blob.data() + kEnvelopeOverhead;
    const std::size_t ciphertext_size = blob.size() - kEnvelopeOverhead;

    std::vector<std::uint8_t> plaintext(ciphertext_size);
    bool auth_ok = false;
    try {
        CryptoPP::GCM<CryptoPP::AES>::Decryption dec;
        dec.SetKeyWithIV(key.data(), key.size(), nonce, kNonceSize);
        auth_ok = dec.DecryptAndVerify(
            plaintext.empty() ? nullptr : plaintext.data(),
            tag,
            kTagSize,
            nonce,
            static_cast<int>(kNonceSize),
            nullptr,
            0,
            ciphertext_size == 0 ? nullptr : ciphertext,
            ciphertext_size);
    } catch (const CryptoPP::Exception& ex) {
        WipeVector(plaintext);
        LogError(kComponent, std::string("Decryption failed: ") + ex.what());
        return WcStatus::CryptoError;
    }

    if (!auth_ok) {
        WipeVector(plaintext);
        LogError(kComponent, "Authentication tag mismatch; cloud data corrupted or tampered");
        return WcStatus::AuthenticationFailed;
    }
    out_plaintext = std::move(plaintext);
    return WcStatus::Ok;
}

WcStatus CryptoManager::DeriveKeyFromPassword(
    const std::string_view password,
    const std::vector<std::uint8_t>& salt,
    DerivedKey& out_key) {
    if (password.empty()) {
        return WcStatus::InvalidArgument;
    }

    DerivedKey derived;
    derived.salt = salt;
    try {
        if (derived.salt.empty()) {
            derived.salt.resize(kSaltSize);
            CryptoPP::AutoSeededRandomPool rng;
            rng.GenerateBlock(derived.salt.data(), derived.salt.size());
        }

        CryptoPP::PKCS5_PBKDF2_HMAC<CryptoPP::SHA256> pbkdf;
        pbkdf.DeriveKey(
            derived.key.data(),
            derived.key.size(),
            0,
            reinterpret_cast<const CryptoPP::byte*>(password.data()),
            password.size(),
            derived.salt.data(),
            derived.salt.size(),
            kPbkdf2Iterations);
    } catch (const CryptoPP::Exception& ex) {
        SecureWipeArray(derived.key);
        LogError(kComponent, std::string("Key derivation failed: ") + ex.what());
        return WcStatus::CryptoError;
    }

    out_key = std::move(derived);
    SecureWipeArray(derived.key);
    return WcStatus::Ok;
}

std::string CryptoManager::HashHex(const std::uint8_t* data, const std::size_t size) {
    std::array<std::uint8_t, CryptoPP::SHA256::DIGESTSIZE> digest{};
    CryptoPP::SHA256 hash;
    hash.CalculateDigest(digest.data(), size == 0 ? nullptr : data, size);
    return ToHex(digest.data(), digest.size());
}

std::string CryptoManager::HashHex(const std::vector<std::uint8_t>& data) {
    return HashHex(data.empty() ? nullptr : data.data(), data.size());
}

}  // namespace wincloud
