#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "wincloud/wc_status.hpp"

namespace wincloud {

constexpr std::size_t kKeyByteCount = 32;

using KeyBytes = std::array<std::uint8_t, kKeyByteCount>;

class IKeyProvider {
public:
    virtual ~IKeyProvider() = default;

    virtual WcStatus LoadKey(KeyBytes& out_key) = 0;
    virtual std::string_view Name() const = 0;
};

// Per-user persistent key. Generated with a CSPRNG on first use and stored
// owner-readable only; an existing file is never overwritten.
class FileKeyProvider final : public IKeyProvider {
public:
    explicit FileKeyProvider(std::string key_path);

    WcStatus LoadKey(KeyBytes& out_key) override;

    std::string_view Name() const override {
        return "file";
    }

    const std::string& key_path() const {
        return key_path_;
    }

    static std::string DefaultKeyPath();

private:
    std::string key_path_;
};

class StaticKeyProvider final : public IKeyProvider {
public:
    explicit StaticKeyProvider(const KeyBytes& key) : key_(key) {}
    ~StaticKeyProvider() override;

    WcStatus LoadKey(KeyBytes& out_key) override;

    std::string_view Name() const override {
        return "static";
    }

private:
    KeyBytes key_{};
};

}  // namespace wincloud
