#include "wincloud/client_config.hpp"

#include <string>

#include "test_support.hpp"
#include "wincloud/file_io.hpp"
#include "wincloud/log.hpp"

using wincloud::ClientConfig;
using wincloud::WcStatus;
using wincloud_test::TempDir;
using wincloud_test::TextBytes;

namespace {

std::string WriteConfig(const std::filesystem::path& dir, const std::string& name, const std::string& text) {
    const std::string path = wincloud::Utf8FromPath(dir / name);
    if (wincloud::WriteFileBytesAtomic(path, TextBytes(text)) != WcStatus::Ok) {
        return std::string();
    }
    return path;
}

}  // namespace

int main() {
    wincloud::SetLogLevel(wincloud::LogLevel::Off);
    const auto dir = TempDir("wincloud_client_config");

    {
        const ClientConfig config;
        if (!WC_CHECK(config.server_url == "https://localhost:8443" && config.api_version == "v1")) {
            return 1;
        }
        if (!WC_CHECK(config.compression_level == 6 && config.local_percentage == 10)) {
            return 1;
        }
        if (!WC_CHECK(config.timeout_seconds == 30 && config.max_retries == 3 && config.chunk_size == 5U * 1024U * 1024U)) {
            return 1;
        }
        if (!WC_CHECK(config.verify_tls && config.key_path.empty())) {
            return 1;
        }
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::Ok)) {
            return 1;
        }
        const std::string default_path = wincloud::DefaultConfigPath();
        if (!WC_CHECK(default_path.find("config.json") != std::string::npos &&
                   default_path.find(".wincloud") != std::string::npos)) {
            return 1;
        }
    }

    {
        const std::string path = WriteConfig(
            dir,
            "full.json",
            R"({
  "server_url": "https://backup.example:9443",
  "api_version": "v2",
  "compression_level": 9,
  "key_path": "/secure/wincloud.key",
  "split_ratio": {"local": 25, "cloud": 75},
  "network": {"timeout": 12, "max_retries": 5, "chunk_size": 1048576, "verify_tls": false},
  "unknown_section": {"ignored": true}
})");
        ClientConfig config;
        if (!WC_CHECK(wincloud::LoadClientConfig(path, false, config) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(config.server_url == "https://backup.example:9443" && config.api_version == "v2")) {
            return 1;
        }
        if (!WC_CHECK(config.compression_level == 9 && config.local_percentage == 25 &&
                   config.key_path == "/secure/wincloud.key")) {
            return 1;
        }
        if (!WC_CHECK(config.timeout_seconds == 12 && config.max_retries == 5 && config.chunk_size == 1048576U &&
                   !config.verify_tls)) {
            return 1;
        }
        // Keys the file does not mention keep their prior values.
        if (!WC_CHECK(config.health_timeout_seconds == 5 && config.backoff_base_ms == 1000)) {
            return 1;
        }
    }

    {
        const std::string path = WriteConfig(dir, "partial.json", R"({"split_ratio": {"local": 40}})");
        ClientConfig config;
        config.server_url = "https://override.example";
        if (!WC_CHECK(wincloud::LoadClientConfig(path, false, config) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(config.local_percentage == 40 && config.server_url == "https://override.example")) {
            return 1;
        }
    }

    {
        ClientConfig config;
        const std::string absent = wincloud::Utf8FromPath(dir / "absent.json");
        if (!WC_CHECK(wincloud::LoadClientConfig(absent, true, config) == WcStatus::Ok)) {
            return 1;
        }
        if (!WC_CHECK(config.local_percentage == 10)) {
            return 1;
        }
        if (!WC_CHECK(wincloud::LoadClientConfig(absent, false, config) == WcStatus::InvalidPath)) {
            return 1;
        }
    }

    {
        ClientConfig config;
        const std::string wrong_type = WriteConfig(dir, "wrong_type.json", R"({"compression_level": "high"})");
        if (!WC_CHECK(wincloud::LoadClientConfig(wrong_type, false, config) == WcStatus::BadJson)) {
            return 1;
        }
        const std::string wrong_section = WriteConfig(dir, "wrong_section.json", R"({"network": 5})");
        if (!WC_CHECK(wincloud::LoadClientConfig(wrong_section, false, config) == WcStatus::BadJson)) {
            return 1;
        }
        const std::string not_object = WriteConfig(dir, "array.json", "[1, 2]");
        if (!WC_CHECK(wincloud::LoadClientConfig(not_object, false, config) == WcStatus::BadJson)) {
            return 1;
        }
        const std::string broken = WriteConfig(dir, "broken.json", "{\"server_url\": ");
        if (!WC_CHECK(wincloud::LoadClientConfig(broken, false, config) == WcStatus::BadJson)) {
            return 1;
        }
        const std::string zero_chunk = WriteConfig(dir, "zero_chunk.json", R"({"network": {"chunk_size": 0}})");
        if (!WC_CHECK(wincloud::LoadClientConfig(zero_chunk, false, config) == WcStatus::BadJson)) {
            return 1;
        }
        const std::string percent = WriteConfig(dir, "percent.json", R"({"split_ratio": {"local": 150}})");
        if (!WC_CHECK(wincloud::LoadClientConfig(percent, false, config) == WcStatus::InvalidPercentage)) {
            return 1;
        }
        const std::string retries = WriteConfig(dir, "retries.json", R"({"network": {"max_retries": 70}})");
        if (!WC_CHECK(wincloud::LoadClientConfig(retries, false, config) == WcStatus::InvalidArgument)) {
            return 1;
        }
        const std::string level = WriteConfig(dir, "level.json", R"({"compression_level": 0})");
        if (!WC_CHECK(wincloud::LoadClientConfig(level, false, config) == WcStatus::InvalidCompressionLevel)) {
            return 1;
        }
        // Failed loads leave the config untouched.
        if (!WC_CHECK(config.local_percentage == 10 && config.compression_level == 6 && config.chunk_size > 0 &&
                      config.max_retries == 3)) {
            return 1;
        }
    }

    {
        ClientConfig config;
        config.max_retries = -1;
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::InvalidArgument)) {
            return 1;
        }
        config.max_retries = wincloud::kMaxRetries;
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::Ok)) {
            return 1;
        }
        config.max_retries = wincloud::kMaxRetries + 1;
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::InvalidArgument)) {
            return 1;
        }
        config = ClientConfig{};
        config.server_url.clear();
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::InvalidArgument)) {
            return 1;
        }
        config = ClientConfig{};
        config.local_percentage = -5;
        if (!WC_CHECK(wincloud::ValidateClientConfig(config) == WcStatus::InvalidPercentage)) {
            return 1;
        }
    }

    return 0;
}
