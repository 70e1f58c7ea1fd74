#include "wincloud/client_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <system_error>

#include "wincloud/file_io.hpp"
#include "wincloud/json_value.hpp"
#include "wincloud/log.hpp"

namespace wincloud {

namespace {

constexpr std::string_view kComponent = "ClientConfig";

// Missing keys leave |out_value| as is; present keys of the wrong type fail.
bool ReadInt(const JsonValue& object, const char* key, int& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr) {
        return true;
    }
    if (field->type != JsonValue::Type::Number || !field->is_integer) {
        return false;
    }
    if (field->int_value < std::numeric_limits<int>::min() || field->int_value > std::numeric_limits<int>::max()) {
        return false;
    }
    out_value = static_cast<int>(field->int_value);
    return true;
}

bool ReadString(const JsonValue& object, const char* key, std::string& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr) {
        return true;
    }
    if (field->type != JsonValue::Type::String) {
        return false;
    }
    out_value = field->string_value;
    return true;
}

bool ReadBool(const JsonValue& object, const char* key, bool& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr) {
        return true;
    }
    if (field->type != JsonValue::Type::Bool) {
        return false;
    }
    out_value = field->bool_value;
    return true;
}

const JsonValue* FindObject(const JsonValue& object, const char* key, bool& ok) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr) {
        return nullptr;
    }
    if (field->type != JsonValue::Type::Object) {
        ok = false;
        return nullptr;
    }
    return field;
}

}  // namespace

std::string DefaultConfigPath() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    std::filesystem::path base = (home != nullptr && *home != '\0') ? PathFromUtf8(home) : std::filesystem::path(".");
    return Utf8FromPath(base / ".wincloud" / "config.json");
}

WcStatus LoadClientConfig(const std::string& path, const bool allow_missing, ClientConfig& in_out_config) {
    std::error_code ec;
    if (allow_missing && !std::filesystem::exists(PathFromUtf8(path), ec)) {
        LogDebug(kComponent, "No config file at " + path + ", using defaults");
        return WcStatus::Ok;
    }

    Bytes raw;
    WcStatus status = ReadFileBytes(path, raw);
    if (status != WcStatus::Ok) {
        LogError(kComponent, "Cannot read config file: " + path);
        return status;
    }
    JsonValue root;
    status = Json::Parse(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()), root);
    if (status != WcStatus::Ok || root.type != JsonValue::Type::Object) {
        LogError(kComponent, "Config file is not a JSON object: " + path);
        return WcStatus::BadJson;
    }

    ClientConfig config = in_out_config;
    bool ok = ReadString(root, "server_url", config.server_url) &&
              ReadString(root, "api_version", config.api_version) &&
              ReadInt(root, "compression_level", config.compression_level) &&
              ReadString(root, "key_path", config.key_path);

    const JsonValue* split_ratio = FindObject(root, "split_ratio", ok);
    if (ok && split_ratio != nullptr) {
        ok = ReadInt(*split_ratio, "local", config.local_percentage);
    }

    const JsonValue* network = FindObject(root, "network", ok);
    if (ok && network != nullptr) {
        int chunk_size = static_cast<int>(config.chunk_size);
        ok = ReadInt(*network, "timeout", config.timeout_seconds) &&
             ReadInt(*network, "max_retries", config.max_retries) &&
             ReadInt(*network, "chunk_size", chunk_size) &&
             ReadBool(*network, "verify_tls", config.verify_tls);
        if (ok && chunk_size <= 0) {
            ok = false;
        }
        config.chunk_size = static_cast<std::size_t>(chunk_size);
    }

    if (!ok) {
        LogError(kComponent, "Config file has a value of the wrong type: " + path);
        return WcStatus::BadJson;
    }
    status = ValidateClientConfig(config);
    if (status != WcStatus::Ok) {
        LogError(kComponent, "Config file has an out of range value: " + path);
        return status;
    }
    in_out_config = config;
    return WcStatus::Ok;
}

WcStatus ValidateClientConfig(const ClientConfig& config) {
    if (config.compression_level < 1 || config.compression_level > 9) {
        return WcStatus::InvalidCompressionLevel;
    }
    if (config.local_percentage < 0 || config.local_percentage > 100) {
        return WcStatus::InvalidPercentage;
    }
    if (config.server_url.empty() || config.api_version.empty()) {
        return WcStatus::InvalidArgument;
    }
    if (config.timeout_seconds <= 0 || config.health_timeout_seconds <= 0 || config.backoff_base_ms < 0 ||
        config.chunk_size == 0) {
        return WcStatus::InvalidArgument;
    }
    if (config.max_retries < 0 || config.max_retries > kMaxRetries) {
        return WcStatus::InvalidArgument;
    }
    return WcStatus::Ok;
}

}  // namespace wincloud
