#include "wincloud/archive_manifest.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace wincloud {

namespace {

JsonValue UnsignedValue(const std::uint64_t value) {
    return JsonValue::MakeInt(static_cast<long long>(value));
}

JsonValue OptionalString(const std::optional<std::string>& value) {
    return value.has_value() ? JsonValue::MakeString(*value) : JsonValue::MakeNull();
}

bool ReadUnsigned(const JsonValue& object, const char* key, std::uint64_t& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr || field->type != JsonValue::Type::Number) {
        return false;
    }
    if (field->is_integer) {
        if (field->int_value < 0) {
            return false;
        }
        out_value = static_cast<std::uint64_t>(field->int_value);
        return true;
    }
    const double number = field->number_value;
    if (!std::isfinite(number) || number < 0.0 || std::floor(number) != number || number > 9.0e15) {
        return false;
    }
    out_value = static_cast<std::uint64_t>(number);
    return true;
}

bool ReadString(const JsonValue& object, const char* key, std::string& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr || field->type != JsonValue::Type::String) {
        return false;
    }
    out_value = field->string_value;
    return true;
}

// Absent and null both read as "no value".
bool ReadOptionalString(const JsonValue& object, const char* key, std::optional<std::string>& out_value) {
    const JsonValue* field = object.Find(key);
    if (field == nullptr || field->IsNull()) {
        out_value.reset();
        return true;
    }
    if (field->type != JsonValue::Type::String) {
        return false;
    }
    out_value = field->string_value;
    return true;
}

bool ReadRecord(const JsonValue& value, FileRecord& out_record) {
    if (value.type != JsonValue::Type::Object) {
        return false;
    }
    FileRecord record;
    if (!ReadString(value, "name", record.name) ||
        !ReadString(value, "path", record.path) ||
        !ReadUnsigned(value, "size", record.size) ||
        !ReadUnsigned(value, "compressed_size", record.compressed_size) ||
        !ReadUnsigned(value, "local_offset", record.local_offset) ||
        !ReadUnsigned(value, "local_size", record.local_size) ||
        !ReadUnsigned(value, "cloud_offset", record.cloud_offset) ||
        !ReadUnsigned(value, "cloud_size", record.cloud_size) ||
        !ReadString(value, "checksum", record.checksum) ||
        !ReadOptionalString(value, "cloud_id", record.cloud_id)) {
        return false;
    }
    out_record = std::move(record);
    return true;
}

}  // namespace

std::uint64_t ArchiveManifest::LocalPayloadSize() const {
    std::uint64_t total = 0;
    for (const auto& record : files) {
        total += record.local_size;
    }
    return total;
}

std::uint64_t ArchiveManifest::CloudPayloadSize() const {
    std::uint64_t total = 0;
    for (const auto& record : files) {
        total += record.cloud_size;
    }
    return total;
}

std::uint64_t ArchiveManifest::CompressedSize() const {
    return LocalPayloadSize() + CloudPayloadSize();
}

JsonValue ManifestJson::ToJson(const ArchiveManifest& manifest) {
    JsonValue root = JsonValue::MakeObject();
    root.Set("version", JsonValue::MakeString(manifest.version));

    JsonValue files = JsonValue::MakeArray();
    for (const auto& record : manifest.files) {
        JsonValue item = JsonValue::MakeObject();
        item.Set("name", JsonValue::MakeString(record.name));
        item.Set("path", JsonValue::MakeString(record.path));
        item.Set("size", UnsignedValue(record.size));
        item.Set("compressed_size", UnsignedValue(record.compressed_size));
        item.Set("local_offset", UnsignedValue(record.local_offset));
        item.Set("local_size", UnsignedValue(record.local_size));
        item.Set("cloud_offset", UnsignedValue(record.cloud_offset));
        item.Set("cloud_size", UnsignedValue(record.cloud_size));
        item.Set("checksum", JsonValue::MakeString(record.checksum));
        item.Set("cloud_id", OptionalString(record.cloud_id));
        files.Push(std::move(item));
    }
    root.Set("files", std::move(files));

    root.Set("created", JsonValue::MakeDouble(manifest.created));
    root.Set("total_size", UnsignedValue(manifest.total_size));
    root.Set("compression", JsonValue::MakeString(manifest.compression));
    root.Set("cloud_archive_id", OptionalString(manifest.cloud_archive_id));
    if (manifest.cloud_error.has_value()) {
        root.Set("cloud_error", JsonValue::MakeString(*manifest.cloud_error));
    }
    if (manifest.kdf_salt.has_value()) {
        root.Set("kdf_salt", JsonValue::MakeString(*manifest.kdf_salt));
    }
    return root;
}

WcStatus ManifestJson::FromJson(const JsonValue& value, ArchiveManifest& out_manifest) {
    if (value.type != JsonValue::Type::Object) {
        return WcStatus::InvalidManifest;
    }

    ArchiveManifest manifest;
    if (!ReadString(value, "version", manifest.version) || manifest.version != kManifestVersion) {
        return WcStatus::InvalidManifest;
    }

    const JsonValue* files = value.Find("files");
    if (files == nullptr || files->type != JsonValue::Type::Array) {
        return WcStatus::InvalidManifest;
    }
    manifest.files.reserve(files->array_value.size());
    for (const auto& item : files->array_value) {
        FileRecord record;
        if (!ReadRecord(item, record)) {
            return WcStatus::InvalidManifest;
        }
        manifest.files.push_back(std::move(record));
    }

    const JsonValue* created = value.Find("created");
    if (created == nullptr || created->type != JsonValue::Type::Number) {
        return WcStatus::InvalidManifest;
    }
    manifest.created = created->number_value;

    if (!ReadUnsigned(value, "total_size", manifest.total_size) ||
        !ReadString(value, "compression", manifest.compression) ||
        !ReadOptionalString(value, "cloud_archive_id", manifest.cloud_archive_id) ||
        !ReadOptionalString(value, "cloud_error", manifest.cloud_error) ||
        !ReadOptionalString(value, "kdf_salt", manifest.kdf_salt)) {
        return WcStatus::InvalidManifest;
    }
    // Payloads from any other pipeline cannot be decompressed here.
    if (manifest.compression != Compressor::kPipelineId) {
        return WcStatus::InvalidManifest;
    }

    out_manifest = std::move(manifest);
    return WcStatus::Ok;
}

WcStatus ManifestJson::Validate(const ArchiveManifest& manifest, const std::optional<std::uint64_t> local_payload_size) {
    std::uint64_t local_cursor = 0;
    std::uint64_t cloud_cursor = 0;
    for (const auto& record : manifest.files) {
        if (record.local_size > record.compressed_size ||
            record.local_size + record.cloud_size != record.compressed_size) {
            return WcStatus::InvalidManifest;
        }
        if (record.local_offset != local_cursor || record.cloud_offset != cloud_cursor) {
            return WcStatus::InvalidManifest;
        }
        local_cursor += record.local_size;
        cloud_cursor += record.cloud_size;
        if (local_payload_size.has_value() && local_cursor > *local_payload_size) {
            return WcStatus::MetadataOutOfBounds;
        }
    }
    if (local_payload_size.has_value() && local_cursor != *local_payload_size) {
        return WcStatus::InvalidManifest;
    }
    return WcStatus::Ok;
}

}  // namespace wincloud
