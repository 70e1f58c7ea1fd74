#pragma once

#include <string_view>

namespace wincloud {

enum class WcStatus {
    Ok = 0,
    InvalidArgument,
    InvalidPercentage,
    InvalidCompressionLevel,
    InvalidKeyLength,
    InvalidPath,
    FileIOError,
    KeyUnavailable,
    BadMagic,
    TruncatedMetadata,
    MetadataOutOfBounds,
    BadJson,
    InvalidManifest,
    CorruptInput,
    CiphertextTooShort,
    NoCloudData,
    ChecksumMismatch,
    AuthenticationFailed,
    CompressionError,
    CryptoError,
    NetworkUnavailable,
    NetworkTimeout,
    ServerUnavailable,
    TransportError,
    AuthRejected,
    ServerRejected,
    ProtocolError,
    Cancelled,
    Busy
};

// Coarse grouping used by callers that only care about how to react.
enum class ErrorCategory {
    None = 0,
    Validation,
    Format,
    Integrity,
    TransientNetwork,
    PermanentServer,
    Cancelled,
    Io,
    Internal
};

inline std::string_view ToString(const WcStatus status) {
    switch (status) {
        case WcStatus::Ok:
            return "Ok";
        case WcStatus::InvalidArgument:
            return "InvalidArgument";
        case WcStatus::InvalidPercentage:
            return "InvalidPercentage";
        case WcStatus::InvalidCompressionLevel:
            return "InvalidCompressionLevel";
        case WcStatus::InvalidKeyLength:
            return "InvalidKeyLength";
        case WcStatus::InvalidPath:
            return "InvalidPath";
        case WcStatus::FileIOError:
            return "FileIOError";
        case WcStatus::KeyUnavailable:
            return "KeyUnavailable";
        case WcStatus::BadMagic:
            return "BadMagic";
        case WcStatus::TruncatedMetadata:
            return "TruncatedMetadata";
        case WcStatus::MetadataOutOfBounds:
            return "MetadataOutOfBounds";
        case WcStatus::BadJson:
            return "BadJson";
        case WcStatus::InvalidManifest:
            return "InvalidManifest";
        case WcStatus::CorruptInput:
            return "CorruptInput";
        case WcStatus::CiphertextTooShort:
            return "CiphertextTooShort";
        case WcStatus::NoCloudData:
            return "NoCloudData";
        case WcStatus::ChecksumMismatch:
            return "ChecksumMismatch";
        case WcStatus::AuthenticationFailed:
            return "AuthenticationFailed";
        case WcStatus::CompressionError:
            return "CompressionError";
        case WcStatus::CryptoError:
            return "CryptoError";
        case WcStatus::NetworkUnavailable:
            return "NetworkUnavailable";
        case WcStatus::NetworkTimeout:
            return "NetworkTimeout";
        case WcStatus::ServerUnavailable:
            return "ServerUnavailable";
        case WcStatus::TransportError:
            return "TransportError";
        case WcStatus::AuthRejected:
            return "AuthRejected";
        case WcStatus::ServerRejected:
            return "ServerRejected";
        case WcStatus::ProtocolError:
            return "ProtocolError";
        case WcStatus::Cancelled:
            return "Cancelled";
        case WcStatus::Busy:
            return "Busy";
    }
    return "UnknownStatus";
}

inline ErrorCategory CategoryOf(const WcStatus status) {
    switch (status) {
        case WcStatus::Ok:
            return ErrorCategory::None;
        case WcStatus::InvalidArgument:
        case WcStatus::InvalidPercentage:
        case WcStatus::InvalidCompressionLevel:
        case WcStatus::InvalidKeyLength:
        case WcStatus::InvalidPath:
        case WcStatus::Busy:
            return ErrorCategory::Validation;
        case WcStatus::BadMagic:
        case WcStatus::TruncatedMetadata:
        case WcStatus::MetadataOutOfBounds:
        case WcStatus::BadJson:
        case WcStatus::InvalidManifest:
        case WcStatus::CorruptInput:
        case WcStatus::CiphertextTooShort:
        case WcStatus::NoCloudData:
            return ErrorCategory::Format;
        case WcStatus::ChecksumMismatch:
        case WcStatus::AuthenticationFailed:
            return ErrorCategory::Integrity;
        case WcStatus::NetworkUnavailable:
        case WcStatus::NetworkTimeout:
        case WcStatus::ServerUnavailable:
            return ErrorCategory::TransientNetwork;
        case WcStatus::AuthRejected:
        case WcStatus::ServerRejected:
        case WcStatus::ProtocolError:
            return ErrorCategory::PermanentServer;
        case WcStatus::Cancelled:
            return ErrorCategory::Cancelled;
        case WcStatus::FileIOError:
        case WcStatus::KeyUnavailable:
            return ErrorCategory::Io;
        case WcStatus::CompressionError:
        case WcStatus::CryptoError:
        case WcStatus::TransportError:
            return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

inline std::string_view ToString(const ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:
            return "None";
        case ErrorCategory::Validation:
            return "ValidationError";
        case ErrorCategory::Format:
            return "FormatError";
        case ErrorCategory::Integrity:
            return "IntegrityError";
        case ErrorCategory::TransientNetwork:
            return "TransientNetworkError";
        case ErrorCategory::PermanentServer:
            return "PermanentServerError";
        case ErrorCategory::Cancelled:
            return "CancelledOperation";
        case ErrorCategory::Io:
            return "IoError";
        case ErrorCategory::Internal:
            return "InternalError";
    }
    return "UnknownCategory";
}

}  // namespace wincloud
