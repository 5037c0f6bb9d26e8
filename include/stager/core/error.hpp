#pragma once

#include <optional>
#include <string>

namespace stager {

enum class ErrorKind {
    InvalidResourceSpec,   ///< Local source missing, unreadable or malformed entry
    InvalidConfiguration,  ///< Non-positive buffer size, missing destination, bad config file
    FingerprintFailed,     ///< Digest engine could not produce a fingerprint
    ProbeFailed,           ///< Existence check could not be answered definitively
    UploadFailed,          ///< Write to the destination did not complete
    StoreError,            ///< Raw failure reported by an object store implementation
    PartialBatchFailure    ///< Batch-level failure wrapping the first per-resource error
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidResourceSpec: return "InvalidResourceSpec";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::FingerprintFailed: return "FingerprintFailed";
        case ErrorKind::ProbeFailed: return "ProbeFailed";
        case ErrorKind::UploadFailed: return "UploadFailed";
        case ErrorKind::StoreError: return "StoreError";
        case ErrorKind::PartialBatchFailure: return "PartialBatchFailure";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::StoreError;
    std::string message;
    std::optional<ErrorKind> cause; ///< Set on batch failures to the kind of the first resource error

    Error() = default;
    Error(ErrorKind k, std::string msg, std::optional<ErrorKind> c = std::nullopt)
        : kind(k), message(std::move(msg)), cause(c) {}

    [[nodiscard]] std::string describe() const {
        std::string text = std::string(to_string(kind)) + ": " + message;
        if (cause) {
            text += " (cause: ";
            text += to_string(*cause);
            text += ")";
        }
        return text;
    }
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

} // namespace stager
