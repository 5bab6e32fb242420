#pragma once

#include <string>

namespace chunkshare::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kIoError,
    kDbError,
    kUnauthorized,
    kForbidden,
    kInternal,

    // Upload pipeline.
    kUnprocessable,
    kQuotaExceeded,
    kInvalidIndex,
    kPayloadTooLarge,
    kChecksumConflict,
    kDigestMismatch,
    kIncompleteUpload,
    kMissingChunk,
    kInvalidState,

    // Download links.
    kFileNotReady,
    kInvalidExpiry,
    kInvalidToken,
    kLinkNotFound,
    kLinkDisabled,
    kLinkExpired,
    kLinkExhausted,
    kPasswordRequired,
    kInvalidPassword,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-snake name used in the JSON error envelope (e.g. "LINK_EXPIRED").
const char* ErrorCodeName(ErrorCode code);

}  // namespace chunkshare::core
