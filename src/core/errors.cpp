#include "chunkshare/core/error.h"

namespace chunkshare::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kAlreadyExists:
            return "ALREADY_EXISTS";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::kForbidden:
            return "FORBIDDEN";
        case ErrorCode::kInternal:
            return "INTERNAL";
        case ErrorCode::kUnprocessable:
            return "UNPROCESSABLE";
        case ErrorCode::kQuotaExceeded:
            return "QUOTA_EXCEEDED";
        case ErrorCode::kInvalidIndex:
            return "INVALID_INDEX";
        case ErrorCode::kPayloadTooLarge:
            return "PAYLOAD_TOO_LARGE";
        case ErrorCode::kChecksumConflict:
            return "CHECKSUM_CONFLICT";
        case ErrorCode::kDigestMismatch:
            return "DIGEST_MISMATCH";
        case ErrorCode::kIncompleteUpload:
            return "INCOMPLETE_UPLOAD";
        case ErrorCode::kMissingChunk:
            return "MISSING_CHUNK";
        case ErrorCode::kInvalidState:
            return "INVALID_STATE";
        case ErrorCode::kFileNotReady:
            return "FILE_NOT_READY";
        case ErrorCode::kInvalidExpiry:
            return "INVALID_EXPIRY";
        case ErrorCode::kInvalidToken:
            return "INVALID_TOKEN";
        case ErrorCode::kLinkNotFound:
            return "LINK_NOT_FOUND";
        case ErrorCode::kLinkDisabled:
            return "LINK_DISABLED";
        case ErrorCode::kLinkExpired:
            return "LINK_EXPIRED";
        case ErrorCode::kLinkExhausted:
            return "LINK_EXHAUSTED";
        case ErrorCode::kPasswordRequired:
            return "PASSWORD_REQUIRED";
        case ErrorCode::kInvalidPassword:
            return "INVALID_PASSWORD";
    }
    return "INTERNAL";
}

}  // namespace chunkshare::core
