#include "chunkshare/metadata/repository.h"

namespace chunkshare::metadata {

const char* ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::kInit:
            return "init";
        case SessionStatus::kUploading:
            return "uploading";
        case SessionStatus::kFinalizing:
            return "finalizing";
        case SessionStatus::kCompleted:
            return "completed";
        case SessionStatus::kFailed:
            return "failed";
        case SessionStatus::kExpired:
            return "expired";
    }
    return "failed";
}

const char* ToString(FileStatus status) {
    switch (status) {
        case FileStatus::kPending:
            return "pending";
        case FileStatus::kReady:
            return "ready";
        case FileStatus::kError:
            return "error";
    }
    return "error";
}

std::optional<SessionStatus> ParseSessionStatus(const std::string& value) {
    for (auto status : {SessionStatus::kInit, SessionStatus::kUploading,
                        SessionStatus::kFinalizing, SessionStatus::kCompleted,
                        SessionStatus::kFailed, SessionStatus::kExpired}) {
        if (value == ToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<FileStatus> ParseFileStatus(const std::string& value) {
    for (auto status : {FileStatus::kPending, FileStatus::kReady, FileStatus::kError}) {
        if (value == ToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool IsTerminal(SessionStatus status) {
    return status == SessionStatus::kCompleted || status == SessionStatus::kFailed ||
           status == SessionStatus::kExpired;
}

bool CanTransition(SessionStatus from, SessionStatus to) {
    if (IsTerminal(from)) {
        return false;
    }
    switch (from) {
        case SessionStatus::kInit:
            return to == SessionStatus::kUploading || to == SessionStatus::kExpired;
        case SessionStatus::kUploading:
            return to == SessionStatus::kFinalizing || to == SessionStatus::kFailed ||
                   to == SessionStatus::kExpired;
        case SessionStatus::kFinalizing:
            // FINALIZING -> FINALIZING is a retried finalize request.
            return to == SessionStatus::kFinalizing || to == SessionStatus::kCompleted ||
                   to == SessionStatus::kFailed || to == SessionStatus::kExpired;
        default:
            return false;
    }
}

}  // namespace chunkshare::metadata
