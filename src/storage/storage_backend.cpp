#include "storage/storage_backend.hpp"

namespace blobxfer::storage {

const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::RESUME:   return "resume";
        case TaskStatus::PROGRESS: return "progress";
        case TaskStatus::PAUSE:    return "pause";
        case TaskStatus::SUCCESS:  return "success";
        case TaskStatus::FAILURE:  return "failure";
        default:                   return "undefined";
    }
}

const char* storage_error_code_to_string(int code) {
    switch (static_cast<StorageErrorCode>(code)) {
        case StorageErrorCode::UNKNOWN:                return "Unknown";
        case StorageErrorCode::OBJECT_NOT_FOUND:       return "Object not found";
        case StorageErrorCode::BUCKET_NOT_FOUND:       return "Bucket not found";
        case StorageErrorCode::PROJECT_NOT_FOUND:      return "Project not found";
        case StorageErrorCode::QUOTA_EXCEEDED:         return "Quota exceeded";
        case StorageErrorCode::UNAUTHENTICATED:        return "Unauthenticated";
        case StorageErrorCode::UNAUTHORIZED:           return "Unauthorized";
        case StorageErrorCode::RETRY_LIMIT_EXCEEDED:   return "Retry limit exceeded";
        case StorageErrorCode::NON_MATCHING_CHECKSUM:  return "Non-matching checksum";
        case StorageErrorCode::DOWNLOAD_SIZE_EXCEEDED: return "Download size exceeded";
        case StorageErrorCode::CANCELLED:              return "Cancelled";
        case StorageErrorCode::INVALID_ARGUMENT:       return "Invalid argument";
        default:                                       return "Undocumented code";
    }
}

} // namespace blobxfer::storage
