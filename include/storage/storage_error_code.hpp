#ifndef BLOBXFER_STORAGE_ERROR_CODE_HPP
#define BLOBXFER_STORAGE_ERROR_CODE_HPP

#include <optional>
#include <string>

namespace blobxfer::storage {

// Documented backend status codes. Backends may report codes outside this
// list, so raw codes travel as plain ints.
enum class StorageErrorCode : int {
    UNKNOWN = -13000,
    OBJECT_NOT_FOUND = -13010,
    BUCKET_NOT_FOUND = -13011,
    PROJECT_NOT_FOUND = -13012,
    QUOTA_EXCEEDED = -13013,
    UNAUTHENTICATED = -13020,
    UNAUTHORIZED = -13021,
    RETRY_LIMIT_EXCEEDED = -13030,
    NON_MATCHING_CHECKSUM = -13031,
    DOWNLOAD_SIZE_EXCEEDED = -13032,
    CANCELLED = -13040,
    INVALID_ARGUMENT = -13050
};

// Error reported by a backend. code is empty when the backend failed
// without giving one.
struct StorageError {
    std::optional<int> code;
    std::string message;

    static StorageError from_code(StorageErrorCode code, const std::string& message = "") {
        return StorageError{static_cast<int>(code), message};
    }
};

const char* storage_error_code_to_string(int code);

} // namespace blobxfer::storage

#endif // BLOBXFER_STORAGE_ERROR_CODE_HPP
