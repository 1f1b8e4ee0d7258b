#include "transfer/transfer_error.hpp"

namespace blobxfer::transfer {

using storage::StorageErrorCode;

namespace {

std::string describe(TransferErrc kind, const std::string& detail) {
    std::string text = transfer_errc_to_string(kind);
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

} // namespace

TransferError::TransferError(TransferErrc kind, const std::string& detail)
    : std::runtime_error(describe(kind, detail))
    , kind_(kind)
    , detail_(detail) {}

const char* transfer_errc_to_string(TransferErrc kind) {
    switch (kind) {
        case TransferErrc::NOT_AUTHENTICATED:            return "Not authenticated";
        case TransferErrc::UNAUTHORIZED:                 return "Unauthorized";
        case TransferErrc::ITEM_NOT_FOUND:               return "Item not found";
        case TransferErrc::CANCELLED:                    return "Cancelled";
        case TransferErrc::NETWORK_UNAVAILABLE:          return "Network unavailable";
        case TransferErrc::SERVICE_UNAVAILABLE:          return "Service unavailable";
        case TransferErrc::DISK_IO:                      return "Disk I/O error";
        case TransferErrc::DECRYPTION_FAILURE:           return "Decryption failure";
        case TransferErrc::DEVELOPMENT_MISCONFIGURATION: return "Development misconfiguration";
        case TransferErrc::MISSING_DATA:                 return "No data";
        case TransferErrc::UNKNOWN:                      return "Unknown error";
        default:                                         return "Undefined error";
    }
}

std::ostream& operator<<(std::ostream& os, TransferErrc kind) {
    return os << transfer_errc_to_string(kind);
}

std::ostream& operator<<(std::ostream& os, const TransferError& error) {
    return os << error.what();
}


//==============================================
// BACKEND CODE MAPPING
//==============================================

TransferError upload_error_from_code(int code) {
    switch (static_cast<StorageErrorCode>(code)) {
        case StorageErrorCode::BUCKET_NOT_FOUND:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Bucket not configured");
        case StorageErrorCode::CANCELLED:
            return TransferError(TransferErrc::CANCELLED);
        case StorageErrorCode::INVALID_ARGUMENT:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Invalid argument");
        case StorageErrorCode::NON_MATCHING_CHECKSUM:
            return TransferError(TransferErrc::SERVICE_UNAVAILABLE);
        case StorageErrorCode::PROJECT_NOT_FOUND:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Project not configured");
        case StorageErrorCode::QUOTA_EXCEEDED:
            return TransferError(TransferErrc::SERVICE_UNAVAILABLE);
        case StorageErrorCode::RETRY_LIMIT_EXCEEDED:
            return TransferError(TransferErrc::NETWORK_UNAVAILABLE);
        case StorageErrorCode::UNAUTHENTICATED:
            return TransferError(TransferErrc::NOT_AUTHENTICATED);
        case StorageErrorCode::UNAUTHORIZED:
            return TransferError(TransferErrc::UNAUTHORIZED);
        default:
            return TransferError(TransferErrc::UNKNOWN, "Backend code " + std::to_string(code) +
                                 " (" + storage::storage_error_code_to_string(code) + ")");
    }
}

TransferError download_error_from_code(int code) {
    switch (static_cast<StorageErrorCode>(code)) {
        case StorageErrorCode::BUCKET_NOT_FOUND:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Bucket not configured");
        case StorageErrorCode::CANCELLED:
            return TransferError(TransferErrc::CANCELLED);
        case StorageErrorCode::DOWNLOAD_SIZE_EXCEEDED:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Insufficient memory");
        case StorageErrorCode::INVALID_ARGUMENT:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Invalid argument");
        case StorageErrorCode::OBJECT_NOT_FOUND:
            return TransferError(TransferErrc::ITEM_NOT_FOUND);
        case StorageErrorCode::PROJECT_NOT_FOUND:
            return TransferError(TransferErrc::DEVELOPMENT_MISCONFIGURATION, "Project not configured");
        case StorageErrorCode::QUOTA_EXCEEDED:
            return TransferError(TransferErrc::SERVICE_UNAVAILABLE);
        case StorageErrorCode::RETRY_LIMIT_EXCEEDED:
            return TransferError(TransferErrc::NETWORK_UNAVAILABLE);
        case StorageErrorCode::UNAUTHENTICATED:
            return TransferError(TransferErrc::NOT_AUTHENTICATED);
        case StorageErrorCode::UNAUTHORIZED:
            return TransferError(TransferErrc::UNAUTHORIZED);
        default:
            return TransferError(TransferErrc::UNKNOWN, "Backend code " + std::to_string(code) +
                                 " (" + storage::storage_error_code_to_string(code) + ")");
    }
}

TransferError upload_error_from(const storage::StorageError& error) {
    if (!error.code) {
        return TransferError(TransferErrc::UNKNOWN, error.message);
    }
    return upload_error_from_code(*error.code);
}

TransferError download_error_from(const storage::StorageError& error) {
    if (!error.code) {
        return TransferError(TransferErrc::UNKNOWN, error.message);
    }
    return download_error_from_code(*error.code);
}

} // namespace blobxfer::transfer
