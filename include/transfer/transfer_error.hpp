#ifndef BLOBXFER_TRANSFER_ERROR_HPP
#define BLOBXFER_TRANSFER_ERROR_HPP

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include "storage/storage_error_code.hpp"

namespace blobxfer::transfer {

// Backend-agnostic failure kinds surfaced to callers
enum class TransferErrc {
    NOT_AUTHENTICATED,
    UNAUTHORIZED,
    ITEM_NOT_FOUND,
    CANCELLED,
    NETWORK_UNAVAILABLE,
    SERVICE_UNAVAILABLE,
    DISK_IO,
    DECRYPTION_FAILURE,
    DEVELOPMENT_MISCONFIGURATION,
    MISSING_DATA,
    UNKNOWN
};

const char* transfer_errc_to_string(TransferErrc kind);

class TransferError : public std::runtime_error {
public:
    explicit TransferError(TransferErrc kind, const std::string& detail = "");

    TransferErrc kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    // Errors compare by kind, details are diagnostic only
    bool operator==(const TransferError& other) const { return kind_ == other.kind_; }
    bool operator!=(const TransferError& other) const { return kind_ != other.kind_; }
    bool operator==(TransferErrc kind) const { return kind_ == kind; }
    bool operator!=(TransferErrc kind) const { return kind_ != kind; }

private:
    TransferErrc kind_;
    std::string detail_;
};

std::ostream& operator<<(std::ostream& os, TransferErrc kind);
std::ostream& operator<<(std::ostream& os, const TransferError& error);


// ---- BACKEND CODE MAPPING ----
// Both mappings are total: codes they do not recognize become UNKNOWN.
TransferError upload_error_from_code(int code);
TransferError download_error_from_code(int code);

// Maps a backend error, an error without a code becomes UNKNOWN
TransferError upload_error_from(const storage::StorageError& error);
TransferError download_error_from(const storage::StorageError& error);

} // namespace blobxfer::transfer

#endif // BLOBXFER_TRANSFER_ERROR_HPP
