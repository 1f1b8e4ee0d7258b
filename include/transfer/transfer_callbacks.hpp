#ifndef BLOBXFER_TRANSFER_CALLBACKS_HPP
#define BLOBXFER_TRANSFER_CALLBACKS_HPP

#include <functional>
#include <optional>
#include "transfer/progress.hpp"
#include "transfer/transfer_error.hpp"

namespace blobxfer::transfer {

// Receives progress values in non-decreasing order
using ProgressFn = std::function<void(const Progress&)>;
// Receives the single terminal outcome, an empty error means success
using CompletionFn = std::function<void(const std::optional<TransferError>&)>;

} // namespace blobxfer::transfer

#endif // BLOBXFER_TRANSFER_CALLBACKS_HPP
