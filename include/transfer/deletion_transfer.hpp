#ifndef BLOBXFER_DELETION_TRANSFER_HPP
#define BLOBXFER_DELETION_TRANSFER_HPP

#include <memory>
#include "storage/storage_backend.hpp"
#include "transfer/event_link.hpp"
#include "transfer/transfer_callbacks.hpp"
#include "transfer/transfer_state.hpp"

namespace blobxfer::transfer {

// Deletes one remote object. Backend deletions cannot be interrupted, so
// cancel() only has an effect before start().
class DeletionTransfer {
public:
  explicit DeletionTransfer(std::unique_ptr<storage::Reference> ref);
  ~DeletionTransfer();

  DeletionTransfer(const DeletionTransfer&) = delete;
  DeletionTransfer& operator=(const DeletionTransfer&) = delete;

  void start(CompletionFn on_complete);
  void cancel();

  TransferState::State state() const;
  const storage::Reference& reference() const { return *ref_; }

private:
  std::unique_ptr<storage::Reference> ref_;
  TransferState state_;
  CompletionFn on_complete_;
  bool outcome_delivered_ = false;
  EventLinkPtr<DeletionTransfer> link_;

  void handle_result(const std::optional<storage::StorageError>& error);
};

} // namespace blobxfer::transfer

#endif // BLOBXFER_DELETION_TRANSFER_HPP
