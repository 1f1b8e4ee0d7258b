#ifndef BLOBXFER_UPLOAD_TRANSFER_HPP
#define BLOBXFER_UPLOAD_TRANSFER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "crypto/symmetric_key.hpp"
#include "storage/storage_backend.hpp"
#include "transfer/event_link.hpp"
#include "transfer/progress.hpp"
#include "transfer/transfer_callbacks.hpp"
#include "transfer/transfer_state.hpp"

namespace blobxfer::transfer {

// Uploads one payload to a remote reference, sealing it first when a key is
// given. Construction does no work; start() seals the payload and starts a
// single put task. A consumer must not destroy the transfer from inside one
// of its own callbacks.
class UploadTransfer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UploadTransfer(std::unique_ptr<storage::Reference> ref,
                 std::vector<uint8_t> payload,
                 std::optional<crypto::SymmetricKey> key);
  // Cancels the backend task of an unfinished upload, delivers nothing
  ~UploadTransfer();

  UploadTransfer(const UploadTransfer&) = delete;
  UploadTransfer& operator=(const UploadTransfer&) = delete;


  // ---- TRANSFER CONTROL ----
  // Starts the upload, later calls are ignored
  void start(ProgressFn on_progress, CompletionFn on_complete);
  // Delivers CANCELLED at once and asks the backend to stop
  void cancel();
  void pause();
  void resume();


  // ---- GETTERS ----
  Progress latest_progress() const;
  TransferState::State state() const;
  const storage::Reference& reference() const { return *ref_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<storage::Reference> ref_;
  std::vector<uint8_t> payload_;
  std::optional<crypto::SymmetricKey> key_;
  std::unique_ptr<storage::Task> task_;
  TransferState state_;
  Progress latest_progress_;
  ProgressFn on_progress_;
  CompletionFn on_complete_;
  bool outcome_delivered_ = false;
  EventLinkPtr<UploadTransfer> link_;


  // ---- BACKEND EVENTS ----
  void observe_task();
  void handle_progress(const storage::Snapshot& snapshot);
  void handle_success(const storage::Snapshot& snapshot);
  void handle_failure(const storage::Snapshot& snapshot);


  // ---- DELIVERY ----
  void deliver_progress();
  // Moves to a terminal state, detaches the link and delivers the outcome
  void finish(TransferState::State terminal, std::optional<TransferError> error);
};

} // namespace blobxfer::transfer

#endif // BLOBXFER_UPLOAD_TRANSFER_HPP
