#ifndef BLOBXFER_DOWNLOAD_TRANSFER_HPP
#define BLOBXFER_DOWNLOAD_TRANSFER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include "crypto/symmetric_key.hpp"
#include "storage/storage_backend.hpp"
#include "transfer/event_link.hpp"
#include "transfer/progress.hpp"
#include "transfer/transfer_callbacks.hpp"
#include "transfer/transfer_state.hpp"
#include "utils/work_queue.hpp"

namespace blobxfer::transfer {

// Downloads one remote object into a private temporary directory, then
// decrypts it (when a key is given) and places it at the destination on the
// finalizer queue. The destination only ever holds a complete file.
// The transfer shares ownership of the finalizer queue. Once the queue is
// shut down a finished download fails instead of finalizing. A consumer must
// not destroy the transfer from inside one of its own callbacks.
class DownloadTransfer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DownloadTransfer(std::unique_ptr<storage::Reference> ref,
                   std::filesystem::path destination,
                   std::optional<crypto::SymmetricKey> key,
                   std::shared_ptr<utils::WorkQueue> finalizer,
                   std::filesystem::path temp_root);
  // Cancels the backend task of an unfinished download and removes its
  // temporary directory, delivers nothing
  ~DownloadTransfer();

  DownloadTransfer(const DownloadTransfer&) = delete;
  DownloadTransfer& operator=(const DownloadTransfer&) = delete;


  // ---- TRANSFER CONTROL ----
  // Starts the download, later calls are ignored
  void start(ProgressFn on_progress, CompletionFn on_complete);
  // Delivers CANCELLED at once, asks the backend to stop and discards partial output
  void cancel();
  void pause();
  void resume();


  // ---- GETTERS ----
  Progress latest_progress() const;
  TransferState::State state() const;
  const storage::Reference& reference() const { return *ref_; }
  const std::filesystem::path& destination() const { return destination_; }
  // Empty until start() created the temporary directory
  std::filesystem::path temporary_directory() const;

private:
  // Inputs of the finalization job, copied so the job never touches the transfer outside its link
  struct Finalization {
    std::filesystem::path temp_dir;
    std::filesystem::path temp_file;
    std::filesystem::path destination;
    std::optional<crypto::SymmetricKey> key;
  };

  // ---- PARAMETERS ----
  std::unique_ptr<storage::Reference> ref_;
  std::filesystem::path destination_;
  std::optional<crypto::SymmetricKey> key_;
  std::shared_ptr<utils::WorkQueue> finalizer_;
  std::filesystem::path temp_root_;
  std::filesystem::path temp_dir_;
  std::filesystem::path temp_file_;
  std::unique_ptr<storage::Task> task_;
  TransferState state_;
  Progress latest_progress_;
  ProgressFn on_progress_;
  CompletionFn on_complete_;
  bool outcome_delivered_ = false;
  EventLinkPtr<DownloadTransfer> link_;


  // ---- BACKEND EVENTS ----
  void observe_task();
  void handle_progress(const storage::Snapshot& snapshot);
  void handle_success(const storage::Snapshot& snapshot);
  void handle_failure(const storage::Snapshot& snapshot);


  // ---- FINALIZATION ----
  // Runs on the finalizer queue
  static void finalize(EventLinkPtr<DownloadTransfer> link, Finalization job);
  // Writes the plaintext next to the destination, throws on disk or decryption failure.
  // Anything else thrown, such as std::bad_alloc, fails the download as UNKNOWN.
  static void stage_output(const Finalization& job, const std::filesystem::path& staging);
  // Replaces the destination with the staged file
  static void place_output(const std::filesystem::path& staging, const std::filesystem::path& destination);
  // ".<name>.<random hex>.blobxfer-partial" beside the destination
  static std::filesystem::path staging_path_for(const std::filesystem::path& destination);


  // ---- DELIVERY ----
  void deliver_progress();
  // Moves to a terminal state, detaches the link and delivers the outcome
  void finish(TransferState::State terminal, std::optional<TransferError> error);
};

} // namespace blobxfer::transfer

#endif // BLOBXFER_DOWNLOAD_TRANSFER_HPP
