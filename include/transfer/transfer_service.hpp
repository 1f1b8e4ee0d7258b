#ifndef BLOBXFER_TRANSFER_SERVICE_HPP
#define BLOBXFER_TRANSFER_SERVICE_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "crypto/symmetric_key.hpp"
#include "transfer/deletion_transfer.hpp"
#include "transfer/download_transfer.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_item.hpp"
#include "transfer/upload_transfer.hpp"
#include "utils/work_queue.hpp"

namespace blobxfer::transfer {

struct ServiceConfig {
  // Parent of every download's private temporary directory
  std::filesystem::path temp_root = std::filesystem::temp_directory_path();
  std::string worker_name = "blobxfer-finalizer";
};

using DownloadUrlFn = std::function<void(const std::optional<std::string>& url,
                                         const std::optional<TransferError>& error)>;

// Creates transfers after checking their pre-conditions and owns the queue
// downloads are finalized on. Downloads share the queue; one that finishes
// after the service is gone fails with UNKNOWN.
class TransferService {
public:
  explicit TransferService(ServiceConfig config = ServiceConfig());
  ~TransferService();

  TransferService(const TransferService&) = delete;
  TransferService& operator=(const TransferService&) = delete;

  // Throw TransferError(NOT_AUTHENTICATED) when the item has no reference,
  // upload_file also throws TransferError(MISSING_DATA) when there is no payload
  std::unique_ptr<UploadTransfer> upload_file(const UploadableItem& item,
                                              std::optional<crypto::SymmetricKey> key);
  std::unique_ptr<DownloadTransfer> download_file(const DownloadableItem& item,
                                                  const std::filesystem::path& output,
                                                  std::optional<crypto::SymmetricKey> key);
  std::unique_ptr<DeletionTransfer> delete_file(const DownloadableItem& item);

  // Reports either a shareable URL or a mapped error
  void resolve_download_url(const DownloadableItem& item, DownloadUrlFn on_complete);

  // Appends "<id>.<extension>" when output names a directory
  static std::filesystem::path resolve_output_path(const DownloadableItem& item,
                                                   const std::filesystem::path& output);

  const ServiceConfig& config() const { return config_; }
  utils::WorkQueue& finalizer() { return *finalizer_; }

private:
  ServiceConfig config_;
  std::shared_ptr<utils::WorkQueue> finalizer_;

  static std::unique_ptr<storage::Reference> require_reference(const DownloadableItem& item);
};

} // namespace blobxfer::transfer

#endif // BLOBXFER_TRANSFER_SERVICE_HPP
