#include "transfer/transfer_service.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace blobxfer::transfer {

namespace fs = std::filesystem;

TransferService::TransferService(ServiceConfig config)
  : config_(std::move(config))
  , finalizer_(std::make_shared<utils::WorkQueue>(config_.worker_name)) {
  BOOST_LOG_TRIVIAL(info) << "Transfer service: Temporary root " << config_.temp_root.string();
}

TransferService::~TransferService() {
  // Downloads still holding the queue see it rejecting jobs from here on
  finalizer_->shutdown();
}

std::unique_ptr<UploadTransfer> TransferService::upload_file(const UploadableItem& item,
                                                             std::optional<crypto::SymmetricKey> key) {
  auto ref = require_reference(item.metadata());
  auto payload = item.payload();
  if (!payload) {
    BOOST_LOG_TRIVIAL(error) << "Transfer service: Item " << item.metadata().id() << " has no data to upload";
    throw TransferError(TransferErrc::MISSING_DATA, "Item " + item.metadata().id() + " has no payload");
  }
  return std::make_unique<UploadTransfer>(std::move(ref), std::move(*payload), std::move(key));
}

std::unique_ptr<DownloadTransfer> TransferService::download_file(const DownloadableItem& item,
                                                                 const fs::path& output,
                                                                 std::optional<crypto::SymmetricKey> key) {
  auto ref = require_reference(item);
  return std::make_unique<DownloadTransfer>(std::move(ref), resolve_output_path(item, output),
                                            std::move(key), finalizer_, config_.temp_root);
}

std::unique_ptr<DeletionTransfer> TransferService::delete_file(const DownloadableItem& item) {
  return std::make_unique<DeletionTransfer>(require_reference(item));
}

void TransferService::resolve_download_url(const DownloadableItem& item, DownloadUrlFn on_complete) {
  auto ref = require_reference(item);
  BOOST_LOG_TRIVIAL(debug) << "Transfer service: Resolving download URL for " << ref->path();
  ref->download_url([on_complete = std::move(on_complete)](const std::optional<std::string>& url,
                                                           const std::optional<storage::StorageError>& error) {
    if (!on_complete) {
      return;
    }
    if (error) {
      on_complete(std::nullopt, download_error_from(*error));
    } else if (!url) {
      on_complete(std::nullopt, TransferError(TransferErrc::UNKNOWN, "Backend returned no URL"));
    } else {
      on_complete(url, std::nullopt);
    }
  });
}

fs::path TransferService::resolve_output_path(const DownloadableItem& item, const fs::path& output) {
  std::error_code ec;
  bool names_directory = !output.empty() && !output.has_filename();
  if (!names_directory && !fs::is_directory(output, ec)) {
    return output;
  }

  std::string name = item.id();
  auto extension = item.file_extension();
  if (extension && !extension->empty()) {
    name += "." + *extension;
  }
  return output / name;
}

std::unique_ptr<storage::Reference> TransferService::require_reference(const DownloadableItem& item) {
  auto ref = item.make_reference();
  if (!ref) {
    BOOST_LOG_TRIVIAL(error) << "Transfer service: No signed in user, cannot resolve " << item.id();
    throw TransferError(TransferErrc::NOT_AUTHENTICATED, "No signed in user");
  }
  return ref;
}

} // namespace blobxfer::transfer
