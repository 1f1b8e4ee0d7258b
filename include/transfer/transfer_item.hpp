#ifndef BLOBXFER_TRANSFER_ITEM_HPP
#define BLOBXFER_TRANSFER_ITEM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "storage/storage_backend.hpp"

namespace blobxfer::transfer {

// Application object that has a remote counterpart
class DownloadableItem {
public:
  virtual ~DownloadableItem() = default;

  virtual std::string id() const = 0;
  // Extension without the leading dot, used to name downloads into a directory
  virtual std::optional<std::string> file_extension() const = 0;
  // Resolves the remote object, nullptr while no user is signed in
  virtual std::unique_ptr<storage::Reference> make_reference() const = 0;
};

// Application object whose bytes can be uploaded
class UploadableItem {
public:
  virtual ~UploadableItem() = default;

  virtual const DownloadableItem& metadata() const = 0;
  // Empty when there is nothing to upload
  virtual std::optional<std::vector<uint8_t>> payload() const = 0;
};

} // namespace blobxfer::transfer

#endif // BLOBXFER_TRANSFER_ITEM_HPP
