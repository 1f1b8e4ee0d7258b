#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "storage/storage_backend.hpp"
#include "store/store.hpp"

namespace blobxfer {
namespace store {

struct LocalBackendOptions {
  std::size_t chunk_size = 64 * 1024;
  std::size_t worker_threads = 2;
  // Pause between chunks, lets tests and demos observe transfers in flight
  std::chrono::milliseconds step_delay{0};
};

// Storage backend on a local directory. Objects are kept in a content
// addressed Store keyed by their remote path; tasks run on a Boost.Asio
// thread pool owned by the backend and report progress per chunk.
// References and tasks may outlive the backend, they fail with CANCELLED
// once it is shut down.
class LocalBackend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalBackend(const std::filesystem::path& root,
                        LocalBackendOptions options = LocalBackendOptions());
  ~LocalBackend();

  LocalBackend(const LocalBackend&) = delete;
  LocalBackend& operator=(const LocalBackend&) = delete;


  // ---- REFERENCES ----
  // Reference to an absolute remote path such as "/user/report.pdf"
  std::unique_ptr<storage::Reference> reference(const std::string& path) const;
  // Reference below the signed in user's folder, nullptr when signed out
  std::unique_ptr<storage::Reference> user_reference(const std::string& relative_path) const;


  // ---- SESSION ----
  void sign_in(const std::string& user_id);
  void sign_out();
  std::optional<std::string> user_id() const;


  // ---- DIRECT ACCESS ----
  bool has_object(const std::string& path) const;
  // Throws ObjectNotFoundError
  std::vector<uint8_t> read_object(const std::string& path) const;
  void write_object(const std::string& path, const std::vector<uint8_t>& data);
  Store& store();


  // ---- TEARDOWN ----
  // Waits for running tasks, later operations fail with CANCELLED.
  // Paused tasks must be resumed or cancelled first.
  void shutdown();

  struct Core;

private:
  std::shared_ptr<Core> core_;
};

} // namespace store
} // namespace blobxfer
