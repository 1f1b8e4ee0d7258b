#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace blobxfer {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown when no object is stored under the requested key
class ObjectNotFoundError : public StoreError {
public:
  explicit ObjectNotFoundError(const std::string& key)
    : StoreError("Store: Object not found: " + key), key_(key) {}

  const std::string& key() const { return key_; }

private:
  std::string key_;
};

// Called after every chunk with the number of bytes moved so far.
// Returning false aborts the operation.
using ChunkCallback = std::function<bool(std::uint64_t bytes_so_far)>;

// Content-addressed object store on a local directory. Objects live at
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash} where hash
// is the SHA-256 of the key. Safe for concurrent use on distinct keys.
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::filesystem::path& base_path, std::size_t chunk_size = 64 * 1024);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores the stream under key. The object becomes visible only once fully
  // written; an aborted store leaves any previous object untouched.
  // Returns false when on_chunk aborted.
  bool store(const std::string& key, std::istream& data, const ChunkCallback& on_chunk = {});
  // Streams the object into output, returns false when on_chunk aborted.
  // Throws ObjectNotFoundError.
  bool get(const std::string& key, std::ostream& output, const ChunkCallback& on_chunk = {}) const;
  // Removes the object and any directories left empty. Throws ObjectNotFoundError.
  void remove(const std::string& key);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  // Throws ObjectNotFoundError
  std::uintmax_t get_file_size(const std::string& key) const;
  // Path the object for key is (or would be) stored at
  std::filesystem::path resolve_key_path(const std::string& key) const;
  const std::filesystem::path& base_path() const { return base_path_; }
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  std::size_t chunk_size_;


  // ---- CAS STORAGE SUPPORT ----
  // Hex SHA-256 of key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- UTILITY METHODS ----
  std::filesystem::path staging_path_for(const std::filesystem::path& object_path) const;
  void verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const;
  void prune_empty_parents(std::filesystem::path directory) const;
};

} // namespace store
} // namespace blobxfer
