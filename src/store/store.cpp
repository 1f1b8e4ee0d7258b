#include "store/store.hpp"
#include <atomic>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>
#include <vector>
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>

namespace blobxfer {
namespace store {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

// Distinguishes staging files of concurrent writers in one process
std::atomic<std::uint64_t> staging_counter{0};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::filesystem::path& base_path, std::size_t chunk_size)
  : base_path_(base_path), chunk_size_(chunk_size == 0 ? 4096 : chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store at " << base_path_.string()
                          << " (chunk size " << chunk_size_ << ")";
  std::filesystem::create_directories(base_path_);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool Store::store(const std::string& key, std::istream& data, const ChunkCallback& on_chunk) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing object " << key;

  if (!data.good() && !data.eof()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream for " << key;
    throw StoreError("Store: Invalid input stream");
  }

  const std::filesystem::path object_path = resolve_key_path(key);
  std::filesystem::create_directories(object_path.parent_path());
  const std::filesystem::path staging = staging_path_for(object_path);

  std::uint64_t bytes_written = 0;
  bool completed = true;
  {
    std::ofstream file(staging, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + staging.string());
    }

    std::vector<char> buffer(chunk_size_);
    while (data) {
      data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize count = data.gcount();
      if (count <= 0) {
        break;
      }
      file.write(buffer.data(), count);
      if (!file) {
        break;
      }
      bytes_written += static_cast<std::uint64_t>(count);
      if (on_chunk && !on_chunk(bytes_written)) {
        completed = false;
        break;
      }
    }
    file.flush();
    if (!file) {
      std::error_code ec;
      std::filesystem::remove(staging, ec);
      throw StoreError("Store: Failed to write file: " + staging.string());
    }
  }

  if (!completed) {
    BOOST_LOG_TRIVIAL(info) << "Store: Store of " << key << " aborted after " << bytes_written << " bytes";
    std::error_code ec;
    std::filesystem::remove(staging, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(staging, object_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    throw StoreError("Store: Failed to commit " + object_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Stored " << bytes_written << " bytes for " << key;
  return true;
}

bool Store::get(const std::string& key, std::ostream& output, const ChunkCallback& on_chunk) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving object " << key;

  const std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(key, file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  std::vector<char> buffer(chunk_size_);
  std::uint64_t total_bytes = 0;
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize count = file.gcount();
    if (count <= 0) {
      break;
    }
    output.write(buffer.data(), count);
    if (!output) {
      throw StoreError("Store: Failed to write to output stream");
    }
    total_bytes += static_cast<std::uint64_t>(count);
    if (on_chunk && !on_chunk(total_bytes)) {
      BOOST_LOG_TRIVIAL(info) << "Store: Read of " << key << " aborted after " << total_bytes << " bytes";
      return false;
    }
  }

  if (file.bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Streamed " << total_bytes << " bytes for " << key;
  return true;
}

void Store::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Removing object " << key;

  const std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec)) {
    if (ec) {
      throw StoreError("Store: Failed to remove " + file_path.string() + ": " + ec.message());
    }
    throw ObjectNotFoundError(key);
  }

  prune_empty_parents(file_path.parent_path());
  BOOST_LOG_TRIVIAL(info) << "Store: Removed object " << key;
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at " << base_path_.string();
  std::filesystem::remove_all(base_path_);
  std::filesystem::create_directories(base_path_);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(resolve_key_path(key), ec);
}

std::uintmax_t Store::get_file_size(const std::string& key) const {
  const std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(key, file_path);
  return std::filesystem::file_size(file_path);
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(hash_key(key));
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string Store::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw StoreError("Store: Failed to create hash context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), key.data(), key.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
    throw StoreError("Store: Failed to hash key");
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path Store::staging_path_for(const std::filesystem::path& object_path) const {
  std::uint64_t id = staging_counter.fetch_add(1);
  return object_path.parent_path() /
    (object_path.filename().string() + ".staging-" + std::to_string(id));
}

void Store::verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Object not found: " << key;
    throw ObjectNotFoundError(key);
  }
}

void Store::prune_empty_parents(std::filesystem::path directory) const {
  std::error_code ec;
  while (directory != base_path_ && directory.has_parent_path()) {
    if (!std::filesystem::is_empty(directory, ec) || ec) {
      break;
    }
    // Another writer may have just created an entry here, that is not an error
    if (!std::filesystem::remove(directory, ec)) {
      break;
    }
    directory = directory.parent_path();
  }
}

} // namespace store
} // namespace blobxfer
