#include "utils/file_utils.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/rand.h>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace blobxfer {
namespace utils {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_NAME_ATTEMPTS = 16;

std::error_code last_os_error() {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

} // namespace

//==============================================
// NAMES
//==============================================

std::string random_hex(size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw fs::filesystem_error("Failed to generate a random name",
                               std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned char byte : buffer) {
    ss << std::setw(2) << static_cast<int>(byte);
  }
  return ss.str();
}


//==============================================
// DIRECTORIES
//==============================================

fs::path create_private_directory(const fs::path& root, const std::string& prefix) {
  fs::create_directories(root);

  for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
    fs::path candidate = root / (prefix + random_hex(8));
    // create_directory returns false when the name is already taken
    if (fs::create_directory(candidate)) {
      fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace);
      BOOST_LOG_TRIVIAL(debug) << "File utils: Created private directory " << candidate.string();
      return candidate;
    }
  }

  throw fs::filesystem_error("Could not allocate a unique directory name", root,
                             std::make_error_code(std::errc::file_exists));
}

bool remove_all_quietly(const fs::path& path, const std::string& component) {
  if (path.empty()) {
    return true;
  }

  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << component << ": Failed to remove " << path.string() << ": " << ec.message();
    return false;
  }
  return true;
}


//==============================================
// WHOLE FILE IO
//==============================================

std::vector<uint8_t> read_file(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw fs::filesystem_error("Failed to open file for reading", path, last_os_error());
  }

  file.seekg(0, std::ios::end);
  std::streamoff size = file.tellg();
  file.seekg(0, std::ios::beg);
  if (size < 0) {
    throw fs::filesystem_error("Failed to determine file size", path, last_os_error());
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    throw fs::filesystem_error("Failed to read file", path, last_os_error());
  }
  return data;
}

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw fs::filesystem_error("Failed to open file for writing", path, last_os_error());
  }

  if (!data.empty()) {
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  }
  file.flush();
  if (!file.good()) {
    throw fs::filesystem_error("Failed to write file", path, last_os_error());
  }
}


//==============================================
// ERROR FORMATTING
//==============================================

std::string describe_filesystem_error(const std::string& operation, const fs::filesystem_error& error) {
  std::string text = operation + " '" + error.path1().string() + "'";
  if (!error.path2().empty()) {
    text += " -> '" + error.path2().string() + "'";
  }
  return text + ": " + error.code().message();
}

} // namespace utils
} // namespace blobxfer
