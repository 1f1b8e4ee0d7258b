#include "cli/cli.hpp"
#include <future>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "utils/file_utils.hpp"

namespace blobxfer {
namespace cli {

namespace {

// A remote object named by a path below the user's folder
class RemoteFile : public transfer::UploadableItem, public transfer::DownloadableItem {
public:
  RemoteFile(const store::LocalBackend& backend, std::string remote_path, std::filesystem::path local_file = {})
    : backend_(backend), remote_path_(std::move(remote_path)), local_file_(std::move(local_file)) {}

  std::string id() const override {
    return std::filesystem::path(remote_path_).stem().string();
  }

  std::optional<std::string> file_extension() const override {
    std::string extension = std::filesystem::path(remote_path_).extension().string();
    if (extension.size() <= 1) {
      return std::nullopt;
    }
    return extension.substr(1);
  }

  std::unique_ptr<storage::Reference> make_reference() const override {
    return backend_.user_reference(remote_path_);
  }

  const transfer::DownloadableItem& metadata() const override { return *this; }

  std::optional<std::vector<uint8_t>> payload() const override {
    try {
      return utils::read_file(local_file_);
    } catch (const std::filesystem::filesystem_error& e) {
      BOOST_LOG_TRIVIAL(error) << "CLI: Cannot read " << local_file_.string() << ": " << e.what();
      return std::nullopt;
    }
  }

private:
  const store::LocalBackend& backend_;
  std::string remote_path_;
  std::filesystem::path local_file_;
};

// Completion slot a blocked command waits on
struct Outcome {
  std::promise<std::optional<transfer::TransferError>> promise;
  std::future<std::optional<transfer::TransferError>> future = promise.get_future();

  transfer::CompletionFn callback() {
    return [this](const std::optional<transfer::TransferError>& error) { promise.set_value(error); };
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::LocalBackend& backend,
         transfer::TransferService& service,
         std::optional<crypto::SymmetricKey> key,
         std::istream& input,
         std::ostream& output)
  : running_(false)
  , backend_(backend)
  , service_(service)
  , key_(std::move(key))
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized" << (key_ ? " with encryption key" : "");
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting shell loop";
  output_ << "blobxfer> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "blobxfer> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Shell loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  std::vector<std::string> args;

  iss >> command;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command " << command << " with " << args.size() << " argument(s)";

  if (command == "upload" && args.size() == 2) {
    handle_upload_command(args[0], args[1]);
  }
  else if (command == "download" && args.size() == 2) {
    handle_download_command(args[0], args[1]);
  }
  else if (command == "delete" && args.size() == 1) {
    handle_delete_command(args[0]);
  }
  else if (command == "url" && args.size() == 1) {
    handle_url_command(args[0]);
  }
  else if (command == "keygen" && args.size() == 1) {
    handle_keygen_command(args[0]);
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& local_file, const std::string& remote_path) {
  RemoteFile item(backend_, remote_path, local_file);
  Outcome outcome;
  try {
    auto upload = service_.upload_file(item, key_);
    upload->start(
      [this, name = upload->reference().name()](const transfer::Progress& progress) {
        print_progress("Uploading", name, progress);
      },
      outcome.callback());
    report_outcome("Upload", outcome.future.get());
  } catch (const transfer::TransferError& e) {
    log_and_display_error("Upload failed", e.what());
  }
}

void CLI::handle_download_command(const std::string& remote_path, const std::string& local_path) {
  RemoteFile item(backend_, remote_path);
  Outcome outcome;
  try {
    auto download = service_.download_file(item, local_path, key_);
    download->start(
      [this, name = download->reference().name()](const transfer::Progress& progress) {
        print_progress("Downloading", name, progress);
      },
      outcome.callback());
    if (report_outcome("Download", outcome.future.get())) {
      output_ << "Saved to " << download->destination().string() << std::endl;
    }
  } catch (const transfer::TransferError& e) {
    log_and_display_error("Download failed", e.what());
  } catch (const std::invalid_argument& e) {
    log_and_display_error("Download failed", e.what());
  }
}

void CLI::handle_delete_command(const std::string& remote_path) {
  RemoteFile item(backend_, remote_path);
  Outcome outcome;
  try {
    auto deletion = service_.delete_file(item);
    deletion->start(outcome.callback());
    report_outcome("Delete", outcome.future.get());
  } catch (const transfer::TransferError& e) {
    log_and_display_error("Delete failed", e.what());
  }
}

void CLI::handle_url_command(const std::string& remote_path) {
  RemoteFile item(backend_, remote_path);
  // Shared with the callback, which may still be returning from set_value when the wait ends
  auto done = std::make_shared<std::promise<void>>();
  try {
    std::future<void> resolved = done->get_future();
    service_.resolve_download_url(item,
      [this, done](const std::optional<std::string>& url, const std::optional<transfer::TransferError>& error) {
        if (url) {
          output_ << *url << std::endl;
        } else if (error) {
          log_and_display_error("URL lookup failed", error->what());
        }
        done->set_value();
      });
    resolved.wait();
  } catch (const transfer::TransferError& e) {
    log_and_display_error("URL lookup failed", e.what());
  }
}

void CLI::handle_keygen_command(const std::string& key_file) {
  try {
    crypto::SymmetricKey key = crypto::SymmetricKey::generate();
    std::string hex = key.to_hex() + "\n";
    utils::write_file(key_file, std::vector<uint8_t>(hex.begin(), hex.end()));
    key_ = key;
    output_ << "Wrote new key to " << key_file << ", transfers are now encrypted" << std::endl;
  } catch (const std::filesystem::filesystem_error& e) {
    log_and_display_error("Error writing key", e.what());
  } catch (const crypto::CryptoError& e) {
    log_and_display_error("Error generating key", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                          Display this help message" << std::endl;
  output_ << "  upload <file> <remote>        Upload local <file> to <remote>" << std::endl;
  output_ << "  download <remote> <path>      Download <remote> to <path> (file or directory)" << std::endl;
  output_ << "  delete <remote>               Delete <remote>" << std::endl;
  output_ << "  url <remote>                  Print a shareable link to <remote>" << std::endl;
  output_ << "  keygen <file>                 Write a new key to <file> and encrypt with it" << std::endl;
  output_ << "  quit                          Exit the shell" << std::endl << std::endl;
}


//==============================================
// OUTPUT
//==============================================

void CLI::print_progress(const std::string& verb, const std::string& name, const transfer::Progress& progress) {
  if (progress.is_indeterminate()) {
    output_ << verb << " " << name << ": " << progress.completed_units << " bytes" << std::endl;
    return;
  }
  output_ << verb << " " << name << ": " << std::fixed << std::setprecision(0)
          << progress.fraction_completed() * 100.0 << "%" << std::endl;
}

bool CLI::report_outcome(const std::string& action, const std::optional<transfer::TransferError>& error) {
  if (error) {
    log_and_display_error(action + " failed", error->what());
    return false;
  }
  output_ << action << " complete" << std::endl;
  return true;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace blobxfer
