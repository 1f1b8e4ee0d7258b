#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "crypto/symmetric_key.hpp"
#include "store/local_backend.hpp"
#include "transfer/transfer_service.hpp"

namespace blobxfer {
namespace cli {

// Interactive shell driving transfers against a local backend. Remote paths
// are relative to the signed in user's folder. Each transfer blocks the shell
// until its outcome arrives.
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::LocalBackend& backend,
        transfer::TransferService& service,
        std::optional<crypto::SymmetricKey> key,
        std::istream& input = std::cin,
        std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line, returns false when the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    store::LocalBackend& backend_;
    transfer::TransferService& service_;
    std::optional<crypto::SymmetricKey> key_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::string& local_file, const std::string& remote_path);
    void handle_download_command(const std::string& remote_path, const std::string& local_path);
    void handle_delete_command(const std::string& remote_path);
    void handle_url_command(const std::string& remote_path);
    void handle_keygen_command(const std::string& key_file);
    void handle_help_command();


    // ---- OUTPUT ----
    void print_progress(const std::string& verb, const std::string& name, const transfer::Progress& progress);
    // Returns true on success
    bool report_outcome(const std::string& action, const std::optional<transfer::TransferError>& error);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace blobxfer
