#include "cli/cli.hpp"
#include "crypto/crypto_error.hpp"
#include "logger/logger.hpp"
#include "store/local_backend.hpp"
#include "transfer/transfer_service.hpp"
#include "utils/file_utils.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string store_root;
  std::string key_file;
  std::string temp_root;
  std::string log_file;
  std::string log_level{"info"};
  std::string user{"local"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -r <store root> [options]\n"
        << "Required arguments:\n"
        << "  -r, --root       Directory holding the local object store\n"
        << "Optional arguments:\n"
        << "  -k, --key        File holding a hex encoded 256-bit key, enables encryption\n"
        << "  -t, --temp       Parent directory for download temporaries\n"
        << "  -l, --log-file   Write logs to this file instead of the console\n"
        << "  -v, --verbosity  trace, debug, info, warning, error or fatal (default info)\n"
        << "  -u, --user       User folder remote paths resolve into (default local)\n"
        << "Example: " << program_name << " -r ./objects -k ./blobxfer.key\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-r", &options.store_root},
    {"--root", &options.store_root},
    {"-k", &options.key_file},
    {"--key", &options.key_file},
    {"-t", &options.temp_root},
    {"--temp", &options.temp_root},
    {"-l", &options.log_file},
    {"--log-file", &options.log_file},
    {"-v", &options.log_level},
    {"--verbosity", &options.log_level},
    {"-u", &options.user},
    {"--user", &options.user}
  };

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    *it->second = argv[i + 1];
  }

  if (options.store_root.empty()) {
    std::cerr << "Error: A store root is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

std::optional<blobxfer::crypto::SymmetricKey> load_key(const std::string& key_file) {
  if (key_file.empty()) {
    return std::nullopt;
  }
  std::vector<uint8_t> bytes = blobxfer::utils::read_file(key_file);
  std::string hex(bytes.begin(), bytes.end());
  hex.erase(hex.find_last_not_of(" \t\r\n") + 1);
  return blobxfer::crypto::SymmetricKey::from_hex(hex);
}

bool run_shell(const ProgramOptions& options) {
  try {
    blobxfer::logging::LogConfig log_config;
    log_config.min_level = blobxfer::logging::parse_severity(options.log_level);
    if (!options.log_file.empty()) {
      log_config.file = options.log_file;
      log_config.console = false;
    }
    blobxfer::logging::init_logging(log_config);

    blobxfer::transfer::ServiceConfig service_config;
    if (!options.temp_root.empty()) {
      service_config.temp_root = options.temp_root;
    }

    auto key = load_key(options.key_file);
    blobxfer::store::LocalBackend backend(options.store_root);
    backend.sign_in(options.user);
    blobxfer::transfer::TransferService service(service_config);
    blobxfer::cli::CLI cli(backend, service, key);

    cli.run();
    return true;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "Error: " << e.what() << '\n';
  } catch (const blobxfer::crypto::CryptoError& e) {
    std::cerr << "Error: Invalid key: " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
  }
  return false;
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
