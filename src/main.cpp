#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>
#include "cli/cli.hpp"
#include "fingerprint/fingerprint_cache.hpp"
#include "logger/logger.hpp"

struct ProgramOptions {
  std::string store_dir;
  std::string password;
  std::string algorithm;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -r <store dir> [-p <password>] [-a <algorithm>]\n"
        << "Required arguments:\n"
        << "  -r, --root        Directory of the object store\n"
        << "Optional arguments:\n"
        << "  -p, --password    Encryption password\n"
        << "  -a, --algorithm   simple, chacha20, aes256cbc or none (default none)\n"
        << "Example: " << program_name << " -r ./store -p secret -a chacha20\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-r", &ProgramOptions::store_dir},
    {"--root", &ProgramOptions::store_dir},
    {"-p", &ProgramOptions::password},
    {"--password", &ProgramOptions::password},
    {"-a", &ProgramOptions::algorithm},
    {"--algorithm", &ProgramOptions::algorithm}
  };

  ProgramOptions options;
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
    options.*(it->second) = argv[i + 1];
  }

  if (options.store_dir.empty()) {
    std::cerr << "Error: A store directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    cloudsync::config::Session session;
    session.user_id = "local";
    session.user_name = "local";
    session.secret = options.password;
    session.cipher.algorithm = cloudsync::crypto::algorithm_from_string(options.algorithm);
    if (session.cipher.algorithm != cloudsync::crypto::Algorithm::None && session.secret.empty()) {
      std::cerr << "Error: Algorithm " << options.algorithm << " needs a password\n";
      return false;
    }

    cloudsync::config::TransferConfig config;
    config.ledger_dir = (std::filesystem::path(options.store_dir) / "ledgers").string();
    std::filesystem::create_directories(config.ledger_dir);

    cloudsync::store::LocalStore store(options.store_dir);
    cloudsync::transfer::TransferScheduler scheduler(
        store, config, std::make_shared<cloudsync::fingerprint::MemoryFingerprintCache>());
    cloudsync::cli::CLI cli(store, scheduler, session);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  cloudsync::logging::init_logging("cloudsync.log");

  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
