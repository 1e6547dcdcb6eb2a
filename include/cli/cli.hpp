#ifndef CLOUDSYNC_CLI_HPP
#define CLOUDSYNC_CLI_HPP

#include <iostream>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "store/store.hpp"
#include "transfer/transfer_scheduler.hpp"

namespace cloudsync::cli {

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(store::LocalStore& store, transfer::TransferScheduler& scheduler, config::Session session,
      std::istream& in = std::cin, std::ostream& out = std::cout);

  // ---- STARTUP ----
  void run();
  // Runs one shell line; false once the shell should exit
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  store::LocalStore& store_;
  transfer::TransferScheduler& scheduler_;
  config::Session session_;
  std::istream& in_;
  std::ostream& out_;

  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_upload_command(const std::vector<std::string>& args);
  void handle_download_command(const std::vector<std::string>& args);
  void handle_sync_command(const std::vector<std::string>& args);
  void handle_link_command(const std::vector<std::string>& args);
  void handle_rapid_command(const std::vector<std::string>& args);
  void handle_ls_command(const std::vector<std::string>& args);
  void handle_task_command(const std::string& command, const std::vector<std::string>& args);
  void handle_status_command(const std::vector<std::string>& args);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cloudsync::cli

#endif // CLOUDSYNC_CLI_HPP
