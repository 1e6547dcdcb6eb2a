#include "cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>
#include <sstream>
#include "fingerprint/fingerprint_codec.hpp"
#include "sync/sync_planner.hpp"

namespace cloudsync::cli {

namespace {

int64_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

transfer::TaskHandle parse_task(const std::string& text) {
  std::size_t used = 0;
  unsigned long long id = std::stoull(text, &used);
  if (used != text.size()) {
    throw std::invalid_argument("not a task number: " + text);
  }
  return static_cast<transfer::TaskHandle>(id);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(store::LocalStore& store, transfer::TransferScheduler& scheduler, config::Session session,
         std::istream& in, std::ostream& out)
  : running_(false),
    store_(store),
    scheduler_(scheduler),
    session_(std::move(session)),
    in_(in),
    out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized for " << session_;
}

//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting shell loop";
  out_ << "cloudsync> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "cloudsync> " << std::flush;
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
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "upload" && args.size() == 2) {
    handle_upload_command(args);
  } else if (command == "download" && args.size() == 2) {
    handle_download_command(args);
  } else if (command == "sync" && args.size() == 2) {
    handle_sync_command(args);
  } else if (command == "link" && (args.size() == 1 || args.size() == 2)) {
    handle_link_command(args);
  } else if (command == "rapid" && (args.size() == 2 || args.size() == 3)) {
    handle_rapid_command(args);
  } else if (command == "ls" && args.size() <= 1) {
    handle_ls_command(args);
  } else if ((command == "pause" || command == "resume" || command == "cancel") && args.size() == 1) {
    handle_task_command(command, args);
  } else if (command == "status" && args.size() <= 1) {
    handle_status_command(args);
  } else if (command == "help" && args.empty()) {
    handle_help_command();
  } else {
    out_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  try {
    transfer::TransferRequest request;
    request.direction = transfer::Direction::Upload;
    request.local_path = args[0];
    request.remote_path = session_.resolve_remote(args[1]);
    request.session = session_;
    auto handle = scheduler_.start(std::move(request));
    out_ << "Task " << handle << " started" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error starting upload", e.what());
  }
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  try {
    std::string remote = session_.resolve_remote(args[0]);
    if (!store_.has(remote)) {
      // A directory: every object below it
      auto handles = scheduler_.start_directory_download(remote, args[1], session_);
      if (!handles.empty()) {
        for (auto handle : handles) {
          out_ << "Task " << handle << " started" << std::endl;
        }
        return;
      }
    }

    transfer::TransferRequest request;
    request.direction = transfer::Direction::Download;
    request.remote_path = remote;
    request.local_path = args[1];
    request.session = session_;
    auto handle = scheduler_.start(std::move(request));
    out_ << "Task " << handle << " started" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error starting download", e.what());
  }
}

void CLI::handle_sync_command(const std::vector<std::string>& args) {
  try {
    sync::SyncPlanner planner(scheduler_, store_);
    std::string remote_root = session_.resolve_remote(args[1]);
    auto plan = planner.plan(args[0], remote_root);
    auto report = planner.execute(plan, args[0], remote_root, session_);

    for (const auto& outcome : report.outcomes) {
      if (outcome.action == sync::SyncAction::Skip) {
        continue;
      }
      out_ << "  " << sync::to_string(outcome.action) << " " << outcome.relative_path
           << (outcome.rapid_uploaded ? " (rapid)" : "")
           << (outcome.ok ? "" : " FAILED: " + outcome.message) << std::endl;
    }
    out_ << "Sync finished: " << report.count(sync::SyncAction::CreateRemote) << " created, "
         << report.count(sync::SyncAction::UpdateRemote) << " updated, "
         << report.count(sync::SyncAction::DeleteRemote) << " deleted, "
         << report.count(sync::SyncAction::Skip) << " unchanged, "
         << report.failures() << " failed" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error syncing", e.what());
  }
}

void CLI::handle_link_command(const std::vector<std::string>& args) {
  try {
    auto protocol = args.size() == 2 ? fingerprint::protocol_from_string(args[1])
                                     : fingerprint::HashLinkProtocol::Cs3l;
    auto fp = fingerprint::compute_file(args[0]);
    out_ << fingerprint::encode(fp, protocol) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error computing link", e.what());
  }
}

void CLI::handle_rapid_command(const std::vector<std::string>& args) {
  try {
    std::optional<std::string> filename;
    if (args.size() == 3) {
      filename = args[2];
    }
    auto fp = fingerprint::decode(args[0], filename);
    std::string remote_path = sync::join_remote(session_.resolve_remote(args[1]), fp.filename);

    if (store_.rapid_upload(remote_path, fp, now_seconds())) {
      out_ << "Registered " << remote_path << std::endl;
    } else {
      out_ << "No stored content matches " << fp.filename << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error registering link", e.what());
  }
}

void CLI::handle_ls_command(const std::vector<std::string>& args) {
  try {
    std::string dir = session_.resolve_remote(args.empty() ? "" : args[0]);
    for (const auto& entry : store_.list(dir)) {
      out_ << "  " << entry.size << "\t" << entry.mtime << "\t" << entry.path << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing", e.what());
  }
}

void CLI::handle_task_command(const std::string& command, const std::vector<std::string>& args) {
  try {
    auto handle = parse_task(args[0]);
    if (command == "pause") {
      scheduler_.pause(handle);
    } else if (command == "resume") {
      scheduler_.resume(handle);
    } else {
      scheduler_.cancel(handle);
    }
    out_ << "Task " << handle << " " << transfer::to_string(scheduler_.status(handle)) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error controlling task", e.what());
  }
}

void CLI::handle_status_command(const std::vector<std::string>& args) {
  try {
    std::vector<transfer::TaskHandle> handles = args.empty() ? scheduler_.tasks()
                                                             : std::vector<transfer::TaskHandle>{parse_task(args[0])};
    for (auto handle : handles) {
      auto snap = scheduler_.snapshot(handle);
      out_ << "  " << snap.id << "\t" << transfer::to_string(snap.direction) << "\t"
           << transfer::to_string(snap.status) << "\t" << snap.bytes_done << "/" << snap.total_size << "\t"
           << snap.remote_path;

      // Finished tasks are reported once, then collected
      if (snap.status == transfer::TaskStatus::Completed || snap.status == transfer::TaskStatus::Failed) {
        auto result = scheduler_.wait(handle);
        if (!result.ok()) {
          out_ << "\t" << result.message;
        }
      }
      out_ << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error reading status", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                              Display this help message" << std::endl;
  out_ << "  upload <local> <remote>           Upload a file in the background" << std::endl;
  out_ << "  download <remote> <local>         Download a file or directory in the background" << std::endl;
  out_ << "  sync <localdir> <remotedir>       Mirror a local directory remotely" << std::endl;
  out_ << "  link <local> [cs3l|short|bdpan]   Print the hash link of a file" << std::endl;
  out_ << "  rapid <link> <remotedir> [name]   Register stored content from a link" << std::endl;
  out_ << "  ls [remotedir]                    List remote files" << std::endl;
  out_ << "  status [task]                     Show transfer progress, forgetting finished tasks" << std::endl;
  out_ << "  pause|resume|cancel <task>        Control a transfer" << std::endl;
  out_ << "  quit                              Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cloudsync::cli
