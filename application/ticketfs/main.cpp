#include <ticketfs/config.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/sync_engine.hpp>
#include <ticketfs/ticket_folder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace ticketfs_cli {

static const char* kVersion = "0.3.0";

struct Args {
  std::string cmd;
  std::vector<std::string> pos;
  std::string path = ".";
  bool verbose = false;
};

static Args parse(int argc, char** argv) {
  Args a{};
  if (argc > 1) a.cmd = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string s = argv[i];
    if (s == "--path" && i + 1 < argc) a.path = argv[++i];
    else if (s == "-v" || s == "--verbose") a.verbose = true;
    else a.pos.push_back(s);
  }
  return a;
}

static void print_help() {
  std::cout <<
    "ticketfs - edit issue tracker tickets as plain-text folders\n"
    "\n"
    "usage:\n"
    "  ticketfs init <path>\n"
    "  ticketfs status  [--path PATH]\n"
    "  ticketfs log     [--path PATH]\n"
    "  ticketfs migrate [--path PATH]\n"
    "  ticketfs version\n";
}

static ticketfs::FolderOptions options_for(const Args& a) {
  ticketfs::FolderOptions opts;
  opts.config = ticketfs::Config::from_env();
  if (a.verbose) opts.config.echo_level = spdlog::level::debug;
  return opts;
}

// No tracker binding ships with the command line tool.
static std::shared_ptr<ticketfs::IssueTrackerClient> no_tracker() {
  throw ticketfs::TrackerError("no issue tracker binding is configured for this command");
}

static int cmd_init(const Args& a) {
  if (a.pos.empty()) { std::cerr << "usage: init <path>\n"; return 2; }
  auto folder = ticketfs::TicketFolder::initialize(a.pos[0], no_tracker, options_for(a));
  std::cout << fmt::format("initialized {} for {}\n", folder->path().string(), folder->ticket_number());
  return 0;
}

static int cmd_status(const Args& a) {
  ticketfs::TicketFolder folder(a.path, no_tracker, options_for(a));
  auto st = ticketfs::SyncEngine(folder).status();

  std::cout << fmt::format("On ticket {}\n", folder.ticket_number());
  if (!st.to_upload.empty()) {
    std::cout << "\nFiles to upload:\n";
    for (const auto& f : st.to_upload) std::cout << fmt::format("  {}\n", f);
  }
  if (!st.local_differs.empty()) {
    std::cout << "\nFields changed locally:\n";
    for (const auto& [field, diff] : st.local_differs) {
      std::cout << fmt::format("  {}: \"{}\" -> {}\n", field, diff.original,
                               diff.local ? fmt::format("\"{}\"", *diff.local) : "<removed>");
    }
  }
  if (!st.new_comment.empty()) {
    std::cout << fmt::format("\nNew comment:\n  {}\n", st.new_comment);
  }
  if (st.to_upload.empty() && st.local_differs.empty() && st.new_comment.empty()) {
    std::cout << "Nothing to push.\n";
  }
  return 0;
}

static int cmd_log(const Args& a) {
  ticketfs::TicketFolder folder(a.path, no_tracker, options_for(a));
  std::cout << folder.read_log();
  return 0;
}

static int cmd_migrate(const Args& a) {
  auto opts = options_for(a);
  opts.migrate = false;
  ticketfs::TicketFolder folder(a.path, no_tracker, opts);
  int before = folder.version();
  int applied = folder.run_migrations();
  std::cout << fmt::format("version {} -> {} ({} migrations)\n", before, folder.version(), applied);
  return 0;
}

static int run(const Args& a) {
  if (a.cmd.empty() || a.cmd == "help" || a.cmd == "--help") { print_help(); return a.cmd.empty() ? 2 : 0; }
  if (a.cmd == "version" || a.cmd == "--version") { std::cout << kVersion << "\n"; return 0; }
  if (a.cmd == "init") return cmd_init(a);
  if (a.cmd == "status") return cmd_status(a);
  if (a.cmd == "log") return cmd_log(a);
  if (a.cmd == "migrate") return cmd_migrate(a);
  if (a.cmd == "fetch" || a.cmd == "pull" || a.cmd == "push" || a.cmd == "sync" || a.cmd == "clone") {
    spdlog::error("{}: no issue tracker binding is available in this build", a.cmd);
    return 1;
  }
  spdlog::error("unknown command: {}", a.cmd);
  print_help();
  return 2;
}

}

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  auto args = ticketfs_cli::parse(argc, argv);
  try {
    return ticketfs_cli::run(args);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
