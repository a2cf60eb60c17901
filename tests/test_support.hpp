#pragma once
#include <ticketfs/ticket_folder.hpp>

#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <memory>
#include <string>

#include "fake_tracker.hpp"

// Fresh, empty scratch directory under the system temp dir.
inline std::filesystem::path mkd(const std::string& tag) {
  auto p = std::filesystem::temp_directory_path() / tag;
  std::filesystem::remove_all(p);
  std::filesystem::create_directories(p);
  return p;
}

inline ticketfs::FolderOptions quiet_options(std::filesystem::path home = {}) {
  ticketfs::FolderOptions opts;
  opts.config.home = std::move(home);
  opts.echo_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return opts;
}

inline ticketfs::TicketFolder::ClientFactory factory_for(std::shared_ptr<FakeTracker> tracker) {
  return [tracker]() -> std::shared_ptr<ticketfs::IssueTrackerClient> { return tracker; };
}

// "<tag>/PROJ-123", initialized against `tracker`.
inline std::unique_ptr<ticketfs::TicketFolder> make_folder(const std::string& tag,
                                                           std::shared_ptr<FakeTracker> tracker,
                                                           bool migrate = true) {
  auto path = mkd(tag) / "PROJ-123";
  std::filesystem::create_directory(path);
  auto opts = quiet_options();
  opts.migrate = migrate;
  return ticketfs::TicketFolder::initialize(path, factory_for(std::move(tracker)), std::move(opts));
}
