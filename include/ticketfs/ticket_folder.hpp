#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include <ticketfs/config.hpp>
#include <ticketfs/constants.hpp>
#include <ticketfs/git.hpp>
#include <ticketfs/ignore.hpp>
#include <ticketfs/issue.hpp>
#include <ticketfs/oplog.hpp>
#include <ticketfs/remote_files.hpp>
#include <ticketfs/shadow.hpp>

namespace ticketfs {

struct FolderOptions {
  Config config;
  // Receives log records at config.echo_level and above; null means stdout.
  spdlog::sink_ptr echo_sink;
  bool migrate = true;
};

// A directory named after a ticket key holding the rendered ticket, its
// metadata dir, the primary git history and the shadow clone.
class TicketFolder {
public:
  using ClientFactory = std::function<std::shared_ptr<IssueTrackerClient>()>;

  TicketFolder(const std::filesystem::path& path, ClientFactory client_factory,
               FolderOptions options = {});
  TicketFolder(const TicketFolder&) = delete;
  TicketFolder& operator=(const TicketFolder&) = delete;

  // Creates the metadata dir and both histories inside an existing directory.
  static std::unique_ptr<TicketFolder> initialize(const std::filesystem::path& path,
                                                  ClientFactory client_factory,
                                                  FolderOptions options = {});

  static std::string infer_ticket_number(const std::filesystem::path& path);

  const std::filesystem::path& path() const { return path_; }
  const std::string& ticket_number() const { return ticket_number_; }
  const Config& config() const { return options_.config; }

  std::filesystem::path metadata_dir() const;
  std::filesystem::path metadata_path(const std::string& filename) const;
  std::filesystem::path local_path(const std::string& filename) const;
  std::filesystem::path shadow_path(const std::string& filename) const;

  int version() const;
  void set_version(int version);
  int run_migrations(bool silent = false);

  IssueTrackerClient& client();
  // Live issue, fetched on first use and kept for this instance's lifetime.
  const IssueSnapshot& issue();
  void refresh_issue();
  // Issue restored from the snapshot of the last fetch; falls back to issue().
  const IssueSnapshot& cached_issue();
  void store_cached_issue();

  const GitHistory& history() const { return history_; }
  const Checkout& working() const { return working_; }
  const ShadowRepository& shadow() const { return shadow_; }
  RemoteFileMetadataStore remote_files() const;

  IgnoreGlobSet ignore_globs(const std::string& which = kIgnoreFile) const;

  // Pending comment buffer, stripped.
  std::string new_comment(bool clear = false);

  OperationLog& log() { return log_; }
  std::string read_log() const { return log_.read(); }

private:
  static std::filesystem::path resolve(const std::filesystem::path& path, const Config& config);

  FolderOptions options_;
  std::filesystem::path path_;
  std::string ticket_number_;
  OperationLog log_;
  GitHistory history_;
  Checkout working_;
  ShadowRepository shadow_;

  ClientFactory client_factory_;
  std::shared_ptr<IssueTrackerClient> client_;
  std::optional<IssueSnapshot> issue_;
  std::optional<IssueSnapshot> cached_issue_;
};

}
