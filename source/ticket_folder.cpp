#include <ticketfs/ticket_folder.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/migrations.hpp>
#include <ticketfs/util.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ticketfs {

static fs::path checked_metadata_dir(const fs::path& folder) {
  auto dir = folder / kMetadataDir;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw NotTicketFolderException(
        fmt::format("{} is not a synchronizable ticket folder", folder.string()));
  }
  return dir;
}

fs::path TicketFolder::resolve(const fs::path& path, const Config& config) {
  fs::path p = path;
  auto s = path.string();
  if (!config.home.empty() && (s == "~" || s.rfind("~/", 0) == 0)) {
    p = config.home / s.substr(std::min<size_t>(2, s.size()));
  }
  std::error_code ec;
  auto canon = fs::weakly_canonical(fs::absolute(p), ec);
  if (ec) return fs::absolute(p).lexically_normal();
  // Drop a trailing separator so filename() is the folder name.
  if (!canon.has_filename()) canon = canon.parent_path();
  return canon;
}

std::string TicketFolder::infer_ticket_number(const fs::path& path) {
  std::string raw = path.filename().string();
  std::transform(raw.begin(), raw.end(), raw.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  static const std::regex pattern(R"(^\w+-\d+$)");
  if (!std::regex_match(raw, pattern)) {
    throw CannotInferTicketNumberFromFolderName(fmt::format(
        "Cannot infer ticket number from folder {}. Please name ticket folders "
        "after the ticket they represent.", path.string()));
  }
  return raw;
}

TicketFolder::TicketFolder(const fs::path& path, ClientFactory client_factory, FolderOptions options)
    : options_(std::move(options)),
      path_(resolve(path, options_.config)),
      ticket_number_((checked_metadata_dir(path_), infer_ticket_number(path_))),
      log_(ticket_number_, metadata_path(kOperationLog), options_.echo_sink, options_.config.echo_level),
      history_(metadata_path(kGitDir), log_.shared_logger()),
      working_(history_.primary(path_)),
      shadow_(history_.shadow(metadata_path(kShadowDir))),
      client_factory_(std::move(client_factory)) {
  if (options_.migrate) run_migrations();

  auto comment_path = local_path(kTicketNewComment);
  if (!fs::exists(comment_path)) write_file(comment_path, "");
}

std::unique_ptr<TicketFolder> TicketFolder::initialize(const fs::path& path,
                                                       ClientFactory client_factory,
                                                       FolderOptions options) {
  auto root = resolve(path, options.config);
  infer_ticket_number(root);

  auto metadata = root / kMetadataDir;
  if (!fs::create_directory(metadata)) {
    throw Error(fmt::format("{} is already a ticket folder", root.string()));
  }
  auto excludes = metadata / kExcludesFile;
  write_file(excludes, kMetadataDir + "\n");
  GitHistory::init_bare(metadata / kGitDir, excludes, kMasterBranch);

  bool migrate = options.migrate;
  options.migrate = false;
  auto folder = std::make_unique<TicketFolder>(root, std::move(client_factory), std::move(options));
  folder->log().info("Ticket folder for issue {} created at {}", folder->ticket_number(),
                     folder->path().string());
  folder->working().ensure_identity(folder->config().git_user_name, folder->config().git_user_email);
  folder->working().run({"commit", "-q", "--allow-empty", "-m", "Initialized"});
  if (migrate) folder->run_migrations(true);

  write_file(folder->local_path(kTicketNewComment), "");
  return folder;
}

fs::path TicketFolder::metadata_dir() const { return path_ / kMetadataDir; }

fs::path TicketFolder::metadata_path(const std::string& filename) const {
  return metadata_dir() / filename;
}

fs::path TicketFolder::local_path(const std::string& filename) const { return path_ / filename; }

fs::path TicketFolder::shadow_path(const std::string& filename) const {
  return metadata_path(kShadowDir) / filename;
}

int TicketFolder::version() const {
  auto content = read_file_if_exists(metadata_path(kVersionFile));
  if (!content) return kInitialRepoVersion;
  auto text = strip(*content);
  auto marker = metadata_path(kVersionFile).string();
  size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(text, &used);
  } catch (const std::logic_error& e) {
    throw Error(fmt::format("corrupt version marker {}: \"{}\" ({})", marker, text, e.what()));
  }
  if (used != text.size()) {
    throw Error(fmt::format("corrupt version marker {}: \"{}\"", marker, text));
  }
  return v;
}

void TicketFolder::set_version(int version) {
  write_file(metadata_path(kVersionFile), std::to_string(version));
}

int TicketFolder::run_migrations(bool silent) {
  static const MigrationRunner runner;
  return runner.run(*this, silent);
}

IssueTrackerClient& TicketFolder::client() {
  if (!client_) {
    if (!client_factory_) throw Error("no issue tracker client configured");
    client_ = client_factory_();
    if (!client_) throw Error("issue tracker client factory returned nothing");
  }
  return *client_;
}

const IssueSnapshot& TicketFolder::issue() {
  if (!issue_) issue_ = client().issue(ticket_number_);
  return *issue_;
}

void TicketFolder::refresh_issue() {
  issue_.reset();
}

const IssueSnapshot& TicketFolder::cached_issue() {
  if (cached_issue_) return *cached_issue_;
  auto content = read_file_if_exists(metadata_path(kCachedIssueFile));
  if (content) {
    try {
      auto snapshot = nlohmann::json::parse(*content).get<CachedIssueSnapshot>();
      cached_issue_ = IssueSnapshot(ticket_number_, std::move(snapshot.raw));
      return *cached_issue_;
    } catch (const nlohmann::json::exception& e) {
      log_.error("Error encountered while loading cached issue! ({})", e.what());
    }
  } else {
    log_.error("Error encountered while loading cached issue! ({} is missing)", kCachedIssueFile);
  }
  cached_issue_ = issue();
  return *cached_issue_;
}

void TicketFolder::store_cached_issue() {
  CachedIssueSnapshot snapshot{client().options(), issue().raw()};
  nlohmann::json j = snapshot;
  write_file(metadata_path(kCachedIssueFile), j.dump());
  cached_issue_.reset();
}

RemoteFileMetadataStore TicketFolder::remote_files() const {
  return RemoteFileMetadataStore(shadow_path(kRemoteFilesFile));
}

IgnoreGlobSet TicketFolder::ignore_globs(const std::string& which) const {
  IgnoreGlobSet globs;
  globs.add_pattern(kTicketDetails);
  globs.add_pattern(kTicketComments);
  globs.add_pattern(kTicketNewComment);
  for (const auto& field : kFileFields) globs.add_pattern(file_field_filename(field));

  globs.load_patterns_from_file(local_path(which));
  if (!config().home.empty()) globs.load_patterns_from_file(config().home / which);
  return globs;
}

std::string TicketFolder::new_comment(bool clear) {
  auto path = local_path(kTicketNewComment);
  auto content = read_file_if_exists(path);
  if (!content) return "";
  if (clear) write_file(path, "");
  return strip(*content);
}

}
