#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <ticketfs/constants.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/sync_engine.hpp>
#include <ticketfs/ticket_folder.hpp>
#include <ticketfs/util.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "test_support.hpp"

using namespace ticketfs;
namespace fs = std::filesystem;

static std::shared_ptr<IssueTrackerClient> unreachable() {
  throw Error("tracker must not be contacted");
}

TEST_CASE("folders without metadata are rejected", "[folder]") {
  auto path = mkd("ticketfs_folder_plain") / "PROJ-1";
  fs::create_directory(path);
  REQUIRE_THROWS_AS(TicketFolder(path, unreachable, quiet_options()), NotTicketFolderException);
}

TEST_CASE("ticket number comes from the folder name", "[folder]") {
  REQUIRE(TicketFolder::infer_ticket_number("/work/proj-42") == "PROJ-42");
  REQUIRE(TicketFolder::infer_ticket_number("/work/ABC_X-7") == "ABC_X-7");
  REQUIRE_THROWS_AS(TicketFolder::infer_ticket_number("/work/notes"), CannotInferTicketNumberFromFolderName);
  REQUIRE_THROWS_AS(TicketFolder::infer_ticket_number("/work/PROJ-12a"), CannotInferTicketNumberFromFolderName);

  auto path = mkd("ticketfs_folder_badname") / "notes";
  fs::create_directories(path / kMetadataDir);
  REQUIRE_THROWS_AS(TicketFolder(path, unreachable, quiet_options()), CannotInferTicketNumberFromFolderName);
}

TEST_CASE("initialize lays out a current folder", "[folder]") {
  auto path = mkd("ticketfs_folder_init") / "proj-123";
  fs::create_directory(path);
  auto folder = TicketFolder::initialize(path, unreachable, quiet_options());

  REQUIRE(folder->ticket_number() == "PROJ-123");
  REQUIRE(folder->version() == kCurrentRepoVersion);
  REQUIRE(fs::is_directory(folder->metadata_path(kGitDir)));
  REQUIRE(folder->shadow().exists());
  REQUIRE(fs::exists(folder->local_path(kTicketNewComment)));
  REQUIRE(strip(*read_file_if_exists(folder->metadata_path(kVersionFile))) == "3");
  REQUIRE(folder->remote_files().load().empty());
  REQUIRE(folder->working().rev_parse("refs/heads/" + kTrackingBranch).has_value());

  REQUIRE_THROWS_AS(TicketFolder::initialize(path, unreachable, quiet_options()), Error);

  // Reopening an up to date folder runs nothing.
  TicketFolder reopened(path, unreachable, quiet_options());
  REQUIRE(reopened.run_migrations() == 0);
}

TEST_CASE("a folder without a version marker is at version 1", "[folder]") {
  auto path = mkd("ticketfs_folder_v1") / "PROJ-5";
  fs::create_directories(path / kMetadataDir);
  auto opts = quiet_options();
  opts.migrate = false;
  TicketFolder folder(path, unreachable, opts);
  REQUIRE(folder.version() == kInitialRepoVersion);

  folder.set_version(2);
  REQUIRE(folder.version() == 2);
}

TEST_CASE("a corrupt version marker names the file", "[folder]") {
  auto path = mkd("ticketfs_folder_bad_version") / "PROJ-6";
  fs::create_directories(path / kMetadataDir);
  auto opts = quiet_options();
  opts.migrate = false;
  TicketFolder folder(path, unreachable, opts);

  for (const char* marker : {"three\n", "3x\n", "99999999999999999999"}) {
    write_file(folder.metadata_path(kVersionFile), marker);
    std::string message;
    try {
      folder.version();
    } catch (const Error& e) {
      message = e.what();
    }
    REQUIRE(message.find("corrupt version marker") != std::string::npos);
    REQUIRE(message.find(folder.metadata_path(kVersionFile).string()) != std::string::npos);
  }
}

TEST_CASE("echoed records use the log file's level names", "[folder][log]") {
  std::ostringstream echoed;
  auto opts = quiet_options();
  opts.echo_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(echoed);
  auto path = mkd("ticketfs_folder_echo") / "PROJ-8";
  fs::create_directory(path);
  auto folder = TicketFolder::initialize(path, unreachable, opts);

  folder->log().warn("heads up");
  folder->log().error("broken");
  auto text = echoed.str();
  REQUIRE(text.find("[INFO PROJ-8] Ticket folder for issue PROJ-8 created at ") != std::string::npos);
  REQUIRE(text.find("[WARNING PROJ-8] heads up\n") != std::string::npos);
  REQUIRE(text.find("[ERROR PROJ-8] broken\n") != std::string::npos);
  REQUIRE(text.find("[DEBUG") == std::string::npos);
}

TEST_CASE("operation log lines are timestamped and escaped", "[folder][log]") {
  auto folder = make_folder("ticketfs_folder_log", std::make_shared<FakeTracker>());
  folder->log().info("first line\nsecond line");
  folder->log().warn("careful {}", 3);
  folder->log().debug("detail");

  auto text = folder->read_log();
  REQUIRE(text.find("\tINFO\tfirst line\\nsecond line\n") != std::string::npos);
  REQUIRE(text.find("\tWARNING\tcareful 3\n") != std::string::npos);
  REQUIRE(text.find("\tDEBUG\tdetail\n") != std::string::npos);
  REQUIRE(text.find("\tINFO\tTicket folder for issue PROJ-123 created at ") != std::string::npos);

  for (const auto& line : split_lines(text)) {
    auto tab = line.find('\t');
    REQUIRE(tab != std::string::npos);
    REQUIRE(line.find('\t', tab + 1) != std::string::npos);
    REQUIRE(line.compare(4, 1, "-") == 0);
    REQUIRE(line.compare(10, 1, "T") == 0);
  }
}

TEST_CASE("cached issue falls back to the tracker when missing", "[folder][cache]") {
  auto tracker = std::make_shared<FakeTracker>();
  tracker->set_field("summary", "Cached?");
  auto folder = make_folder("ticketfs_folder_cache_miss", tracker);

  REQUIRE(tracker->issue_calls == 0);
  const auto& issue = folder->cached_issue();
  REQUIRE(issue.fields().at("summary") == "Cached?");
  REQUIRE(tracker->issue_calls == 1);
  REQUIRE(folder->read_log().find("\tERROR\tError encountered while loading cached issue!") != std::string::npos);
}

TEST_CASE("cached issue is read without contacting the tracker", "[folder][cache]") {
  auto tracker = std::make_shared<FakeTracker>();
  tracker->set_field("summary", "From the last fetch");
  auto folder = make_folder("ticketfs_folder_cache_hit", tracker);
  SyncEngine(*folder).fetch();

  auto stored = nlohmann::json::parse(*read_file_if_exists(folder->metadata_path(kCachedIssueFile)));
  REQUIRE(stored["options"]["server"] == "https://tracker.invalid");
  REQUIRE(stored["raw"]["fields"]["summary"] == "From the last fetch");

  TicketFolder reopened(folder->path(), unreachable, quiet_options());
  REQUIRE(reopened.cached_issue().fields().at("summary") == "From the last fetch");
}

TEST_CASE("corrupt cached issue is logged and refetched", "[folder][cache]") {
  auto tracker = std::make_shared<FakeTracker>();
  auto folder = make_folder("ticketfs_folder_cache_bad", tracker);
  write_file(folder->metadata_path(kCachedIssueFile), "{not json");

  folder->cached_issue();
  REQUIRE(tracker->issue_calls == 1);
  REQUIRE(folder->read_log().find("\tERROR\tError encountered while loading cached issue!") != std::string::npos);
}

TEST_CASE("ignore globs combine built-ins, folder and home files", "[folder][ignore]") {
  auto root = mkd("ticketfs_folder_ignore");
  auto home = root / "home";
  fs::create_directory(home);
  write_file(home / kIgnoreFile, "*.bak\n");

  auto path = root / "PROJ-9";
  fs::create_directory(path);
  auto folder = TicketFolder::initialize(path, unreachable, quiet_options(home));
  write_file(folder->local_path(kIgnoreFile), "# local\n*.tmp\n");

  auto globs = folder->ignore_globs();
  REQUIRE(globs.matches(kTicketDetails));
  REQUIRE(globs.matches(kTicketComments));
  REQUIRE(globs.matches(kTicketNewComment));
  REQUIRE(globs.matches(file_field_filename("description")));
  REQUIRE(globs.matches("scratch.tmp"));
  REQUIRE(globs.matches("old.bak"));
  REQUIRE_FALSE(globs.matches("notes.txt"));

  auto remote = folder->ignore_globs(kRemoteIgnoreFile);
  REQUIRE_FALSE(remote.matches("scratch.tmp"));
  REQUIRE(remote.matches(kTicketDetails));
}

TEST_CASE("new comment buffer is stripped and optionally cleared", "[folder]") {
  auto folder = make_folder("ticketfs_folder_comment", std::make_shared<FakeTracker>());
  REQUIRE(folder->new_comment().empty());

  write_file(folder->local_path(kTicketNewComment), "\n  looks good  \n\n");
  REQUIRE(folder->new_comment() == "looks good");
  REQUIRE(folder->new_comment(true) == "looks good");
  REQUIRE(read_file_if_exists(folder->local_path(kTicketNewComment)) == std::string());
}
