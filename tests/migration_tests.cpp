#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <ticketfs/constants.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/migrations.hpp>
#include <ticketfs/ticket_folder.hpp>
#include <ticketfs/util.hpp>

#include <filesystem>
#include <vector>

#include "test_support.hpp"

using namespace ticketfs;
namespace fs = std::filesystem;

static Migration step(int version, std::vector<int>* applied) {
  return Migration{version, "step_" + std::to_string(version), [version, applied](TicketFolder& f) {
                     applied->push_back(version);
                     f.set_version(version);
                   }};
}

TEST_CASE("migration table must cover every version in order", "[migrations]") {
  std::vector<int> applied;
  REQUIRE_NOTHROW(MigrationRunner({step(2, &applied), step(3, &applied)}, 3));
  REQUIRE_NOTHROW(MigrationRunner({}, 1));

  // gap
  REQUIRE_THROWS_AS(MigrationRunner({step(2, &applied), step(4, &applied)}, 3), MigrationError);
  // wrong size
  REQUIRE_THROWS_AS(MigrationRunner({step(2, &applied)}, 3), MigrationError);
  REQUIRE_THROWS_AS(MigrationRunner({step(2, &applied), step(3, &applied), step(4, &applied)}, 3),
                    MigrationError);
  // out of order
  REQUIRE_THROWS_AS(MigrationRunner({step(3, &applied), step(2, &applied)}, 3), MigrationError);
  // no body
  REQUIRE_THROWS_AS(MigrationRunner({Migration{2, "empty", nullptr}}, 2), MigrationError);

  REQUIRE(applied.empty());
}

TEST_CASE("the built-in table is consistent", "[migrations]") {
  MigrationRunner runner;
  REQUIRE(runner.current_version() == kCurrentRepoVersion);
  REQUIRE(MigrationRunner::builtin().size() == static_cast<size_t>(kCurrentRepoVersion - kInitialRepoVersion));
}

TEST_CASE("pending migrations run once in ascending order", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_order", std::make_shared<FakeTracker>(), false);
  REQUIRE(folder->version() == 1);

  std::vector<int> applied;
  MigrationRunner runner({step(2, &applied), step(3, &applied)}, 3);
  REQUIRE(runner.run(*folder) == 2);
  REQUIRE(applied == std::vector<int>{2, 3});
  REQUIRE(folder->version() == 3);

  REQUIRE(runner.run(*folder) == 0);
  REQUIRE(applied.size() == 2);

  auto log = folder->read_log();
  REQUIRE(log.find("\tINFO\tstep_2: Migration started\n") != std::string::npos);
  REQUIRE(log.find("\tINFO\tstep_3: Migration finished\n") != std::string::npos);
}

TEST_CASE("silent migrations log at debug", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_silent", std::make_shared<FakeTracker>(), false);
  std::vector<int> applied;
  MigrationRunner runner({step(2, &applied), step(3, &applied)}, 3);
  runner.run(*folder, true);
  REQUIRE(folder->read_log().find("\tDEBUG\tstep_2: Migration started\n") != std::string::npos);
}

TEST_CASE("a failing migration stops the run at the last good version", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_fail", std::make_shared<FakeTracker>(), false);
  std::vector<int> applied;
  MigrationRunner runner({step(2, &applied), Migration{3, "step_3", [](TicketFolder&) {
                                                         throw Error("boom");
                                                       }}},
                         3);
  REQUIRE_THROWS_WITH(runner.run(*folder), "boom");
  REQUIRE(applied == std::vector<int>{2});
  REQUIRE(folder->version() == 2);
}

TEST_CASE("a migration that does not record its version is an error", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_stuck", std::make_shared<FakeTracker>(), false);
  MigrationRunner runner({Migration{2, "lazy", [](TicketFolder&) {}}}, 2);
  REQUIRE_THROWS_AS(runner.run(*folder), MigrationError);
  REQUIRE(folder->version() == 1);
}

TEST_CASE("built-in migrations create the shadow and remote file metadata", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_builtin", std::make_shared<FakeTracker>(), false);
  REQUIRE_FALSE(folder->shadow().exists());

  REQUIRE(folder->run_migrations() == 2);
  REQUIRE(folder->version() == 3);
  REQUIRE(folder->shadow().exists());
  REQUIRE(fs::exists(folder->remote_files().path()));
  REQUIRE(folder->remote_files().load().empty());

  // The tracking branch carries the metadata file and master has merged it.
  const auto& working = folder->working();
  REQUIRE(working.read_file_at(kTrackingBranch, kRemoteFilesFile).has_value());
  REQUIRE(working.read_file_at(kMasterBranch, kRemoteFilesFile).has_value());
  REQUIRE(working.rev_parse(kMasterBranch) == working.rev_parse(kTrackingBranch));

  auto log = folder->read_log();
  REQUIRE(log.find("migration_0002: Migration started") != std::string::npos);
  REQUIRE(log.find("migration_0003: Migration finished") != std::string::npos);
}

TEST_CASE("re-running the shadow migration reuses the tracking branch", "[migrations]") {
  auto folder = make_folder("ticketfs_migrations_rerun", std::make_shared<FakeTracker>());
  auto jira_before = folder->working().rev_parse(kTrackingBranch);

  migration_0002_create_shadow(*folder);
  REQUIRE(folder->shadow().exists());
  REQUIRE(folder->shadow().checkout().rev_parse("HEAD") == jira_before);
  REQUIRE(folder->working().rev_parse(kTrackingBranch) == jira_before);
}
