#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <ticketfs/remote_files.hpp>
#include <ticketfs/util.hpp>

#include "test_support.hpp"

using namespace ticketfs;

TEST_CASE("metadata store starts empty", "[remote_files]") {
  auto dir = mkd("ticketfs_remote_files_empty");
  RemoteFileMetadataStore store(dir / ".ticketfs" / "remote_files.json");
  REQUIRE(store.load().empty());

  write_file(store.path(), "  \n");
  REQUIRE(store.load().empty());
}

TEST_CASE("metadata store persists tokens as json", "[remote_files]") {
  auto dir = mkd("ticketfs_remote_files_save");
  RemoteFileMetadataStore store(dir / ".ticketfs" / "remote_files.json");
  store.save({{"spec.pdf", "T1"}, {"notes.txt", "T2"}});

  auto loaded = RemoteFileMetadataStore(store.path()).load();
  REQUIRE(loaded.size() == 2);
  REQUIRE(loaded.at("spec.pdf") == "T1");
  REQUIRE(loaded.at("notes.txt") == "T2");

  auto raw = nlohmann::json::parse(*read_file_if_exists(store.path()));
  REQUIRE(raw["spec.pdf"] == "T1");
}

TEST_CASE("a token is changed when absent or different", "[remote_files]") {
  RemoteFileMetadata data{{"spec.pdf", "T1"}};
  REQUIRE_FALSE(RemoteFileMetadataStore::changed(data, "spec.pdf", "T1"));
  REQUIRE(RemoteFileMetadataStore::changed(data, "spec.pdf", "T2"));
  REQUIRE(RemoteFileMetadataStore::changed(data, "other.pdf", "T1"));
}
