#include <ticketfs/migrations.hpp>
#include <ticketfs/constants.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/ticket_folder.hpp>

#include <fmt/format.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace ticketfs {

static const char* kOrigin = "origin";

void migration_0002_create_shadow(TicketFolder& folder) {
  auto shadow_dir = folder.metadata_path(kShadowDir);
  // A previous attempt may have died half way through the clone.
  if (fs::exists(shadow_dir)) fs::remove_all(shadow_dir);

  auto shadow = folder.history().clone_shadow(shadow_dir);
  shadow.ensure_identity(folder.config().git_user_name, folder.config().git_user_email);
  if (shadow.rev_parse("refs/remotes/origin/" + kTrackingBranch)) {
    shadow.run({"checkout", "-q", "-B", kTrackingBranch, "origin/" + kTrackingBranch});
  } else {
    shadow.run({"checkout", "-q", "-b", kTrackingBranch});
    shadow.run({"commit", "-q", "--allow-empty", "-m", "Shadow created"});
  }
  shadow.push_ref(kOrigin, kTrackingBranch);
  folder.set_version(2);
}

void migration_0003_remote_file_metadata(TicketFolder& folder) {
  auto store = folder.remote_files();
  if (!fs::exists(store.path())) store.save({});

  const auto& shadow = folder.shadow();
  shadow.commit("Remote file metadata created");
  shadow.push_to(kTrackingBranch);
  folder.working().merge_from(kTrackingBranch);
  folder.set_version(3);
}

MigrationRunner::MigrationRunner() : MigrationRunner(builtin(), kCurrentRepoVersion) {}

MigrationRunner::MigrationRunner(std::vector<Migration> table, int current_version)
    : table_(std::move(table)), current_version_(current_version) {
  validate();
}

const std::vector<Migration>& MigrationRunner::builtin() {
  static const std::vector<Migration> table = {
      {2, "migration_0002", migration_0002_create_shadow},
      {3, "migration_0003", migration_0003_remote_file_metadata},
  };
  return table;
}

void MigrationRunner::validate() const {
  if (current_version_ < kInitialRepoVersion) {
    throw MigrationError(fmt::format("invalid current version {}", current_version_));
  }
  if (static_cast<int>(table_.size()) != current_version_ - kInitialRepoVersion) {
    throw MigrationError(fmt::format("migration table has {} entries, expected {}",
                                     table_.size(), current_version_ - kInitialRepoVersion));
  }
  for (size_t i = 0; i < table_.size(); ++i) {
    int expected = kInitialRepoVersion + 1 + static_cast<int>(i);
    if (table_[i].version != expected) {
      throw MigrationError(fmt::format("migration for version {} missing (found {} at position {})",
                                       expected, table_[i].version, i));
    }
    if (!table_[i].apply) {
      throw MigrationError(fmt::format("migration {} has no body", table_[i].name));
    }
  }
}

int MigrationRunner::run(TicketFolder& folder, bool silent) const {
  auto level = silent ? spdlog::level::debug : spdlog::level::info;
  int applied = 0;
  while (folder.version() < current_version_) {
    int next = folder.version() + 1;
    const auto& m = table_.at(static_cast<size_t>(next - kInitialRepoVersion - 1));
    folder.log().logger().log(level, "{}: Migration started", m.name);
    m.apply(folder);
    folder.log().logger().log(level, "{}: Migration finished", m.name);
    if (folder.version() < next) {
      throw MigrationError(fmt::format("{} did not record version {}", m.name, next));
    }
    ++applied;
  }
  return applied;
}

}
