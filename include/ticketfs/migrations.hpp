#pragma once
#include <functional>
#include <string>
#include <vector>

namespace ticketfs {

class TicketFolder;

// Brings a folder from `version - 1` to `version`. Must persist `version`
// as its last step so an interrupted run is retried from the same point.
struct Migration {
  int version;
  std::string name;
  std::function<void(TicketFolder&)> apply;
};

class MigrationRunner {
public:
  MigrationRunner();
  // Throws MigrationError unless `table` covers 2..current_version in order.
  MigrationRunner(std::vector<Migration> table, int current_version);

  int current_version() const { return current_version_; }

  // Applies every pending migration in ascending order; returns how many ran.
  int run(TicketFolder& folder, bool silent = false) const;

  static const std::vector<Migration>& builtin();

private:
  void validate() const;

  std::vector<Migration> table_;
  int current_version_;
};

void migration_0002_create_shadow(TicketFolder& folder);
void migration_0003_remote_file_metadata(TicketFolder& folder);

}
