#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ticketfs/field_codec.hpp>
#include <ticketfs/ticket_folder.hpp>

namespace ticketfs {

struct FieldDiff {
  std::string original;
  // nullopt when the field is gone from the working tree.
  std::optional<std::string> local;

  bool operator==(const FieldDiff& o) const { return original == o.original && local == o.local; }
};

struct Status {
  std::vector<std::string> to_upload;
  std::map<std::string, FieldDiff> local_differs;
  std::string new_comment;
};

// Reconciles a ticket folder with the tracker through the shadow history.
class SyncEngine {
public:
  explicit SyncEngine(TicketFolder& folder);
  SyncEngine(TicketFolder& folder, std::shared_ptr<const FieldCodec> codec);

  // Creates `path`, initializes it and runs a first sync.
  static std::unique_ptr<TicketFolder> clone(const std::filesystem::path& path,
                                             TicketFolder::ClientFactory client_factory,
                                             FolderOptions options = {});

  Status status();
  void fetch();
  void merge();
  void pull();
  void push();
  void sync();

  std::vector<std::string> locally_changed();
  std::vector<std::string> remotely_changed();
  FieldMap local_fields();
  FieldMap original_values();
  std::map<std::string, FieldDiff> local_differing_fields();

private:
  TicketFolder& folder_;
  std::shared_ptr<const FieldCodec> codec_;
};

}
