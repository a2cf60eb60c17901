#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace ticketfs {

// attachment filename -> change token of the copy last synced
using RemoteFileMetadata = std::map<std::string, std::string>;

class RemoteFileMetadataStore {
public:
  explicit RemoteFileMetadataStore(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

  // Empty when the file does not exist yet.
  RemoteFileMetadata load() const;
  void save(const RemoteFileMetadata& data) const;

  static bool changed(const RemoteFileMetadata& data, const std::string& filename,
                      const std::string& token);

private:
  std::filesystem::path path_;
};

}
