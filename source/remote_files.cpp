#include <ticketfs/remote_files.hpp>
#include <ticketfs/util.hpp>

#include <nlohmann/json.hpp>

namespace ticketfs {

RemoteFileMetadataStore::RemoteFileMetadataStore(std::filesystem::path path)
    : path_(std::move(path)) {}

RemoteFileMetadata RemoteFileMetadataStore::load() const {
  auto content = read_file_if_exists(path_);
  if (!content || strip(*content).empty()) return {};
  return nlohmann::json::parse(*content).get<RemoteFileMetadata>();
}

void RemoteFileMetadataStore::save(const RemoteFileMetadata& data) const {
  nlohmann::json j = data;
  write_file(path_, j.dump());
}

bool RemoteFileMetadataStore::changed(const RemoteFileMetadata& data, const std::string& filename,
                                      const std::string& token) {
  auto it = data.find(filename);
  return it == data.end() || it->second != token;
}

}
