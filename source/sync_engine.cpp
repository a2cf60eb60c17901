#include <ticketfs/sync_engine.hpp>
#include <ticketfs/constants.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/util.hpp>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace ticketfs {

static bool safe_attachment_name(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

SyncEngine::SyncEngine(TicketFolder& folder)
    : SyncEngine(folder, std::make_shared<RstFieldCodec>()) {}

SyncEngine::SyncEngine(TicketFolder& folder, std::shared_ptr<const FieldCodec> codec)
    : folder_(folder), codec_(std::move(codec)) {}

std::unique_ptr<TicketFolder> SyncEngine::clone(const fs::path& path,
                                                TicketFolder::ClientFactory client_factory,
                                                FolderOptions options) {
  if (!fs::create_directory(path)) {
    throw Error(fmt::format("{} already exists", path.string()));
  }
  auto folder = TicketFolder::initialize(path, std::move(client_factory), std::move(options));
  SyncEngine(*folder).sync();
  return folder;
}

std::vector<std::string> SyncEngine::locally_changed() {
  auto globs = folder_.ignore_globs(kIgnoreFile);
  const auto& working = folder_.working();

  auto candidates = working.untracked_files();
  auto modified = working.modified_files();
  candidates.insert(candidates.end(), modified.begin(), modified.end());

  std::vector<std::string> assets;
  for (const auto& filename : candidates) {
    if (globs.matches(filename)) continue;
    std::error_code ec;
    if (!fs::is_regular_file(folder_.local_path(filename), ec)) continue;
    if (filename[0] == '.') continue;
    assets.push_back(filename);
  }
  return assets;
}

std::vector<std::string> SyncEngine::remotely_changed() {
  auto globs = folder_.ignore_globs(kRemoteIgnoreFile);
  auto metadata = folder_.remote_files().load();

  std::vector<std::string> assets;
  for (const auto& attachment : folder_.issue().attachments()) {
    if (globs.matches(attachment.filename)) continue;
    if (RemoteFileMetadataStore::changed(metadata, attachment.filename, attachment.created)) {
      assets.push_back(attachment.filename);
    }
  }
  return assets;
}

FieldMap SyncEngine::local_fields() {
  return codec_->parse([this](const std::string& name) {
    return read_file_if_exists(folder_.local_path(name));
  });
}

FieldMap SyncEngine::original_values() {
  const auto& working = folder_.working();
  auto base = working.merge_base(kMasterBranch, kTrackingBranch);
  return codec_->parse([&working, &base](const std::string& name) {
    return working.read_file_at(base, name);
  });
}

std::map<std::string, FieldDiff> SyncEngine::local_differing_fields() {
  auto local = local_fields();
  auto original = original_values();

  std::map<std::string, FieldDiff> differing;
  for (const auto& [field, value] : original) {
    auto it = local.find(field);
    if (it != local.end() && it->second == value) continue;
    FieldDiff diff{value, std::nullopt};
    if (it != local.end()) diff.local = it->second;
    differing.emplace(field, std::move(diff));
  }
  return differing;
}

Status SyncEngine::status() {
  Status st;
  st.to_upload = locally_changed();
  st.local_differs = local_differing_fields();
  st.new_comment = folder_.new_comment(false);
  return st;
}

void SyncEngine::fetch() {
  folder_.refresh_issue();
  const auto& issue = folder_.issue();
  const auto& shadow = folder_.shadow();
  auto store = folder_.remote_files();
  auto file_meta = store.load();

  auto changed = remotely_changed();
  for (const auto& filename : changed) {
    if (!safe_attachment_name(filename)) {
      folder_.log().warn("Skipping attachment with unsafe name \"{}\"", filename);
      continue;
    }
    for (const auto& attachment : issue.attachments()) {
      if (attachment.filename != filename) continue;
      folder_.log().info("Download file \"{}\"", filename);
      shadow.write_file(filename, folder_.client().attachment_content(attachment));
      file_meta[filename] = attachment.created;
    }
  }
  store.save(file_meta);

  shadow.write(codec_->render(issue));
  folder_.store_cached_issue();

  if (!shadow.commit("Pulled remote changes")) {
    folder_.log().debug("No remote changes to record");
  }
  shadow.push_to(kTrackingBranch);
}

void SyncEngine::merge() {
  const auto& working = folder_.working();
  bool stashed = working.stash();
  try {
    working.merge_from(kTrackingBranch);
  } catch (const GitCommandError& e) {
    folder_.log().error("Merging remote changes failed: {}", e.what());
    if (stashed) folder_.log().warn("Uncommitted local changes were left in the git stash");
    throw;
  }
  if (stashed && !working.stash_pop()) {
    folder_.log().warn("Could not restore stashed local changes cleanly");
  }
}

void SyncEngine::pull() {
  fetch();
  merge();
}

void SyncEngine::push() {
  // Attachment ids change on every upload; never delete from a stale listing.
  folder_.refresh_issue();
  auto st = status();
  auto store = folder_.remote_files();
  auto file_meta = store.load();
  auto& client = folder_.client();
  const auto& key = folder_.ticket_number();

  for (const auto& filename : st.to_upload) {
    auto content = read_file_if_exists(folder_.local_path(filename));
    if (!content) continue;
    folder_.log().info("Uploading file \"{}\"", filename);
    for (const auto& attachment : folder_.issue().attachments()) {
      if (attachment.filename == filename) client.delete_attachment(attachment);
    }
    auto uploaded = client.add_attachment(key, filename, *content);
    file_meta[filename] = uploaded.created;
  }

  // The buffer is cleared only once the tracker has accepted the comment.
  if (!st.new_comment.empty()) {
    folder_.log().info("Adding comment \"{}\"", st.new_comment);
    client.add_comment(key, st.new_comment);
    folder_.new_comment(true);
  }

  auto updates = nlohmann::json::object();
  for (const auto& [field, diff] : st.local_differs) {
    updates[field] = diff.local ? nlohmann::json(*diff.local) : nlohmann::json(nullptr);
  }
  if (!updates.empty()) {
    folder_.log().info("Updating fields \"{}\"", updates.dump());
    client.update(key, updates);
  }

  const auto& working = folder_.working();
  working.stage_all();
  working.commit("Pushed local changes");

  // Record the metadata of what was just uploaded in the shadow as well.
  const auto& shadow = folder_.shadow();
  shadow.fetch();
  working.merge_from(kTrackingBranch);
  store.save(file_meta);
  shadow.commit("Pulled remote changes");
  shadow.push_to(kTrackingBranch);
}

void SyncEngine::sync() {
  pull();
  push();
}

}
