#include <ticketfs/shadow.hpp>
#include <ticketfs/util.hpp>

namespace ticketfs {

static const char* kOrigin = "origin";

ShadowRepository::ShadowRepository(Checkout checkout) : checkout_(std::move(checkout)) {}

std::filesystem::path ShadowRepository::path_of(const std::string& rel) const {
  return root() / rel;
}

bool ShadowRepository::exists() const {
  std::error_code ec;
  return std::filesystem::exists(checkout_.git_dir(), ec);
}

void ShadowRepository::write(const FileTree& files) const {
  for (const auto& [rel, content] : files) write_file(rel, content);
}

void ShadowRepository::write_file(const std::string& rel, const std::string& content) const {
  ::ticketfs::write_file(path_of(rel), content);
}

bool ShadowRepository::commit(const std::string& message) const {
  checkout_.stage_all();
  return checkout_.commit(message);
}

void ShadowRepository::push_to(const std::string& target_ref) const {
  checkout_.push_ref(kOrigin, target_ref);
}

void ShadowRepository::fetch() const {
  checkout_.fetch(kOrigin);
}

}
