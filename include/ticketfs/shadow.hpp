#pragma once
#include <filesystem>
#include <string>

#include <ticketfs/field_codec.hpp>
#include <ticketfs/git.hpp>

namespace ticketfs {

// Work tree holding the last fetched remote rendering. It is a shared clone
// of the primary history; its "origin" is the primary git dir.
class ShadowRepository {
public:
  explicit ShadowRepository(Checkout checkout);

  const Checkout& checkout() const { return checkout_; }
  const std::filesystem::path& root() const { return checkout_.work_tree(); }
  std::filesystem::path path_of(const std::string& rel) const;

  bool exists() const;

  void write(const FileTree& files) const;
  void write_file(const std::string& rel, const std::string& content) const;
  // Stages everything; false when nothing changed.
  bool commit(const std::string& message) const;
  void push_to(const std::string& target_ref) const;
  void fetch() const;

private:
  Checkout checkout_;
};

}
