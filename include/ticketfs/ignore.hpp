#pragma once
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace ticketfs {

// Ordered fnmatch-style glob list matched against repository-relative names.
class IgnoreGlobSet {
public:
  IgnoreGlobSet() = default;

  void add_pattern(const std::string& pattern);
  // Missing file is not an error; returns whether it was read.
  bool load_patterns_from_file(const std::filesystem::path& file);
  bool matches(const std::string& filename) const;

  const std::vector<std::string>& patterns() const { return patterns_; }

  static std::string glob_to_regex(const std::string& pat);

private:
  std::vector<std::string> patterns_;
  std::vector<std::regex> compiled_;
};

}
