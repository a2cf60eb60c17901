#include <ticketfs/ignore.hpp>
#include <ticketfs/util.hpp>

#include <fstream>

namespace ticketfs {

std::string IgnoreGlobSet::glob_to_regex(const std::string& pat) {
  std::string rx;
  size_t i = 0;
  while (i < pat.size()) {
    char c = pat[i++];
    if (c == '*') {
      rx += ".*";
    } else if (c == '?') {
      rx += '.';
    } else if (c == '[') {
      size_t j = i;
      if (j < pat.size() && pat[j] == '!') ++j;
      if (j < pat.size() && pat[j] == ']') ++j;
      while (j < pat.size() && pat[j] != ']') ++j;
      if (j >= pat.size()) {
        rx += "\\[";
        continue;
      }
      std::string cls = pat.substr(i, j - i);
      i = j + 1;
      std::string body;
      for (size_t k = 0; k < cls.size(); ++k) {
        if (k == 0 && cls[k] == '!') { body.push_back('^'); continue; }
        if (cls[k] == '\\' || (k == 0 && cls[k] == '^')) body.push_back('\\');
        body.push_back(cls[k]);
      }
      rx += "[" + body + "]";
    } else if (c == '.' || c == '+' || c == '(' || c == ')' || c == '{' || c == '}' ||
               c == ']' || c == '^' || c == '$' || c == '|' || c == '\\') {
      rx.push_back('\\');
      rx.push_back(c);
    } else {
      rx.push_back(c);
    }
  }
  return rx;
}

void IgnoreGlobSet::add_pattern(const std::string& pattern) {
  patterns_.push_back(pattern);
  compiled_.emplace_back(glob_to_regex(pattern));
}

bool IgnoreGlobSet::load_patterns_from_file(const std::filesystem::path& file) {
  auto content = read_file_if_exists(file);
  if (!content) return false;
  for (const auto& line : split_lines(*content)) {
    if (!line.empty() && line[0] == '#') continue;
    std::string s = strip(line);
    if (s.empty()) continue;
    add_pattern(s);
  }
  return true;
}

bool IgnoreGlobSet::matches(const std::string& filename) const {
  for (const auto& re : compiled_) {
    if (std::regex_match(filename, re)) return true;
  }
  return false;
}

}
