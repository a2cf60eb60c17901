#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ticketfs {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

CmdResult run_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd);

std::string iso8601_now();

std::string strip(const std::string& s);
std::string normalize_newlines(const std::string& s);
std::vector<std::string> split_lines(const std::string& s);

// std::nullopt only when the file does not exist; other failures throw.
std::optional<std::string> read_file_if_exists(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& data);

}
