#pragma once
#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace ticketfs {

struct Config {
  // Global ignore files are looked up here; empty disables them.
  std::filesystem::path home;
  spdlog::level::level_enum echo_level = spdlog::level::info;
  std::string git_user_name = "ticketfs";
  std::string git_user_email = "ticketfs@localhost";

  static Config from_env();
};

}
