#include <ticketfs/config.hpp>

#include <cstdlib>

namespace ticketfs {

Config Config::from_env() {
  Config cfg;
  if (const char* e = std::getenv("HOME")) cfg.home = e;
  if (const char* e = std::getenv("TICKETFS_LOG_LEVEL")) cfg.echo_level = spdlog::level::from_str(e);
  if (const char* e = std::getenv("TICKETFS_GIT_USER")) cfg.git_user_name = e;
  if (const char* e = std::getenv("TICKETFS_GIT_EMAIL")) cfg.git_user_email = e;
  return cfg;
}

}
