#include <ticketfs/git.hpp>
#include <ticketfs/errors.hpp>
#include <ticketfs/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>


namespace fs = std::filesystem;

namespace ticketfs {

GitCommandError::GitCommandError(std::vector<std::string> argv, int exit_code, std::string stderr_text)
    : Error(fmt::format("git command failed (rc={}): {}: {}", exit_code, fmt::join(argv, " "),
                        strip(stderr_text))),
      argv_(std::move(argv)),
      exit_code_(exit_code),
      stderr_(std::move(stderr_text)) {}

std::vector<std::string> split_nul_terminated(const std::string& s) {
  std::vector<std::string> v;
  size_t start = 0;
  while (start < s.size()) {
    auto end = s.find('\0', start);
    if (end == std::string::npos) end = s.size();
    if (end > start) v.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return v;
}

Checkout::Checkout(std::string name, fs::path work_tree, fs::path git_dir,
                   std::shared_ptr<spdlog::logger> log)
    : name_(std::move(name)),
      work_tree_(std::move(work_tree)),
      git_dir_(std::move(git_dir)),
      log_(std::move(log)) {}

std::vector<std::string> Checkout::argv_for(const std::vector<std::string>& args) const {
  std::vector<std::string> argv{"git", "--work-tree=" + work_tree_.string(),
                                "--git-dir=" + git_dir_.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

std::string Checkout::run(const std::vector<std::string>& args) const {
  auto argv = argv_for(args);
  if (log_) log_->debug("Executing git command ({}) {}", name_, fmt::join(argv, " "));
  auto r = run_command(argv, work_tree_);
  if (r.exit_code != 0) throw GitCommandError(std::move(argv), r.exit_code, r.err);
  return strip(r.out);
}

std::optional<std::string> Checkout::try_run(const std::vector<std::string>& args) const {
  auto out = try_run_raw(args);
  if (!out) return std::nullopt;
  return strip(*out);
}

std::optional<std::string> Checkout::try_run_raw(const std::vector<std::string>& args) const {
  auto argv = argv_for(args);
  if (log_) log_->debug("Executing git command ({}) {}", name_, fmt::join(argv, " "));
  auto r = run_command(argv, work_tree_);
  if (r.exit_code != 0) {
    if (log_) log_->debug("git exited with rc={}: {}", r.exit_code, strip(r.err));
    return std::nullopt;
  }
  return std::move(r.out);
}

void Checkout::ensure_identity(const std::string& user_name, const std::string& user_email) const {
  auto name = try_run({"config", "user.name"});
  if (!name || name->empty()) run({"config", "user.name", user_name});
  auto email = try_run({"config", "user.email"});
  if (!email || email->empty()) run({"config", "user.email", user_email});
}

void Checkout::stage_all() const {
  run({"add", "-A"});
}

bool Checkout::commit(const std::string& message) const {
  auto argv = argv_for({"diff", "--cached", "--quiet"});
  if (log_) log_->debug("Executing git command ({}) {}", name_, fmt::join(argv, " "));
  auto r = run_command(argv, work_tree_);
  if (r.exit_code == 0) return false;
  if (r.exit_code != 1) throw GitCommandError(std::move(argv), r.exit_code, r.err);
  run({"commit", "-m", message});
  return true;
}

void Checkout::merge_from(const std::string& ref) const {
  run({"merge", "--no-edit", ref});
}

void Checkout::push_ref(const std::string& remote, const std::string& ref) const {
  run({"push", "-q", remote, ref});
}

void Checkout::fetch(const std::string& remote) const {
  run({"fetch", "-q", remote});
}

std::optional<std::string> Checkout::read_file_at(const std::string& rev, const std::string& rel_path) const {
  return try_run({"show", rev + ":" + rel_path});
}

std::optional<std::string> Checkout::rev_parse(const std::string& rev) const {
  return try_run({"rev-parse", "-q", "--verify", rev});
}

std::string Checkout::merge_base(const std::string& a, const std::string& b) const {
  return run({"merge-base", a, b});
}

std::vector<std::string> Checkout::untracked_files() const {
  return split_nul_terminated(try_run_raw({"ls-files", "-z", "-o"}).value_or(""));
}

std::vector<std::string> Checkout::modified_files() const {
  return split_nul_terminated(try_run_raw({"ls-files", "-z", "-m"}).value_or(""));
}

bool Checkout::stash() const {
  auto before = rev_parse("refs/stash");
  if (!try_run({"stash", "push", "--include-untracked"})) return false;
  auto after = rev_parse("refs/stash");
  return after.has_value() && after != before;
}

bool Checkout::stash_pop() const {
  return try_run({"stash", "pop"}).has_value();
}

GitHistory::GitHistory(fs::path git_dir, std::shared_ptr<spdlog::logger> log)
    : git_dir_(std::move(git_dir)), log_(std::move(log)) {}

void GitHistory::init_bare(const fs::path& git_dir, const fs::path& excludes_file,
                           const std::string& branch) {
  auto check = [](std::vector<std::string> argv, const fs::path& cwd) {
    auto r = run_command(argv, cwd);
    if (r.exit_code != 0) throw GitCommandError(std::move(argv), r.exit_code, r.err);
  };
  auto cwd = git_dir.parent_path();
  check({"git", "--bare", "init", "-q", git_dir.string()}, cwd);
  check({"git", "--git-dir=" + git_dir.string(), "symbolic-ref", "HEAD", "refs/heads/" + branch}, cwd);
  check({"git", "config", "--file=" + (git_dir / "config").string(), "core.excludesfile",
         excludes_file.string()}, cwd);
}

Checkout GitHistory::primary(const fs::path& work_tree) const {
  return Checkout("primary", work_tree, git_dir_, log_);
}

Checkout GitHistory::shadow(const fs::path& shadow_dir) const {
  return Checkout("shadow", shadow_dir, shadow_dir / ".git", log_);
}

Checkout GitHistory::clone_shadow(const fs::path& shadow_dir) const {
  std::vector<std::string> argv{"git", "clone", "--shared", "-q", git_dir_.string(), shadow_dir.string()};
  if (log_) log_->debug("Executing git command {}", fmt::join(argv, " "));
  auto r = run_command(argv, shadow_dir.parent_path());
  if (r.exit_code != 0) throw GitCommandError(std::move(argv), r.exit_code, r.err);
  return shadow(shadow_dir);
}

}
