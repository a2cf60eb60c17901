#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace ticketfs {

// One work tree bound to a git dir. Every call blocks on a `git` subprocess.
class Checkout {
public:
  Checkout(std::string name, std::filesystem::path work_tree, std::filesystem::path git_dir,
           std::shared_ptr<spdlog::logger> log);

  const std::string& name() const { return name_; }
  const std::filesystem::path& work_tree() const { return work_tree_; }
  const std::filesystem::path& git_dir() const { return git_dir_; }

  // Output with surrounding whitespace removed; throws GitCommandError.
  std::string run(const std::vector<std::string>& args) const;
  // Failure-tolerant form: nullopt when git exits non-zero.
  std::optional<std::string> try_run(const std::vector<std::string>& args) const;

  void ensure_identity(const std::string& user_name, const std::string& user_email) const;

  void stage_all() const;
  // Returns false when there was nothing to commit.
  bool commit(const std::string& message) const;
  void merge_from(const std::string& ref) const;
  void push_ref(const std::string& remote, const std::string& ref) const;
  void fetch(const std::string& remote) const;
  std::optional<std::string> read_file_at(const std::string& rev, const std::string& rel_path) const;
  std::optional<std::string> rev_parse(const std::string& rev) const;
  std::string merge_base(const std::string& a, const std::string& b) const;

  std::vector<std::string> untracked_files() const;
  std::vector<std::string> modified_files() const;

  bool stash() const;
  bool stash_pop() const;

private:
  std::vector<std::string> argv_for(const std::vector<std::string>& args) const;
  // Unstripped output; needed where names are NUL separated.
  std::optional<std::string> try_run_raw(const std::vector<std::string>& args) const;

  std::string name_;
  std::filesystem::path work_tree_;
  std::filesystem::path git_dir_;
  std::shared_ptr<spdlog::logger> log_;
};

// The object store shared by a ticket folder's primary work tree and its
// shadow clone.
class GitHistory {
public:
  GitHistory(std::filesystem::path git_dir, std::shared_ptr<spdlog::logger> log);

  static void init_bare(const std::filesystem::path& git_dir,
                        const std::filesystem::path& excludes_file,
                        const std::string& branch);

  const std::filesystem::path& git_dir() const { return git_dir_; }

  Checkout primary(const std::filesystem::path& work_tree) const;
  Checkout shadow(const std::filesystem::path& shadow_dir) const;
  // Creates a shadow clone sharing this history's objects.
  Checkout clone_shadow(const std::filesystem::path& shadow_dir) const;

private:
  std::filesystem::path git_dir_;
  std::shared_ptr<spdlog::logger> log_;
};

// Splits `git ... -z` output; paths come back verbatim, unquoted.
std::vector<std::string> split_nul_terminated(const std::string& s);

}
