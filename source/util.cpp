#include <ticketfs/util.hpp>

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ticketfs {

static int safe_pipe(int fds[2]) {
  return pipe2(fds, O_CLOEXEC);
}

CmdResult run_command(const std::vector<std::string>& args,
                      const std::filesystem::path& cwd) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    close(out_pipe[0]); close(out_pipe[1]);
    res.exit_code = -1;
    res.err = "pipe failed";
    return res;
  }

  pid_t pid = fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = "fork failed";
    close(out_pipe[0]); close(out_pipe[1]);
    close(err_pipe[0]); close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(127);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]); close(out_pipe[1]);
    close(err_pipe[0]); close(err_pipe[1]);

    std::vector<char*> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto& s : args) argv_c.push_back(const_cast<char*>(s.c_str()));
    argv_c.push_back(nullptr);

    execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);

  // Both pipes are drained together so a chatty stderr cannot stall the child.
  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  std::array<std::string*, 2> sinks{&res.out, &res.err};
  std::array<char, 4096> buf{};
  int open_fds = 2;
  while (open_fds > 0) {
    int rc = ::poll(fds.data(), fds.size(), -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(n));
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else {
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  if (waitpid(pid, &status, 0) == -1) {
    res.exit_code = -1;
    return res;
  }
  if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
  else res.exit_code = -1;

  return res;
}

std::string iso8601_now() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[64];
  strftime(buf, sizeof(buf), "%FT%T", &tm);
  return fmt::format("{}.{:06d}", buf, us);
}

std::string strip(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string normalize_newlines(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
    out.push_back(s[i]);
  }
  return out;
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> lines;
  std::istringstream ss(s);
  std::string line;
  while (std::getline(ss, line)) lines.push_back(line);
  return lines;
}

std::optional<std::string> read_file_if_exists(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;
    throw std::runtime_error(fmt::format("open failed: {}", path.string()));
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_file(const std::filesystem::path& path, const std::string& data) {
  auto parent = path.parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) throw std::runtime_error(fmt::format("open failed: {}", path.string()));
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!f.good()) throw std::runtime_error(fmt::format("write failed: {}", path.string()));
}

}
