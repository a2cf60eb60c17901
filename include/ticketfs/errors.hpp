#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace ticketfs {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The folder has no metadata directory.
class NotTicketFolderException : public Error {
public:
  using Error::Error;
};

class CannotInferTicketNumberFromFolderName : public Error {
public:
  using Error::Error;
};

class GitCommandError : public Error {
public:
  GitCommandError(std::vector<std::string> argv, int exit_code, std::string stderr_text);

  const std::vector<std::string>& argv() const { return argv_; }
  int exit_code() const { return exit_code_; }
  const std::string& stderr_text() const { return stderr_; }

private:
  std::vector<std::string> argv_;
  int exit_code_;
  std::string stderr_;
};

class MigrationError : public Error {
public:
  using Error::Error;
};

// Base for failures raised by IssueTrackerClient implementations.
class TrackerError : public Error {
public:
  using Error::Error;
};

}
