#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

namespace ticketfs {

// Appends "timestamp\tLEVEL\tmessage" lines to a ticket folder's operation log.
class OperationLogSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  explicit OperationLogSink(std::filesystem::path path);

protected:
  void sink_it_(const spdlog::details::log_msg& msg) override;
  void flush_() override {}

private:
  std::filesystem::path path_;
};

class OperationLog {
public:
  OperationLog(const std::string& ticket_key,
               std::filesystem::path log_path,
               spdlog::sink_ptr echo_sink,
               spdlog::level::level_enum echo_level);

  spdlog::logger& logger() { return *logger_; }
  const std::shared_ptr<spdlog::logger>& shared_logger() const { return logger_; }
  const std::filesystem::path& path() const { return path_; }

  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args&&... args) {
    logger_->debug(f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void info(fmt::format_string<Args...> f, Args&&... args) {
    logger_->info(f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void warn(fmt::format_string<Args...> f, Args&&... args) {
    logger_->warn(f, std::forward<Args>(args)...);
  }
  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args&&... args) {
    logger_->error(f, std::forward<Args>(args)...);
  }

  std::string read() const;

  static std::string level_name(spdlog::level::level_enum lvl);
  static std::string escape_newlines(const std::string& s);

private:
  std::filesystem::path path_;
  std::shared_ptr<spdlog::logger> logger_;
};

}
