#include <ticketfs/oplog.hpp>
#include <ticketfs/util.hpp>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <stdexcept>

namespace ticketfs {

namespace {

// %* expands to the same upper-case level names the log file uses.
class LevelNameFlag : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
    auto name = OperationLog::level_name(msg.level);
    dest.append(name.data(), name.data() + name.size());
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<LevelNameFlag>();
  }
};

}

OperationLogSink::OperationLogSink(std::filesystem::path path) : path_(std::move(path)) {}

void OperationLogSink::sink_it_(const spdlog::details::log_msg& msg) {
  std::string text(msg.payload.data(), msg.payload.size());
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) throw std::runtime_error("cannot append to " + path_.string());
  out << iso8601_now() << '\t' << OperationLog::level_name(msg.level) << '\t'
      << OperationLog::escape_newlines(text) << '\n';
}

OperationLog::OperationLog(const std::string& ticket_key,
                           std::filesystem::path log_path,
                           spdlog::sink_ptr echo_sink,
                           spdlog::level::level_enum echo_level)
    : path_(std::move(log_path)) {
  auto file_sink = std::make_shared<OperationLogSink>(path_);
  file_sink->set_level(spdlog::level::debug);

  if (!echo_sink) echo_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto formatter = std::make_unique<spdlog::pattern_formatter>();
  formatter->add_flag<LevelNameFlag>('*').set_pattern("[%^%*%$ " + ticket_key + "] %v");
  echo_sink->set_formatter(std::move(formatter));
  echo_sink->set_level(echo_level);

  logger_ = std::make_shared<spdlog::logger>("ticketfs:" + ticket_key,
                                             spdlog::sinks_init_list{file_sink, echo_sink});
  logger_->set_level(spdlog::level::debug);
  logger_->flush_on(spdlog::level::debug);
}

std::string OperationLog::read() const {
  return read_file_if_exists(path_).value_or("");
}

std::string OperationLog::level_name(spdlog::level::level_enum lvl) {
  switch (lvl) {
    case spdlog::level::trace: return "TRACE";
    case spdlog::level::debug: return "DEBUG";
    case spdlog::level::info: return "INFO";
    case spdlog::level::warn: return "WARNING";
    case spdlog::level::err: return "ERROR";
    case spdlog::level::critical: return "CRITICAL";
    default: return "NOTSET";
  }
}

std::string OperationLog::escape_newlines(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\n') out += "\\n";
    else out.push_back(c);
  }
  return out;
}

}
