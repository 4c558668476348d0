#pragma once

#include <fstream>
#include <functional>
#include <mutex>
#include <string_view>

#include "types.hpp"

// `Report` lines are the user-facing output of a run (dry-run listings,
// summaries) and are emitted regardless of verbosity.
enum class LogLevel { Report, Error, Warn, Info, Debug, Trace };

const char* log_level_name(LogLevel level);

class Reporter {
 public:
  using Handler = std::function<void(LogLevel, std::string_view)>;

  // 0 = warnings and errors, 1 = info, 2 = debug, 3 or more = trace.
  explicit Reporter(int verbosity = 0);

  void set_handler(Handler handler);
  // Appends timestamped copies of every emitted message to `path`.
  bool open_log_file(const fs::path& path);

  bool enabled(LogLevel level) const;
  void log(LogLevel level, std::string_view message);

  void error(std::string_view message) { log(LogLevel::Error, message); }
  void warn(std::string_view message) { log(LogLevel::Warn, message); }
  void info(std::string_view message) { log(LogLevel::Info, message); }
  void debug(std::string_view message) { log(LogLevel::Debug, message); }
  void trace(std::string_view message) { log(LogLevel::Trace, message); }
  void report(std::string_view message) { log(LogLevel::Report, message); }

  void rule_parsed(const Rule& rule);
  void file_listed(const fs::path& path, bool is_regular);
  void file_unmatched(std::string_view name);
  void action_planned(const Action& action);
  void directory_created(const fs::path& path);
  void action_performed(size_t index, const Action& action);
  void action_skipped(size_t index, const Action& action);

 private:
  LogLevel m_threshold;
  Handler m_handler;
  std::ofstream m_log_file;
  std::mutex m_mutex;
};
