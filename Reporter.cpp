#include "Reporter.hpp"

#include <chrono>
#include <format>
#include <print>

#include "utils.hpp"

namespace {
LogLevel threshold_for(int verbosity) {
  if (verbosity <= 0) return LogLevel::Warn;
  if (verbosity == 1) return LogLevel::Info;
  if (verbosity == 2) return LogLevel::Debug;
  return LogLevel::Trace;
}

void print_to_console(LogLevel level, std::string_view message) {
  if (level == LogLevel::Report) {
    std::println("{}", message);
  } else if (level == LogLevel::Error || level == LogLevel::Warn) {
    std::println(stderr, "{}: {}", log_level_name(level), message);
  } else {
    std::println(stderr, "{}", message);
  }
}
}  // namespace

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Report:
      return "report";
    case LogLevel::Error:
      return "error";
    case LogLevel::Warn:
      return "warning";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Trace:
      return "trace";
  }
  return "unknown";
}

Reporter::Reporter(int verbosity)
    : m_threshold(threshold_for(verbosity)), m_handler(print_to_console) {}

void Reporter::set_handler(Handler handler) {
  std::scoped_lock lock(m_mutex);
  m_handler = std::move(handler);
}

bool Reporter::open_log_file(const fs::path& path) {
  std::scoped_lock lock(m_mutex);
  m_log_file.open(path, std::ios_base::app);
  return m_log_file.is_open();
}

bool Reporter::enabled(LogLevel level) const {
  return level == LogLevel::Report || level <= m_threshold;
}

void Reporter::log(LogLevel level, std::string_view message) {
  if (!enabled(level)) return;

  Handler handler;
  {
    std::scoped_lock lock(m_mutex);
    handler = m_handler;
    if (m_log_file.is_open()) {
      auto now = std::chrono::system_clock::now();
      m_log_file << std::format("{:%Y-%m-%d %H:%M:%S} | {:<7} | {}", now,
                                log_level_name(level), message)
                 << "\n"
                 << std::flush;
    }
  }

  // Called unlocked so a handler may log through this reporter again.
  if (handler) {
    handler(level, message);
  }
}

void Reporter::rule_parsed(const Rule& rule) {
  if (!enabled(LogLevel::Debug)) return;
  debug(std::format("Rule {}: {} /{}/ -> '{}'", rule.line_number,
                    action_name(rule.kind), rule.pattern_text,
                    safe_path_to_string(rule.destination)));
}

void Reporter::file_listed(const fs::path& path, bool is_regular) {
  if (!enabled(LogLevel::Trace)) return;
  trace(std::format("{}: {}", is_regular ? "Regular file" : "Not a file",
                    safe_path_to_string(path)));
}

void Reporter::file_unmatched(std::string_view name) {
  debug(std::format("No rule matches file: {}", name));
}

void Reporter::action_planned(const Action& action) {
  if (!enabled(LogLevel::Debug)) return;
  debug(std::format("Planned {} '{}' -> '{}' (rule {})",
                    action_name(action.kind), safe_path_to_string(action.from),
                    safe_path_to_string(action.to), action.rule_line));
}

void Reporter::directory_created(const fs::path& path) {
  info(std::format("[DIR] Creating directory: '{}'", safe_path_to_string(path)));
}

void Reporter::action_performed(size_t index, const Action& action) {
  if (!enabled(LogLevel::Info)) return;
  info(std::format("[{}] {} '{}' -> '{}'", index + 1,
                   action.kind == ActionType::MOVE ? "Moving" : "Copying",
                   safe_path_to_string(action.from),
                   safe_path_to_string(action.to)));
}

void Reporter::action_skipped(size_t index, const Action& action) {
  report(std::format("[{}] Would {} '{}' -> '{}'", index + 1,
                     action.kind == ActionType::MOVE ? "move" : "copy",
                     safe_path_to_string(action.from),
                     safe_path_to_string(action.to)));
}
