#include <gtest/gtest.h>

#include <fstream>
#include <regex>
#include <string>
#include <vector>

#include "../Reporter.hpp"
#include "TestEnvironment.hpp"

namespace {
struct Captured {
  std::vector<std::pair<LogLevel, std::string>> lines;

  Reporter::Handler handler() {
    return [this](LogLevel level, std::string_view message) {
      lines.emplace_back(level, std::string(message));
    };
  }

  bool has(LogLevel level) const {
    for (const auto& [l, m] : lines) {
      if (l == level) return true;
    }
    return false;
  }
};

void LogAtEveryLevel(Reporter& reporter) {
  reporter.report("report");
  reporter.error("error");
  reporter.warn("warn");
  reporter.info("info");
  reporter.debug("debug");
  reporter.trace("trace");
}
}  // namespace

class ReporterTest : public ScratchDirTest {};

TEST_F(ReporterTest, DefaultVerbosityKeepsWarningsErrorsAndReports) {
  Reporter quiet(0);
  Captured captured;
  quiet.set_handler(captured.handler());

  LogAtEveryLevel(quiet);

  EXPECT_TRUE(captured.has(LogLevel::Report));
  EXPECT_TRUE(captured.has(LogLevel::Error));
  EXPECT_TRUE(captured.has(LogLevel::Warn));
  EXPECT_FALSE(captured.has(LogLevel::Info));
  EXPECT_FALSE(captured.has(LogLevel::Debug));
  EXPECT_FALSE(captured.has(LogLevel::Trace));
}

TEST_F(ReporterTest, EachVerbosityStepAddsOneLevel) {
  Reporter info(1);
  EXPECT_TRUE(info.enabled(LogLevel::Info));
  EXPECT_FALSE(info.enabled(LogLevel::Debug));

  Reporter debug(2);
  EXPECT_TRUE(debug.enabled(LogLevel::Debug));
  EXPECT_FALSE(debug.enabled(LogLevel::Trace));

  Reporter trace(3);
  EXPECT_TRUE(trace.enabled(LogLevel::Trace));

  Reporter beyond(7);
  EXPECT_TRUE(beyond.enabled(LogLevel::Trace));
}

TEST_F(ReporterTest, InfoVerbosityDropsDebugMessages) {
  Reporter info(1);
  Captured captured;
  info.set_handler(captured.handler());

  LogAtEveryLevel(info);

  EXPECT_TRUE(captured.has(LogLevel::Info));
  EXPECT_FALSE(captured.has(LogLevel::Debug));
  EXPECT_FALSE(captured.has(LogLevel::Trace));
}

TEST_F(ReporterTest, DryRunLinesPrintAtDefaultVerbosity) {
  Reporter quiet(0);
  Captured captured;
  quiet.set_handler(captured.handler());
  Action action{ActionType::MOVE, "/src/lime.txt", "/dst/Lime/lime.txt", 1};

  quiet.action_skipped(0, action);
  quiet.action_performed(0, action);

  ASSERT_EQ(captured.lines.size(), 1);
  EXPECT_EQ(captured.lines[0].first, LogLevel::Report);
  EXPECT_EQ(captured.lines[0].second,
            "[1] Would move '/src/lime.txt' -> '/dst/Lime/lime.txt'");
}

TEST_F(ReporterTest, LogFileGetsTimestampedLines) {
  const fs::path log_path = test_dir / "run.log";
  CreateFile(log_path, "earlier line\n");
  Reporter info(1);
  info.set_handler(nullptr);

  ASSERT_TRUE(info.open_log_file(log_path));
  info.info("planned 3 actions");
  info.debug("not written");

  std::ifstream log_file(log_path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(log_file, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 2);
  EXPECT_EQ(lines[0], "earlier line");
  const std::regex format(
      R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\S* \| info    \| planned 3 actions$)");
  EXPECT_TRUE(std::regex_match(lines[1], format)) << lines[1];
}

TEST_F(ReporterTest, OpenLogFileFailsForMissingDirectory) {
  Reporter reporter_without_file(0);

  EXPECT_FALSE(
      reporter_without_file.open_log_file(test_dir / "missing" / "run.log"));
}

TEST_F(ReporterTest, HandlerMayLogThroughTheSameReporter) {
  Reporter nested(1);
  std::vector<std::string> seen;
  nested.set_handler([&](LogLevel level, std::string_view message) {
    seen.emplace_back(message);
    if (level == LogLevel::Warn) nested.info("echo");
  });

  nested.warn("first");

  ASSERT_EQ(seen.size(), 2);
  EXPECT_EQ(seen[0], "first");
  EXPECT_EQ(seen[1], "echo");
}
