#pragma once

#include <vector>

#include "FileSystem.hpp"
#include "Reporter.hpp"
#include "types.hpp"

// Runs a plan in order and stops at the first failure. Completed actions are
// never undone; journal() still lists them after an ExecutionError.
class Executor {
 public:
  Executor(FileSystem& fileSystem, Reporter& reporter, bool dryRun);

  // Throws ExecutionError.
  ExecutionReport execute(const std::vector<Action>& actions);

  const std::vector<JournalEntry>& journal() const { return m_journal; }

 private:
  void perform(size_t index, const Action& action);

  FileSystem& m_fs;
  Reporter& m_reporter;
  bool m_dry_run;
  std::vector<JournalEntry> m_journal;
};
