#include "Executor.hpp"

#include <format>

#include "errors.hpp"
#include "utils.hpp"

Executor::Executor(FileSystem& fileSystem, Reporter& reporter, bool dryRun)
    : m_fs(fileSystem), m_reporter(reporter), m_dry_run(dryRun) {}

ExecutionReport Executor::execute(const std::vector<Action>& actions) {
  m_journal.clear();
  m_journal.reserve(actions.size());

  m_reporter.info(std::format("{} plan of {} actions...",
                              m_dry_run ? "Simulating" : "Executing",
                              actions.size()));

  for (size_t i = 0; i < actions.size(); ++i) {
    if (m_dry_run) {
      const fs::path parent_dir = actions[i].to.parent_path();
      if (!m_fs.is_directory(parent_dir)) {
        m_reporter.debug(std::format("[DIR] Would create directory: '{}'",
                                     safe_path_to_string(parent_dir)));
      }
      m_reporter.action_skipped(i, actions[i]);
      continue;
    }
    perform(i, actions[i]);
  }

  m_reporter.info("Execution complete.");
  return ExecutionReport{actions.size(), m_journal};
}

void Executor::perform(size_t index, const Action& action) {
  const size_t completed = m_journal.size();
  const fs::path parent_dir = action.to.parent_path();

  if (!m_fs.is_directory(parent_dir)) {
    if (auto ec = m_fs.create_dir_all(parent_dir)) {
      throw ExecutionError(
          ExecutionError::Kind::DirectoryCreateFailed, index, parent_dir,
          completed,
          std::format("Action {}: unable to create destination directory "
                      "'{}': {}",
                      index + 1, safe_path_to_string(parent_dir),
                      ec.message()));
    }
    m_reporter.directory_created(parent_dir);
  }

  m_reporter.action_performed(index, action);

  if (auto ec = m_fs.copy(action.from, action.to)) {
    throw ExecutionError(
        ExecutionError::Kind::CopyFailed, index, action.from, completed,
        std::format("Action {}: unable to copy '{}' to '{}': {}", index + 1,
                    safe_path_to_string(action.from),
                    safe_path_to_string(action.to), ec.message()));
  }

  if (action.kind == ActionType::MOVE) {
    if (auto ec = m_fs.remove(action.from)) {
      // The copy half already landed on disk.
      m_journal.push_back({ActionType::COPY, action.from, action.to});
      throw ExecutionError(
          ExecutionError::Kind::DeleteFailed, index, action.from, completed,
          std::format("Action {}: copied to '{}' but unable to remove '{}': {}",
                      index + 1, safe_path_to_string(action.to),
                      safe_path_to_string(action.from), ec.message()));
    }
  }

  m_journal.push_back({action.kind, action.from, action.to});
}
