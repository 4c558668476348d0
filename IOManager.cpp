#include "IOManager.hpp"

#include <algorithm>
#include <format>
#include <fstream>

#include "errors.hpp"
#include "utils.hpp"

std::vector<std::string> IOManager::list_regular_files(
    const fs::path& directory, Reporter& reporter) {
  std::vector<std::string> names;
  std::error_code ec;

  fs::directory_iterator it(directory, ec);
  for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
    std::error_code status_ec;
    // symlink_status so that a link to a regular file is not followed.
    bool is_regular = it->symlink_status(status_ec).type() ==
                      fs::file_type::regular;
    if (status_ec) {
      ec = status_ec;
      break;
    }
    reporter.file_listed(it->path(), is_regular);
    if (is_regular) {
      names.push_back(safe_path_to_string(it->path().filename()));
    }
  }

  if (ec) {
    throw PlanningError(
        PlanningError::Kind::SourceUnreadable, directory,
        std::format("Unable to read entries of directory '{}': {}",
                    safe_path_to_string(directory), ec.message()));
  }

  std::sort(names.begin(), names.end());
  return names;
}

std::vector<std::string> IOManager::read_rule_file(const fs::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ParseError(ParseError::Kind::RuleFileUnreadable, 0,
                     std::format("Unable to open rule file '{}'",
                                 safe_path_to_string(path)));
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    lines.push_back(line);
  }
  if (file.bad()) {
    throw ParseError(ParseError::Kind::RuleFileUnreadable, 0,
                     std::format("Error reading rule file '{}'",
                                 safe_path_to_string(path)));
  }
  return lines;
}

bool IOManager::save_journal(const fs::path& journalPath,
                             const std::vector<JournalEntry>& journal,
                             Reporter& reporter) {
  std::ofstream j_file(journalPath);
  if (!j_file.is_open()) {
    reporter.error(std::format("Unable to write journal '{}'",
                               safe_path_to_string(journalPath)));
    return false;
  }
  j_file << json(journal).dump(2);
  reporter.info(std::format("Journal saved with {} actions to '{}'.",
                            journal.size(), safe_path_to_string(journalPath)));
  return true;
}
