#pragma once

#include <string>
#include <vector>

#include "Reporter.hpp"
#include "types.hpp"

namespace IOManager {
// Names of the regular files directly inside `directory`, sorted. Directories
// and symlinks are left out. Throws PlanningError(SourceUnreadable).
std::vector<std::string> list_regular_files(const fs::path& directory,
                                            Reporter& reporter);

// Throws ParseError(RuleFileUnreadable).
std::vector<std::string> read_rule_file(const fs::path& path);

bool save_journal(const fs::path& journalPath,
                  const std::vector<JournalEntry>& journal, Reporter& reporter);
}  // namespace IOManager
