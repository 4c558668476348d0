#pragma once

#include <string>
#include <vector>

#include "Reporter.hpp"
#include "types.hpp"

class Planner {
 public:
  Planner(const fs::path& sourceDir, const fs::path& destDir,
          Reporter& reporter);

  // Pure: rule-major, then file names in lexicographic order. One Action per
  // (rule, matching file) pair; nothing is deduplicated.
  std::vector<Action> plan(const std::vector<Rule>& rules,
                           std::vector<std::string> fileNames) const;

  // Lists the source directory, then plans. Throws PlanningError.
  std::vector<Action> plan_directory(const std::vector<Rule>& rules) const;

  const fs::path& source_dir() const { return m_source_dir; }
  const fs::path& dest_dir() const { return m_dest_dir; }

 private:
  fs::path m_source_dir;
  fs::path m_dest_dir;
  Reporter& m_reporter;
};
