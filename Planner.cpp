#include "Planner.hpp"

#include <algorithm>
#include <format>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
fs::path resolve_root(const fs::path& p) {
  return fs::absolute(p).lexically_normal();
}
}  // namespace

Planner::Planner(const fs::path& sourceDir, const fs::path& destDir,
                 Reporter& reporter)
    : m_source_dir(resolve_root(sourceDir)),
      m_dest_dir(resolve_root(destDir)),
      m_reporter(reporter) {}

std::vector<Action> Planner::plan(const std::vector<Rule>& rules,
                                  std::vector<std::string> fileNames) const {
  std::sort(fileNames.begin(), fileNames.end());

  std::vector<Action> result_plan;
  std::vector<bool> matched(fileNames.size(), false);

  for (const auto& rule : rules) {
    const fs::path target_dir = m_dest_dir / rule.destination;
    for (size_t i = 0; i < fileNames.size(); ++i) {
      const std::string& name = fileNames[i];
      if (!std::regex_search(name, rule.pattern)) continue;

      matched[i] = true;
      const fs::path file_name = path_from_utf8(name);
      Action action{rule.kind, m_source_dir / file_name,
                    (target_dir / file_name).lexically_normal(),
                    rule.line_number};
      m_reporter.action_planned(action);
      result_plan.push_back(std::move(action));
    }
  }

  for (size_t i = 0; i < fileNames.size(); ++i) {
    if (!matched[i]) m_reporter.file_unmatched(fileNames[i]);
  }

  m_reporter.info(std::format("Planning complete. {} files, {} actions.",
                              fileNames.size(), result_plan.size()));
  return result_plan;
}

std::vector<Action> Planner::plan_directory(
    const std::vector<Rule>& rules) const {
  m_reporter.info(std::format("Scanning '{}' for files to process...",
                              safe_path_to_string(m_source_dir)));
  return plan(rules, IOManager::list_regular_files(m_source_dir, m_reporter));
}
