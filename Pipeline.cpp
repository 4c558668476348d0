#include "Pipeline.hpp"

#include <format>

#include "Executor.hpp"
#include "IOManager.hpp"
#include "Planner.hpp"
#include "RuleParser.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
std::vector<std::string> load_rule_lines(const RunConfig& config) {
  if (config.rules_file) {
    return IOManager::read_rule_file(*config.rules_file);
  }
  return {config.inline_rule.value_or("")};
}
}  // namespace

int run_pipeline(const RunConfig& config, Reporter& reporter,
                 FileSystem& fileSystem) {
  std::vector<Action> plan;
  try {
    RuleParser parser(reporter);
    std::vector<Rule> rules = parser.parse_all(load_rule_lines(config));
    if (rules.empty()) {
      reporter.warn("No rules given. Nothing to do.");
      return kExitSuccess;
    }

    Planner planner(config.source_dir, config.dest_dir, reporter);
    plan = planner.plan_directory(rules);
  } catch (const ParseError& e) {
    reporter.error(e.what());
    reporter.error("No files were changed.");
    return kExitFailure;
  } catch (const PlanningError& e) {
    reporter.error(e.what());
    reporter.error("No files were changed.");
    return kExitFailure;
  } catch (const fs::filesystem_error& e) {
    reporter.error(std::format("Unable to resolve directories: {}", e.what()));
    return kExitFailure;
  }

  Executor executor(fileSystem, reporter, config.dry_run);
  int status = kExitSuccess;
  try {
    ExecutionReport result = executor.execute(plan);
    if (config.dry_run) {
      reporter.report(std::format("Dry run: {} actions would be performed.",
                                  result.performed));
    } else {
      reporter.info(std::format("{} actions performed.", result.performed));
    }
  } catch (const ExecutionError& e) {
    reporter.error(e.what());
    reporter.error(std::format(
        "Stopped at action {} of {}. {} earlier actions were completed and "
        "have not been undone.",
        e.action_index() + 1, plan.size(), e.completed()));
    status = kExitFailure;
  }

  if (config.journal_file && !config.dry_run) {
    if (!IOManager::save_journal(*config.journal_file, executor.journal(),
                                 reporter)) {
      status = kExitFailure;
    }
  }
  return status;
}
