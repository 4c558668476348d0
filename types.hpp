#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

enum class ActionType { COPY, MOVE };
NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {{ActionType::COPY, "COPY"},
                                          {ActionType::MOVE, "MOVE"}});

inline const char* action_name(ActionType type) {
  return type == ActionType::MOVE ? "Move" : "Copy";
}

// A validated rule. Only RuleParser builds these, so `pattern` always holds
// a successfully compiled expression.
struct Rule {
  ActionType kind;
  std::regex pattern;
  std::string pattern_text;
  fs::path destination;
  int line_number = 0;
};

// A fully resolved unit of work. `from` and `to` are absolute.
struct Action {
  ActionType kind;
  fs::path from;
  fs::path to;
  int rule_line = 0;
};

struct JournalEntry {
  ActionType action;
  fs::path from;
  fs::path to;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(JournalEntry, action, from, to);

struct RunConfig {
  std::optional<fs::path> rules_file;
  std::optional<std::string> inline_rule;
  fs::path source_dir = ".";
  fs::path dest_dir = ".";
  bool dry_run = false;
  int verbosity = 0;
  std::optional<fs::path> journal_file;
  std::optional<fs::path> log_file;
};

struct ExecutionReport {
  size_t performed = 0;
  std::vector<JournalEntry> journal;
};
