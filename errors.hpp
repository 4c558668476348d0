#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class ParseError : public std::runtime_error {
 public:
  enum class Kind {
    UnknownRuleKind,
    InvalidRegex,
    InvalidDestination,
    RuleFileUnreadable
  };

  ParseError(Kind kind, int line_number, const std::string& message)
      : std::runtime_error(message), m_kind(kind), m_line(line_number) {}

  Kind kind() const { return m_kind; }
  // 1-based; 0 when the error is not tied to a line.
  int line_number() const { return m_line; }

 private:
  Kind m_kind;
  int m_line;
};

class PlanningError : public std::runtime_error {
 public:
  enum class Kind { SourceUnreadable };

  PlanningError(Kind kind, fs::path directory, const std::string& message)
      : std::runtime_error(message),
        m_kind(kind),
        m_directory(std::move(directory)) {}

  Kind kind() const { return m_kind; }
  const fs::path& directory() const { return m_directory; }

 private:
  Kind m_kind;
  fs::path m_directory;
};

class ExecutionError : public std::runtime_error {
 public:
  enum class Kind { DirectoryCreateFailed, CopyFailed, DeleteFailed };

  ExecutionError(Kind kind, size_t action_index, fs::path path,
                 size_t completed, const std::string& message)
      : std::runtime_error(message),
        m_kind(kind),
        m_index(action_index),
        m_path(std::move(path)),
        m_completed(completed) {}

  Kind kind() const { return m_kind; }
  // 0-based index of the action that failed.
  size_t action_index() const { return m_index; }
  const fs::path& path() const { return m_path; }
  // Actions that already mutated the filesystem before the failure.
  size_t completed() const { return m_completed; }

 private:
  Kind m_kind;
  size_t m_index;
  fs::path m_path;
  size_t m_completed;
};

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
