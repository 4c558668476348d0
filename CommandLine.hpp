#pragma once

#include <string>
#include <string_view>

#include "errors.hpp"
#include "types.hpp"

inline constexpr std::string_view kProgramVersion = "1.0.0";

struct CommandLine {
  enum class Mode { Run, Help, Version };
  Mode mode = Mode::Run;
  RunConfig config;
};

// Throws UsageError on unknown flags, missing values, or when neither or both
// of --rules and an inline rule are given.
CommandLine parse_command_line(int argc, char* argv[]);

std::string usage_text(std::string_view program);
