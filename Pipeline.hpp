#pragma once

#include "FileSystem.hpp"
#include "Reporter.hpp"
#include "types.hpp"

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

// Parse all rules, plan all actions, then execute them. Every error is
// reported through `reporter`; the return value is the process exit status.
int run_pipeline(const RunConfig& config, Reporter& reporter,
                 FileSystem& fileSystem);
