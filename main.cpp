#include <exception>
#include <format>
#include <print>

#include "CommandLine.hpp"
#include "FileSystem.hpp"
#include "Pipeline.hpp"
#include "Reporter.hpp"
#include "utils.hpp"

int main(int argc, char* argv[]) {
  const char* program = argc > 0 ? argv[0] : "filemapper";

  CommandLine cmd;
  try {
    cmd = parse_command_line(argc, argv);
  } catch (const UsageError& e) {
    std::println(stderr, "{}: {}", program, e.what());
    std::println(stderr, "Try '{} --help' for more information.", program);
    return kExitUsage;
  }

  if (cmd.mode == CommandLine::Mode::Help) {
    std::print("{}", usage_text(program));
    return kExitSuccess;
  }
  if (cmd.mode == CommandLine::Mode::Version) {
    std::println("filemapper {}", kProgramVersion);
    return kExitSuccess;
  }

  Reporter reporter(cmd.config.verbosity);
  try {
    if (cmd.config.log_file &&
        !reporter.open_log_file(*cmd.config.log_file)) {
      reporter.warn(std::format("Unable to open log file '{}'",
                                safe_path_to_string(*cmd.config.log_file)));
    }
    reporter.debug(std::format("--- filemapper {} started ---",
                               kProgramVersion));
    reporter.debug(std::format("Source directory: {}",
                               safe_path_to_string(cmd.config.source_dir)));
    reporter.debug(std::format("Destination directory: {}",
                               safe_path_to_string(cmd.config.dest_dir)));
    if (cmd.config.dry_run) {
      reporter.info("Dry run: no files will be changed.");
    }

    LocalFileSystem fileSystem;
    return run_pipeline(cmd.config, reporter, fileSystem);
  } catch (const std::exception& e) {
    reporter.error(std::format("FATAL EXCEPTION: {}", e.what()));
    return kExitFailure;
  }
}
