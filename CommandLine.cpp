#include "CommandLine.hpp"

#include <getopt.h>

#include <format>

#include "utils.hpp"

namespace {
constexpr int kMaxVerbosity = 3;

const char* const kShortOptions = ":nvr:s:d:j:l:hV";

const struct option kLongOptions[] = {
    {"dry-run", no_argument, nullptr, 'n'},
    {"verbose", no_argument, nullptr, 'v'},
    {"rules", required_argument, nullptr, 'r'},
    {"source-dir", required_argument, nullptr, 's'},
    {"dest-dir", required_argument, nullptr, 'd'},
    {"journal", required_argument, nullptr, 'j'},
    {"log-file", required_argument, nullptr, 'l'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0}};

std::string describe_option(int opt, char* argv[]) {
  if (opt != 0) return std::format("-{}", static_cast<char>(opt));
  // Long option: getopt has already advanced optind past it.
  return argv[optind - 1];
}
}  // namespace

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine cmd;
  RunConfig& config = cmd.config;

  // Reset getopt so the parser can run more than once per process.
  optind = 0;
  opterr = 0;

  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions,
                            &option_index)) != -1) {
    switch (opt) {
      case 'n':
        config.dry_run = true;
        break;
      case 'v':
        if (config.verbosity < kMaxVerbosity) ++config.verbosity;
        break;
      case 'r':
        config.rules_file = path_from_utf8(optarg);
        break;
      case 's':
        config.source_dir = path_from_utf8(optarg);
        break;
      case 'd':
        config.dest_dir = path_from_utf8(optarg);
        break;
      case 'j':
        config.journal_file = path_from_utf8(optarg);
        break;
      case 'l':
        config.log_file = path_from_utf8(optarg);
        break;
      case 'h':
        cmd.mode = CommandLine::Mode::Help;
        return cmd;
      case 'V':
        cmd.mode = CommandLine::Mode::Version;
        return cmd;
      case ':':
        throw UsageError(std::format("option '{}' requires a value",
                                     describe_option(optopt, argv)));
      default:
        throw UsageError(std::format("unknown option '{}'",
                                     describe_option(optopt, argv)));
    }
  }

  for (int i = optind; i < argc; ++i) {
    if (config.inline_rule) {
      throw UsageError(std::format("unexpected argument '{}'", argv[i]));
    }
    config.inline_rule = argv[i];
  }

  if (config.rules_file && config.inline_rule) {
    throw UsageError("--rules and an inline rule are mutually exclusive");
  }
  if (!config.rules_file && !config.inline_rule) {
    throw UsageError("either --rules <file> or an inline rule is required");
  }

  return cmd;
}

std::string usage_text(std::string_view program) {
  return std::format(
      "Usage: {0} [options] <rule>\n"
      "       {0} [options] -r <file>\n"
      "\n"
      "Copies or moves files from a source directory into folders under a\n"
      "destination directory, based on regex matches of their names.\n"
      "\n"
      "Rules, one per line:\n"
      "  c /<regex>/<relative destination>   copy matching files\n"
      "  m /<regex>/<relative destination>   move matching files\n"
      "\n"
      "Options:\n"
      "  -r, --rules <file>        read rules from <file>\n"
      "  -s, --source-dir <dir>    directory to scan (default: .)\n"
      "  -d, --dest-dir <dir>      root for rule destinations (default: .)\n"
      "  -n, --dry-run             report actions without touching files\n"
      "  -v                        more output; repeat up to -vvv\n"
      "  -j, --journal <file>      write completed actions as JSON\n"
      "  -l, --log-file <file>     append log messages to <file>\n"
      "  -h, --help                show this help\n"
      "  -V, --version             show version\n",
      program);
}
