#include "RuleParser.hpp"

#include <format>

#include "utils.hpp"

namespace {
struct PatternBody {
  std::string text;
  size_t end;  // index of the closing '/'
};

// Scans from just after the opening '/' to the next unescaped '/'.
std::optional<PatternBody> scan_pattern(std::string_view line, size_t start) {
  std::string body;
  for (size_t i = start; i < line.size(); ++i) {
    char c = line[i];
    if (c == '\\' && i + 1 < line.size()) {
      if (line[i + 1] == '/') {
        body += '/';
      } else {
        body += c;
        body += line[i + 1];
      }
      ++i;
    } else if (c == '/') {
      return PatternBody{std::move(body), i};
    } else {
      body += c;
    }
  }
  return std::nullopt;
}
}  // namespace

RuleParser::RuleParser(Reporter& reporter) : m_reporter(reporter) {}

Rule RuleParser::parse(std::string_view line, int line_number) const {
  std::string_view rest = trim_ascii(line);

  size_t kind_end = 0;
  while (kind_end < rest.size() && rest[kind_end] != '/' &&
         !is_blank_ascii(rest[kind_end])) {
    ++kind_end;
  }
  std::string_view kind_token = rest.substr(0, kind_end);

  Rule rule;
  rule.line_number = line_number;
  if (kind_token == "c") {
    rule.kind = ActionType::COPY;
  } else if (kind_token == "m") {
    rule.kind = ActionType::MOVE;
  } else {
    throw ParseError(
        ParseError::Kind::UnknownRuleKind, line_number,
        std::format("Line {}: unknown rule kind '{}' (expected 'c' or 'm')",
                    line_number, kind_token));
  }

  rest = trim_ascii(rest.substr(kind_end));
  if (rest.empty() || rest.front() != '/') {
    throw ParseError(ParseError::Kind::InvalidRegex, line_number,
                     std::format("Line {}: expected '/' to open the pattern",
                                 line_number));
  }

  auto body = scan_pattern(rest, 1);
  if (!body) {
    throw ParseError(ParseError::Kind::InvalidRegex, line_number,
                     std::format("Line {}: pattern is missing its closing '/'",
                                 line_number));
  }

  try {
    rule.pattern = std::regex(body->text, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw ParseError(ParseError::Kind::InvalidRegex, line_number,
                     std::format("Line {}: unable to compile pattern '{}': {}",
                                 line_number, body->text, e.what()));
  }
  rule.pattern_text = std::move(body->text);

  std::string_view destination = trim_ascii(rest.substr(body->end + 1));
  if (destination.empty()) {
    throw ParseError(
        ParseError::Kind::InvalidDestination, line_number,
        std::format("Line {}: rule has no destination", line_number));
  }
  rule.destination = path_from_utf8(destination);
  if (rule.destination.is_absolute() || rule.destination.has_root_path()) {
    throw ParseError(
        ParseError::Kind::InvalidDestination, line_number,
        std::format("Line {}: destination '{}' must be a relative path",
                    line_number, destination));
  }

  return rule;
}

std::vector<Rule> RuleParser::parse_all(
    const std::vector<std::string>& lines) const {
  std::vector<Rule> rules;
  rules.reserve(lines.size());

  int line_number = 0;
  for (const auto& line : lines) {
    ++line_number;
    if (trim_ascii(line).empty()) continue;

    rules.push_back(parse(line, line_number));
    m_reporter.rule_parsed(rules.back());
  }

  m_reporter.info(std::format("Parsed {} rules.", rules.size()));
  return rules;
}
