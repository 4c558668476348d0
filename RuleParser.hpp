#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Reporter.hpp"
#include "errors.hpp"
#include "types.hpp"

// Turns rule text into validated Rules. A line looks like
//
//   c /<regex>/<relative destination>
//   m /<regex>/<relative destination>
//
// `\/` inside the regex body is a literal slash. Throws ParseError.
class RuleParser {
 public:
  explicit RuleParser(Reporter& reporter);

  Rule parse(std::string_view line, int line_number) const;

  // All-or-nothing: the first bad line throws and no rule is returned.
  // Blank lines are skipped; numbering starts at 1.
  std::vector<Rule> parse_all(const std::vector<std::string>& lines) const;

 private:
  Reporter& m_reporter;
};
