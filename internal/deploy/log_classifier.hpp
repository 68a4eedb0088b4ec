#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace shipyard::deploy {

// Patterns only ever see this many bytes of a single log line. The
// std::regex matcher recurses per character, so minified bundles or
// progress bars printed as one line would otherwise exhaust the stack.
inline constexpr std::size_t kMaxMatchedLineBytes = 2048;

// Splits `log` on '\n', drops a trailing '\r' and cuts every line to
// kMaxMatchedLineBytes.
std::vector<std::string_view> BoundedLines(std::string_view log);

// regex_search over BoundedLines(log).
bool SearchLines(std::string_view log, const std::regex& pattern);

struct Classification {
  bool        has_error = false;
  std::string kind;    // rule kind, "generic" for the fallback
  std::string message; // human readable, stored as the deploy error
};

/*
  Heuristic error classifier for build output.

  Rules are tried in order; the first failure pattern that matches a
  line wins unless any success signature appears on any line, in which
  case the log is considered clean. Tools routinely print "error" in
  benign contexts ("0 errors"), hence the overrides.

  All patterns are case-insensitive ECMAScript regexes.
*/
class LogClassifier {
 public:
  struct Rule {
    std::string kind;
    std::string message;
    std::regex  pattern;
  };

  // Built-in docker/compose/package-manager rules.
  LogClassifier();

  // Appended after the built-in rules. Throws util::ConfigurationError on
  // an invalid pattern.
  void AddRule(const std::string& pattern, const std::string& kind, const std::string& message);
  void AddSuccessSignature(const std::string& pattern);

  Classification Classify(const std::string& log) const;

  bool HasSuccessSignature(const std::string& log) const;

  const std::vector<Rule>& Rules() const {
    return rules_;
  }

 private:
  std::vector<Rule>       rules_;
  std::vector<std::regex> success_;
};

} // namespace shipyard::deploy
