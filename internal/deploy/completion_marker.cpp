#include "completion_marker.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace shipyard::deploy {

namespace {

constexpr std::string_view kFailedPrefix = "STATUS: FAILED (exit code: ";

// Parses "<digits>)" followed by optional whitespace. An exit code that
// does not fit in an int is reported as absent.
bool ParseFailedSuffix(std::string_view rest, std::optional<int>& exit_code) {
  std::size_t digits = 0;
  while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits >= rest.size() || rest[digits] != ')') {
    return false;
  }
  for (std::size_t i = digits + 1; i < rest.size(); ++i) {
    if (!std::isspace(static_cast<unsigned char>(rest[i]))) {
      return false;
    }
  }

  int value = 0;
  const auto [end, ec] = std::from_chars(rest.data(), rest.data() + digits, value);
  if (ec == std::errc() && end == rest.data() + digits) {
    exit_code = value;
  } else {
    exit_code.reset();
  }
  return true;
}

} // namespace

CompletionMarker ParseCompletionMarker(const std::string& log) {
  CompletionMarker marker;

  const auto at = log.rfind(kCompletionMarker);
  if (at == std::string::npos) {
    return marker;
  }
  marker.present = true;

  std::istringstream tail(log.substr(at + kCompletionMarker.size()));
  std::string        line;
  while (std::getline(tail, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    const std::string_view view(line);
    if (view.substr(0, 15) == "STATUS: SUCCESS") {
      marker.success = true;
    } else if (view.substr(0, kFailedPrefix.size()) == kFailedPrefix) {
      std::optional<int> exit_code;
      if (ParseFailedSuffix(view.substr(kFailedPrefix.size()), exit_code)) {
        marker.success   = false;
        marker.exit_code = exit_code;
      }
    } else if (view.substr(0, 11) == "TIMESTAMP: ") {
      marker.timestamp = line.substr(11);
    }
  }
  return marker;
}

} // namespace shipyard::deploy
