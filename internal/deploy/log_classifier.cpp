#include "log_classifier.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace shipyard::deploy {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::regex Compile(const std::string& pattern) {
  try {
    return std::regex(pattern, kFlags);
  } catch (const std::regex_error& e) {
    throw util::ConfigurationError("invalid classifier pattern '" + pattern + "': " + e.what());
  }
}

std::string Lower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::vector<std::string_view> BoundedLines(std::string_view log) {
  std::vector<std::string_view> lines;
  while (!log.empty()) {
    const auto end  = log.find('\n');
    auto       line = log.substr(0, end);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line.substr(0, kMaxMatchedLineBytes));
    if (end == std::string_view::npos) {
      break;
    }
    log.remove_prefix(end + 1);
  }
  return lines;
}

bool SearchLines(std::string_view log, const std::regex& pattern) {
  for (const auto line : BoundedLines(log)) {
    if (std::regex_search(line.begin(), line.end(), pattern)) {
      return true;
    }
  }
  return false;
}

LogClassifier::LogClassifier() {
  AddRule(R"(error[:\s]+.*build.*failed)", "build_failed", "Build failed");
  AddRule(R"(exited with code [1-9]\d*)", "container_exit", "Container exited with error");
  AddRule(R"(failed to (build|pull|create|start))", "docker_operation", "Docker operation failed");
  AddRule(R"(error during connect)", "docker_connect", "Docker connection error");
  AddRule(R"(cannot connect to the docker daemon)", "daemon_unreachable", "Docker daemon unreachable");
  AddRule(R"(no space left on device)", "disk_full", "Disk full");
  AddRule(R"(error:\s*enoent)", "file_not_found", "File not found");
  AddRule(R"(npm err!)", "npm", "NPM error");
  AddRule(R"(yarn error)", "yarn", "Yarn error");
  AddRule(R"(fatal:)", "fatal", "Fatal error");
  AddRule(R"(error: failed to solve)", "docker_build", "Docker build failed");
  AddRule(R"(exec /.*: no such file or directory)", "entrypoint", "Entrypoint not found");

  AddSuccessSignature(R"(successfully built)");
  AddSuccessSignature(R"(successfully tagged)");
  AddSuccessSignature(R"(container .+ started)");
  AddSuccessSignature(R"(Creating .+ \.\.\. done)");
  AddSuccessSignature(R"(0 error)");
}

void LogClassifier::AddRule(const std::string& pattern, const std::string& kind, const std::string& message) {
  rules_.push_back(Rule{kind, message.empty() ? kind : message, Compile(pattern)});
}

void LogClassifier::AddSuccessSignature(const std::string& pattern) {
  success_.push_back(Compile(pattern));
}

bool LogClassifier::HasSuccessSignature(const std::string& log) const {
  return std::any_of(success_.begin(), success_.end(), [&](const std::regex& re) { return SearchLines(log, re); });
}

Classification LogClassifier::Classify(const std::string& log) const {
  const bool overridden = HasSuccessSignature(log);

  for (const auto& rule : rules_) {
    if (SearchLines(log, rule.pattern)) {
      if (overridden) {
        return {};
      }
      return Classification{true, rule.kind, rule.message};
    }
  }

  const auto lower = Lower(log);
  if (!overridden && lower.find("error") != std::string::npos && lower.find("0 error") == std::string::npos) {
    return Classification{true, "generic", "Build completed with errors (check logs)"};
  }
  return {};
}

} // namespace shipyard::deploy
