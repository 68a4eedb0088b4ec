#include "shell_command.hpp"

#include <cstdio>
#include <regex>
#include <sstream>

#include "internal/deploy/completion_marker.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::command {

namespace {

// Longer fragments are rejected before the (recursive) regex matcher sees them.
constexpr std::size_t kMaxFragmentBytes = 1024;

bool Matches(std::string_view value, const std::regex& pattern) {
  if (value.size() > kMaxFragmentBytes) {
    return false;
  }
  return std::regex_match(value.begin(), value.end(), pattern);
}

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string Quoted(const std::string& value) {
  return "\"" + value + "\"";
}

std::string InDir(const std::string& path) {
  RequirePath(path);
  return "cd " + Quoted(path) + " && ";
}

std::string ProjectFlag(const std::optional<std::string>& project) {
  if (!project) {
    return {};
  }
  RequireComposeProject(*project);
  return " -p " + *project;
}

std::string ProfileFlags(const std::vector<std::string>& profiles) {
  std::string flags;
  for (const auto& profile : profiles) {
    if (!IsValidProfileName(profile)) {
      throw util::InvalidArgument("invalid compose profile name: " + profile);
    }
    flags += " --profile " + profile;
  }
  return flags;
}

// 30 -> "0.5", 90 -> "1.5", 20 -> "0.333"
std::string MinutesArg(std::uint32_t seconds) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(seconds) / 60.0);
  std::string out(buf);
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.pop_back();
  return out.empty() ? "0" : out;
}

} // namespace

bool IsValidPath(std::string_view path) {
  static const std::regex kPath(R"(^/[A-Za-z0-9._/-]+$)");
  if (!Matches(path, kPath)) {
    return false;
  }
  return path.find("..") == std::string_view::npos;
}

bool IsValidBranch(std::string_view branch) {
  static const std::regex kBranch(R"(^[A-Za-z0-9._/-]+$)");
  if (branch.empty() || branch.front() == '-' || branch.front() == '/' || branch.back() == '/') {
    return false;
  }
  if (branch.find("..") != std::string_view::npos || branch.find("//") != std::string_view::npos) {
    return false;
  }
  return Matches(branch, kBranch);
}

bool IsValidProfileName(std::string_view profile) {
  static const std::regex kProfile(R"(^[A-Za-z0-9][A-Za-z0-9_-]*$)");
  return Matches(profile, kProfile);
}

bool IsValidComposeProject(std::string_view project) {
  static const std::regex kProject(R"(^[a-z0-9][a-z0-9_-]*$)");
  return Matches(project, kProject);
}

bool IsValidContainerName(std::string_view name) {
  static const std::regex kContainer(R"(^[A-Za-z0-9][A-Za-z0-9_.-]*$)");
  return Matches(name, kContainer);
}

void RequirePath(std::string_view path) {
  if (!IsValidPath(path)) {
    throw util::InvalidArgument("invalid path: " + std::string(path));
  }
}

void RequireBranch(std::string_view branch) {
  if (!IsValidBranch(branch)) {
    throw util::InvalidArgument("invalid branch name: " + std::string(branch));
  }
}

void RequireComposeProject(std::string_view project) {
  if (!IsValidComposeProject(project)) {
    throw util::InvalidArgument("invalid compose project name: " + std::string(project));
  }
}

void RequireContainerName(std::string_view name) {
  if (!IsValidContainerName(name)) {
    throw util::InvalidArgument("invalid container name: " + std::string(name));
  }
}

std::vector<std::string> FilterProfiles(const std::string& output, std::vector<std::string>* rejected) {
  std::vector<std::string> profiles;
  std::istringstream       in(output);
  std::string              line;
  while (std::getline(in, line)) {
    const auto candidate = Trim(line);
    if (candidate.empty()) {
      continue;
    }
    if (IsValidProfileName(candidate)) {
      profiles.push_back(candidate);
    } else if (rejected) {
      rejected->push_back(candidate);
    }
  }
  return profiles;
}

std::string DirectoryExists(const std::string& path) {
  RequirePath(path);
  return "test -d " + Quoted(path) + " && echo \"EXISTS\" || echo \"NOT_FOUND\"";
}

std::string ListDirectory(const std::string& path) {
  RequirePath(path);
  return "ls -la " + Quoted(path) + " 2>&1 | head -20";
}

std::string ComposeFileExists(const std::string& path) {
  RequirePath(path);
  return "test -f " + Quoted(path + "/docker-compose.yml") + " && echo \"FOUND\" || (test -f " + Quoted(path + "/docker-compose.yaml") +
         " && echo \"FOUND\" || echo \"NOT_FOUND\")";
}

std::string ComposeProfiles(const std::string& path, const std::optional<std::string>& project) {
  return InDir(path) + "docker compose" + ProjectFlag(project) + " config --profiles 2>/dev/null";
}

std::string ComposeServices(const std::string& path, const std::optional<std::string>& project, const std::vector<std::string>& profiles) {
  return InDir(path) + "docker compose" + ProjectFlag(project) + ProfileFlags(profiles) + " config --services 2>/dev/null";
}

std::string GitFetch(const std::string& path) {
  return InDir(path) + "git fetch --all 2>&1";
}

std::string GitCheckout(const std::string& path, const std::string& branch) {
  RequireBranch(branch);
  return InDir(path) + "git checkout " + branch + " 2>&1";
}

std::string GitPull(const std::string& path) {
  return InDir(path) + "git pull 2>&1";
}

std::string GitRevParseHead(const std::string& path) {
  return InDir(path) + "git rev-parse HEAD";
}

std::string ComposeInvocation(shipyard::model::DeployStrategy strategy, const std::optional<std::string>& project,
                              const std::vector<std::string>& profiles) {
  using shipyard::model::DeployStrategy;

  std::string verb;
  switch (strategy) {
    case DeployStrategy::kPullRestart:
      verb = "restart";
      break;
    case DeployStrategy::kPullRebuild:
      verb = "up -d --build";
      break;
    case DeployStrategy::kComposeUp:
      verb = "up -d";
      break;
    case DeployStrategy::kManual:
      throw util::InvalidState("service requires manual deployment");
  }
  return "docker compose" + ProjectFlag(project) + ProfileFlags(profiles) + " " + verb;
}

std::string DetachedLaunch(const std::string& path, const std::string& invocation, const std::string& log_file) {
  RequirePath(log_file);
  if (invocation.find('\'') != std::string::npos) {
    throw util::InvalidArgument("compose invocation must not contain single quotes");
  }

  std::string script;
  script += invocation + " 2>&1; EXIT_CODE=$?; echo \"\"; echo \"" + std::string(deploy::kCompletionMarker) + "\"; ";
  script += "if [ $EXIT_CODE -eq 0 ]; then echo \"STATUS: SUCCESS\"; else echo \"STATUS: FAILED (exit code: $EXIT_CODE)\"; fi; ";
  script += "echo \"TIMESTAMP: $(date -Iseconds)\"";

  return InDir(path) + "nohup bash -c '" + script + "' > " + Quoted(log_file) + " 2>&1 &";
}

std::string TailLog(const std::string& log_file, std::uint32_t lines) {
  RequirePath(log_file);
  return "tail -" + std::to_string(lines) + " " + Quoted(log_file) + " 2>&1 || echo \"Log file not found or empty\"";
}

std::string LogFreshness(const std::string& log_file, std::uint32_t window_seconds) {
  RequirePath(log_file);
  return "find " + Quoted(log_file) + " -mmin -" + MinutesArg(window_seconds) +
         " 2>/dev/null | grep -q . && echo \"RECENT\" || echo \"STALE\"";
}

std::string ReadLogFrom(const std::string& log_file, std::uint64_t offset, std::uint32_t max_bytes) {
  RequirePath(log_file);
  return "tail -c +" + std::to_string(offset + 1) + " " + Quoted(log_file) + " 2>/dev/null | head -c " + std::to_string(max_bytes);
}

std::string LogHasMarker(const std::string& log_file) {
  RequirePath(log_file);
  return "grep -qF -- \"" + std::string(deploy::kCompletionMarker) + "\" " + Quoted(log_file) +
         " 2>/dev/null && echo \"COMPLETE\" || echo \"RUNNING\"";
}

std::string RestartContainer(const std::string& container_name) {
  RequireContainerName(container_name);
  return "docker restart " + container_name + " 2>&1";
}

} // namespace shipyard::command
