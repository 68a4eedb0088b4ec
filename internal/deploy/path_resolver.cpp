#include "path_resolver.hpp"

#include <algorithm>

#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/command/shell_command.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::deploy {

using shipyard::observability::StringField;

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string SpacesToDashes(std::string s) {
  std::string out;
  bool        in_space = false;
  for (char c : s) {
    if (c == ' ' || c == '\t') {
      if (!in_space) out.push_back('-');
      in_space = true;
    } else {
      out.push_back(c);
      in_space = false;
    }
  }
  return out;
}

} // namespace

const char* ToString(PathSource source) {
  switch (source) {
    case PathSource::kCustom:
      return "custom";
    case PathSource::kService:
      return "service";
    case PathSource::kConvention:
      return "convention";
  }
  return "unknown";
}

PathResolver::PathResolver(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<allowlist::AllowlistGuard> guard,
                           std::string projects_dir)
    : gateway_(std::move(gateway)), guard_(std::move(guard)), projects_dir_(std::move(projects_dir)) {
  while (projects_dir_.size() > 1 && projects_dir_.back() == '/') {
    projects_dir_.pop_back();
  }
}

std::vector<std::string> PathResolver::CandidatePaths(const catalog::Project& project) const {
  std::vector<std::string> out;
  for (const auto& leaf : {project.slug, project.name, SpacesToDashes(project.name)}) {
    if (leaf.empty()) {
      continue;
    }
    auto candidate = projects_dir_ + "/" + leaf;
    if (std::find(out.begin(), out.end(), candidate) == out.end()) {
      out.push_back(std::move(candidate));
    }
  }
  return out;
}

bool PathResolver::Exists(const std::string& path) const {
  const auto result = gateway_->Execute(command::DirectoryExists(path));
  SHIPYARD_LOG_DEBUG("path check", {StringField("path", path), StringField("result", Trim(result.stdout_text))});
  return result.stdout_text.find("EXISTS") != std::string::npos;
}

ResolvedPath PathResolver::Resolve(const catalog::Project& project, const std::vector<catalog::Service>& services,
                                   const std::optional<std::string>& custom_path) const {
  if (custom_path) {
    auto path = Trim(*custom_path);
    if (!path.empty()) {
      command::RequirePath(path);
      return ResolvedPath{path, PathSource::kCustom};
    }
  }

  for (const auto& service : services) {
    if (!service.repo_path.empty()) {
      command::RequirePath(service.repo_path);
      SHIPYARD_LOG_DEBUG("repo path from service", {StringField("service", service.id), StringField("path", service.repo_path)});
      return ResolvedPath{service.repo_path, PathSource::kService};
    }
  }

  std::optional<std::string> transport_error;
  for (const auto& candidate : CandidatePaths(project)) {
    if (!command::IsValidPath(candidate)) {
      SHIPYARD_LOG_DEBUG("skipping candidate path", {StringField("path", candidate), StringField("reason", "invalid")});
      continue;
    }
    if (!guard_->IsAllowed(allowlist::AllowlistKind::kRepoPath, candidate)) {
      SHIPYARD_LOG_WARN("skipping candidate path", {StringField("path", candidate), StringField("reason", "not in allowlist")});
      continue;
    }

    try {
      if (Exists(candidate)) {
        return ResolvedPath{candidate, PathSource::kConvention};
      }
    } catch (const util::TransportError& e) {
      SHIPYARD_LOG_WARN("path check failed", {StringField("path", candidate), StringField("error", e.what())});
      transport_error = e.what();
    }
  }

  if (transport_error) {
    throw util::TransportError(*transport_error);
  }
  throw util::ResolutionError("could not determine deploy directory for project " + project.name +
                              "; set a repo path on the service or pass one explicitly");
}

} // namespace shipyard::deploy
