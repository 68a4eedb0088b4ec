#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/project_catalog.hpp"

namespace shipyard::gateway {
class ExecutionGateway;
}

namespace shipyard::allowlist {
class AllowlistGuard;
}

namespace shipyard::deploy {

enum class PathSource {
  kCustom,
  kService,
  kConvention,
};

const char* ToString(PathSource source);

struct ResolvedPath {
  std::string path;
  PathSource  source = PathSource::kCustom;
};

/*
  Finds the directory to deploy from, first match wins:

    1. explicit caller path
    2. repo_path of a linked service (in the order given)
    3. {projects_dir}/{slug}, {projects_dir}/{name},
       {projects_dir}/{name with spaces as '-'}, checked one at a time
       with an existence check through the gateway

  Candidates that are not valid paths or not in the allowlist are skipped
  without probing. Throws util::ResolutionError when nothing matches.
*/
class PathResolver {
 public:
  PathResolver(std::shared_ptr<gateway::ExecutionGateway> gateway, std::shared_ptr<allowlist::AllowlistGuard> guard,
               std::string projects_dir);

  ResolvedPath Resolve(const catalog::Project& project, const std::vector<catalog::Service>& services,
                       const std::optional<std::string>& custom_path) const;

  std::vector<std::string> CandidatePaths(const catalog::Project& project) const;

 private:
  bool Exists(const std::string& path) const;

  std::shared_ptr<gateway::ExecutionGateway> gateway_;
  std::shared_ptr<allowlist::AllowlistGuard> guard_;
  std::string                                projects_dir_;
};

} // namespace shipyard::deploy
