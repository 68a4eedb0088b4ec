#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/deploy_state.hpp"

namespace shipyard::runtime::config {
class RuntimeConfig;
}

namespace shipyard::catalog {

struct Project {
  std::string id;
  std::string name;
  std::string slug;
};

struct Service {
  std::string id;
  std::string project_id;
  std::string name;
  std::string type; // docker, static, ...
  std::string repo_path;

  std::optional<std::string>                    compose_project;
  std::optional<shipyard::model::DeployStrategy> strategy;
};

/*
  Read-only view of the dashboard's project/service data.
*/
class ProjectCatalog {
 public:
  virtual ~ProjectCatalog() = default;

  virtual std::optional<Project> FindProject(const std::string& id) const = 0;
  virtual std::vector<Service>   ServicesOf(const std::string& project_id) const = 0;
  virtual std::optional<Service> FindService(const std::string& id) const = 0;

  // Every service of every project, in catalog order.
  virtual std::vector<Service> AllServices() const = 0;
};

// The service a project-level deploy is recorded against: the first
// docker service, else the first service, else none.
std::optional<Service> LinkedService(const std::vector<Service>& services);

/*
  Catalog loaded once from the `projects` configuration section.
*/
class StaticProjectCatalog final : public ProjectCatalog {
 public:
  // Throws util::ConfigurationError on duplicate ids or unknown strategies.
  explicit StaticProjectCatalog(const shipyard::runtime::config::RuntimeConfig& config);

  std::optional<Project> FindProject(const std::string& id) const override;
  std::vector<Service>   ServicesOf(const std::string& project_id) const override;
  std::optional<Service> FindService(const std::string& id) const override;
  std::vector<Service>   AllServices() const override;

 private:
  std::vector<std::string>                    service_order_;
  std::map<std::string, Project>              projects_;
  std::map<std::string, std::vector<Service>> services_by_project_;
  std::map<std::string, Service>              services_;
};

} // namespace shipyard::catalog
