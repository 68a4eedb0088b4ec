#include "project_catalog.hpp"

#include "config/config.pb.h"
#include "internal/deploy/log_pointer.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::catalog {

std::optional<Service> LinkedService(const std::vector<Service>& services) {
  for (const auto& service : services) {
    if (service.type == "docker") {
      return service;
    }
  }
  if (!services.empty()) {
    return services.front();
  }
  return std::nullopt;
}

StaticProjectCatalog::StaticProjectCatalog(const shipyard::runtime::config::RuntimeConfig& config) {
  for (const auto& entry : config.projects()) {
    if (entry.id().empty()) {
      throw util::ConfigurationError("project without id in catalog");
    }

    Project project;
    project.id   = entry.id();
    project.name = entry.name().empty() ? entry.id() : entry.name();
    project.slug = entry.slug().empty() ? deploy::LogPointerPolicy::NormalizeSlug(project.name) : entry.slug();

    if (!projects_.emplace(project.id, project).second) {
      throw util::ConfigurationError("duplicate project id: " + project.id);
    }

    auto& services = services_by_project_[project.id];
    for (const auto& s : entry.services()) {
      if (s.id().empty()) {
        throw util::ConfigurationError("service without id in project " + project.id);
      }

      Service service;
      service.id         = s.id();
      service.project_id = project.id;
      service.name       = s.name().empty() ? s.id() : s.name();
      service.type       = s.type();
      service.repo_path  = s.repo_path();
      if (!s.compose_project().empty()) {
        service.compose_project = s.compose_project();
      }
      if (!s.deploy_strategy().empty()) {
        service.strategy = shipyard::model::ParseDeployStrategy(s.deploy_strategy());
        if (!service.strategy) {
          throw util::ConfigurationError("unknown deploy_strategy '" + s.deploy_strategy() + "' for service " + s.id());
        }
      }

      if (!services_.emplace(service.id, service).second) {
        throw util::ConfigurationError("duplicate service id: " + service.id);
      }
      service_order_.push_back(service.id);
      services.push_back(std::move(service));
    }
  }
}

std::optional<Project> StaticProjectCatalog::FindProject(const std::string& id) const {
  auto it = projects_.find(id);
  if (it == projects_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Service> StaticProjectCatalog::ServicesOf(const std::string& project_id) const {
  auto it = services_by_project_.find(project_id);
  if (it == services_by_project_.end()) {
    return {};
  }
  return it->second;
}

std::optional<Service> StaticProjectCatalog::FindService(const std::string& id) const {
  auto it = services_.find(id);
  if (it == services_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Service> StaticProjectCatalog::AllServices() const {
  std::vector<Service> out;
  out.reserve(service_order_.size());
  for (const auto& id : service_order_) {
    out.push_back(services_.at(id));
  }
  return out;
}

} // namespace shipyard::catalog
