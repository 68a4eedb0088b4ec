#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/allowlist/allowlist_store.hpp"
#include "internal/audit/audit_trail.hpp"
#include "internal/catalog/project_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deploy/deploy_lifecycle.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::testing {

/*
  Scripted gateway: the most recently added rule whose needle occurs in
  the command decides the result. Unmatched commands succeed silently.
  Execute may be called from several threads; script it before they start.
*/
class FakeGateway final : public gateway::ExecutionGateway {
 public:
  void On(const std::string& needle, const std::string& stdout_text, bool success = true) {
    gateway::ShellResult result;
    result.success     = success;
    result.stdout_text = stdout_text;
    result.exit_code   = success ? 0 : 1;
    rules_.push_back(Rule{needle, {result}, 0, false});
  }

  // Successive matches return successive outputs; the last one repeats.
  void OnSequence(const std::string& needle, const std::vector<std::string>& outputs) {
    Rule rule{needle, {}, 0, false};
    for (const auto& output : outputs) {
      gateway::ShellResult result;
      result.success     = true;
      result.stdout_text = output;
      rule.results.push_back(result);
    }
    rules_.push_back(rule);
  }

  void Unreachable(const std::string& needle) {
    rules_.push_back(Rule{needle, {}, 0, true});
  }

  gateway::ShellResult Execute(const std::string& command, const std::optional<std::string>&) override {
    std::scoped_lock lock(mutex_);
    commands.push_back(command);
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
      if (command.find(it->needle) != std::string::npos) {
        if (it->unreachable) {
          throw util::TransportError("gateway unreachable");
        }
        const auto at = std::min(it->next, it->results.size() - 1);
        ++it->next;
        return it->results[at];
      }
    }
    gateway::ShellResult ok;
    ok.success = true;
    return ok;
  }

  std::size_t Count(const std::string& needle) const {
    std::scoped_lock lock(mutex_);
    std::size_t      n = 0;
    for (const auto& command : commands) {
      if (command.find(needle) != std::string::npos) ++n;
    }
    return n;
  }

  bool Saw(const std::string& needle) const {
    return Count(needle) > 0;
  }

  std::vector<std::string> commands;

 private:
  struct Rule {
    std::string                       needle;
    std::vector<gateway::ShellResult> results;
    std::size_t                       next;
    bool                              unreachable;
  };
  std::vector<Rule>  rules_;
  mutable std::mutex mutex_;
};

class RecordingNotifier final : public notify::Notifier {
 public:
  void DeployStarted(const std::string& service_name, const std::string&) override {
    std::scoped_lock lock(mutex_);
    ++started;
    last_service = service_name;
  }

  void DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                       std::optional<std::uint64_t>) override {
    std::scoped_lock lock(mutex_);
    ++succeeded;
    last_service = service_name;
    last_commit  = commit_sha;
  }

  void DeployFailed(const std::string& service_name, const std::string& error_message) override {
    std::scoped_lock lock(mutex_);
    ++failed;
    last_service = service_name;
    last_error   = error_message;
  }

  std::atomic<int>           started{0};
  std::atomic<int>           succeeded{0};
  std::atomic<int>           failed{0};
  std::string                last_service;
  std::string                last_error;
  std::optional<std::string> last_commit;

 private:
  std::mutex mutex_;
};

// Project "p-web" ("Web App") with one docker service "svc-web".
inline shipyard::runtime::config::RuntimeConfig CatalogConfig(const std::string& repo_path = "",
                                                             const std::string& strategy = "pull_rebuild") {
  shipyard::runtime::config::RuntimeConfig config;
  auto*                                     project = config.add_projects();
  project->set_id("p-web");
  project->set_name("Web App");
  project->set_slug("web-app");

  auto* service = project->add_services();
  service->set_id("svc-web");
  service->set_name("web");
  service->set_type("docker");
  service->set_repo_path(repo_path);
  service->set_compose_project("webapp");
  service->set_deploy_strategy(strategy);
  return config;
}

/*
  In-memory wiring shared by the deploy tests.
*/
struct Harness {
  explicit Harness(const shipyard::runtime::config::RuntimeConfig& config = CatalogConfig()) {
    repository = std::make_shared<db::memory::MemoryRepository>();
    audit      = std::make_shared<audit::AuditTrail>(repository);
    lifecycle  = std::make_shared<deploy::DeployLifecycle>(repository);
    store      = std::make_shared<allowlist::AllowlistStore>("");
    guard      = std::make_shared<allowlist::AllowlistGuard>(store, audit);
    catalog    = std::make_shared<catalog::StaticProjectCatalog>(config);
    gateway    = std::make_shared<FakeGateway>();
    notifier   = std::make_shared<RecordingNotifier>();

    shipyard::v1::Allowlist seed;
    seed.add_repo_paths("/home/pi/projects/web-app");
    seed.add_repo_paths("/srv/web");
    seed.add_compose_projects("webapp");
    seed.add_container_names("web-1");
    store->Load(seed);
  }

  std::shared_ptr<db::memory::MemoryRepository>  repository;
  std::shared_ptr<audit::AuditTrail>             audit;
  std::shared_ptr<deploy::DeployLifecycle>       lifecycle;
  std::shared_ptr<allowlist::AllowlistStore>     store;
  std::shared_ptr<allowlist::AllowlistGuard>     guard;
  std::shared_ptr<catalog::StaticProjectCatalog> catalog;
  std::shared_ptr<FakeGateway>                   gateway;
  std::shared_ptr<RecordingNotifier>             notifier;
};

} // namespace shipyard::testing
