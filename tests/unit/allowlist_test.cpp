#include "internal/allowlist/allowlist_guard.hpp"
#include "internal/allowlist/allowlist_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/audit/audit_trail.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using shipyard::allowlist::AllowlistGuard;
using shipyard::allowlist::AllowlistKind;
using shipyard::allowlist::AllowlistStore;
using shipyard::db::model::AuditOutcome;

std::filesystem::path TempFile(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "shipyard_allowlist_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  std::filesystem::remove(path);
  return path;
}

shipyard::v1::Allowlist Seed() {
  shipyard::v1::Allowlist seed;
  seed.add_repo_paths("/srv/web/");
  seed.add_repo_paths("/srv/web");
  seed.add_compose_projects("webapp");
  seed.add_container_names("web-1");
  return seed;
}

void TestSeedIsNormalizedAndPersisted() {
  const auto path = TempFile("seed.json");

  AllowlistStore store(path.string());
  store.Load(Seed());

  const auto snapshot = store.Snapshot();
  assert(snapshot.repo_paths_size() == 1);
  assert(snapshot.repo_paths(0) == "/srv/web");
  assert(std::filesystem::exists(path));

  assert(store.Contains(AllowlistKind::kRepoPath, "/srv/web"));
  assert(store.Contains(AllowlistKind::kRepoPath, "/srv/web/"));
  assert(!store.Contains(AllowlistKind::kRepoPath, "/srv/web/sub"));
  assert(!store.Contains(AllowlistKind::kComposeProject, "other"));

  // An existing file wins over the seed.
  AllowlistStore reopened(path.string());
  reopened.Load(shipyard::v1::Allowlist{});
  assert(reopened.Contains(AllowlistKind::kContainerName, "web-1"));
}

void TestReplaceValidatesEntries() {
  AllowlistStore store("");
  store.Load(Seed());

  shipyard::v1::Allowlist bad;
  bad.add_repo_paths("/srv/../etc");

  bool rejected = false;
  try {
    store.Replace(bad);
  } catch (const shipyard::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
  assert(store.Contains(AllowlistKind::kRepoPath, "/srv/web"));

  shipyard::v1::Allowlist next;
  next.add_container_names("api-1");
  store.Replace(next);
  assert(!store.Contains(AllowlistKind::kRepoPath, "/srv/web"));
  assert(store.Contains(AllowlistKind::kContainerName, "api-1"));
}

void TestExternalEditsArePickedUp() {
  const auto path = TempFile("external.json");

  AllowlistStore store(path.string());
  store.Load(Seed());
  assert(!store.Contains(AllowlistKind::kComposeProject, "api"));

  // Make sure the modification time moves on coarse filesystems.
  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  {
    std::ofstream out(path, std::ios::trunc);
    out << R"({"compose_projects": ["api"]})";
  }
  assert(store.Contains(AllowlistKind::kComposeProject, "api"));
  assert(!store.Contains(AllowlistKind::kComposeProject, "webapp"));

  // A broken edit keeps the last good document in force.
  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  {
    std::ofstream out(path, std::ios::trunc);
    out << "{ not json";
  }
  assert(store.Contains(AllowlistKind::kComposeProject, "api"));
}

void TestGuardBlocksAndAudits() {
  auto repository = std::make_shared<shipyard::db::memory::MemoryRepository>();
  auto audit      = std::make_shared<shipyard::audit::AuditTrail>(repository);
  auto store      = std::make_shared<AllowlistStore>("");
  store->Load(Seed());

  AllowlistGuard guard(store, audit);
  guard.Require(AllowlistKind::kRepoPath, "/srv/web", "alice", "deploy.start");

  bool blocked = false;
  try {
    guard.Require(AllowlistKind::kContainerName, "db-1", "alice", "container.restart");
  } catch (const shipyard::util::OperationBlocked& e) {
    blocked = std::string(e.what()).find("db-1") != std::string::npos;
  }
  assert(blocked);

  const auto events = audit->Recent(10);
  assert(events.size() == 1);
  assert(events[0].outcome == AuditOutcome::kBlocked);
  assert(events[0].actor == "alice");
  assert(events[0].action == "container.restart");
  assert(events[0].entity_id == "db-1");
}

} // namespace

int main() {
  TestSeedIsNormalizedAndPersisted();
  TestReplaceValidatesEntries();
  TestExternalEditsArePickedUp();
  TestGuardBlocksAndAudits();

  std::cout << "shipyard_unit_allowlist: pass\n";
  return 0;
}
