#include "internal/deploy/completion_detector.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

#if SHIPYARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using shipyard::deploy::CompletionDetector;
using shipyard::deploy::DeployLifecycle;
using shipyard::deploy::DetectorOptions;
using shipyard::deploy::LogClassifier;
using shipyard::deploy::LogPointerPolicy;
using shipyard::model::DeployStatus;
using shipyard::testing::Harness;

const std::string kLog = "/tmp/deploy-web-app-1700000000000.log";

CompletionDetector MakeDetector(Harness& h) {
  return CompletionDetector(h.gateway, h.lifecycle, h.catalog, h.notifier, LogPointerPolicy("/tmp"), LogClassifier(), DetectorOptions{});
}

std::string StartRunningDeploy(Harness& h) {
  auto record = h.lifecycle->Create(std::string("svc-web"), "alice", "0123456789abcdef0123456789abcdef01234567");
  h.lifecycle->MarkRunning(record.id, kLog);
  return record.id;
}

void TestFailedMarkerCompletesOnce() {
  Harness h;
  auto    detector = MakeDetector(h);
  const auto id    = StartRunningDeploy(h);

  const std::string log = "Step 3/7 : RUN npm ci\nnpm ERR! missing script: build\n\n===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 1)\n"
                          "TIMESTAMP: 2024-05-01T10:00:00+00:00\n";
  h.gateway->On("tail -", log);

  const auto first = detector.CheckStatus(kLog, std::nullopt);
  assert(first.is_complete);
  assert(first.transitioned);
  assert(first.status && *first.status == DeployStatus::kFailed);
  assert(first.log == log);
  assert(h.notifier->failed == 1);
  assert(h.notifier->last_service == "web");
  assert(h.notifier->last_error == "NPM error (exit code: 1)");

  const auto stored = h.lifecycle->Get(id);
  assert(stored->status == DeployStatus::kFailed);
  assert(stored->error_message == "NPM error (exit code: 1)");
  assert(stored->completed_at_ms.has_value());

  // Repeated polls observe the same terminal state and stay silent.
  const auto second = detector.CheckStatus(kLog, id);
  assert(second.is_complete);
  assert(!second.transitioned);
  assert(second.log == log);
  assert(second.status && *second.status == DeployStatus::kFailed);
  assert(h.notifier->failed == 1);
  assert(h.notifier->succeeded == 0);

  const auto again = h.lifecycle->Get(id);
  assert(again->completed_at_ms == stored->completed_at_ms);
  assert(again->error_message == stored->error_message);
}

void TestMarkerStatusBeatsErrorText() {
  Harness h;
  auto    detector = MakeDetector(h);
  const auto id    = StartRunningDeploy(h);

  h.gateway->On("tail -", "warning: error fetching optional metadata\nfatal: retrying\n===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\n");

  const auto report = detector.CheckStatus(kLog, id);
  assert(report.is_complete);
  assert(report.status && *report.status == DeployStatus::kSuccess);
  assert(h.notifier->succeeded == 1);
  assert(h.notifier->last_commit == std::string("0123456789abcdef0123456789abcdef01234567"));
  assert(h.lifecycle->Get(id)->error_message.empty());
}

void TestFailedMarkerWithoutKnownError() {
  Harness h;
  auto    detector = MakeDetector(h);
  StartRunningDeploy(h);

  h.gateway->On("tail -", "pulling images\n===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 125)\n");

  const auto report = detector.CheckStatus(kLog, std::nullopt);
  assert(report.status && *report.status == DeployStatus::kFailed);
  assert(h.notifier->last_error == "Docker compose exited with non-zero code (exit code: 125)");
}

void TestStaleDockerSuccessCountsAsComplete() {
  Harness h;
  auto    detector = MakeDetector(h);
  StartRunningDeploy(h);

  h.gateway->On("tail -", "#8 exporting layers\nSuccessfully built 3f2a1b\n");
  h.gateway->On("find ", "STALE\n");

  const auto report = detector.CheckStatus(kLog, std::nullopt);
  assert(report.is_complete);
  assert(report.status && *report.status == DeployStatus::kSuccess);
  assert(h.notifier->succeeded == 1);
}

void TestFreshLogIsStillRunning() {
  Harness h;
  auto    detector = MakeDetector(h);
  StartRunningDeploy(h);

  h.gateway->On("tail -", "Container webapp-web-1  Started\n");
  h.gateway->On("find ", "RECENT\n");

  const auto report = detector.CheckStatus(kLog, std::nullopt);
  assert(!report.is_complete);
  assert(report.status && *report.status == DeployStatus::kRunning);
  assert(h.notifier->succeeded == 0 && h.notifier->failed == 0);

  // No docker success signature: staleness is never consulted.
  Harness quiet;
  auto    quiet_detector = MakeDetector(quiet);
  StartRunningDeploy(quiet);
  quiet.gateway->On("tail -", "Step 2/9 : COPY . .\n");
  assert(!quiet_detector.CheckStatus(kLog, std::nullopt).is_complete);
  assert(!quiet.gateway->Saw("find "));
}

void TestUnreachableFreshnessCheckMeansRunning() {
  Harness h;
  auto    detector = MakeDetector(h);
  StartRunningDeploy(h);

  h.gateway->On("tail -", "Successfully tagged web:latest\n");
  h.gateway->Unreachable("find ");

  assert(!detector.CheckStatus(kLog, std::nullopt).is_complete);
}

void TestInvalidPointersNeverReachGateway() {
  Harness h;
  auto    detector = MakeDetector(h);

  bool rejected = false;
  try {
    detector.CheckStatus("/etc/passwd", std::nullopt);
  } catch (const shipyard::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
  assert(h.gateway->commands.empty());

  bool missing = false;
  try {
    detector.CheckStatus(kLog, std::string("no-such-deploy"));
  } catch (const shipyard::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestRefreshRunningDeploys() {
  Harness h;
  auto    detector = MakeDetector(h);
  StartRunningDeploy(h);

  auto other = h.lifecycle->Create(std::string("svc-web"), "bob", "");
  h.lifecycle->MarkRunning(other.id, "/tmp/deploy-web-app-1700000000001.log");

  h.gateway->On("deploy-web-app-1700000000000", "===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\n");
  h.gateway->On("deploy-web-app-1700000000001", "Step 1/4 : FROM node:20\n");

  const auto summary = detector.RefreshRunningDeploys();
  assert(summary.checked == 2);
  assert(summary.completed == 1);
  assert(h.lifecycle->Get(other.id)->status == DeployStatus::kRunning);

  const auto second = detector.RefreshRunningDeploys();
  assert(second.checked == 1);
  assert(second.completed == 0);
  assert(h.notifier->succeeded == 1);
}

void TestDockerSuccessSignatures() {
  assert(CompletionDetector::HasDockerSuccess(" Container webapp-web-1  Started\n"));
  assert(CompletionDetector::HasDockerSuccess("Creating webapp_web_1 ... done\n"));
  assert(CompletionDetector::HasDockerSuccess("Successfully built abc123\n"));
  assert(CompletionDetector::HasDockerSuccess("web Started\r\n"));
  assert(!CompletionDetector::HasDockerSuccess("Step 4/9 : RUN make\n"));
}

void TestHugeLogLinesDoNotCrash() {
  const std::string bundle = "ERROR in ./src/vendor.min.js 1:0 Module parse failed: " + std::string(100000, 'x') + "\n";

  Harness h;
  auto    detector = MakeDetector(h);
  const auto id    = StartRunningDeploy(h);

  const std::string log = bundle + " Container webapp-web-1  Started\n===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\n";
  h.gateway->On("tail -", log);

  const auto report = detector.CheckStatus(kLog, id);
  assert(report.is_complete);
  assert(report.transitioned);
  assert(report.status && *report.status == DeployStatus::kSuccess);
  assert(report.log == log);

  Harness failing;
  auto    failing_detector = MakeDetector(failing);
  const auto failing_id    = StartRunningDeploy(failing);
  failing.gateway->On("tail -", bundle + "===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 2)\n");

  const auto failed = failing_detector.CheckStatus(kLog, failing_id);
  assert(failed.status && *failed.status == DeployStatus::kFailed);
  const auto message = failing.lifecycle->Get(failing_id)->error_message;
  assert(message.find("(exit code: 2)") != std::string::npos);

  // Without a marker the same line goes through the docker success check.
  assert(!CompletionDetector::HasDockerSuccess(" Container " + std::string(100000, 'x') + "\n"));
  assert(CompletionDetector::HasDockerSuccess(bundle + " Container webapp-web-1  Started\n"));
}

void TestOversizedExitCodeStillCompletes() {
  Harness h;
  auto    detector = MakeDetector(h);
  const auto id    = StartRunningDeploy(h);

  const std::string log = "===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 99999999999)\n";
  h.gateway->On("tail -", log);

  const auto report = detector.CheckStatus(kLog, id);
  assert(report.log == log);
  assert(report.transitioned);
  assert(report.status && *report.status == DeployStatus::kFailed);
  assert(h.lifecycle->Get(id)->error_message == "Docker compose exited with non-zero code");
  assert(h.notifier->failed == 1);
}

// Many pollers hit one finished deploy at once: exactly one applies the
// terminal state and notifies.
void RunConcurrentChecks(const std::shared_ptr<shipyard::db::Repository>& repository) {
  Harness h;
  auto    lifecycle = std::make_shared<DeployLifecycle>(repository);
  CompletionDetector detector(h.gateway, lifecycle, h.catalog, h.notifier, LogPointerPolicy("/tmp"), LogClassifier(), DetectorOptions{});

  auto record = lifecycle->Create(std::string("svc-web"), "alice", "");
  lifecycle->MarkRunning(record.id, kLog);

  h.gateway->On("tail -", "npm ERR! missing script: build\n===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 1)\n");

  constexpr int            kPollers = 8;
  std::atomic<int>         transitioned{0};
  std::atomic<int>         complete{0};
  std::atomic<int>         failures{0};
  std::vector<std::thread> pollers;
  for (int i = 0; i < kPollers; ++i) {
    pollers.emplace_back([&] {
      try {
        const auto report = detector.CheckStatus(kLog, record.id);
        if (report.transitioned) ++transitioned;
        if (report.is_complete && report.status && *report.status == DeployStatus::kFailed) ++complete;
      } catch (const std::exception& e) {
        std::cerr << "concurrent check failed: " << e.what() << "\n";
        ++failures;
      }
    });
  }
  for (auto& t : pollers) {
    t.join();
  }

  assert(failures == 0);
  assert(transitioned == 1);
  assert(complete == kPollers);
  assert(h.notifier->failed == 1);
  assert(h.notifier->succeeded == 0);

  const auto stored = lifecycle->Get(record.id);
  assert(stored->status == DeployStatus::kFailed);
  assert(stored->completed_at_ms.has_value());

  // Later polls leave the recorded completion untouched.
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  assert(!detector.CheckStatus(kLog, record.id).transitioned);
  assert(lifecycle->Get(record.id)->completed_at_ms == stored->completed_at_ms);
  assert(h.notifier->failed == 1);
}

void TestConcurrentChecksCompleteOnce() {
  RunConcurrentChecks(std::make_shared<shipyard::db::memory::MemoryRepository>());

#if SHIPYARD_DB_SQLITE
  const auto path = (std::filesystem::temp_directory_path() /
                     ("shipyard_detector_concurrency_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db"))
                        .string();
  {
    auto db = std::make_shared<shipyard::db::sqlite::SqliteDB>(path);
    for (const auto& sql : shipyard::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    RunConcurrentChecks(std::make_shared<shipyard::db::sqlite::SqliteRepository>(std::move(db)));
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
#endif
}

} // namespace

int main() {
  TestFailedMarkerCompletesOnce();
  TestMarkerStatusBeatsErrorText();
  TestFailedMarkerWithoutKnownError();
  TestStaleDockerSuccessCountsAsComplete();
  TestFreshLogIsStillRunning();
  TestUnreachableFreshnessCheckMeansRunning();
  TestInvalidPointersNeverReachGateway();
  TestRefreshRunningDeploys();
  TestDockerSuccessSignatures();
  TestHugeLogLinesDoNotCrash();
  TestOversizedExitCodeStillCompletes();
  TestConcurrentChecksCompleteOnce();

  std::cout << "shipyard_unit_completion_detector: pass\n";
  return 0;
}
