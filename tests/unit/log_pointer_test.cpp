#include "internal/deploy/completion_marker.hpp"
#include "internal/deploy/log_pointer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using shipyard::deploy::LogPointerPolicy;
using shipyard::deploy::ParseCompletionMarker;

void TestMakeUsesNormalizedSlug() {
  LogPointerPolicy policy("/tmp/");

  assert(policy.LogDir() == "/tmp");
  assert(policy.Make("Web App", 1700000000000) == "/tmp/deploy-web-app-1700000000000.log");
  assert(policy.Make("../../etc", 1) == "/tmp/deploy-etc-1.log");
  assert(LogPointerPolicy::NormalizeSlug("***") == "project");
}

void TestPointersOutsideLogDirAreRejected() {
  LogPointerPolicy policy("/var/log/shipyard");

  assert(policy.IsValid("/var/log/shipyard/deploy-web-app-1700000000000.log"));
  assert(!policy.IsValid("/etc/passwd"));
  assert(!policy.IsValid("/var/log/shipyard/../../etc/passwd"));
  assert(!policy.IsValid("/var/log/shipyard/deploy-web-app-1.log; rm -rf /"));
  assert(!policy.IsValid("/var/log/shipyard/other.log"));
  assert(!policy.IsValid("/var/log/shipyard/deploy-" + std::string(100000, 'a') + "-1.log"));

  bool rejected = false;
  try {
    policy.Require("/etc/shadow");
  } catch (const shipyard::util::InvalidArgument& e) {
    rejected = std::string(e.what()).find("invalid log file path") != std::string::npos;
  }
  assert(rejected);
}

void TestMarkerParsing() {
  const auto success = ParseCompletionMarker("building...\n===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\nTIMESTAMP: 2024-01-01T00:00:00+00:00\n");
  assert(success.present);
  assert(success.success);
  assert(!success.exit_code);
  assert(success.timestamp == "2024-01-01T00:00:00+00:00");

  const auto failed = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\r\nSTATUS: FAILED (exit code: 17)\r\n");
  assert(failed.present);
  assert(!failed.success);
  assert(failed.exit_code && *failed.exit_code == 17);

  const auto none = ParseCompletionMarker("Container web Started\n");
  assert(!none.present);

  // Marker without a status line counts as a failed run.
  const auto truncated = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\n");
  assert(truncated.present);
  assert(!truncated.success);
}

void TestOversizedExitCodeIsDropped() {
  const auto huge = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 99999999999)\n");
  assert(huge.present);
  assert(!huge.success);
  assert(!huge.exit_code);

  const auto digits = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: " + std::string(200000, '9') + ")\n");
  assert(digits.present);
  assert(!digits.success);
  assert(!digits.exit_code);

  const auto padded = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 2)  \n");
  assert(padded.exit_code && *padded.exit_code == 2);

  const auto garbled = ParseCompletionMarker("===[DEPLOY_COMPLETE]===\nSTATUS: FAILED (exit code: 2x)\n");
  assert(garbled.present);
  assert(!garbled.exit_code);
}

} // namespace

int main() {
  TestMakeUsesNormalizedSlug();
  TestPointersOutsideLogDirAreRejected();
  TestMarkerParsing();
  TestOversizedExitCodeIsDropped();

  std::cout << "shipyard_unit_log_pointer: pass\n";
  return 0;
}
