#include "internal/command/shell_command.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace shipyard::command;
using shipyard::model::DeployStrategy;

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const shipyard::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestPathValidation() {
  assert(IsValidPath("/home/pi/projects/web-app"));
  assert(IsValidPath("/srv/app_v2.1"));
  assert(!IsValidPath("relative/path"));
  assert(!IsValidPath("/home/pi/../etc"));
  assert(!IsValidPath("/home/pi/app; rm -rf /"));
  assert(!IsValidPath("/home/pi/$(whoami)"));
  assert(!IsValidPath("/home/pi/app name"));
  assert(!IsValidPath(""));
}

void TestBranchValidation() {
  assert(IsValidBranch("main"));
  assert(IsValidBranch("feature/login-v2"));
  assert(!IsValidBranch("-f"));
  assert(!IsValidBranch("main;reboot"));
  assert(!IsValidBranch("a..b"));
  assert(!IsValidBranch("feature//x"));
  assert(!IsValidBranch(""));

  assert(Throws([] { (void)GitCheckout("/srv/web", "main && reboot"); }));
}

void TestProfileSanitization() {
  std::vector<std::string> rejected;
  const auto               profiles = FilterProfiles("web\nworker\n$(touch /tmp/pwned)\nbad;name\n\n  jobs  \n", &rejected);

  assert((profiles == std::vector<std::string>{"web", "worker", "jobs"}));
  assert(rejected.size() == 2);
  assert(rejected[0] == "$(touch /tmp/pwned)");

  // A hostile profile never reaches a composed command.
  assert(Throws([] { (void)ComposeInvocation(DeployStrategy::kComposeUp, std::nullopt, {"web", "x;reboot"}); }));
  assert(Throws([] { (void)ComposeServices("/srv/web", std::nullopt, {"`id`"}); }));
}

void TestComposeInvocationPerStrategy() {
  assert(ComposeInvocation(DeployStrategy::kPullRestart, std::nullopt, {}) == "docker compose restart");
  assert(ComposeInvocation(DeployStrategy::kPullRebuild, std::string("webapp"), {"web"}) ==
         "docker compose -p webapp --profile web up -d --build");
  assert(ComposeInvocation(DeployStrategy::kComposeUp, std::nullopt, {"a", "b"}) == "docker compose --profile a --profile b up -d");

  bool manual_rejected = false;
  try {
    (void)ComposeInvocation(DeployStrategy::kManual, std::nullopt, {});
  } catch (const shipyard::util::InvalidState&) {
    manual_rejected = true;
  }
  assert(manual_rejected);

  assert(Throws([] { (void)ComposeInvocation(DeployStrategy::kComposeUp, std::string("Web App"), {}); }));
}

void TestDetachedLaunchWritesMarker() {
  const auto command = DetachedLaunch("/srv/web", "docker compose up -d --build", "/tmp/deploy-web-1.log");

  assert(command.rfind("cd \"/srv/web\" && nohup bash -c '", 0) == 0);
  assert(command.find("===[DEPLOY_COMPLETE]===") != std::string::npos);
  assert(command.find("STATUS: SUCCESS") != std::string::npos);
  assert(command.find("STATUS: FAILED (exit code: $EXIT_CODE)") != std::string::npos);
  assert(command.find("> \"/tmp/deploy-web-1.log\" 2>&1 &") != std::string::npos);

  assert(Throws([] { (void)DetachedLaunch("/srv/web", "echo 'x'", "/tmp/deploy-web-1.log"); }));
}

void TestLogInspection() {
  assert(TailLog("/tmp/deploy-web-1.log", 300) == "tail -300 \"/tmp/deploy-web-1.log\" 2>&1 || echo \"Log file not found or empty\"");
  assert(LogFreshness("/tmp/deploy-web-1.log", 30).find("-mmin -0.5 ") != std::string::npos);
  assert(LogFreshness("/tmp/deploy-web-1.log", 90).find("-mmin -1.5 ") != std::string::npos);
  assert(Throws([] { (void)TailLog("/tmp/x.log; cat /etc/shadow", 10); }));
}

void TestContainerRestart() {
  assert(RestartContainer("web-1") == "docker restart web-1 2>&1");
  assert(Throws([] { (void)RestartContainer("web-1 && reboot"); }));
  assert(Throws([] { (void)RestartContainer("-web"); }));
}

} // namespace

int main() {
  TestPathValidation();
  TestBranchValidation();
  TestProfileSanitization();
  TestComposeInvocationPerStrategy();
  TestDetachedLaunchWritesMarker();
  TestLogInspection();
  TestContainerRestart();

  std::cout << "shipyard_unit_shell_command: pass\n";
  return 0;
}
