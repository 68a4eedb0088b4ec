#include "internal/deploy/log_follower.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using shipyard::deploy::FollowOptions;
using shipyard::deploy::LogChunk;
using shipyard::deploy::LogFollower;
using shipyard::deploy::LogPointerPolicy;
using shipyard::testing::FakeGateway;

constexpr const char* kLog = "/tmp/deploy-web-app-1700000000000.log";

LogFollower MakeFollower(const std::shared_ptr<FakeGateway>& gateway, std::uint32_t max_polls = 10) {
  return LogFollower(gateway, LogPointerPolicy("/tmp"), FollowOptions{std::chrono::milliseconds(1), max_polls, 4096});
}

std::vector<LogChunk> Collect(const LogFollower& follower, std::uint64_t offset = 0) {
  std::vector<LogChunk> chunks;
  follower.Follow(kLog, offset, [&](const LogChunk& chunk) {
    chunks.push_back(chunk);
    return true;
  });
  return chunks;
}

void TestOffsetAdvancesWithEachRead() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->OnSequence("tail -c", {"Pulling web\n", "", "Container web-1 Started\n",
                                  "===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\nTIMESTAMP: Mon Jan  1 00:00:00 UTC 2024\n"});

  const auto chunks = Collect(MakeFollower(gateway));
  assert(chunks.size() == 4);
  assert(chunks[0].offset == 12);
  assert(chunks[1].content.empty());
  assert(chunks[1].offset == 12);
  assert(!chunks[2].complete);
  assert(chunks[3].complete);
  assert(!chunks[3].timed_out);

  assert(gateway->Saw("tail -c +1 "));
  assert(gateway->Saw("tail -c +13 "));
  // An empty read consults the whole file for the marker.
  assert(gateway->Count("grep -qF") == 1);
}

void TestMarkerSplitAcrossReads() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->OnSequence("tail -c", {"done\n===[DEPLOY_", "COMPLETE]===\nSTATUS: FAILED (exit code: 1)\n", "TIMESTAMP: now\n"});

  const auto chunks = Collect(MakeFollower(gateway));
  assert(chunks.size() == 3);
  assert(!chunks[0].complete);
  assert(!chunks[1].complete);
  assert(chunks[2].complete);
}

void TestMarkerWithoutTimestampCompletesAfterOneMoreRead() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->OnSequence("tail -c", {"===[DEPLOY_COMPLETE]===\nSTATUS: SUCCESS\n", ""});

  const auto chunks = Collect(MakeFollower(gateway));
  assert(chunks.size() == 2);
  assert(!chunks[0].complete);
  assert(chunks[1].complete);
}

void TestResumePastMarkerCompletesImmediately() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->On("grep -qF", "COMPLETE\n");

  const auto chunks = Collect(MakeFollower(gateway), 4096);
  assert(chunks.size() == 1);
  assert(chunks[0].complete);
  assert(chunks[0].offset == 4096);
  assert(gateway->Saw("tail -c +4097 "));
}

void TestGivesUpAfterMaxPolls() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->On("tail -c", "still building\n");

  const auto chunks = Collect(MakeFollower(gateway, 3));
  assert(chunks.size() == 3);
  assert(!chunks[1].timed_out);
  assert(chunks[2].timed_out);
  assert(!chunks[2].complete);
  assert(chunks[2].offset == 3 * std::string("still building\n").size());
}

void TestGatewayErrorsAreReportedPerRead() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->Unreachable("tail -c");

  const auto chunks = Collect(MakeFollower(gateway, 2));
  assert(chunks.size() == 2);
  assert(chunks[0].error == "gateway unreachable");
  assert(chunks[1].timed_out);
}

void TestSinkCanStopFollowing() {
  auto gateway = std::make_shared<FakeGateway>();
  gateway->On("tail -c", "line\n");

  int calls = 0;
  MakeFollower(gateway, 100).Follow(kLog, 0, [&](const LogChunk&) { return ++calls < 2; });
  assert(calls == 2);
  assert(gateway->Count("tail -c") == 2);
}

void TestInvalidPointerNeverReachesGateway() {
  auto gateway  = std::make_shared<FakeGateway>();
  auto follower = MakeFollower(gateway);

  for (const std::string pointer : {"/etc/passwd", "/tmp/deploy-web-1.log; rm -rf /", "/tmp/../etc/deploy-x-1.log"}) {
    bool rejected = false;
    try {
      follower.Follow(pointer, 0, [](const LogChunk&) { return true; });
    } catch (const shipyard::util::InvalidArgument&) {
      rejected = true;
    }
    assert(rejected);
  }
  assert(gateway->commands.empty());
}

} // namespace

int main() {
  TestOffsetAdvancesWithEachRead();
  TestMarkerSplitAcrossReads();
  TestMarkerWithoutTimestampCompletesAfterOneMoreRead();
  TestResumePastMarkerCompletesImmediately();
  TestGivesUpAfterMaxPolls();
  TestGatewayErrorsAreReportedPerRead();
  TestSinkCanStopFollowing();
  TestInvalidPointerNeverReachesGateway();

  std::cout << "shipyard_unit_log_follower: pass\n";
  return 0;
}
