#include "log_follower.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "internal/command/shell_command.hpp"
#include "internal/deploy/completion_marker.hpp"
#include "internal/gateway/execution_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::deploy {

using shipyard::observability::IntField;
using shipyard::observability::StringField;

namespace {

// The marker block is finished once its TIMESTAMP line is terminated.
bool MarkerBlockComplete(const std::string& after_marker) {
  const auto at = after_marker.find("TIMESTAMP: ");
  return at != std::string::npos && after_marker.find('\n', at) != std::string::npos;
}

} // namespace

LogFollower::LogFollower(std::shared_ptr<gateway::ExecutionGateway> gateway, LogPointerPolicy log_policy, FollowOptions options)
    : gateway_(std::move(gateway)), log_policy_(std::move(log_policy)), options_(options) {
  options_.max_polls   = std::max<std::uint32_t>(options_.max_polls, 1);
  options_.chunk_bytes = std::max<std::uint32_t>(options_.chunk_bytes, 1);
}

void LogFollower::Follow(const std::string& logs_pointer, std::uint64_t offset, const Sink& sink) const {
  log_policy_.Require(logs_pointer);

  const std::size_t carry_bytes = kCompletionMarker.size() - 1;

  std::string carry; // end of the previous read, for a marker split across polls
  std::string after_marker;
  bool        marker_seen = false;
  bool        grace_used  = false;

  for (std::uint32_t poll = 1;; ++poll) {
    LogChunk chunk;
    bool     complete = false;

    try {
      chunk.content = gateway_->Execute(command::ReadLogFrom(logs_pointer, offset, options_.chunk_bytes)).stdout_text;

      // Resumed past the marker: everything was delivered before.
      if (chunk.content.empty() && !marker_seen) {
        complete = gateway_->Execute(command::LogHasMarker(logs_pointer)).stdout_text.find("COMPLETE") != std::string::npos;
      }
    } catch (const util::TransportError& e) {
      chunk.error = e.what();
      SHIPYARD_LOG_WARN("log follow poll failed", {StringField("log", logs_pointer), StringField("error", e.what())});
    }

    offset += chunk.content.size();
    chunk.offset = offset;

    if (marker_seen) {
      after_marker += chunk.content;
    } else if (!chunk.content.empty()) {
      const auto window = carry + chunk.content;
      const auto at     = window.find(kCompletionMarker);
      if (at != std::string::npos) {
        marker_seen  = true;
        after_marker = window.substr(at + kCompletionMarker.size());
      } else {
        carry = window.substr(window.size() - std::min(window.size(), carry_bytes));
      }
    }

    if (marker_seen) {
      // The status lines follow the marker within moments; wait one poll at most.
      complete   = complete || grace_used || MarkerBlockComplete(after_marker);
      grace_used = true;
    }

    chunk.complete  = complete;
    chunk.timed_out = !complete && poll >= options_.max_polls;

    if (!sink(chunk)) {
      SHIPYARD_LOG_DEBUG("log follower stopped by caller", {StringField("log", logs_pointer), IntField("offset", offset)});
      return;
    }
    if (chunk.complete || chunk.timed_out) {
      return;
    }

    // A full chunk means more is already waiting.
    if (chunk.content.size() < options_.chunk_bytes) {
      std::this_thread::sleep_for(options_.poll_interval);
    }
  }
}

} // namespace shipyard::deploy
