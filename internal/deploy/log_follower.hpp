#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/deploy/log_pointer.hpp"

namespace shipyard::gateway {
class ExecutionGateway;
}

namespace shipyard::deploy {

struct FollowOptions {
  std::chrono::milliseconds poll_interval{1000};
  std::uint32_t             max_polls   = 600;
  std::uint32_t             chunk_bytes = 64 * 1024;
};

struct LogChunk {
  std::string   content;    // bytes read by this poll, possibly none
  std::uint64_t offset = 0; // log bytes consumed so far, including content
  bool          complete  = false;
  bool          timed_out = false;
  std::string   error; // gateway failure during this poll
};

/*
  Incremental reader for a background job's log.

  Every poll reads what was appended since the last one and hands it to
  the sink, even when nothing arrived, so callers can detect a gone
  client. Following ends after the completion marker and its status
  lines have been read, after max_polls, or when the sink returns false.
  It never changes deploy records; CompletionDetector does that.
*/
class LogFollower {
 public:
  using Sink = std::function<bool(const LogChunk&)>;

  LogFollower(std::shared_ptr<gateway::ExecutionGateway> gateway, LogPointerPolicy log_policy, FollowOptions options);

  // Throws util::InvalidArgument for a pointer outside the log directory.
  void Follow(const std::string& logs_pointer, std::uint64_t offset, const Sink& sink) const;

 private:
  std::shared_ptr<gateway::ExecutionGateway> gateway_;
  LogPointerPolicy                           log_policy_;
  FollowOptions                              options_;
};

} // namespace shipyard::deploy
