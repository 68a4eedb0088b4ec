#include "status_poller.hpp"

#include "internal/deploy/completion_detector.hpp"
#include "internal/observability/logging.hpp"

namespace shipyard::deploy {

using shipyard::observability::IntField;
using shipyard::observability::StringField;

StatusPoller::StatusPoller(std::shared_ptr<CompletionDetector> detector, std::chrono::milliseconds interval)
    : detector_(std::move(detector)), interval_(interval) {
}

StatusPoller::~StatusPoller() {
  Stop();
}

void StatusPoller::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&StatusPoller::Run, this);
  SHIPYARD_LOG_INFO("status poller started", {IntField("interval_ms", interval_.count())});
}

void StatusPoller::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StatusPoller::Run() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      wake_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_) {
      break;
    }

    try {
      const auto summary = detector_->RefreshRunningDeploys();
      if (summary.completed > 0) {
        SHIPYARD_LOG_INFO("status poller completed deploys", {IntField("completed", summary.completed)});
      }
    } catch (const std::exception& e) {
      SHIPYARD_LOG_ERROR("status poll failed", {StringField("error", e.what())});
    }
  }
}

} // namespace shipyard::deploy
