#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace shipyard::deploy {

class CompletionDetector;

/*
  Background caller of CompletionDetector::RefreshRunningDeploys.

  Purely a convenience poller: it holds no deploy state, and a deploy
  advances exactly as if an operator had polled it.
*/
class StatusPoller {
 public:
  StatusPoller(std::shared_ptr<CompletionDetector> detector, std::chrono::milliseconds interval);
  ~StatusPoller();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<CompletionDetector> detector_;
  std::chrono::milliseconds           interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;
};

} // namespace shipyard::deploy
