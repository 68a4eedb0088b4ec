#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "internal/net/http_client.hpp"
#include "internal/notify/notifier.hpp"

namespace google::protobuf {
class ListValue;
}

namespace shipyard::notify {

/*
  Discord-style webhook: one embed per event.

  Events are encoded on the caller's thread and posted by a delivery
  thread, so deploys and status checks never wait on the webhook host.
  At most kMaxPending events wait for delivery; newer ones are dropped
  (and logged) while the host is slow. Events still queued at
  destruction are dropped.
*/
class WebhookNotifier final : public Notifier {
 public:
  static constexpr std::size_t kMaxPending = 64;

  WebhookNotifier(std::string webhook_url, std::string username, std::chrono::milliseconds timeout = std::chrono::seconds(5));
  ~WebhookNotifier() override;

  WebhookNotifier(const WebhookNotifier&)            = delete;
  WebhookNotifier& operator=(const WebhookNotifier&) = delete;

  void DeployStarted(const std::string& service_name, const std::string& actor) override;
  void DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                       std::optional<std::uint64_t> duration_ms) override;
  void DeployFailed(const std::string& service_name, const std::string& error_message) override;

  // Waits until every queued event has been attempted. Returns false on timeout.
  bool Drain(std::chrono::milliseconds timeout);

  // Exposed for tests.
  static std::string EncodeEmbed(const std::string& title, const std::string& description, std::uint32_t color,
                                 const google::protobuf::ListValue& fields, const std::string& footer);

 private:
  struct Delivery {
    std::string event;
    std::string body;
  };

  void Enqueue(const std::string& event, std::string body);
  void Deliver(const Delivery& delivery);
  void Run();

  std::string     url_;
  std::string     username_;
  net::HttpClient client_;

  std::mutex              mutex_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::deque<Delivery>    pending_;
  bool                    in_flight_ = false;
  bool                    stopping_  = false;
  std::thread             thread_;
};

} // namespace shipyard::notify
