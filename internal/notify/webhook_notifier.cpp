#include "webhook_notifier.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace shipyard::notify {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using shipyard::observability::IntField;
using shipyard::observability::StringField;

namespace {

constexpr std::uint32_t kColorInfo    = 0x3b82f6;
constexpr std::uint32_t kColorSuccess = 0x22c55e;
constexpr std::uint32_t kColorDanger  = 0xef4444;

void AddField(ListValue& fields, const std::string& name, const std::string& value, bool is_inline) {
  auto& field = *fields.add_values()->mutable_struct_value()->mutable_fields();
  field["name"].set_string_value(name);
  field["value"].set_string_value(value);
  field["inline"].set_bool_value(is_inline);
}

} // namespace

WebhookNotifier::WebhookNotifier(std::string webhook_url, std::string username, std::chrono::milliseconds timeout)
    : url_(std::move(webhook_url)), username_(std::move(username)), client_(timeout) {
  thread_ = std::thread(&WebhookNotifier::Run, this);
}

WebhookNotifier::~WebhookNotifier() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    dropped   = pending_.size();
    pending_.clear();
  }
  wake_.notify_all();
  idle_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  if (dropped > 0) {
    SHIPYARD_LOG_WARN("notifications dropped at shutdown", {IntField("count", static_cast<std::int64_t>(dropped))});
  }
}

bool WebhookNotifier::Drain(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_.wait_for(lock, timeout, [this] { return pending_.empty() && !in_flight_; });
}

std::string WebhookNotifier::EncodeEmbed(const std::string& title, const std::string& description, std::uint32_t color,
                                         const ListValue& fields, const std::string& footer) {
  Struct embed;
  auto&  e = *embed.mutable_fields();
  e["title"].set_string_value(title);
  e["description"].set_string_value(description);
  e["color"].set_number_value(static_cast<double>(color));
  e["timestamp"].set_string_value(util::ToIso8601(util::Now()));
  (*e["footer"].mutable_struct_value()->mutable_fields())["text"].set_string_value(footer);

  *e["fields"].mutable_list_value() = fields;

  Struct payload;
  if (!footer.empty()) {
    (*payload.mutable_fields())["username"].set_string_value(footer);
  }
  *(*payload.mutable_fields())["embeds"].mutable_list_value()->add_values()->mutable_struct_value() = std::move(embed);

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(payload, &json).ok()) {
    return {};
  }
  return json;
}

void WebhookNotifier::Enqueue(const std::string& event, std::string body) {
  if (body.empty()) {
    SHIPYARD_LOG_ERROR("notification encode failed", {StringField("event", event)});
    return;
  }

  {
    std::lock_guard lock(mutex_);
    if (pending_.size() >= kMaxPending) {
      SHIPYARD_LOG_WARN("notification queue full, dropping event", {StringField("event", event)});
      return;
    }
    pending_.push_back(Delivery{event, std::move(body)});
  }
  wake_.notify_one();
}

void WebhookNotifier::Deliver(const Delivery& delivery) {
  try {
    const auto response = client_.Post(url_, delivery.body, {});
    if (!response.Ok()) {
      SHIPYARD_LOG_WARN("notification rejected", {StringField("event", delivery.event), IntField("http_status", response.status)});
    }
  } catch (const std::exception& e) {
    SHIPYARD_LOG_WARN("notification delivery failed", {StringField("event", delivery.event), StringField("error", e.what())});
  }
}

void WebhookNotifier::Run() {
  std::unique_lock lock(mutex_);
  while (true) {
    wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
    if (stopping_) {
      break;
    }

    auto delivery = std::move(pending_.front());
    pending_.pop_front();
    in_flight_ = true;

    lock.unlock();
    Deliver(delivery);
    lock.lock();

    in_flight_ = false;
    if (pending_.empty()) {
      idle_.notify_all();
    }
  }
}

void WebhookNotifier::DeployStarted(const std::string& service_name, const std::string& actor) {
  ListValue fields;
  AddField(fields, "Triggered by", actor, false);
  Enqueue("deploy_started", EncodeEmbed("🚀 Deploy Started", "Deployment for **" + service_name + "** has started.", kColorInfo, fields,
                                     username_));
}

void WebhookNotifier::DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                                      std::optional<std::uint64_t> duration_ms) {
  ListValue fields;
  if (commit_sha && !commit_sha->empty()) {
    AddField(fields, "Commit", commit_sha->substr(0, 7), true);
  }
  if (duration_ms && *duration_ms > 0) {
    AddField(fields, "Duration", std::to_string((*duration_ms + 500) / 1000) + "s", true);
  }
  Enqueue("deploy_succeeded", EncodeEmbed("✅ Deploy Successful", "Deployment for **" + service_name + "** completed successfully.",
                                       kColorSuccess, fields, username_));
}

void WebhookNotifier::DeployFailed(const std::string& service_name, const std::string& error_message) {
  ListValue fields;
  AddField(fields, "Error", error_message, false);
  Enqueue("deploy_failed",
          EncodeEmbed("❌ Deploy Failed", "Deployment for **" + service_name + "** failed.", kColorDanger, fields, username_));
}

} // namespace shipyard::notify
