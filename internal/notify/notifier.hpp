#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace shipyard::notify {

/*
  Deploy lifecycle events for operators.

  Fire-and-forget: implementations log delivery failures and never throw
  back into the deploy path.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void DeployStarted(const std::string& service_name, const std::string& actor) = 0;

  virtual void DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                               std::optional<std::uint64_t> duration_ms = std::nullopt) = 0;

  virtual void DeployFailed(const std::string& service_name, const std::string& error_message) = 0;
};

// Writes the events to the process log. Used when no webhook is configured.
class LogNotifier final : public Notifier {
 public:
  void DeployStarted(const std::string& service_name, const std::string& actor) override;
  void DeploySucceeded(const std::string& service_name, const std::optional<std::string>& commit_sha,
                       std::optional<std::uint64_t> duration_ms) override;
  void DeployFailed(const std::string& service_name, const std::string& error_message) override;
};

} // namespace shipyard::notify
