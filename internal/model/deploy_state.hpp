#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shipyard::model {

/*
  Deploy record lifecycle.

    pending -> running -> { success, failed, cancelled }

  Terminal states are absorbing. Only running records may move to a
  terminal state, with the one exception of cancelling an abandoned
  pending record.
*/
enum class DeployStatus : std::uint8_t {
  kPending   = 1,
  kRunning   = 2,
  kSuccess   = 3,
  kFailed    = 4,
  kCancelled = 5,
};

constexpr bool IsTerminal(DeployStatus status) {
  return status == DeployStatus::kSuccess || status == DeployStatus::kFailed || status == DeployStatus::kCancelled;
}

constexpr bool CanTransition(DeployStatus from, DeployStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case DeployStatus::kPending:
      return to == DeployStatus::kRunning || to == DeployStatus::kCancelled;
    case DeployStatus::kRunning:
      return IsTerminal(to);
    default:
      return false;
  }
}

inline std::string_view ToString(DeployStatus status) {
  switch (status) {
    case DeployStatus::kPending:
      return "pending";
    case DeployStatus::kRunning:
      return "running";
    case DeployStatus::kSuccess:
      return "success";
    case DeployStatus::kFailed:
      return "failed";
    case DeployStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

inline std::optional<DeployStatus> ParseDeployStatus(std::string_view value) {
  if (value == "pending") return DeployStatus::kPending;
  if (value == "running") return DeployStatus::kRunning;
  if (value == "success") return DeployStatus::kSuccess;
  if (value == "failed") return DeployStatus::kFailed;
  if (value == "cancelled") return DeployStatus::kCancelled;
  return std::nullopt;
}

enum class DeployStrategy : std::uint8_t {
  kPullRestart,
  kPullRebuild,
  kComposeUp,
  kManual,
};

inline std::optional<DeployStrategy> ParseDeployStrategy(std::string_view value) {
  if (value == "pull_restart") return DeployStrategy::kPullRestart;
  if (value == "pull_rebuild") return DeployStrategy::kPullRebuild;
  if (value == "compose_up") return DeployStrategy::kComposeUp;
  if (value == "manual") return DeployStrategy::kManual;
  return std::nullopt;
}

inline std::string_view ToString(DeployStrategy strategy) {
  switch (strategy) {
    case DeployStrategy::kPullRestart:
      return "pull_restart";
    case DeployStrategy::kPullRebuild:
      return "pull_rebuild";
    case DeployStrategy::kComposeUp:
      return "compose_up";
    case DeployStrategy::kManual:
      return "manual";
  }
  return "unknown";
}

} // namespace shipyard::model
