#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace shipyard::deploy {

/*
  Completion marker protocol.

  The detached build appends, after its own output:

    ===[DEPLOY_COMPLETE]===
    STATUS: SUCCESS | STATUS: FAILED (exit code: N)
    TIMESTAMP: <ISO-8601>
*/

inline constexpr std::string_view kCompletionMarker = "===[DEPLOY_COMPLETE]===";

struct CompletionMarker {
  bool               present = false;
  bool               success = false; // only meaningful when present
  std::optional<int> exit_code;
  std::string        timestamp;
};

// Looks at the last marker in `log`. A marker without a STATUS line is
// reported as present and not successful.
CompletionMarker ParseCompletionMarker(const std::string& log);

} // namespace shipyard::deploy
