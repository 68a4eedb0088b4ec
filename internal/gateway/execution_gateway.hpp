#pragma once

#include <optional>
#include <string>

namespace shipyard::gateway {

struct ShellResult {
  bool        success = false;
  std::string stdout_text;
  std::string stderr_text;
  int         exit_code = 0;
};

/*
  One shell command per call, executed on the target host.

  The gateway trusts its caller: every dynamic fragment of `command`
  must already have passed the command builder's validation and, for
  operator-privileged targets, the allowlist guard.

  Implementations throw util::TransportError when the host cannot be
  reached or answers with a non-2xx status. A command that ran and
  failed is NOT an exception: it comes back with success == false.
*/
class ExecutionGateway {
 public:
  virtual ~ExecutionGateway() = default;

  virtual ShellResult Execute(const std::string& command, const std::optional<std::string>& cwd = std::nullopt) = 0;
};

} // namespace shipyard::gateway
