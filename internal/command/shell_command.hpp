#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/deploy_state.hpp"

namespace shipyard::command {

/*
  Shell command builder for the execution gateway.

  Every dynamic fragment is checked against an allow-pattern before it is
  spliced into a command. Validation failures throw util::InvalidArgument;
  nothing here ever reaches the gateway with unchecked input. Values that
  come from the remote host (compose profile names) are treated exactly
  like caller input.
*/

// ---------------------------------------------------------------------
// Fragment validation
// ---------------------------------------------------------------------

// Absolute path made of [A-Za-z0-9._/-], no ".." component.
bool IsValidPath(std::string_view path);

// Git ref name: [A-Za-z0-9._/-], no leading '-', no "..", no "//".
bool IsValidBranch(std::string_view branch);

// Compose profile: ^[A-Za-z0-9][A-Za-z0-9_-]*$
bool IsValidProfileName(std::string_view profile);

// Compose project: ^[a-z0-9][a-z0-9_-]*$ (the compose project naming rule).
bool IsValidComposeProject(std::string_view project);

// Docker container: ^[A-Za-z0-9][A-Za-z0-9_.-]*$
bool IsValidContainerName(std::string_view name);

void RequirePath(std::string_view path);
void RequireBranch(std::string_view branch);
void RequireComposeProject(std::string_view project);
void RequireContainerName(std::string_view name);

// Keeps the lines of `output` that are valid profile names. Anything else
// (warnings, injected metacharacters) is dropped and reported in `rejected`.
std::vector<std::string> FilterProfiles(const std::string& output, std::vector<std::string>* rejected = nullptr);

// ---------------------------------------------------------------------
// Host checks
// ---------------------------------------------------------------------

std::string DirectoryExists(const std::string& path);
std::string ListDirectory(const std::string& path);
std::string ComposeFileExists(const std::string& path);

// ---------------------------------------------------------------------
// Compose topology
// ---------------------------------------------------------------------

std::string ComposeProfiles(const std::string& path, const std::optional<std::string>& project);
std::string ComposeServices(const std::string& path, const std::optional<std::string>& project, const std::vector<std::string>& profiles);

// ---------------------------------------------------------------------
// Source update
// ---------------------------------------------------------------------

std::string GitFetch(const std::string& path);
std::string GitCheckout(const std::string& path, const std::string& branch);
std::string GitPull(const std::string& path);
std::string GitRevParseHead(const std::string& path);

// ---------------------------------------------------------------------
// Background build
// ---------------------------------------------------------------------

// "docker compose [-p P] [--profile X]... <verb>" for the strategy.
// Throws util::InvalidState for the manual strategy.
std::string ComposeInvocation(shipyard::model::DeployStrategy strategy, const std::optional<std::string>& project,
                              const std::vector<std::string>& profiles);

// Runs `invocation` detached under nohup, appends the completion marker
// with the exit status and a timestamp, and redirects everything to
// `log_file`. The gateway call returns as soon as the job is spawned.
std::string DetachedLaunch(const std::string& path, const std::string& invocation, const std::string& log_file);

// ---------------------------------------------------------------------
// Log inspection
// ---------------------------------------------------------------------

std::string TailLog(const std::string& log_file, std::uint32_t lines);

// Prints RECENT if the file was written within the window, STALE otherwise.
std::string LogFreshness(const std::string& log_file, std::uint32_t window_seconds);

// At most `max_bytes` of `log_file` starting at byte `offset`; empty output
// when the file is missing or not that long yet.
std::string ReadLogFrom(const std::string& log_file, std::uint64_t offset, std::uint32_t max_bytes);

// Prints COMPLETE once the completion marker is in the file, RUNNING otherwise.
std::string LogHasMarker(const std::string& log_file);

// ---------------------------------------------------------------------
// Operator actions
// ---------------------------------------------------------------------

std::string RestartContainer(const std::string& container_name);

} // namespace shipyard::command
