#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "shipyard/v1/deploy.pb.h"

namespace shipyard::allowlist {

enum class AllowlistKind {
  kRepoPath,
  kComposeProject,
  kContainerName,
};

std::string_view ToString(AllowlistKind kind);

/*
  Persisted allowlist document.

  Stored as JSON (protobuf json_util, proto field names) at `path`.
  Writes go to a temporary sibling and are renamed into place. Reads
  pick up changes made to the file by other processes: the snapshot is
  reloaded whenever the file's modification time moves.

  An empty path keeps the allowlist in memory only.
*/
class AllowlistStore {
 public:
  explicit AllowlistStore(std::string path);

  // Reads the file, or writes `seed` to it when it does not exist yet.
  // Throws util::ConfigurationError on an unreadable or invalid file.
  void Load(const shipyard::v1::Allowlist& seed);

  shipyard::v1::Allowlist Snapshot();

  bool Contains(AllowlistKind kind, std::string_view value);

  // Validates every entry (util::InvalidArgument), de-duplicates, persists,
  // then publishes. Returns the normalized document.
  shipyard::v1::Allowlist Replace(const shipyard::v1::Allowlist& allowlist);

  static shipyard::v1::Allowlist Normalize(const shipyard::v1::Allowlist& allowlist);

 private:
  void RefreshIfChanged();
  void Persist(const shipyard::v1::Allowlist& allowlist);
  shipyard::v1::Allowlist ReadFile() const;

  std::string                                    path_;
  std::shared_mutex                              mutex_;
  shipyard::v1::Allowlist                        current_;
  std::optional<std::filesystem::file_time_type> loaded_mtime_;
};

} // namespace shipyard::allowlist
