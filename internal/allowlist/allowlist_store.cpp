#include "allowlist_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>

#include "internal/command/shell_command.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shipyard::allowlist {

namespace fs = std::filesystem;

using shipyard::observability::IntField;
using shipyard::observability::StringField;

namespace {

std::string StripTrailingSlash(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

template <typename Field, typename Check>
void NormalizeField(const Field& in, Field* out, Check check, const char* what, bool is_path) {
  std::set<std::string> unique;
  for (const auto& raw : in) {
    auto value = is_path ? StripTrailingSlash(raw) : raw;
    if (!check(value)) {
      throw util::InvalidArgument(std::string("invalid ") + what + " in allowlist: " + raw);
    }
    unique.insert(std::move(value));
  }
  out->Clear();
  for (const auto& value : unique) {
    out->Add(std::string(value));
  }
}

std::optional<fs::file_time_type> ModificationTime(const std::string& path) {
  std::error_code ec;
  auto            mtime = fs::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return mtime;
}

} // namespace

std::string_view ToString(AllowlistKind kind) {
  switch (kind) {
    case AllowlistKind::kRepoPath:
      return "repo_path";
    case AllowlistKind::kComposeProject:
      return "compose_project";
    case AllowlistKind::kContainerName:
      return "container_name";
  }
  return "unknown";
}

AllowlistStore::AllowlistStore(std::string path) : path_(std::move(path)) {
}

shipyard::v1::Allowlist AllowlistStore::Normalize(const shipyard::v1::Allowlist& allowlist) {
  shipyard::v1::Allowlist out;
  NormalizeField(allowlist.repo_paths(), out.mutable_repo_paths(), [](const std::string& v) { return command::IsValidPath(v); },
                 "repository path", true);
  NormalizeField(allowlist.compose_projects(), out.mutable_compose_projects(),
                 [](const std::string& v) { return command::IsValidComposeProject(v); }, "compose project", false);
  NormalizeField(allowlist.container_names(), out.mutable_container_names(),
                 [](const std::string& v) { return command::IsValidContainerName(v); }, "container name", false);
  return out;
}

shipyard::v1::Allowlist AllowlistStore::ReadFile() const {
  std::ifstream in(path_);
  if (!in) {
    throw util::ConfigurationError("failed to open allowlist: " + path_);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  shipyard::v1::Allowlist parsed;
  const auto              status = google::protobuf::util::JsonStringToMessage(buffer.str(), &parsed);
  if (!status.ok()) {
    throw util::ConfigurationError("invalid allowlist " + path_ + ": " + std::string(status.message()));
  }

  try {
    return Normalize(parsed);
  } catch (const util::InvalidArgument& e) {
    throw util::ConfigurationError(path_ + ": " + e.what());
  }
}

void AllowlistStore::Persist(const shipyard::v1::Allowlist& allowlist) {
  if (path_.empty()) {
    return;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(allowlist, &json, options).ok()) {
    throw util::InvalidState("failed to encode allowlist");
  }

  const fs::path target(path_);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path());
  }

  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << json;
    out.flush();
    if (!out) {
      throw util::InvalidState("failed to write allowlist: " + tmp.string());
    }
  }
  fs::rename(tmp, target);
  loaded_mtime_ = ModificationTime(path_);
}

void AllowlistStore::Load(const shipyard::v1::Allowlist& seed) {
  std::unique_lock lock(mutex_);

  if (path_.empty() || !fs::exists(path_)) {
    current_ = Normalize(seed);
    Persist(current_);
    SHIPYARD_LOG_INFO("allowlist seeded", {StringField("path", path_), IntField("repo_paths", current_.repo_paths_size()),
                                           IntField("compose_projects", current_.compose_projects_size()),
                                           IntField("container_names", current_.container_names_size())});
    return;
  }

  current_      = ReadFile();
  loaded_mtime_ = ModificationTime(path_);
  SHIPYARD_LOG_INFO("allowlist loaded", {StringField("path", path_), IntField("repo_paths", current_.repo_paths_size()),
                                         IntField("compose_projects", current_.compose_projects_size()),
                                         IntField("container_names", current_.container_names_size())});
}

void AllowlistStore::RefreshIfChanged() {
  if (path_.empty()) {
    return;
  }

  const auto mtime = ModificationTime(path_);
  {
    std::shared_lock lock(mutex_);
    if (mtime == loaded_mtime_) {
      return;
    }
  }

  std::unique_lock lock(mutex_);
  if (!mtime) {
    SHIPYARD_LOG_WARN("allowlist file disappeared, keeping last snapshot", {StringField("path", path_)});
    loaded_mtime_ = mtime;
    return;
  }
  try {
    current_      = ReadFile();
    loaded_mtime_ = mtime;
  } catch (const util::ConfigurationError& e) {
    // Keep enforcing the last good document.
    SHIPYARD_LOG_ERROR("allowlist reload failed", {StringField("path", path_), StringField("error", e.what())});
    loaded_mtime_ = mtime;
  }
}

shipyard::v1::Allowlist AllowlistStore::Snapshot() {
  RefreshIfChanged();
  std::shared_lock lock(mutex_);
  return current_;
}

bool AllowlistStore::Contains(AllowlistKind kind, std::string_view value) {
  RefreshIfChanged();
  std::shared_lock lock(mutex_);

  const auto has = [&](const auto& field, std::string_view v) { return std::find(field.begin(), field.end(), v) != field.end(); };

  switch (kind) {
    case AllowlistKind::kRepoPath:
      return has(current_.repo_paths(), StripTrailingSlash(std::string(value)));
    case AllowlistKind::kComposeProject:
      return has(current_.compose_projects(), value);
    case AllowlistKind::kContainerName:
      return has(current_.container_names(), value);
  }
  return false;
}

shipyard::v1::Allowlist AllowlistStore::Replace(const shipyard::v1::Allowlist& allowlist) {
  auto normalized = Normalize(allowlist);

  std::unique_lock lock(mutex_);
  Persist(normalized);
  current_ = normalized;
  return normalized;
}

} // namespace shipyard::allowlist
