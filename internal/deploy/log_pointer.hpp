#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shipyard::deploy {

/*
  Naming convention for background build logs:

    {log_dir}/deploy-{slug}-{epoch_ms}.log

  Completion checks refuse any pointer that does not match before the
  file is touched on the remote host.
*/
class LogPointerPolicy {
 public:
  explicit LogPointerPolicy(std::string log_dir);

  const std::string& LogDir() const {
    return log_dir_;
  }

  std::string Make(std::string_view slug, std::uint64_t epoch_ms) const;

  bool IsValid(std::string_view pointer) const;

  // Throws util::InvalidArgument("invalid log file path").
  void Require(std::string_view pointer) const;

  // Lowercase [a-z0-9-] form of a project slug or name; "project" if
  // nothing usable is left.
  static std::string NormalizeSlug(std::string_view slug);

 private:
  std::string log_dir_;
};

} // namespace shipyard::deploy
