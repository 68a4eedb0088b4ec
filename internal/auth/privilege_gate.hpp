#pragma once

#include <string>
#include <utility>
#include <vector>

namespace shipyard::runtime::config {
class AuthConfig;
}

namespace shipyard::auth {

/*
  Caller verification for the two deploy entry points.

  VerifySession backs user-initiated (PIN-gated) requests and yields the
  actor recorded as triggered_by. VerifyInternal backs system callers
  such as a verified webhook, which name their own identity.
*/
class PrivilegeGate {
 public:
  virtual ~PrivilegeGate() = default;

  // Returns the actor. Throws util::PermissionDenied.
  virtual std::string VerifySession(const std::string& token) const = 0;

  virtual bool VerifyInternal(const std::string& token) const = 0;
};

class StaticTokenGate final : public PrivilegeGate {
 public:
  explicit StaticTokenGate(const shipyard::runtime::config::AuthConfig& config);

  std::string VerifySession(const std::string& token) const override;
  bool        VerifyInternal(const std::string& token) const override;

 private:
  std::vector<std::pair<std::string, std::string>> sessions_; // token, actor
  std::vector<std::string>                         internal_;
};

} // namespace shipyard::auth
