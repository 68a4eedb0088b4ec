#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/allowlist/allowlist_store.hpp"

namespace shipyard::audit {
class AuditTrail;
}

namespace shipyard::allowlist {

/*
  Gate for operator-privileged targets.

  Every path, compose project or container named in a gateway command
  that acts on the host goes through Require() first. A denial is
  terminal: util::OperationBlocked is thrown, a `blocked` audit entry is
  written, and the caller must not reach the gateway.
*/
class AllowlistGuard {
 public:
  AllowlistGuard(std::shared_ptr<AllowlistStore> store, std::shared_ptr<audit::AuditTrail> audit);

  bool IsAllowed(AllowlistKind kind, std::string_view value) const;

  void Require(AllowlistKind kind, const std::string& value, const std::string& actor, const std::string& action) const;

 private:
  std::shared_ptr<AllowlistStore>    store_;
  std::shared_ptr<audit::AuditTrail> audit_;
};

} // namespace shipyard::allowlist
