#include "privilege_gate.hpp"

#include <openssl/crypto.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace shipyard::auth {

namespace {

bool TokenEquals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

StaticTokenGate::StaticTokenGate(const shipyard::runtime::config::AuthConfig& config) {
  for (const auto& session : config.session_tokens()) {
    if (session.token().empty()) {
      throw util::ConfigurationError("empty session token for actor " + session.actor());
    }
    sessions_.emplace_back(session.token(), session.actor().empty() ? "operator" : session.actor());
  }
  for (const auto& token : config.internal_tokens()) {
    if (token.empty()) {
      throw util::ConfigurationError("empty internal token");
    }
    internal_.push_back(token);
  }
}

std::string StaticTokenGate::VerifySession(const std::string& token) const {
  if (!token.empty()) {
    for (const auto& [expected, actor] : sessions_) {
      if (TokenEquals(token, expected)) {
        return actor;
      }
    }
  }
  throw util::PermissionDenied("session verification required");
}

bool StaticTokenGate::VerifyInternal(const std::string& token) const {
  if (token.empty()) {
    return false;
  }
  for (const auto& expected : internal_) {
    if (TokenEquals(token, expected)) {
      return true;
    }
  }
  return false;
}

} // namespace shipyard::auth
