#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/deploy_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/service_context.hpp"
#include "shipyard/v1.hpp"

namespace shipyard::service {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  shipyard::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed    = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      shipyard::observability::Metrics::Instance().RecordRequest(route, true);
      shipyard::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed());
      return;
    } else {
      auto result = fn();
      shipyard::observability::Metrics::Instance().RecordRequest(route, true);
      shipyard::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SHIPYARD_LOG_ERROR("RPC failed",
                       {shipyard::observability::StringField("route", route), shipyard::observability::StringField("error", ex.what())});
    shipyard::observability::Metrics::Instance().RecordRequest(route, false);
    shipyard::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed());
    throw;
  }
}

// Session caller -> actor. Throws util::PermissionDenied.
std::string RequireSession(const ServiceContext& ctx, const CallerCredentials& credentials);

// Session or internal caller. Returns the actor ("system" for internal).
std::string RequireAnyCaller(const ServiceContext& ctx, const CallerCredentials& credentials);

shipyard::v1::DeployRecord ToProto(const db::model::DeployRecord& record);
shipyard::v1::AuditEvent   ToProto(const db::model::AuditRecord& record);
shipyard::v1::DeployStatus ToProto(shipyard::model::DeployStatus status);

// UNSPECIFIED -> nullopt.
std::optional<shipyard::model::DeployStatus> FromProto(shipyard::v1::DeployStatus status);

} // namespace shipyard::service
