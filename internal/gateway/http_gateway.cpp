#include "http_gateway.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "shipyard/v1/gateway.pb.h"

namespace shipyard::gateway {

namespace {

using shipyard::observability::DurationMsField;
using shipyard::observability::IntField;
using shipyard::observability::StringField;

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

std::string Truncate(const std::string& text, std::size_t max) {
  return text.size() <= max ? text : text.substr(0, max) + "...";
}

} // namespace

HttpGateway::HttpGateway(std::string base_url, std::string token, std::chrono::milliseconds timeout)
    : endpoint_(std::move(base_url) + "/shell"), token_(std::move(token)), client_(timeout) {
}

ShellResult HttpGateway::Execute(const std::string& command, const std::optional<std::string>& cwd) {
  shipyard::observability::SpanScope span("ExecutionGateway.Execute");
  const auto                         started_at = std::chrono::steady_clock::now();

  shipyard::v1::ShellRequest request;
  request.set_command(command);
  if (cwd) {
    request.set_cwd(*cwd);
  }

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;

  std::string body;
  if (!google::protobuf::util::MessageToJsonString(request, &body, print_options).ok()) {
    throw util::InvalidArgument("failed to encode gateway request");
  }

  net::HttpResponse response;
  try {
    response = client_.Post(endpoint_, body, {{"Authorization", "Bearer " + token_}});
  } catch (const util::TransportError& e) {
    span.RecordException(e.what());
    shipyard::observability::Metrics::Instance().ObserveGatewayLatencyMs(ElapsedMs(started_at), false);
    SHIPYARD_LOG_WARN("gateway unreachable", {StringField("error", e.what())});
    throw;
  }

  if (!response.Ok()) {
    shipyard::observability::Metrics::Instance().ObserveGatewayLatencyMs(ElapsedMs(started_at), false);
    SHIPYARD_LOG_WARN("gateway rejected request", {IntField("http_status", response.status)});
    throw util::TransportError("gateway returned HTTP " + std::to_string(response.status) + ": " + Truncate(response.body, 200));
  }

  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  shipyard::v1::ShellResponse reply;
  if (!google::protobuf::util::JsonStringToMessage(response.body, &reply, parse_options).ok()) {
    shipyard::observability::Metrics::Instance().ObserveGatewayLatencyMs(ElapsedMs(started_at), false);
    throw util::TransportError("gateway returned a malformed response: " + Truncate(response.body, 200));
  }

  const auto elapsed = ElapsedMs(started_at);
  shipyard::observability::Metrics::Instance().ObserveGatewayLatencyMs(elapsed, true);
  SHIPYARD_LOG_DEBUG("gateway call", {shipyard::observability::BoolField("success", reply.success()), DurationMsField("elapsed_ms", elapsed)});

  ShellResult result;
  result.success     = reply.success();
  result.stdout_text = reply.stdout_text();
  result.stderr_text = reply.stderr_text();
  result.exit_code   = reply.exit_code();
  return result;
}

} // namespace shipyard::gateway
