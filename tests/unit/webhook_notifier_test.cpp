#include "internal/notify/webhook_notifier.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using shipyard::notify::WebhookNotifier;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

std::string LocalUrl(const tcp::acceptor& acceptor) {
  return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/hook";
}

Struct Parse(const std::string& json) {
  Struct out;
  assert(google::protobuf::util::JsonStringToMessage(json, &out).ok());
  return out;
}

void TestEmbedShape() {
  ListValue fields;
  auto&     field = *fields.add_values()->mutable_struct_value()->mutable_fields();
  field["name"].set_string_value("Commit");
  field["value"].set_string_value("89abcde");
  field["inline"].set_bool_value(true);

  const auto json    = WebhookNotifier::EncodeEmbed("✅ Deploy Successful", "Deployment for **web** completed successfully.", 0x22c55e,
                                                    fields, "shipyard");
  const auto payload = Parse(json);

  assert(payload.fields().at("username").string_value() == "shipyard");

  const auto& embeds = payload.fields().at("embeds").list_value();
  assert(embeds.values_size() == 1);

  const auto& embed = embeds.values(0).struct_value().fields();
  assert(embed.at("title").string_value() == "✅ Deploy Successful");
  assert(static_cast<std::uint32_t>(embed.at("color").number_value()) == 0x22c55e);
  assert(embed.at("footer").struct_value().fields().at("text").string_value() == "shipyard");
  assert(!embed.at("timestamp").string_value().empty());

  const auto& encoded = embed.at("fields").list_value();
  assert(encoded.values_size() == 1);
  assert(encoded.values(0).struct_value().fields().at("value").string_value() == "89abcde");
}

void TestDeliveryFailureIsNotFatal() {
  // Nothing listens on the discard port.
  WebhookNotifier notifier("http://127.0.0.1:9/hook", "shipyard", std::chrono::milliseconds(200));

  notifier.DeployStarted("web", "alice");
  notifier.DeployFailed("web", "Disk full (exit code: 1)");
  assert(notifier.Drain(std::chrono::seconds(5)));
}

void TestSlowHostDoesNotBlockCaller() {
  // Listens but never answers: connections sit in the backlog.
  asio::io_context ioc;
  tcp::acceptor    acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

  WebhookNotifier notifier(LocalUrl(acceptor), "shipyard", std::chrono::milliseconds(1500));

  const auto started = std::chrono::steady_clock::now();
  notifier.DeployFailed("web", "Build failed");
  notifier.DeploySucceeded("web", std::string("0123456789"), 42000);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::milliseconds(500));

  // The delivery thread gives up after the client timeout.
  assert(notifier.Drain(std::chrono::seconds(10)));
}

void TestEventIsPosted() {
  asio::io_context ioc;
  tcp::acceptor    acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

  std::string received;
  std::thread server([&] {
    tcp::socket socket(ioc);
    acceptor.accept(socket);

    beast::flat_buffer               buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req);
    received = req.body();

    http::response<http::empty_body> res{http::status::no_content, req.version()};
    res.keep_alive(false);
    http::write(socket, res);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
  });

  WebhookNotifier notifier(LocalUrl(acceptor), "shipyard", std::chrono::seconds(5));
  notifier.DeploySucceeded("web", std::string("89abcdef0123"), 42000);
  assert(notifier.Drain(std::chrono::seconds(10)));
  server.join();

  const auto  payload = Parse(received);
  const auto& embed   = payload.fields().at("embeds").list_value().values(0).struct_value().fields();
  assert(embed.at("title").string_value() == "✅ Deploy Successful");

  const auto& fields = embed.at("fields").list_value();
  assert(fields.values_size() == 2);
  assert(fields.values(0).struct_value().fields().at("value").string_value() == "89abcde");
  assert(fields.values(1).struct_value().fields().at("value").string_value() == "42s");
}

} // namespace

int main() {
  TestEmbedShape();
  TestDeliveryFailureIsNotFatal();
  TestSlowHostDoesNotBlockCaller();
  TestEventIsPosted();

  std::cout << "shipyard_unit_webhook_notifier: pass\n";
  return 0;
}
