#include "internal/net/http_client.hpp"

#include <openssl/ssl.h>

#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "internal/util/errors.hpp"

namespace shipyard::net {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
namespace ssl   = asio::ssl;
using tcp       = asio::ip::tcp;

namespace {

http::request<http::string_body> BuildRequest(const Url& url, const std::string& body, const HeaderList& headers) {
  http::request<http::string_body> req{http::verb::post, url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, "shipyard/0.1");
  req.set(http::field::content_type, "application/json");
  for (const auto& [name, value] : headers) {
    req.set(name, value);
  }
  req.body() = body;
  req.prepare_payload();
  return req;
}

// Runs one asynchronous operation to completion. tcp_stream deadlines
// only apply to asynchronous operations.
template <typename Initiate>
beast::error_code Run(asio::io_context& ioc, Initiate&& initiate) {
  beast::error_code result;
  initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

template <typename Initiate>
void Await(asio::io_context& ioc, Initiate&& initiate) {
  if (const auto ec = Run(ioc, std::forward<Initiate>(initiate))) {
    throw beast::system_error(ec);
  }
}

template <typename Stream>
HttpResponse Exchange(asio::io_context& ioc, Stream& stream, const http::request<http::string_body>& req) {
  Await(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

  beast::flat_buffer                buffer;
  http::response<http::string_body> res;
  Await(ioc, [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

  return HttpResponse{res.result_int(), std::move(res.body())};
}

HttpResponse PostPlain(const Url& url, const http::request<http::string_body>& req, std::chrono::milliseconds timeout) {
  asio::io_context  ioc;
  tcp::resolver     resolver(ioc);
  beast::tcp_stream stream(ioc);

  const auto endpoints = resolver.resolve(url.host, url.port);

  stream.expires_after(timeout);
  Await(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });

  stream.expires_after(timeout);
  auto response = Exchange(ioc, stream, req);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return response;
}

HttpResponse PostTls(const Url& url, const http::request<http::string_body>& req, std::chrono::milliseconds timeout) {
  asio::io_context ioc;
  ssl::context     ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  tcp::resolver                        resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
  }
  stream.set_verify_callback(ssl::host_name_verification(url.host));

  const auto endpoints = resolver.resolve(url.host, url.port);

  beast::get_lowest_layer(stream).expires_after(timeout);
  Await(ioc, [&](auto handler) { beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler)); });
  Await(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });

  beast::get_lowest_layer(stream).expires_after(timeout);
  auto response = Exchange(ioc, stream, req);

  // Servers routinely close without close_notify; the response is already complete.
  beast::get_lowest_layer(stream).expires_after(timeout);
  if (Run(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); })) {
    beast::get_lowest_layer(stream).close();
  }
  return response;
}

} // namespace

Url Url::Parse(const std::string& url) {
  Url         out;
  std::size_t rest = 0;
  if (url.rfind("http://", 0) == 0) {
    out.scheme = "http";
    rest       = 7;
  } else if (url.rfind("https://", 0) == 0) {
    out.scheme = "https";
    rest       = 8;
  } else {
    throw util::InvalidArgument("unsupported url scheme: " + url);
  }

  const auto slash     = url.find('/', rest);
  const auto authority = url.substr(rest, slash == std::string::npos ? std::string::npos : slash - rest);
  out.target           = slash == std::string::npos ? "/" : url.substr(slash);

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
    out.port = out.scheme == "https" ? "443" : "80";
  }

  if (out.host.empty() || out.port.empty()) {
    throw util::InvalidArgument("malformed url: " + url);
  }
  return out;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

HttpResponse HttpClient::Post(const std::string& url, const std::string& body, const HeaderList& headers) const {
  const auto parsed = Url::Parse(url);
  const auto req    = BuildRequest(parsed, body, headers);

  try {
    return parsed.scheme == "https" ? PostTls(parsed, req, timeout_) : PostPlain(parsed, req, timeout_);
  } catch (const beast::system_error& e) {
    throw util::TransportError(parsed.host + ":" + parsed.port + ": " + e.code().message());
  }
}

} // namespace shipyard::net
