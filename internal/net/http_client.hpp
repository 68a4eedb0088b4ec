#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace shipyard::net {

struct Url {
  std::string scheme; // http | https
  std::string host;
  std::string port;
  std::string target; // path + query, at least "/"

  // Throws util::InvalidArgument for anything other than http(s)://host[:port][/path].
  static Url Parse(const std::string& url);
};

struct HttpResponse {
  unsigned    status = 0;
  std::string body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/*
  Blocking HTTP/1.1 client on Boost.Beast.

  One connection per request; TLS (with peer verification against the
  system trust store) for https URLs. The timeout bounds the connect and
  handshake, then separately the request/response exchange. Connection, TLS and I/O failures
  raise util::TransportError. Non-2xx answers are returned, not thrown.
*/
class HttpClient {
 public:
  explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(30));

  HttpResponse Post(const std::string& url, const std::string& body, const HeaderList& headers) const;

 private:
  std::chrono::milliseconds timeout_;
};

} // namespace shipyard::net
