#pragma once

#include "resilink/http/Transport.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

namespace resilink::http {

// Blocking Beast client. Each call drives its own io_context so the stream
// deadline applies to connect, handshake, write and read alike.
class HttpClient : public Transport {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpClient();

    Response send(const OutboundRequest& request,
                  const std::optional<proxy::ProxyAgent>& proxy,
                  std::chrono::milliseconds timeout) override;

private:
    HttpResponse exchange(HttpRequest request,
                          const std::string& scheme,
                          const std::string& host,
                          const std::string& port,
                          const std::optional<proxy::ProxyAgent>& proxy,
                          std::chrono::milliseconds timeout);

    boost::asio::ssl::context sslContext_;
};

} // namespace resilink::http
