#include "resilink/http/HttpClient.hpp"
#include "resilink/util/Logging.hpp"
#include "resilink/util/UrlUtil.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace resilink::http {
namespace {
constexpr unsigned kHttpVersion = 11;

boost::beast::http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "GET") return boost::beast::http::verb::get;
    if (upper == "POST") return boost::beast::http::verb::post;
    if (upper == "PUT") return boost::beast::http::verb::put;
    if (upper == "DELETE") return boost::beast::http::verb::delete_;
    if (upper == "PATCH") return boost::beast::http::verb::patch;
    if (upper == "HEAD") return boost::beast::http::verb::head;
    if (upper == "OPTIONS") return boost::beast::http::verb::options;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

std::string authorityFrom(const std::string& scheme, const std::string& host, const std::string& port) {
    if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) {
        return host;
    }
    return host + ":" + port;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Runs one async operation to completion on the call-local io_context.
template <typename Initiate>
void runOperation(boost::asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

template <typename Stream>
HttpClient::HttpResponse roundTrip(boost::asio::io_context& io, Stream& stream, HttpClient::HttpRequest& request) {
    runOperation(io, [&](auto handler) { boost::beast::http::async_write(stream, request, std::move(handler)); });
    boost::beast::flat_buffer buffer;
    HttpClient::HttpResponse response;
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_read(stream, buffer, response, std::move(handler));
    });
    return response;
}

void openTunnel(boost::asio::io_context& io,
                boost::beast::tcp_stream& stream,
                const std::string& authority,
                const proxy::ProxyAgent& proxy) {
    boost::beast::http::request<boost::beast::http::empty_body> connectRequest{
        boost::beast::http::verb::connect, authority, kHttpVersion};
    connectRequest.set(boost::beast::http::field::host, authority);
    if (!proxy.authorization.empty()) {
        connectRequest.set(boost::beast::http::field::proxy_authorization, proxy.authorization);
    }
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_write(stream, connectRequest, std::move(handler));
    });

    boost::beast::flat_buffer connectBuffer;
    boost::beast::http::response_parser<boost::beast::http::empty_body> parser;
    // A CONNECT reply carries no body even when it advertises a length.
    parser.skip(true);
    runOperation(io, [&](auto handler) {
        boost::beast::http::async_read_header(stream, connectBuffer, parser, std::move(handler));
    });
    auto status = parser.get().result_int();
    if (status != 200) {
        throw core::RequestError(core::RequestError::Type::transient_network,
                                 "Proxy CONNECT to " + describe(proxy.endpoint) + " failed with status " +
                                     std::to_string(status));
    }
}

Response toResponse(const HttpClient::HttpResponse& response) {
    Response out;
    out.status = static_cast<int>(response.result_int());
    out.body = response.body();
    for (const auto& field : response) {
        auto name = toLower(std::string(field.name_string()));
        auto& slot = out.headers[name];
        if (!slot.empty()) {
            slot += ", ";
        }
        slot += std::string(field.value());
    }
    return out;
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

Response HttpClient::send(const OutboundRequest& request,
                          const std::optional<proxy::ProxyAgent>& proxy,
                          std::chrono::milliseconds timeout) {
    util::ParsedUrl parsed;
    try {
        parsed = util::parseUrl(request.url);
    } catch (const std::invalid_argument& ex) {
        throw core::RequestError(core::RequestError::Type::configuration, ex.what());
    }

    HttpRequest outbound{toVerb(request.method), parsed.target, kHttpVersion};
    outbound.set(boost::beast::http::field::host, authorityFrom(parsed.scheme, parsed.host, parsed.port));
    for (const auto& [name, value] : request.headers) {
        outbound.set(name, value);
    }
    if (!request.body.empty() && outbound.method() != boost::beast::http::verb::get &&
        outbound.method() != boost::beast::http::verb::head) {
        outbound.body() = request.body;
        outbound.prepare_payload();
    }

    try {
        return toResponse(exchange(std::move(outbound), parsed.scheme, parsed.host, parsed.port, proxy, timeout));
    } catch (const core::RequestError&) {
        throw;
    } catch (const boost::system::system_error& ex) {
        auto via = proxy ? " via proxy " + describe(proxy->endpoint) : std::string{};
        throw core::RequestError(core::RequestError::Type::transient_network,
                                 request.method + " " + request.url + via + " failed: " + ex.code().message());
    } catch (const std::exception& ex) {
        throw core::RequestError(core::RequestError::Type::transient_network,
                                 request.method + " " + request.url + " failed: " + ex.what());
    }
}

HttpClient::HttpResponse HttpClient::exchange(HttpRequest request,
                                              const std::string& scheme,
                                              const std::string& host,
                                              const std::string& port,
                                              const std::optional<proxy::ProxyAgent>& proxy,
                                              std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = proxy ? resolver.resolve(proxy->endpoint.host, std::to_string(proxy->endpoint.port))
                         : resolver.resolve(host, port);

    if (scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext_);
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        runOperation(io, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });

        if (proxy) {
            openTunnel(io, lowest, authorityFrom(scheme, host, port), *proxy);
        }

        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        runOperation(io, [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });

        auto response = roundTrip(io, stream, request);

        try {
            runOperation(io, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        } catch (const boost::system::system_error& ex) {
            if (ex.code() != boost::asio::error::eof && ex.code() != boost::asio::ssl::error::stream_truncated) {
                util::log(util::LogLevel::debug, "TLS shutdown with " + host + " failed: " + ex.code().message());
            }
        }
        return response;
    }

    boost::beast::tcp_stream stream(io);
    stream.expires_after(timeout);
    runOperation(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });

    if (proxy) {
        request.target(scheme + "://" + authorityFrom(scheme, host, port) + std::string(request.target()));
        if (!proxy->authorization.empty()) {
            request.set(boost::beast::http::field::proxy_authorization, proxy->authorization);
        }
    }

    auto response = roundTrip(io, stream, request);

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        util::log(util::LogLevel::debug, "Socket shutdown with " + host + " failed: " + ec.message());
    }

    if (proxy && response.result() == boost::beast::http::status::proxy_authentication_required) {
        throw core::RequestError(core::RequestError::Type::transient_network,
                                 "Proxy authentication required by " + describe(proxy->endpoint));
    }
    return response;
}

} // namespace resilink::http
