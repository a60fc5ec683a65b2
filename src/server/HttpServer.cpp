#include "resilink/server/HttpServer.hpp"
#include "resilink/server/Router.hpp"
#include "resilink/server/RequestContext.hpp"
#include "resilink/util/JsonResponse.hpp"
#include "resilink/util/Logging.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace resilink::server {
namespace {

namespace http = boost::beast::http;

constexpr auto kSessionTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxRequestBody = 64 * 1024;

void writeJson(RequestContext::HttpResponse& response, http::status status, const boost::json::value& body) {
    response.result(status);
    response.set(http::field::content_type, "application/json; charset=utf-8");
    response.body() = boost::json::serialize(body);
}

boost::json::object messageBody(const std::string& message) {
    boost::json::object body;
    body["message"] = message;
    return body;
}

bool isJson(const RequestContext::HttpResponse& response) {
    auto it = response.find(http::field::content_type);
    if (it == response.end()) {
        return false;
    }
    auto value = std::string(it->value());
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value.find("application/json") != std::string::npos;
}

// Handlers write plain JSON; the envelope is applied once on the way out.
void envelope(RequestContext& ctx) {
    auto& response = ctx.response;
    if (response.body().empty() || !isJson(response)) {
        return;
    }
    std::string path(ctx.request.target());
    path = path.substr(0, path.find('?'));

    boost::system::error_code ec;
    auto body = boost::json::parse(response.body(), ec);
    if (ec) {
        body = boost::json::string(response.body());
    }
    writeJson(response, response.result(), util::makeEnvelope(response.result_int(), body, path));
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router)
        : stream_(std::move(socket)), router_(std::move(router)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(kMaxRequestBody);
        stream_.expires_after(kSessionTimeout);
        http::async_read(stream_, buffer_, *parser_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->close();
                    return;
                }
                self->handle(self->parser_->release());
            }));
    }

    void handle(RequestContext::HttpRequest request) {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = std::move(request);
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());
        ctx.response.set(http::field::server, "resilink");

        route(ctx);
        envelope(ctx);
        ctx.response.prepare_payload();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::debug, std::string(ctx.request.method_string()) + " " +
                                             std::string(ctx.request.target()) + " -> " +
                                             std::to_string(ctx.response.result_int()) + " in " +
                                             std::to_string(elapsed.count()) + "ms");

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec || !response->keep_alive()) {
                    self->close();
                    return;
                }
                self->readRequest();
            }));
    }

    void route(RequestContext& ctx) {
        // The ops surface is read-only.
        const auto method = ctx.request.method();
        if (method != http::verb::get && method != http::verb::head) {
            ctx.response.set(http::field::allow, "GET, HEAD");
            writeJson(ctx.response, http::status::method_not_allowed, messageBody("Method not allowed"));
            return;
        }

        std::unordered_map<std::string, std::string> params;
        auto handler = router_->resolve("GET", std::string(ctx.request.target()), params);
        if (!handler) {
            writeJson(ctx.response, http::status::not_found, messageBody("Route not found"));
            return;
        }
        ctx.pathParameters = std::move(params);

        try {
            handler(ctx);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error,
                      "Handler for " + std::string(ctx.request.target()) + " failed: " + ex.what());
            writeJson(ctx.response, http::status::internal_server_error, messageBody(ex.what()));
            return;
        }
        if (ctx.response.result() == http::status::unknown) {
            ctx.response.result(ctx.response.body().empty() ? http::status::no_content : http::status::ok);
        }
        if (method == http::verb::head) {
            ctx.response.body().clear();
        }
    }

    void close() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<Router> router_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_) {
        return;
    }

    const boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(host_), port_};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
    running_ = true;

    util::log(util::LogLevel::info, "Ops server listening on " + host_ + ":" + std::to_string(port_));
    doAccept();
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);
    util::log(util::LogLevel::info, "Ops server stopped");
}

unsigned short HttpServer::port() const {
    return port_;
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }
            if (ec) {
                util::log(util::LogLevel::warn, "Accept failed: " + ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->start();
            }
            self->doAccept();
        });
}

} // namespace resilink::server
