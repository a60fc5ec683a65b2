#include "resilink/client/QueueDispatcher.hpp"
#include "resilink/util/JsonUtil.hpp"
#include "resilink/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <exception>

namespace resilink::client {
namespace {

boost::json::value decodeBody(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    try {
        return util::parseJson(body);
    } catch (const std::exception&) {
        return boost::json::string(body);
    }
}

} // namespace

QueueDispatcher::QueueDispatcher(queue::RateLimitedRequestQueue& queue,
                                 ResilientClientFactory& factory,
                                 boost::asio::thread_pool& worker)
    : queue_(queue)
    , factory_(factory)
    , worker_(worker) {}

void QueueDispatcher::execute(const queue::QueuedRequest& request) {
    boost::asio::post(worker_, [this, request]() { run(request); });
}

void QueueDispatcher::run(const queue::QueuedRequest& request) {
    try {
        auto client = factory_.getClient(request.provider);
        CallOptions options;
        options.params = request.params;
        options.headers = request.headers;
        options.timeout = request.timeout;
        auto response = client->execute(request.endpoint, options);
        queue_.completeRequest(request.id, decodeBody(response.body));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, "Queued request " + request.id + " failed: " + ex.what());
        queue_.failRequest(request.id, std::current_exception());
    }
}

} // namespace resilink::client
