#pragma once

#include "resilink/client/ResilientClientFactory.hpp"
#include "resilink/queue/RequestQueue.hpp"

#include <boost/asio/thread_pool.hpp>

namespace resilink::client {

// Runs queued requests through the provider's client on the worker pool and
// reports the outcome back to the queue. The body is resolved as JSON, or as a
// string when it does not parse.
class QueueDispatcher : public queue::RequestExecutor {
public:
    QueueDispatcher(queue::RateLimitedRequestQueue& queue,
                    ResilientClientFactory& factory,
                    boost::asio::thread_pool& worker);

    void execute(const queue::QueuedRequest& request) override;

private:
    void run(const queue::QueuedRequest& request);

    queue::RateLimitedRequestQueue& queue_;
    ResilientClientFactory& factory_;
    boost::asio::thread_pool& worker_;
};

} // namespace resilink::client
