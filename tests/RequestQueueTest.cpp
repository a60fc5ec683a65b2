#include "resilink/core/RequestError.hpp"
#include "resilink/queue/RequestQueue.hpp"

#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace resilink;
using namespace std::chrono_literals;
using Type = core::RequestError::Type;

namespace {

class RecordingExecutor : public queue::RequestExecutor {
public:
    void execute(const queue::QueuedRequest& request) override {
        std::function<void(const queue::QueuedRequest&)> hook;
        {
            std::scoped_lock lock(mutex_);
            requests_.push_back(request);
            hook = onExecute;
        }
        if (hook) {
            hook(request);
        }
    }

    std::vector<queue::QueuedRequest> requests() const {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

    std::function<void(const queue::QueuedRequest&)> onExecute;

private:
    mutable std::mutex mutex_;
    std::vector<queue::QueuedRequest> requests_;
};

ratelimit::RateLimitConfig unlimited() {
    return ratelimit::RateLimitConfig{0, 0, 0, 0, 0};
}

queue::QueueOptions unlimitedOptions() {
    queue::QueueOptions options;
    options.tickInterval = 10ms;
    options.rateLimits = {{"testAPI", unlimited()}};
    options.retry.baseDelay = 1ms;
    options.retry.maxDelay = 5ms;
    return options;
}

queue::RequestOptions withPriority(queue::Priority priority) {
    queue::RequestOptions options;
    options.priority = priority;
    return options;
}

Type errorType(std::future<boost::json::value>& future) {
    try {
        future.get();
    } catch (const core::RequestError& error) {
        return error.type();
    }
    ADD_FAILURE() << "future did not hold a RequestError";
    return Type::configuration;
}

class RequestQueueTest : public ::testing::Test {
protected:
    void SetUp() override { queue.setExecutor(executor); }

    boost::asio::io_context io;
    std::shared_ptr<RecordingExecutor> executor = std::make_shared<RecordingExecutor>();
    queue::RateLimitedRequestQueue queue{io, unlimitedOptions()};
};

} // namespace

TEST_F(RequestQueueTest, HigherPriorityRunsFirstThenFifo) {
    queue.enqueue("testAPI", "/low", withPriority(queue::Priority::low));
    queue.enqueue("testAPI", "/first-medium", withPriority(queue::Priority::medium));
    queue.enqueue("testAPI", "/critical", withPriority(queue::Priority::critical));
    queue.enqueue("testAPI", "/second-medium", withPriority(queue::Priority::medium));
    queue.enqueue("testAPI", "/high", withPriority(queue::Priority::high));

    for (int i = 0; i < 5; ++i) {
        queue.processQueues();
    }

    auto requests = executor->requests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests[0].endpoint, "/critical");
    EXPECT_EQ(requests[1].endpoint, "/high");
    EXPECT_EQ(requests[2].endpoint, "/first-medium");
    EXPECT_EQ(requests[3].endpoint, "/second-medium");
    EXPECT_EQ(requests[4].endpoint, "/low");
}

TEST_F(RequestQueueTest, OneDispatchPerProviderPerPass) {
    queue.enqueue("testAPI", "/a");
    queue.enqueue("testAPI", "/b");
    queue.enqueue("otherAPI", "/c");

    queue.processQueues();
    EXPECT_EQ(executor->requests().size(), 2u);
    EXPECT_EQ(queue.getQueueStats("testAPI").pending, 1u);
    EXPECT_EQ(queue.getQueueStats("testAPI").processing, 1u);
}

TEST_F(RequestQueueTest, CompletesFiveRequestsInOrder) {
    queue::RateLimitedRequestQueue defaults{io};
    defaults.setExecutor(executor);

    std::vector<std::future<boost::json::value>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(defaults.enqueue("testAPI", "/item/" + std::to_string(i)));
    }
    EXPECT_EQ(defaults.getQueueStats("testAPI").pending, 5u);

    for (std::size_t i = 0; i < 5; ++i) {
        defaults.processQueues();
        auto dispatched = executor->requests();
        ASSERT_EQ(dispatched.size(), i + 1);
        boost::json::object result;
        result["index"] = static_cast<std::int64_t>(i);
        defaults.completeRequest(dispatched.back().id, result);

        auto stats = defaults.getQueueStats("testAPI");
        EXPECT_EQ(stats.pending, 4 - i);
        EXPECT_EQ(stats.completed, i + 1);
        EXPECT_EQ(stats.processing, 0u);
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        EXPECT_EQ(futures[i].get().as_object().at("index").as_int64(), static_cast<std::int64_t>(i));
    }
    EXPECT_EQ(defaults.getQueueStats("testAPI").totalProcessed, 5u);
}

TEST_F(RequestQueueTest, RejectsWithLastErrorAfterMaxRetries) {
    int attempts = 0;
    executor->onExecute = [&](const queue::QueuedRequest& request) {
        ++attempts;
        queue.failRequest(request.id, std::make_exception_ptr(core::RequestError(
            Type::upstream_server, "attempt " + std::to_string(attempts), 503)));
    };

    queue::RequestOptions options;
    options.maxRetries = 3;
    auto future = queue.enqueue("testAPI", "/flaky", options);

    for (int i = 0; i < 200 && future.wait_for(0ms) != std::future_status::ready; ++i) {
        queue.processQueues();
        std::this_thread::sleep_for(2ms);
    }

    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    try {
        future.get();
        FAIL() << "expected failure";
    } catch (const core::RequestError& error) {
        EXPECT_EQ(std::string(error.what()), "attempt 3");
        EXPECT_EQ(error.status(), 503);
    }
    EXPECT_EQ(attempts, 3);

    for (int i = 0; i < 5; ++i) {
        queue.processQueues();
    }
    EXPECT_EQ(attempts, 3);
    auto stats = queue.getQueueStats("testAPI");
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(executor->requests().back().retryCount, 2);
}

TEST_F(RequestQueueTest, RetryWaitsForScheduledTime) {
    queue::QueueOptions options = unlimitedOptions();
    options.retry.baseDelay = 200ms;
    options.retry.maxDelay = 200ms;
    queue::RateLimitedRequestQueue slow{io, options};
    slow.setExecutor(executor);

    auto future = slow.enqueue("testAPI", "/later");
    slow.processQueues();
    slow.failRequest(executor->requests().front().id,
                     std::make_exception_ptr(core::RequestError(Type::transient_network, "reset")));

    slow.processQueues();
    EXPECT_EQ(executor->requests().size(), 1u);
    EXPECT_EQ(slow.getQueueStats("testAPI").pending, 1u);

    std::this_thread::sleep_for(250ms);
    slow.processQueues();
    ASSERT_EQ(executor->requests().size(), 2u);
    EXPECT_EQ(executor->requests().back().retryCount, 1);
    slow.completeRequest(executor->requests().back().id, "done");
    EXPECT_EQ(future.get().as_string(), "done");
}

TEST_F(RequestQueueTest, ExecutorExceptionCountsAsFailure) {
    executor->onExecute = [](const queue::QueuedRequest&) { throw std::runtime_error("executor down"); };
    queue::RequestOptions options;
    options.maxRetries = 1;
    auto future = queue.enqueue("testAPI", "/boom", options);
    queue.processQueues();

    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(RequestQueueTest, TimeoutRejectsIndependentlyOfRetries) {
    queue::RequestOptions options;
    options.timeout = 30ms;
    auto future = queue.enqueue("testAPI", "/slow", options);
    queue.processQueues();
    ASSERT_EQ(executor->requests().size(), 1u);

    io.run_for(150ms);

    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    try {
        future.get();
        FAIL() << "expected timeout";
    } catch (const core::RequestError& error) {
        EXPECT_EQ(error.type(), Type::timeout);
        EXPECT_EQ(std::string(error.what()), "Request timeout after 30ms");
    }

    // A late completion is ignored.
    queue.completeRequest(executor->requests().front().id, "late");
    auto stats = queue.getQueueStats("testAPI");
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.completed, 0u);
    EXPECT_EQ(stats.processing, 0u);
}

TEST_F(RequestQueueTest, ClearQueueCancelsPendingRequests) {
    auto first = queue.enqueue("testAPI", "/a");
    auto second = queue.enqueue("testAPI", "/b");
    auto other = queue.enqueue("otherAPI", "/c");

    EXPECT_EQ(queue.clearQueue("testAPI"), 2u);
    EXPECT_EQ(errorType(first), Type::cancelled);
    EXPECT_EQ(errorType(second), Type::cancelled);
    EXPECT_EQ(queue.getQueueStats("testAPI").pending, 0u);
    EXPECT_EQ(queue.getQueueStats("otherAPI").pending, 1u);
    EXPECT_EQ(queue.clearQueue("missing"), 0u);
}

TEST_F(RequestQueueTest, PausedProviderIsSkipped) {
    queue.pauseQueue("testAPI");
    queue.enqueue("testAPI", "/held");
    queue.enqueue("otherAPI", "/free");

    queue.processQueues();
    auto requests = executor->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].provider, "otherAPI");

    queue.resumeQueue("testAPI");
    queue.processQueues();
    EXPECT_EQ(executor->requests().size(), 2u);
}

TEST_F(RequestQueueTest, PerMinuteLimitCapsDispatches) {
    queue::QueueOptions options = unlimitedOptions();
    options.rateLimits["testAPI"].requestsPerMinute = 2;
    queue::RateLimitedRequestQueue limited{io, options};
    limited.setExecutor(executor);

    for (int i = 0; i < 4; ++i) {
        limited.enqueue("testAPI", "/r" + std::to_string(i));
    }
    for (int i = 0; i < 4; ++i) {
        limited.processQueues();
    }
    EXPECT_EQ(executor->requests().size(), 2u);

    auto status = limited.getRateLimitStatus("testAPI");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->requestsInLastMinute, 2u);
    EXPECT_FALSE(status->canMakeRequest);
    EXPECT_EQ(status->limits.requestsPerMinute, 2);
    EXPECT_FALSE(limited.getRateLimitStatus("unknown"));
    EXPECT_EQ(limited.getRateLimitStatus().size(), 1u);
}

TEST_F(RequestQueueTest, DestroyRejectsEverythingAndEmptiesState) {
    auto inFlight = queue.enqueue("testAPI", "/running");
    queue.processQueues();
    auto pendingA = queue.enqueue("testAPI", "/a");
    auto pendingB = queue.enqueue("otherAPI", "/b");

    queue.destroy();

    EXPECT_EQ(errorType(inFlight), Type::service_shutdown);
    EXPECT_EQ(errorType(pendingA), Type::service_shutdown);
    EXPECT_EQ(errorType(pendingB), Type::service_shutdown);
    EXPECT_TRUE(queue.getQueueStats().empty());
    EXPECT_TRUE(queue.getRateLimitStatus().empty());

    auto late = queue.enqueue("testAPI", "/late");
    EXPECT_EQ(errorType(late), Type::service_shutdown);
    queue.destroy();
}

TEST_F(RequestQueueTest, TickLoopDrivesDispatch) {
    executor->onExecute = [this](const queue::QueuedRequest& request) {
        queue.completeRequest(request.id, boost::json::string(request.endpoint));
    };
    queue.start();
    auto future = queue.enqueue("testAPI", "/ticked");

    io.run_for(200ms);

    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(future.get().as_string(), "/ticked");
    queue.destroy();
}

TEST(QueuedRequestTest, PriorityNamesRoundTrip) {
    EXPECT_EQ(queue::parsePriority("critical"), queue::Priority::critical);
    EXPECT_EQ(queue::parsePriority("low"), queue::Priority::low);
    EXPECT_EQ(queue::parsePriority("bogus"), queue::Priority::medium);
    EXPECT_STREQ(queue::toString(queue::Priority::high), "high");
}
