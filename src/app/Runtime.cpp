#include "resilink/app/Runtime.hpp"
#include "resilink/util/Logging.hpp"

#include <utility>

namespace resilink::app {
namespace {

queue::QueueOptions makeQueueOptions(const config::AppConfig& config) {
    queue::QueueOptions options;
    options.tickInterval = config.queueTick;
    options.rateLimits = config.rateLimits;
    options.retry = config.retry;
    return options;
}

client::FactoryOptions makeFactoryOptions(const config::AppConfig& config) {
    client::FactoryOptions options;
    options.retry = config.retry;
    options.defaultTimeout = config.defaultTimeout;
    options.providerTimeouts = config.providerTimeouts;
    return options;
}

} // namespace

Runtime::Runtime(boost::asio::io_context& io,
                 boost::asio::thread_pool& worker,
                 config::AppConfig config,
                 http::Transport& transport,
                 cache::DistributedStore& store,
                 client::Sleeper sleeper)
    : config_(std::move(config))
    , proxies_(io, worker, transport, config::makeProxyOptions(config_.proxy))
    , cache_(store, config_.cache)
    , queue_(io, makeQueueOptions(config_))
    , clients_(transport, proxies_, makeFactoryOptions(config_), std::move(sleeper))
    , dispatcher_(std::make_shared<client::QueueDispatcher>(queue_, clients_, worker)) {
    queue_.setExecutor(dispatcher_);
}

Runtime::~Runtime() {
    stop();
}

void Runtime::start() {
    if (started_ || stopped_) {
        return;
    }
    started_ = true;

    for (const auto& [name, provider] : config_.providers) {
        client::ClientOptions options;
        options.baseUrl = provider.baseUrl;
        options.headers = provider.headers;
        options.useProxy = provider.useProxy;
        if (auto it = config_.rateLimits.find(name); it != config_.rateLimits.end()) {
            options.rateLimits = it->second;
        }
        clients_.createClient(name, options);
    }

    proxies_.start();
    queue_.start();
    util::log(util::LogLevel::info,
              "Runtime started with " + std::to_string(config_.providers.size()) + " provider clients");
}

void Runtime::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    clients_.destroy();
    queue_.destroy();
    cache_.destroy();
    proxies_.destroy();
    util::log(util::LogLevel::info, "Runtime stopped");
}

} // namespace resilink::app
