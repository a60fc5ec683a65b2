#include "resilink/app/Runtime.hpp"
#include "resilink/cache/RedisStore.hpp"
#include "resilink/config/AppConfig.hpp"
#include "resilink/controller/OpsController.hpp"
#include "resilink/http/HttpClient.hpp"
#include "resilink/server/HttpServer.hpp"
#include "resilink/server/Router.hpp"
#include "resilink/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace resilink;

    std::filesystem::path configPath = "config/resilink.json";
    if (argc > 1) {
        configPath = argv[1];
    } else if (const char* value = std::getenv("RESILINK_CONFIG")) {
        configPath = value;
    }

    auto config = config::loadAppConfig(configPath);
    util::initLogging(config.logLevel);

    boost::asio::io_context io;
    boost::asio::thread_pool workerPool(std::max(2u, std::thread::hardware_concurrency()));
    http::HttpClient httpClient;

    util::log(util::LogLevel::info,
              "Connecting Redis: " + config.redis.host + ":" + std::to_string(config.redis.port) + "/" +
                  std::to_string(config.redis.db));
    std::unique_ptr<cache::RedisStore> store;
    try {
        store = std::make_unique<cache::RedisStore>(config.redis);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Failed to configure Redis: "} + ex.what());
        return EXIT_FAILURE;
    }

    const auto serverHost = config.server.host;
    const auto serverPort = config.server.port;

    int exitCode = EXIT_SUCCESS;
    {
        app::Runtime runtime{io, workerPool, std::move(config), httpClient, *store};

        auto router = std::make_shared<server::Router>();
        controller::OpsController opsController{runtime.proxies(), runtime.queue(), runtime.cache(), runtime.clients()};
        opsController.registerRoutes(*router);

        auto server = std::make_shared<server::HttpServer>(io, router, serverHost, serverPort);
        try {
            server->start();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, std::string{"Failed to start ops server: "} + ex.what());
            exitCode = EXIT_FAILURE;
        }

        if (exitCode == EXIT_SUCCESS) {
            runtime.start();

            boost::asio::signal_set signals(io, SIGINT, SIGTERM);
            signals.async_wait([&](const boost::system::error_code& ec, int signal) {
                if (ec) {
                    return;
                }
                util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
                server->stop();
                runtime.stop();
                io.stop();
            });

            unsigned int ioThreadsCount = std::max(2u, std::thread::hardware_concurrency());
            std::vector<std::thread> ioThreads;
            ioThreads.reserve(ioThreadsCount - 1);
            for (unsigned int i = 0; i < ioThreadsCount - 1; ++i) {
                ioThreads.emplace_back([&io]() { io.run(); });
            }

            util::log(util::LogLevel::info, "resilink service running");
            io.run();

            for (auto& thread : ioThreads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }

        runtime.stop();
        workerPool.join();
    }

    return exitCode;
}
