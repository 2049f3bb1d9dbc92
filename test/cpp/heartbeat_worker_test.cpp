#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

#include "heartbeat_worker.hpp"

using namespace toolhost;

TEST_CASE("HeartbeatWorker expires idle sessions", "[heartbeat]") {
    auto sessions = std::make_shared<MCPSessionManager>();
    sessions->setSessionTimeout(std::chrono::milliseconds(10));
    auto session = sessions->createSession();

    HeartbeatWorker worker(sessions, std::make_shared<ToolMetricsRegistry>(), std::chrono::milliseconds(5));
    worker.start();
    for (int i = 0; i < 500 && sessions->getActiveSessionCount() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    worker.stop();

    REQUIRE(worker.ticks() > 0);
    REQUIRE(sessions->getActiveSessionCount() == 0);
    REQUIRE(session->isClosed());
}

TEST_CASE("HeartbeatWorker stops promptly", "[heartbeat]") {
    HeartbeatWorker worker(std::make_shared<MCPSessionManager>(), std::make_shared<ToolMetricsRegistry>(),
                           std::chrono::hours(1));
    worker.start();
    worker.start();

    auto before = std::chrono::steady_clock::now();
    worker.stop();
    worker.stop();
    REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(5));
    REQUIRE(worker.ticks() == 0);
}
