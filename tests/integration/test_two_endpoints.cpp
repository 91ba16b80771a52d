/**
 * @file test_two_endpoints.cpp
 * @brief Integration test: endpoints in one process finding each other over multicast
 *
 * Uses a non-default port so a running mcdiscd does not interfere. Skipped
 * when the host does not loop multicast back to itself.
 */

#include <gtest/gtest.h>
#include <mcdisc/core/async_endpoint.hpp>
#include <mcdisc/core/endpoint_builder.hpp>
#include <mcdisc/core/multicast_transport.hpp>
#include <mcdisc/core/sync_endpoint.hpp>
#include <mcdisc/utils/logger.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <thread>

using namespace mcdisc;
using namespace mcdisc::core;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kTestPort = 18787;
constexpr auto kFindTimeout = 5000ms;

EndpointOptions testOptions() {
    EndpointOptions options;
    options.multicast.port = kTestPort;
    options.multicast.loopback = true;
    options.receive_poll_ms = 20;
    return options;
}

bool multicastLoopbackWorks() {
    MulticastTransport transport(testOptions().multicast);
    if (!transport.open()) {
        return false;
    }

    const std::string marker = "mcdisc-loopback-check";
    if (!transport.send(marker)) {
        return false;
    }

    std::vector<uint8_t> buffer;
    net::SocketAddress sender;
    const auto deadline = std::chrono::steady_clock::now() + 1s;
    while (std::chrono::steady_clock::now() < deadline) {
        int received = transport.receive(buffer, 100, sender);
        if (received < 0) {
            return false;
        }
        if (std::string(buffer.begin(), buffer.begin() + received) == marker) {
            return true;
        }
    }
    return false;
}

}  // namespace

class TwoEndpointsTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        if (!multicastLoopbackWorks()) {
            GTEST_SKIP() << "Multicast loopback unavailable on this host";
        }
    }

    static std::unique_ptr<SyncEndpoint> host(const std::string& name, const std::string& kind,
                                              uint16_t port) {
        EndpointBuilder builder(name);
        builder.address("127.0.0.1").host(kind, port).options(testOptions());
        return builder.buildSync();
    }

    static std::unique_ptr<SyncEndpoint> searcher(const std::string& name, const std::string& kind) {
        EndpointBuilder builder(name);
        builder.address("127.0.0.1").search(kind).options(testOptions());
        return builder.buildSync();
    }
};

// =============================================================================
// Sync endpoints
// =============================================================================

TEST_F(TwoEndpointsTest, HostFirstThenSearcher) {
    auto server = host("server-a", "hello", 4112);
    auto client = searcher("client-a", "hello");

    FindResult found = client->findService("hello", kFindTimeout);

    ASSERT_TRUE(found.found()) << findStatusToString(found.status);
    EXPECT_EQ(found.service->kind, "hello");
    EXPECT_EQ(found.service->port, 4112);
    EXPECT_EQ(found.service->hosted_by.name, "server-a");
    EXPECT_EQ(found.service->hosted_by.address, "127.0.0.1");
}

TEST_F(TwoEndpointsTest, StatsReadableWhileRunning) {
    auto server = host("server-s", "hello", 4112);
    auto client = searcher("client-s", "hello");

    FindResult found = client->findService("hello", kFindTimeout);
    ASSERT_TRUE(found.found()) << findStatusToString(found.status);

    // Worker keeps handling datagrams while these snapshots are taken
    for (int i = 0; i < 20; ++i) {
        RunnerStats stats = client->stats();
        EXPECT_GE(stats.packets_received, 1u);
        EXPECT_GE(stats.results_reported, 1u);
        EXPECT_GE(server->stats().packets_received, 1u);
        EXPECT_GE(client->channelStats().total_delivered, 1u);
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(client->isRunning());
}

TEST_F(TwoEndpointsTest, NegativePollIntervalIsClamped) {
    EndpointOptions options = testOptions();
    options.receive_poll_ms = -1;

    EndpointBuilder builder("client-p");
    builder.address("127.0.0.1").search("hello").options(options);
    auto client = builder.buildSync();
    EXPECT_EQ(client->options().receive_poll_ms, 1);

    auto stopped = std::async(std::launch::async, [&client]() { client->shutdown(); });
    ASSERT_EQ(stopped.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(client->isRunning());
}

TEST_F(TwoEndpointsTest, SearcherFirstThenHost) {
    auto client = searcher("client-b", "hello");
    std::this_thread::sleep_for(50ms);
    auto server = host("server-b", "hello", 4112);

    FindResult found = client->findService("hello", kFindTimeout);

    ASSERT_TRUE(found.found()) << findStatusToString(found.status);
    EXPECT_EQ(found.service->hosted_by.name, "server-b");
    EXPECT_EQ(found.service->port, 4112);
}

TEST_F(TwoEndpointsTest, TwoHostsYieldTwoResults) {
    auto first = host("server-c1", "hello", 4112);
    auto second = host("server-c2", "hello", 4113);
    auto client = searcher("client-c", "hello");

    std::set<std::string> hosts;
    for (int i = 0; i < 2; ++i) {
        FindResult found = client->findService("hello", kFindTimeout);
        ASSERT_TRUE(found.found()) << findStatusToString(found.status);
        hosts.insert(found.service->hosted_by.name + ":" + std::to_string(found.service->port));
    }

    EXPECT_EQ(hosts, (std::set<std::string>{"server-c1:4112", "server-c2:4113"}));

    // No duplicates follow
    EXPECT_EQ(client->findService("hello", 300ms).status, FindStatus::TIMED_OUT);
}

TEST_F(TwoEndpointsTest, StreamDeliversResults) {
    auto client = searcher("client-d", "hello");
    auto server = host("server-d", "hello", 4112);

    ServiceStream stream = client->findAllServices();
    auto result = stream.next(kFindTimeout);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->hosted_by.name, "server-d");
}

TEST_F(TwoEndpointsTest, TimeoutLeavesOtherResultsBuffered) {
    EndpointBuilder builder("client-e");
    builder.address("127.0.0.1").search("hello").search("absent").options(testOptions());
    auto client = builder.buildSync();
    auto server = host("server-e", "hello", 4112);

    EXPECT_EQ(client->findService("absent", 500ms).status, FindStatus::TIMED_OUT);

    FindResult found = client->findService("hello", kFindTimeout);
    ASSERT_TRUE(found.found());
    EXPECT_EQ(found.service->hosted_by.name, "server-e");
}

TEST_F(TwoEndpointsTest, ShutdownWakesBlockedFinder) {
    auto client = searcher("client-f", "absent");

    auto pending = std::async(std::launch::async, [&client]() {
        return client->findService("absent");
    });

    std::this_thread::sleep_for(100ms);
    client->shutdown();

    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(pending.get().status, FindStatus::NO_ENDPOINT);
    EXPECT_FALSE(client->isRunning());
}

TEST_F(TwoEndpointsTest, SelfHostIsNotReported) {
    EndpointBuilder builder("loner");
    builder.address("127.0.0.1").host("hello", 4112).search("hello").options(testOptions());
    auto endpoint = builder.buildSync();

    EXPECT_EQ(endpoint->findService("hello", 500ms).status, FindStatus::TIMED_OUT);
}

// =============================================================================
// Async endpoints
// =============================================================================

class AsyncTwoEndpointsTest : public TwoEndpointsTest {
protected:
    void SetUp() override {
        TwoEndpointsTest::SetUp();
        if (IsSkipped()) {
            return;
        }
        runner_ = std::thread([this]() { io_.run(); });
    }

    // Every test shuts its endpoints down, so run() returns once their
    // queued handlers have drained.
    void TearDown() override {
        work_.reset();
        if (runner_.joinable()) {
            runner_.join();
        }
    }

    std::shared_ptr<AsyncEndpoint> asyncSearcher(const std::string& name, const std::string& kind) {
        EndpointBuilder builder(name);
        builder.address("127.0.0.1").search(kind).options(testOptions());
        return builder.buildAsync(io_);
    }

    std::shared_ptr<AsyncEndpoint> asyncHost(const std::string& name, const std::string& kind,
                                             uint16_t port) {
        EndpointBuilder builder(name);
        builder.address("127.0.0.1").host(kind, port).options(testOptions());
        return builder.buildAsync(io_);
    }

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_ =
        boost::asio::make_work_guard(io_);
    std::thread runner_;
};

TEST_F(AsyncTwoEndpointsTest, HostFirstThenSearcher) {
    auto server = asyncHost("async-server-a", "hello", 4112);
    auto client = asyncSearcher("async-client-a", "hello");

    std::promise<FindResult> promise;
    auto future = promise.get_future();
    client->asyncFindService("hello", [&promise](FindResult result) {
        promise.set_value(std::move(result));
    }, kFindTimeout);

    ASSERT_EQ(future.wait_for(kFindTimeout + 1s), std::future_status::ready);
    FindResult found = future.get();
    ASSERT_TRUE(found.found()) << findStatusToString(found.status);
    EXPECT_EQ(found.service->hosted_by.name, "async-server-a");
    EXPECT_EQ(found.service->port, 4112);

    server->shutdown();
    client->shutdown();
}

TEST_F(AsyncTwoEndpointsTest, SearcherFirstThenHost) {
    auto client = asyncSearcher("async-client-b", "hello");

    std::promise<FindResult> promise;
    auto future = promise.get_future();
    client->asyncFindService("hello", [&promise](FindResult result) {
        promise.set_value(std::move(result));
    }, kFindTimeout);

    std::this_thread::sleep_for(50ms);
    auto server = asyncHost("async-server-b", "hello", 4112);

    ASSERT_EQ(future.wait_for(kFindTimeout + 1s), std::future_status::ready);
    FindResult found = future.get();
    ASSERT_TRUE(found.found()) << findStatusToString(found.status);
    EXPECT_EQ(found.service->hosted_by.name, "async-server-b");

    server->shutdown();
    client->shutdown();
}

TEST_F(AsyncTwoEndpointsTest, SyncHostAsyncSearcher) {
    auto server = host("mixed-server", "hello", 4112);
    auto client = asyncSearcher("mixed-client", "hello");

    std::promise<FindResult> promise;
    auto future = promise.get_future();
    client->asyncFindAnyService([&promise](FindResult result) {
        promise.set_value(std::move(result));
    }, kFindTimeout);

    ASSERT_EQ(future.wait_for(kFindTimeout + 1s), std::future_status::ready);
    FindResult found = future.get();
    ASSERT_TRUE(found.found()) << findStatusToString(found.status);
    EXPECT_EQ(found.service->hosted_by.name, "mixed-server");

    client->shutdown();
}

TEST_F(AsyncTwoEndpointsTest, FindTimesOut) {
    auto client = asyncSearcher("async-client-c", "absent");

    std::promise<FindResult> promise;
    auto future = promise.get_future();
    client->asyncFindService("absent", [&promise](FindResult result) {
        promise.set_value(std::move(result));
    }, 200ms);

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().status, FindStatus::TIMED_OUT);

    client->shutdown();
}

TEST_F(AsyncTwoEndpointsTest, ShutdownCompletesPendingFinds) {
    auto client = asyncSearcher("async-client-d", "absent");

    std::promise<FindResult> found;
    std::promise<void> closed;
    std::promise<void> stopped;
    client->asyncFindService("absent", [&found](FindResult result) {
        found.set_value(std::move(result));
    });
    client->findAllServices(
        [](const DiscoveryResult&) { return true; },
        [&closed]() { closed.set_value(); });

    client->shutdown([&stopped]() { stopped.set_value(); });

    auto foundFuture = found.get_future();
    ASSERT_EQ(foundFuture.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(foundFuture.get().status, FindStatus::NO_ENDPOINT);
    EXPECT_EQ(closed.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_EQ(stopped.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(client->isRunning());
}

TEST_F(AsyncTwoEndpointsTest, SubscriptionReceivesResults) {
    auto client = asyncSearcher("async-client-e", "hello");

    std::promise<DiscoveryResult> first;
    client->findAllServices([&first](const DiscoveryResult& result) {
        first.set_value(result);
        return false;
    });

    auto server = asyncHost("async-server-e", "hello", 4112);

    auto future = first.get_future();
    ASSERT_EQ(future.wait_for(kFindTimeout), std::future_status::ready);
    EXPECT_EQ(future.get().hosted_by.name, "async-server-e");

    server->shutdown();
    client->shutdown();
}
