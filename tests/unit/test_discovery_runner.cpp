/**
 * @file test_discovery_runner.cpp
 * @brief Unit tests for the runner state machine against a mocked backend
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <mcdisc/core/discovery_runner.hpp>
#include <mcdisc/core/notification_codec.hpp>

#include <chrono>
#include <string>

using namespace mcdisc::core;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

class MockBackend : public RunnerBackend {
public:
    MOCK_METHOD(bool, sendAnnouncement, (const std::string& payload), (override));
    MOCK_METHOD(void, publish, (const DiscoveryResult& result), (override));
};

Announcement make(const std::string& name, const std::string& address,
                  std::vector<ServiceRole> roles) {
    Announcement announcement;
    announcement.identity = Identity{name, address};
    announcement.roles = std::move(roles);
    return announcement;
}

std::string encode(const Announcement& announcement) {
    auto payload = NotificationCodec::encode(announcement);
    return payload ? *payload : std::string();
}

}  // namespace

class DiscoveryRunnerTest : public ::testing::Test {
protected:
    void deliver(DiscoveryRunner& runner, const Announcement& announcement) {
        const std::string payload = encode(announcement);
        runner.handleDatagram(payload.data(), payload.size());
    }

    StrictMock<MockBackend> backend_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(DiscoveryRunnerTest, StartSendsEncodedAnnouncement) {
    Announcement local = make("server", "10.0.0.1", {Hosting{"hello", 4112}});
    DiscoveryRunner runner(local, backend_);

    EXPECT_CALL(backend_, sendAnnouncement(encode(local))).WillOnce(Return(true));

    EXPECT_EQ(runner.state(), RunnerState::STARTING);
    ASSERT_TRUE(runner.start());
    EXPECT_EQ(runner.state(), RunnerState::RUNNING);
    EXPECT_TRUE(runner.isRunning());
}

TEST_F(DiscoveryRunnerTest, StartFailsWhenSendFails) {
    DiscoveryRunner runner(make("server", "10.0.0.1", {}), backend_);

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(false));

    EXPECT_FALSE(runner.start());
    EXPECT_EQ(runner.state(), RunnerState::STARTING);
    EXPECT_EQ(runner.stats().send_failures, 1u);
}

TEST_F(DiscoveryRunnerTest, StartTwiceIsRejected) {
    DiscoveryRunner runner(make("server", "10.0.0.1", {}), backend_);

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));

    ASSERT_TRUE(runner.start());
    EXPECT_FALSE(runner.start());
}

TEST_F(DiscoveryRunnerTest, StopAndFinish) {
    DiscoveryRunner runner(make("server", "10.0.0.1", {}), backend_);
    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    ASSERT_TRUE(runner.start());

    runner.stop();
    EXPECT_EQ(runner.state(), RunnerState::STOPPING);
    EXPECT_FALSE(runner.isRunning());

    runner.stop();
    EXPECT_EQ(runner.state(), RunnerState::STOPPING);

    runner.finish();
    EXPECT_EQ(runner.state(), RunnerState::STOPPED);

    runner.finish();
    EXPECT_EQ(runner.state(), RunnerState::STOPPED);
    EXPECT_STREQ(runnerStateToString(runner.state()), "stopped");
}

TEST_F(DiscoveryRunnerTest, IgnoresDatagramsUnlessRunning) {
    DiscoveryRunner runner(make("client", "10.0.0.2", {Searching{"hello"}}), backend_);
    Announcement server = make("server", "10.0.0.1", {Hosting{"hello", 4112}});

    // Not started: no publish expected (StrictMock)
    deliver(runner, server);
    EXPECT_EQ(runner.stats().packets_received, 0u);

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    ASSERT_TRUE(runner.start());
    runner.stop();

    deliver(runner, server);
    EXPECT_EQ(runner.stats().packets_received, 0u);
}

// =============================================================================
// Protocol
// =============================================================================

TEST_F(DiscoveryRunnerTest, PublishesMatchingHostOnce) {
    DiscoveryRunner runner(make("client", "10.0.0.2", {Searching{"hello"}}), backend_);
    Announcement server = make("server", "10.0.0.1", {Hosting{"hello", 4112}});

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    EXPECT_CALL(backend_, publish(DiscoveryResult{"hello", server.identity, 4112})).Times(1);

    ASSERT_TRUE(runner.start());
    deliver(runner, server);
    deliver(runner, server);

    EXPECT_EQ(runner.stats().packets_received, 2u);
    EXPECT_EQ(runner.stats().results_reported, 1u);
    EXPECT_EQ(runner.endpointState().reportedCount(), 1u);
}

TEST_F(DiscoveryRunnerTest, ReannouncesWhenSearchedFor) {
    Announcement local = make("server", "10.0.0.1", {Hosting{"hello", 4112}});
    DiscoveryRunner runner(local, backend_, std::chrono::milliseconds(60000));

    {
        InSequence seq;
        EXPECT_CALL(backend_, sendAnnouncement(encode(local))).WillOnce(Return(true));
        EXPECT_CALL(backend_, sendAnnouncement(encode(local))).WillOnce(Return(true));
    }

    ASSERT_TRUE(runner.start());

    Announcement client = make("client", "10.0.0.2", {Searching{"hello"}});
    deliver(runner, client);
    // Within the hold-off: no further send
    deliver(runner, client);

    EXPECT_EQ(runner.stats().reannouncements, 1u);
}

TEST_F(DiscoveryRunnerTest, HostOnlyPeerDoesNotTriggerSend) {
    Announcement local = make("a", "10.0.0.1", {Hosting{"hello", 1}});
    DiscoveryRunner runner(local, backend_);

    // Only the initial announcement; StrictMock fails on any further send or publish
    EXPECT_CALL(backend_, sendAnnouncement(encode(local))).WillOnce(Return(true));
    ASSERT_TRUE(runner.start());

    deliver(runner, make("b", "10.0.0.2", {Hosting{"hello", 2}}));

    EXPECT_EQ(runner.stats().packets_received, 1u);
    EXPECT_EQ(runner.stats().reannouncements, 0u);
}

TEST_F(DiscoveryRunnerTest, IgnoresOwnAnnouncement) {
    Announcement local = make("node", "10.0.0.1", {Hosting{"hello", 4112}, Searching{"hello"}});
    DiscoveryRunner runner(local, backend_);

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    ASSERT_TRUE(runner.start());

    deliver(runner, local);

    EXPECT_EQ(runner.stats().self_packets, 1u);
    EXPECT_EQ(runner.stats().results_reported, 0u);
}

TEST_F(DiscoveryRunnerTest, CountsUndecodablePayloads) {
    DiscoveryRunner runner(make("client", "10.0.0.2", {Searching{"hello"}}), backend_);
    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    ASSERT_TRUE(runner.start());

    const std::string garbage = "{\"name\":\"x\"";
    runner.handleDatagram(garbage.data(), garbage.size());
    runner.handleDatagram("", 0);

    EXPECT_EQ(runner.stats().packets_received, 2u);
    EXPECT_EQ(runner.stats().decode_failures, 2u);
}

TEST_F(DiscoveryRunnerTest, FailedReannounceKeepsRunning) {
    Announcement local = make("server", "10.0.0.1", {Hosting{"hello", 4112}});
    DiscoveryRunner runner(local, backend_);

    EXPECT_CALL(backend_, sendAnnouncement(_))
        .WillOnce(Return(true))
        .WillOnce(Return(false));

    ASSERT_TRUE(runner.start());
    deliver(runner, make("client", "10.0.0.2", {Searching{"hello"}}));

    EXPECT_TRUE(runner.isRunning());
    EXPECT_EQ(runner.stats().send_failures, 1u);
    EXPECT_EQ(runner.stats().reannouncements, 0u);
}

TEST_F(DiscoveryRunnerTest, PublishesEachDistinctHost) {
    DiscoveryRunner runner(make("client", "10.0.0.9", {Searching{"hello"}}), backend_);

    EXPECT_CALL(backend_, sendAnnouncement(_)).WillOnce(Return(true));
    EXPECT_CALL(backend_, publish(Field(&DiscoveryResult::kind, "hello"))).Times(2);

    ASSERT_TRUE(runner.start());
    deliver(runner, make("s1", "10.0.0.1", {Hosting{"hello", 4112}}));
    deliver(runner, make("s2", "10.0.0.2", {Hosting{"hello", 4112}}));
}
