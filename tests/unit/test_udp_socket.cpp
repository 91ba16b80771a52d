/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <mcdisc/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <string>
#include <utility>

using namespace mcdisc::net;

class UdpSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Platform-specific socket init is handled by the UdpSocket constructor
    }
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());

    // Idempotent
    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
    EXPECT_EQ(socket.getLocalAddress(), "127.0.0.1");
}

TEST_F(UdpSocketTest, BindInvalidAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-address"));
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;

    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));
    const uint16_t port = receiver.getLocalPort();
    ASSERT_NE(port, 0);

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", port), message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer) - 1, 1000, from);

    ASSERT_GT(received, 0);
    buffer[received] = '\0';
    EXPECT_STREQ(buffer, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto end = std::chrono::steady_clock::now();

    EXPECT_EQ(received, 0);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(elapsed.count(), 90);  // Allow some tolerance
}

TEST_F(UdpSocketTest, ReceiveOnClosedSocket) {
    UdpSocket socket;
    socket.close();

    char buffer[16];
    SocketAddress from;
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 10, from), -1);
}

TEST_F(UdpSocketTest, MulticastOptions) {
    UdpSocket socket;
    ASSERT_TRUE(socket.setReuseAddress(true));
    EXPECT_TRUE(socket.setMulticastTTL(1));
    EXPECT_TRUE(socket.setMulticastLoopback(true));
    EXPECT_TRUE(socket.setMulticastLoopback(false));
}

TEST_F(UdpSocketTest, JoinRejectsNonMulticastGroup) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0));
    EXPECT_FALSE(socket.joinMulticastGroup("not-a-group"));
}

TEST_F(UdpSocketTest, ConnectReportsRoutedAddress) {
    UdpSocket socket;
    ASSERT_TRUE(socket.connect(SocketAddress("127.0.0.1", 9)));
    EXPECT_EQ(socket.getLocalAddress(), "127.0.0.1");
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket first;
    ASSERT_TRUE(first.isValid());

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());

    UdpSocket third;
    third = std::move(second);
    EXPECT_FALSE(second.isValid());
    EXPECT_TRUE(third.isValid());
}
