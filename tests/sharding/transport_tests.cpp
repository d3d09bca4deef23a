/**
 * @file transport_tests.cpp
 * @brief Unit tests for the in-process transport
 */

#include <gtest/gtest.h>
#include "sharding/sharding_test_kit.h"

using namespace tessera;
using namespace tessera::sharding;
using namespace tessera::sharding::test;

class LocalTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_.register_endpoint("a", &a_);
        transport_.register_endpoint("b", &b_);
    }

    LocalTransport transport_;
    ClientProbe a_;
    ClientProbe b_;
};

TEST_F(LocalTransportTest, QueuedUntilDelivered) {
    EXPECT_EQ(transport_.send("a", "b", HostShard{"1"}), ShardingResult::Success);
    EXPECT_EQ(transport_.pending_count(), 1u);
    EXPECT_TRUE(b_.messages.empty());

    EXPECT_EQ(transport_.deliver_pending(), 1u);
    ASSERT_EQ(b_.received<HostShard>().size(), 1u);
    EXPECT_EQ(b_.senders.front(), "a");
}

TEST_F(LocalTransportTest, PreservesOrderPerPair) {
    for (int i = 0; i < 5; ++i) {
        transport_.send("a", "b", HostShard{std::to_string(i)});
    }
    transport_.run_until_idle();

    auto received = b_.received<HostShard>();
    ASSERT_EQ(received.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(received[i].shard, std::to_string(i));
    }
}

TEST_F(LocalTransportTest, UnknownEndpointRefused) {
    EXPECT_EQ(transport_.send("a", "nowhere", HostShard{"1"}), ShardingResult::RegionUnreachable);
    EXPECT_EQ(transport_.pending_count(), 0u);
}

TEST_F(LocalTransportTest, UnreachableBlocksBothDirections) {
    transport_.set_reachable("b", false);
    EXPECT_FALSE(transport_.is_reachable("b"));
    EXPECT_EQ(transport_.send("a", "b", HostShard{"1"}), ShardingResult::RegionUnreachable);
    EXPECT_EQ(transport_.send("b", "a", HostShard{"1"}), ShardingResult::RegionUnreachable);

    transport_.set_reachable("b", true);
    EXPECT_EQ(transport_.send("a", "b", HostShard{"1"}), ShardingResult::Success);
}

TEST_F(LocalTransportTest, QueuedMessagesDroppedWhenPeerBecomesUnreachable) {
    transport_.send("a", "b", HostShard{"1"});
    transport_.send("a", "b", HostShard{"2"});
    transport_.set_reachable("b", false);

    EXPECT_EQ(transport_.run_until_idle(), 0u);
    EXPECT_EQ(transport_.dropped_count(), 2u);
    EXPECT_TRUE(b_.messages.empty());
}

TEST_F(LocalTransportTest, HandlersMaySendDuringDelivery) {
    class Echo : public IMessageHandler {
    public:
        explicit Echo(LocalTransport& transport) : transport_(transport) {}
        void receive(const Address& from, const ClusterMessage&) override {
            transport_.send("echo", from, RegisterAck{"echo"});
        }
    private:
        LocalTransport& transport_;
    };

    Echo echo(transport_);
    transport_.register_endpoint("echo", &echo);
    transport_.send("a", "echo", Register{"a"});

    EXPECT_EQ(transport_.run_until_idle(), 2u);
    EXPECT_EQ(a_.received<RegisterAck>().size(), 1u);
}

TEST_F(LocalTransportTest, TapSeesAcceptedMessages) {
    std::vector<std::string> seen;
    transport_.set_tap([&seen](const Address& from, const Address& to, const ClusterMessage& msg) {
        seen.push_back(from + ">" + to + ":" + message_type_name(msg));
    });

    transport_.send("a", "b", BeginHandOff{"3"});
    transport_.send("a", "missing", BeginHandOff{"3"});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen.front(), "a>b:BeginHandOff");
}

TEST_F(LocalTransportTest, DeliverPendingRespectsLimit) {
    for (int i = 0; i < 4; ++i) {
        transport_.send("a", "b", HostShard{"x"});
    }
    EXPECT_EQ(transport_.deliver_pending(3), 3u);
    EXPECT_EQ(transport_.pending_count(), 1u);
}
