/**
 * @file shard_region_tests.cpp
 * @brief Unit tests for region routing against a scripted coordinator
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "sharding/sharding_test_kit.h"

using namespace tessera;
using namespace tessera::sharding;
using namespace tessera::sharding::test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockRememberStore : public IRememberEntitiesStore {
public:
    MOCK_METHOD(ShardingResult, load, (const ShardKey& shard, std::set<EntityKey>& entities), (const, override));
    MOCK_METHOD(ShardingResult, add, (const ShardKey& shard, const EntityKey& entity), (override));
    MOCK_METHOD(ShardingResult, remove, (const ShardKey& shard, const EntityKey& entity), (override));
};

} // anonymous namespace

class ShardRegionTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = test_settings();
        settings_.coordinator_address = "coordinator";
        clock_ = std::make_shared<core::ManualClock>();
        transport_ = std::make_shared<LocalTransport>();
        transport_->register_endpoint("coordinator", &coordinator_);
        transport_->register_endpoint("r2", &r2_);
        transport_->register_endpoint("client", &client_);
    }

    void TearDown() override {
        transport_->unregister_endpoint("r1");
    }

    ShardRegion& make_region(bool proxy = false, std::shared_ptr<IRememberEntitiesStore> store = nullptr) {
        ShardRegionOptions options;
        options.address = "r1";
        options.proxy = proxy;
        options.handoff_stop_message = std::string("handoff-stop");
        options.extractor = extractor_ ? extractor_ : make_test_extractor();
        options.remember_store = std::move(store);
        options.clock = clock_;
        if (!proxy) {
            host_ = std::make_shared<RecordingEntityHost>("r1", transport_);
            options.entity_host = host_;
        }
        region_ = std::make_unique<ShardRegion>(settings_, std::move(options), transport_);
        region_->set_dead_letter_callback([this](const DeadLetter& letter) {
            dead_letters_.push_back(letter);
        });
        transport_->register_endpoint("r1", region_.get());
        return *region_;
    }

    void start_registered(bool proxy = false, std::shared_ptr<IRememberEntitiesStore> store = nullptr) {
        make_region(proxy, std::move(store));
        ASSERT_EQ(region_->start(), ShardingResult::Success);
        pump();
        from_coordinator(RegisterAck{"coordinator"});
        ASSERT_EQ(region_->get_state(), RegionState::Active);
    }

    void from_coordinator(ClusterMessage message) {
        transport_->send("coordinator", "r1", std::move(message));
        pump();
    }

    void tell(const EntityKey& entity, const std::string& text) {
        region_->tell(TestMessage{entity, text}, "client");
        pump();
    }

    /// Answer the most recent GetShardHome
    void answer_home(const RegionId& owner) {
        auto requests = coordinator_.received<GetShardHome>();
        ASSERT_FALSE(requests.empty());
        const auto& last = requests.back();
        from_coordinator(ShardHome{last.shard, owner, last.correlation});
    }

    /// Host shard "1" with entity "1-a"
    void host_shard_one() {
        start_registered();
        tell("1-a", "hello");
        answer_home("r1");
        ASSERT_EQ(region_->get_shard_state("1"), ShardState::Running);
    }

    void pump() { transport_->run_until_idle(); }

    void tick(Duration delta) {
        clock_->advance(delta);
        region_->update();
        pump();
    }

    config::ShardingSettings settings_;
    std::shared_ptr<core::ManualClock> clock_;
    std::shared_ptr<LocalTransport> transport_;
    std::shared_ptr<RecordingEntityHost> host_;
    std::shared_ptr<IMessageExtractor> extractor_;
    std::unique_ptr<ShardRegion> region_;
    ClientProbe coordinator_;
    ClientProbe r2_;
    ClientProbe client_;
    std::vector<DeadLetter> dead_letters_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ShardRegionTest, RegistersOnStart) {
    make_region();
    EXPECT_EQ(region_->get_state(), RegionState::Idle);
    EXPECT_EQ(region_->graceful_shutdown(), ShardingResult::NotInitialized);

    ASSERT_EQ(region_->start(), ShardingResult::Success);
    pump();
    EXPECT_EQ(region_->get_state(), RegionState::Registering);
    EXPECT_EQ(coordinator_.received<Register>().size(), 1u);
    EXPECT_EQ(region_->start(), ShardingResult::AlreadyInitialized);
}

TEST_F(ShardRegionTest, RegistrationRetried) {
    make_region();
    region_->start();
    pump();

    tick(settings_.retry_interval);
    EXPECT_EQ(coordinator_.received<Register>().size(), 2u);

    from_coordinator(RegisterAck{"coordinator"});
    tick(settings_.retry_interval);
    EXPECT_EQ(coordinator_.received<Register>().size(), 2u);
}

TEST_F(ShardRegionTest, IncompleteOptionsRejected) {
    ShardRegionOptions options;
    options.address = "r1";
    ShardRegion region(settings_, std::move(options), transport_);
    EXPECT_EQ(region.start(), ShardingResult::InvalidConfiguration);
}

TEST_F(ShardRegionTest, BuffersUntilRegistered) {
    make_region();
    region_->start();
    tell("1-a", "early");

    EXPECT_TRUE(coordinator_.received<GetShardHome>().empty());
    EXPECT_EQ(region_->get_stats().buffered_messages, 1u);

    from_coordinator(RegisterAck{"coordinator"});
    auto requests = coordinator_.received<GetShardHome>();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests.front().shard, "1");
    EXPECT_EQ(requests.front().requester, "r1");
}

// ============================================================================
// Routing
// ============================================================================

TEST_F(ShardRegionTest, OneRequestPerShard) {
    start_registered();
    tell("1-a", "x");
    tell("1-b", "y");
    tell("2-c", "z");

    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);
    EXPECT_TRUE(region_->is_resolving("1"));
    EXPECT_TRUE(region_->is_resolving("2"));
}

TEST_F(ShardRegionTest, HostsShardWhenHomeIsSelf) {
    start_registered();
    tell("1-a", "x");
    tell("1-a", "y");
    answer_home("r1");

    EXPECT_EQ(region_->get_hosted_shards(), (std::vector<ShardKey>{"1"}));
    ASSERT_EQ(coordinator_.received<ShardStarted>().size(), 1u);
    EXPECT_EQ(host_->texts_for("1-a"), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(region_->get_cached_location("1"), RegionId("r1"));

    tell("1-a", "z");
    EXPECT_EQ(host_->texts_for("1-a").size(), 3u);
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 1u);
    EXPECT_EQ(region_->get_stats().delivered_local, 3u);
}

TEST_F(ShardRegionTest, ForwardsToRemoteOwner) {
    start_registered();
    tell("1-a", "x");
    answer_home("r2");
    tell("1-a", "y");

    auto forwarded = r2_.received<ShardEnvelope>();
    ASSERT_EQ(forwarded.size(), 2u);
    EXPECT_EQ(forwarded[0].entity_key, "1-a");
    EXPECT_EQ(text_of(forwarded[0].payload), "x");
    EXPECT_EQ(text_of(forwarded[1].payload), "y");
    EXPECT_EQ(forwarded[0].sender, "client");
    EXPECT_EQ(region_->get_stats().forwarded, 2u);
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 1u);
}

TEST_F(ShardRegionTest, ExtractorRunsOncePerMessage) {
    int entity_calls = 0;
    auto base = make_test_extractor();
    extractor_ = std::make_shared<FunctionMessageExtractor>(
        [&entity_calls, base](const Payload& payload) {
            ++entity_calls;
            return base->extract_entity(payload);
        },
        [base](const Payload& payload) { return base->shard_key(payload); });
    start_registered();

    EXPECT_EQ(region_->tell(TestMessage{"1-a", "x"}, "client"), ShardingResult::Success);
    EXPECT_EQ(entity_calls, 1);
    EXPECT_EQ(region_->tell(Payload{5}), ShardingResult::UnknownPartition);
    EXPECT_EQ(entity_calls, 2);
}

TEST_F(ShardRegionTest, UnpartitionableMessageIsDeadLetter) {
    start_registered();
    EXPECT_EQ(region_->tell(TestMessage{"", "x"}), ShardingResult::UnknownPartition);
    EXPECT_EQ(region_->tell(Payload{5}), ShardingResult::UnknownPartition);

    ASSERT_EQ(dead_letters_.size(), 2u);
    EXPECT_EQ(dead_letters_.front().reason, ShardingResult::UnknownPartition);
    EXPECT_TRUE(coordinator_.received<GetShardHome>().empty());
}

TEST_F(ShardRegionTest, BufferOverflowIsDeadLetter) {
    settings_.buffer_size = 2;
    start_registered();
    tell("1-a", "one");
    tell("1-a", "two");
    tell("1-a", "three");

    ASSERT_EQ(dead_letters_.size(), 1u);
    EXPECT_EQ(dead_letters_.front().reason, ShardingResult::BufferOverflow);
    EXPECT_EQ(text_of(dead_letters_.front().payload), "three");
}

TEST_F(ShardRegionTest, UnreachableOwnerEventuallyDeadLetters) {
    start_registered();
    tell("1-a", "x");
    answer_home("r2");
    ASSERT_EQ(r2_.received<ShardEnvelope>().size(), 1u);

    transport_->set_reachable("r2", false);
    tell("1-a", "y");
    EXPECT_FALSE(region_->get_cached_location("1").has_value());
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);
    EXPECT_TRUE(dead_letters_.empty());

    answer_home("r2");
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 3u);
    EXPECT_TRUE(dead_letters_.empty());

    answer_home("r2");
    ASSERT_EQ(dead_letters_.size(), 1u);
    EXPECT_EQ(dead_letters_.front().reason, ShardingResult::DeliveryFailed);
    EXPECT_EQ(text_of(dead_letters_.front().payload), "y");
}

TEST_F(ShardRegionTest, GetShardHomeRetried) {
    start_registered();
    tell("1-a", "x");

    tick(std::chrono::milliseconds(100));
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 1u);

    tick(settings_.retry_interval);
    auto requests = coordinator_.received<GetShardHome>();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].correlation, requests[1].correlation);
}

TEST_F(ShardRegionTest, LateAnswerToEarlierRequestAccepted) {
    start_registered();
    tell("1-a", "x");
    tick(settings_.retry_interval);

    auto requests = coordinator_.received<GetShardHome>();
    ASSERT_EQ(requests.size(), 2u);
    from_coordinator(ShardHome{"1", "r2", requests.front().correlation});
    EXPECT_EQ(r2_.received<ShardEnvelope>().size(), 1u);
}

// ============================================================================
// Coordinator Commands
// ============================================================================

TEST_F(ShardRegionTest, BeginHandOffDropsCacheAndAcks) {
    start_registered();
    tell("1-a", "x");
    answer_home("r2");

    from_coordinator(BeginHandOff{"1"});
    EXPECT_FALSE(region_->get_cached_location("1").has_value());
    auto acks = coordinator_.received<BeginHandOffAck>();
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks.front().shard, "1");
    EXPECT_EQ(acks.front().region, "r1");

    tell("1-a", "y");
    EXPECT_EQ(r2_.received<ShardEnvelope>().size(), 1u);
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);
}

TEST_F(ShardRegionTest, HandOffWithoutLocalShard) {
    start_registered();
    from_coordinator(HandOff{"5"});

    auto stopped = coordinator_.received<ShardStopped>();
    ASSERT_EQ(stopped.size(), 1u);
    EXPECT_EQ(stopped.front().shard, "5");
}

TEST_F(ShardRegionTest, HandOffStopsLocalShard) {
    host_shard_one();
    host_->defer_stops = true;

    from_coordinator(HandOff{"1"});
    EXPECT_EQ(region_->get_shard_state("1"), ShardState::HandingOff);
    EXPECT_EQ(host_->stop_messages, (std::vector<std::string>{"handoff-stop"}));
    EXPECT_TRUE(coordinator_.received<ShardStopped>().empty());

    // Held locally while the old incarnation stops
    tell("1-a", "during");
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 1u);

    host_->complete_stops();
    pump();
    EXPECT_TRUE(region_->get_hosted_shards().empty());
    EXPECT_EQ(coordinator_.received<ShardStopped>().size(), 1u);
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);

    answer_home("r2");
    auto forwarded = r2_.received<ShardEnvelope>();
    ASSERT_EQ(forwarded.size(), 1u);
    EXPECT_EQ(text_of(forwarded.front().payload), "during");
}

TEST_F(ShardRegionTest, BeginHandOffOnHostedShardReResolves) {
    host_shard_one();
    from_coordinator(BeginHandOff{"1"});

    // HandOff may never come if the coordinator restarts now
    tell("1-a", "after");
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);

    answer_home("r1");
    EXPECT_EQ(host_->texts_for("1-a"), (std::vector<std::string>{"hello", "after"}));
    EXPECT_EQ(region_->get_cached_location("1"), RegionId("r1"));
}

TEST_F(ShardRegionTest, BeginHandOffThenHomeElsewhereMovesMessages) {
    host_shard_one();
    from_coordinator(BeginHandOff{"1"});
    tell("1-a", "after");

    answer_home("r2");
    EXPECT_TRUE(region_->get_hosted_shards().empty());
    EXPECT_EQ(coordinator_.received<ShardStopped>().size(), 1u);
    auto forwarded = r2_.received<ShardEnvelope>();
    ASSERT_EQ(forwarded.size(), 1u);
    EXPECT_EQ(text_of(forwarded.front().payload), "after");
}

TEST_F(ShardRegionTest, ShardHomeWithUnknownCorrelationIgnored) {
    start_registered();
    tell("1-a", "x");
    auto requests = coordinator_.received<GetShardHome>();
    ASSERT_EQ(requests.size(), 1u);

    from_coordinator(ShardHome{"1", "r2", requests.front().correlation + 1000});
    EXPECT_TRUE(r2_.received<ShardEnvelope>().empty());
    EXPECT_FALSE(region_->get_cached_location("1").has_value());

    answer_home("r2");
    EXPECT_EQ(r2_.received<ShardEnvelope>().size(), 1u);
}

TEST_F(ShardRegionTest, HostShardStartsShard) {
    start_registered();
    from_coordinator(HostShard{"4"});
    EXPECT_EQ(region_->get_hosted_shards(), (std::vector<ShardKey>{"4"}));
    EXPECT_EQ(coordinator_.received<ShardStarted>().size(), 1u);

    from_coordinator(HostShard{"4"});
    EXPECT_EQ(coordinator_.received<ShardStarted>().size(), 2u);
    EXPECT_EQ(region_->get_hosted_shards().size(), 1u);
}

TEST_F(ShardRegionTest, HomeElsewhereHandsOffLocalCopy) {
    host_shard_one();
    from_coordinator(ShardHome{"1", "r2", INVALID_CORRELATION_ID});

    EXPECT_TRUE(region_->get_hosted_shards().empty());
    EXPECT_EQ(region_->get_cached_location("1"), RegionId("r2"));
    EXPECT_EQ(coordinator_.received<ShardStopped>().size(), 1u);
}

TEST_F(ShardRegionTest, ShardStartFailureRetriedAfterBackoff) {
    auto store = std::make_shared<NiceMock<MockRememberStore>>();
    ON_CALL(*store, add(_, _)).WillByDefault(Return(ShardingResult::Success));
    EXPECT_CALL(*store, load("1", _))
        .WillOnce(Return(ShardingResult::StorageError))
        .WillOnce(Return(ShardingResult::Success));

    start_registered(false, store);
    tell("1-a", "x");
    answer_home("r1");
    EXPECT_TRUE(region_->get_hosted_shards().empty());
    EXPECT_TRUE(coordinator_.received<ShardStarted>().empty());

    tell("1-a", "y");
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 1u);

    tick(settings_.shard_failure_backoff);
    EXPECT_EQ(coordinator_.received<GetShardHome>().size(), 2u);

    answer_home("r1");
    EXPECT_EQ(region_->get_hosted_shards().size(), 1u);
    EXPECT_EQ(host_->texts_for("1-a"), (std::vector<std::string>{"x", "y"}));
}

// ============================================================================
// Entities
// ============================================================================

TEST_F(ShardRegionTest, StartEntityAcknowledged) {
    start_registered();
    EXPECT_EQ(region_->start_entity("", "client"), ShardingResult::InvalidEntityKey);

    ASSERT_EQ(region_->start_entity("3-x", "client"), ShardingResult::Success);
    pump();
    answer_home("r1");

    auto acks = client_.received<StartEntityAck>();
    ASSERT_EQ(acks.size(), 1u);
    EXPECT_EQ(acks.front().entity_key, "3-x");
    EXPECT_EQ(acks.front().shard_key, "3");
    EXPECT_TRUE(host_->is_running("3", "3-x"));
}

TEST_F(ShardRegionTest, PassivationRequestFromEntity) {
    host_shard_one();

    SystemControl control;
    control.kind = ControlKind::Passivate;
    control.shard_key = "1";
    control.entity_key = "1-a";
    control.stop_message = std::string("bye");
    transport_->send("r1", "r1", control);
    pump();

    EXPECT_EQ(host_->stop_messages, (std::vector<std::string>{"bye"}));
    EXPECT_TRUE(region_->get_shard_entities("1").empty());
    EXPECT_EQ(region_->get_shard_state("1"), ShardState::Running);
}

// ============================================================================
// Membership / Reports
// ============================================================================

TEST_F(ShardRegionTest, RegionRemovedInvalidatesCache) {
    start_registered();
    tell("1-a", "x");
    answer_home("r2");
    ASSERT_TRUE(region_->get_cached_location("1").has_value());

    transport_->send("membership", "r1", RegionRemoved{"r2"});
    pump();
    EXPECT_FALSE(region_->get_cached_location("1").has_value());
}

TEST_F(ShardRegionTest, ReportsShardSizes) {
    settings_.stats_report_interval = std::chrono::seconds(1);
    host_shard_one();
    tell("1-b", "x");

    tick(std::chrono::seconds(1));
    auto reports = coordinator_.received<ShardSizesReport>();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports.front().region, "r1");
    EXPECT_EQ(reports.front().sizes.at("1"), 2u);
}

TEST_F(ShardRegionTest, ProxyNeverHosts) {
    make_region(true);
    region_->start();
    pump();
    EXPECT_EQ(coordinator_.received<RegisterProxy>().size(), 1u);
    EXPECT_TRUE(coordinator_.received<Register>().empty());

    from_coordinator(RegisterAck{"coordinator"});
    tell("1-a", "x");
    answer_home("r1");
    EXPECT_TRUE(region_->get_hosted_shards().empty());

    from_coordinator(HostShard{"1"});
    EXPECT_TRUE(region_->get_hosted_shards().empty());

    answer_home("r2");
    EXPECT_EQ(r2_.received<ShardEnvelope>().size(), 1u);
}

// ============================================================================
// Graceful Shutdown
// ============================================================================

TEST_F(ShardRegionTest, ShutdownWithoutShardsStopsImmediately) {
    start_registered();
    ASSERT_EQ(region_->graceful_shutdown(), ShardingResult::Success);
    pump();
    EXPECT_EQ(coordinator_.received<GracefulShutdownReq>().size(), 1u);
    EXPECT_EQ(region_->get_state(), RegionState::Stopped);
}

TEST_F(ShardRegionTest, ShutdownWaitsForHandoff) {
    host_shard_one();
    ASSERT_EQ(region_->graceful_shutdown(), ShardingResult::Success);
    pump();
    EXPECT_EQ(region_->get_state(), RegionState::ShuttingDown);

    tick(settings_.retry_interval);
    EXPECT_EQ(coordinator_.received<GracefulShutdownReq>().size(), 2u);

    from_coordinator(BeginHandOff{"1"});
    from_coordinator(HandOff{"1"});
    EXPECT_EQ(region_->get_state(), RegionState::Stopped);
    EXPECT_EQ(coordinator_.received<ShardStopped>().size(), 1u);

    // A stopped region still routes
    tell("1-a", "after");
    answer_home("r2");
    EXPECT_EQ(r2_.received<ShardEnvelope>().size(), 1u);
}
