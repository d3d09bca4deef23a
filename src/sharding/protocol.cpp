/**
 * @file protocol.cpp
 * @brief Protocol message helpers
 */

#include "tessera/sharding/protocol.h"
#include <type_traits>

namespace tessera::sharding {

namespace {

template <typename T>
constexpr const char* type_name() {
    if constexpr (std::is_same_v<T, Register>) return "Register";
    else if constexpr (std::is_same_v<T, RegisterProxy>) return "RegisterProxy";
    else if constexpr (std::is_same_v<T, GetShardHome>) return "GetShardHome";
    else if constexpr (std::is_same_v<T, ShardStarted>) return "ShardStarted";
    else if constexpr (std::is_same_v<T, BeginHandOffAck>) return "BeginHandOffAck";
    else if constexpr (std::is_same_v<T, ShardStopped>) return "ShardStopped";
    else if constexpr (std::is_same_v<T, GracefulShutdownReq>) return "GracefulShutdownReq";
    else if constexpr (std::is_same_v<T, ShardSizesReport>) return "ShardSizesReport";
    else if constexpr (std::is_same_v<T, RegisterAck>) return "RegisterAck";
    else if constexpr (std::is_same_v<T, ShardHome>) return "ShardHome";
    else if constexpr (std::is_same_v<T, HostShard>) return "HostShard";
    else if constexpr (std::is_same_v<T, BeginHandOff>) return "BeginHandOff";
    else if constexpr (std::is_same_v<T, HandOff>) return "HandOff";
    else if constexpr (std::is_same_v<T, EntityMessage>) return "EntityMessage";
    else if constexpr (std::is_same_v<T, ShardEnvelope>) return "ShardEnvelope";
    else if constexpr (std::is_same_v<T, SystemControl>) return "SystemControl";
    else if constexpr (std::is_same_v<T, EntityTerminated>) return "EntityTerminated";
    else if constexpr (std::is_same_v<T, UserMessage>) return "UserMessage";
    else if constexpr (std::is_same_v<T, StartEntityAck>) return "StartEntityAck";
    else if constexpr (std::is_same_v<T, RegionUp>) return "RegionUp";
    else if constexpr (std::is_same_v<T, RegionUnreachable>) return "RegionUnreachable";
    else if constexpr (std::is_same_v<T, RegionRemoved>) return "RegionRemoved";
    else return "Unknown";
}

} // anonymous namespace

const char* message_type_name(const ClusterMessage& message) {
    return std::visit([](const auto& msg) {
        return type_name<std::decay_t<decltype(msg)>>();
    }, message);
}

} // namespace tessera::sharding
