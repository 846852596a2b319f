#ifndef PENDING_UPDATE_HPP
#define PENDING_UPDATE_HPP

#include "CounterKey.hpp"
#include <optional>
#include <cstdint>
#include <utility>

// A delta waiting in the update queue for a worker to apply it
struct PendingUpdate
{
    CounterKey name;
    double delta = 0.0;
    std::optional<uint32_t> shardCount = std::nullopt;
    std::optional<uint32_t> pinnedShard = std::nullopt;

    PendingUpdate() = default;
    PendingUpdate(CounterKey counterName, double value,
                  std::optional<uint32_t> shards = std::nullopt,
                  std::optional<uint32_t> pinned = std::nullopt)
        : name(std::move(counterName)), delta(value), shardCount(shards), pinnedShard(pinned) {}

    PendingUpdate(const PendingUpdate &) = default;
    PendingUpdate(PendingUpdate &&) = default;
    PendingUpdate &operator=(const PendingUpdate &) = default;
    PendingUpdate &operator=(PendingUpdate &&) = default;
};

#endif
