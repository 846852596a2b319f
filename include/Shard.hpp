#ifndef SHARD_HPP
#define SHARD_HPP

#include "CounterKey.hpp"
#include <vector>
#include <cstdint>
#include <utility>

// Primary key of a shard record
struct ShardId
{
    CounterKey name;
    uint32_t shardIndex = 0;

    bool operator==(const ShardId &other) const
    {
        return shardIndex == other.shardIndex && name == other.name;
    }
    bool operator<(const ShardId &other) const
    {
        if (name != other.name)
            return name < other.name;
        return shardIndex < other.shardIndex;
    }
};

/**
 * @brief One physical partition of a logical counter
 *
 * The logical counter value for a name is the sum of `value` over all of its
 * shards.
 */
struct Shard
{
    CounterKey name;
    uint32_t shardIndex = 0;
    double value = 0.0;

    Shard() = default;
    Shard(CounterKey shardName, uint32_t index, double shardValue)
        : name(std::move(shardName)), shardIndex(index), value(shardValue) {}

    ShardId id() const { return ShardId{name, shardIndex}; }

    void serializeInto(std::vector<uint8_t> &out) const;
    bool deserialize(const std::vector<uint8_t> &data, size_t &offset);

    static std::vector<uint8_t> serializeBatch(const std::vector<Shard> &shards);
    static std::vector<Shard> deserializeBatch(std::vector<uint8_t> &&batchData);
};

#endif
