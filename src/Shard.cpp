#include "Shard.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>

void Shard::serializeInto(std::vector<uint8_t> &out) const
{
    name.serializeInto(out);

    size_t offset = out.size();
    out.resize(offset + sizeof(shardIndex) + sizeof(value));
    std::memcpy(out.data() + offset, &shardIndex, sizeof(shardIndex));
    std::memcpy(out.data() + offset + sizeof(shardIndex), &value, sizeof(value));
}

bool Shard::deserialize(const std::vector<uint8_t> &data, size_t &offset)
{
    size_t cursor = offset;
    CounterKey key;
    if (!key.deserialize(data, cursor))
    {
        return false;
    }

    if (cursor + sizeof(shardIndex) + sizeof(value) > data.size())
    {
        return false;
    }

    std::memcpy(&shardIndex, data.data() + cursor, sizeof(shardIndex));
    cursor += sizeof(shardIndex);
    std::memcpy(&value, data.data() + cursor, sizeof(value));
    cursor += sizeof(value);

    name = std::move(key);
    offset = cursor;
    return true;
}

std::vector<uint8_t> Shard::serializeBatch(const std::vector<Shard> &shards)
{
    // [4 bytes] number of shards, followed by the shard records back to back
    std::vector<uint8_t> batchData;
    uint32_t numShards = static_cast<uint32_t>(shards.size());
    batchData.resize(sizeof(numShards));
    std::memcpy(batchData.data(), &numShards, sizeof(numShards));

    for (const auto &shard : shards)
    {
        shard.serializeInto(batchData);
    }

    return batchData;
}

std::vector<Shard> Shard::deserializeBatch(std::vector<uint8_t> &&batchData)
{
    std::vector<Shard> shards;
    if (batchData.size() < sizeof(uint32_t))
    {
        throw std::runtime_error("Shard batch too small");
    }

    uint32_t numShards = 0;
    std::memcpy(&numShards, batchData.data(), sizeof(numShards));
    size_t offset = sizeof(numShards);

    shards.reserve(std::min<size_t>(numShards, batchData.size() - offset));
    for (uint32_t i = 0; i < numShards; ++i)
    {
        Shard shard;
        if (!shard.deserialize(batchData, offset))
        {
            throw std::runtime_error("Failed to deserialize shard " + std::to_string(i));
        }
        shards.push_back(std::move(shard));
    }

    return shards;
}
