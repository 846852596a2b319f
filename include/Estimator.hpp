#ifndef ESTIMATOR_HPP
#define ESTIMATOR_HPP

#include "ShardStore.hpp"
#include "RandomSource.hpp"
#include <memory>
#include <vector>
#include <cstdint>

/**
 * @brief Approximate counter totals from a random sample of shards
 *
 * Reads k distinct shards chosen by a fair shuffle and scales their sum by
 * shardCount / k. The estimate is unbiased when the counter's mass is spread
 * uniformly over its shards (after many random writes, or right after a
 * rebalance). With mass concentrated on few shards it can be far off.
 */
class Estimator
{
public:
    Estimator(const ShardStore &store, std::shared_ptr<RandomSource> random);

    // readFromShards is clamped to [1, shardCount].
    double estimate(const CounterKey &name, uint32_t shardCount, uint32_t readFromShards) const;

    // First k entries of a uniformly random permutation of [0, shardCount),
    // via a partial Fisher-Yates shuffle. Memory is O(k), not O(shardCount).
    std::vector<uint32_t> sampleIndices(uint32_t shardCount, uint32_t k) const;

private:
    const ShardStore &m_store;
    std::shared_ptr<RandomSource> m_random;
};

#endif
