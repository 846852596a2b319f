#ifndef REBALANCER_HPP
#define REBALANCER_HPP

#include "ShardStore.hpp"
#include "Config.hpp"
#include <vector>
#include <cstdint>

/**
 * @brief Redistributes a counter's total over a new shard count
 *
 * Rebalancing is a sequence of independent single-record writes: it scans
 * the counter, rewrites indices [0, shardCount) and deletes everything at or
 * above shardCount. Writers racing with it may cause drift, in which case
 * rebalancing again converges. A failure part-way leaves the shards
 * partially rewritten.
 */
class Rebalancer
{
public:
    Rebalancer(ShardStore &store, RebalancePolicy policy)
        : m_store(store), m_policy(policy) {}

    void rebalance(const CounterKey &name, uint32_t shardCount) const;

    RebalancePolicy policy() const { return m_policy; }

    /**
     * @brief Per-index target values for a total
     *
     * EVEN yields total / shardCount everywhere. INTEGRAL truncates
     * total / shardCount and hands the remainder (same sign as total) out in
     * steps of one unit to indices 0, 1, 2, ..., the last step being the
     * fractional leftover. Either way the values sum to total and each lies
     * within 1 of total / shardCount.
     */
    static std::vector<double> distribute(double total, uint32_t shardCount, RebalancePolicy policy);

private:
    ShardStore &m_store;
    RebalancePolicy m_policy;
};

#endif
