#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "ShardStore.hpp"
#include <vector>

// Exact counter totals. Reads every shard of the name.
class Aggregator
{
public:
    explicit Aggregator(const ShardStore &store) : m_store(store) {}

    double count(const CounterKey &name) const;

    static double sum(const std::vector<Shard> &shards);

private:
    const ShardStore &m_store;
};

#endif
