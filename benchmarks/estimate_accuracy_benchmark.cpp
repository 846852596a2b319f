#include "BenchmarkUtils.hpp"
#include "MemoryShardStore.hpp"
#include <iostream>
#include <vector>
#include <cmath>
#include <iomanip>

// Mean and worst relative error of estimateCount() for each sample size,
// over a counter filled by random single-unit writes.
int main()
{
    // benchmark parameters
    const uint32_t shardCount = 32;
    const int increments = 100000;
    const int trials = 2000;
    std::vector<uint32_t> sampleSizes = {1, 2, 4, 8, 16, 32};

    auto store = std::make_shared<MemoryShardStore>();
    auto random = std::make_shared<SeededRandomSource>(20240601);
    ShardedCounter counter(store, random);
    const CounterKey name("page_views");

    for (int i = 0; i < increments; ++i)
    {
        counter.add(name, 1.0, shardCount);
    }
    const double exact = counter.count(name);

    std::cout << "\n================ ESTIMATE ACCURACY SUMMARY ================" << std::endl;
    std::cout << "Shards: " << shardCount << ", exact count: " << exact << std::endl;
    std::cout << std::left << std::setw(20) << "Shards read"
              << std::setw(20) << "Mean error (%)"
              << std::setw(20) << "Max error (%)" << std::endl;
    std::cout << "-----------------------------------------------------------" << std::endl;

    for (uint32_t k : sampleSizes)
    {
        double errorSum = 0.0;
        double errorMax = 0.0;
        for (int t = 0; t < trials; ++t)
        {
            double error = std::fabs(counter.estimateCount(name, shardCount, k) - exact) / exact;
            errorSum += error;
            errorMax = std::max(errorMax, error);
        }

        std::cout << std::left << std::setw(20) << k
                  << std::setw(20) << std::fixed << std::setprecision(3) << 100.0 * errorSum / trials
                  << std::setw(20) << std::fixed << std::setprecision(3) << 100.0 * errorMax << std::endl;
    }
    std::cout << "===========================================================" << std::endl;

    // Same counter after a rebalance: every sample size is exact
    counter.rebalance(name, shardCount);
    std::cout << "After rebalance, estimate with 1 shard: " << counter.estimateCount(name, shardCount, 1)
              << std::endl;

    return 0;
}
