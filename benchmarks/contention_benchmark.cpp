#include "BenchmarkUtils.hpp"
#include "MemoryShardStore.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <future>
#include <iomanip>

struct ContentionResult
{
    double throughput;
    double seconds;
    LatencyStats latency;
};

ContentionResult runContention(uint32_t shardCount, int numProducerThreads, int incrementsPerProducer)
{
    auto store = std::make_shared<MemoryShardStore>();
    ShardedCounter counter(store);
    const CounterKey name("hot_counter");

    auto startTime = std::chrono::high_resolution_clock::now();

    // Every producer hammers the same counter name
    std::vector<std::future<LatencyCollector>> futures;
    for (int i = 0; i < numProducerThreads; i++)
    {
        futures.push_back(std::async(
            std::launch::async,
            addToCounter,
            std::ref(counter),
            std::cref(name),
            incrementsPerProducer,
            std::optional<uint32_t>(shardCount)));
    }

    LatencyCollector masterCollector;
    for (auto &future : futures)
    {
        masterCollector.merge(future.get());
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = endTime - startTime;

    const double expected = static_cast<double>(numProducerThreads) * incrementsPerProducer;
    double total = counter.count(name);
    if (total != expected)
    {
        std::cerr << "Count mismatch: expected " << expected << ", got " << total << std::endl;
    }

    return {expected / elapsed.count(), elapsed.count(), calculateLatencyStats(masterCollector)};
}

int main()
{
    // benchmark parameters
    const int numProducers = 16;
    const int incrementsPerProducer = 200000;
    std::vector<uint32_t> shardCounts = {1, 2, 4, 8, 16, 32, 64};

    std::vector<ContentionResult> results;
    for (uint32_t shardCount : shardCounts)
    {
        std::cout << "\nRunning benchmark with " << shardCount << " shard(s)..." << std::endl;
        results.push_back(runContention(shardCount, numProducers, incrementsPerProducer));
        printLatencyStats(results.back().latency);
    }

    std::cout << "\n=================== CONTENTION BENCHMARK SUMMARY ===================" << std::endl;
    std::cout << std::left << std::setw(15) << "Shards"
              << std::setw(25) << "Throughput (adds/s)"
              << std::setw(20) << "Time (seconds)"
              << std::setw(10) << "Speedup vs. 1 Shard" << std::endl;
    std::cout << "--------------------------------------------------------------------" << std::endl;

    double baselineThroughput = results[0].throughput;
    for (size_t i = 0; i < shardCounts.size(); i++)
    {
        std::cout << std::left << std::setw(15) << shardCounts[i]
                  << std::setw(25) << std::fixed << std::setprecision(2) << results[i].throughput
                  << std::setw(20) << std::fixed << std::setprecision(2) << results[i].seconds
                  << std::setw(10) << std::fixed << std::setprecision(2)
                  << results[i].throughput / baselineThroughput << std::endl;
    }
    std::cout << "====================================================================" << std::endl;

    return 0;
}
