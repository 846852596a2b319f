#include "BenchmarkUtils.hpp"

LatencyCollector addToCounter(ShardedCounter &counter, const CounterKey &name,
                              int increments, std::optional<uint32_t> shardCount)
{
    LatencyCollector localCollector;
    // Pre-allocate to avoid reallocations during measurement
    localCollector.reserve(increments);

    for (int i = 0; i < increments; ++i)
    {
        auto startTime = std::chrono::high_resolution_clock::now();

        counter.add(name, 1.0, shardCount);

        auto endTime = std::chrono::high_resolution_clock::now();
        localCollector.addMeasurement(std::chrono::duration_cast<std::chrono::nanoseconds>(endTime - startTime));
    }

    return localCollector;
}

LatencyCollector enqueueToService(CounterService &service, const CounterKey &name,
                                  int increments, std::optional<uint32_t> shardCount)
{
    LatencyCollector localCollector;
    localCollector.reserve(increments);

    auto token = service.createProducerToken();

    for (int i = 0; i < increments; ++i)
    {
        auto startTime = std::chrono::high_resolution_clock::now();

        bool success = service.enqueueAdd(name, 1.0, token, shardCount);

        auto endTime = std::chrono::high_resolution_clock::now();
        localCollector.addMeasurement(std::chrono::duration_cast<std::chrono::nanoseconds>(endTime - startTime));

        if (!success)
        {
            std::cerr << "Failed to enqueue update for " << name.toString() << std::endl;
        }
    }

    return localCollector;
}

LatencyStats calculateLatencyStats(const LatencyCollector &collector)
{
    const auto &latencies = collector.getMeasurements();

    if (latencies.empty())
    {
        return {0.0, 0.0, 0.0, 0};
    }

    // Convert to milliseconds for easier reading
    std::vector<double> latenciesMs;
    latenciesMs.reserve(latencies.size());
    for (const auto &lat : latencies)
    {
        latenciesMs.push_back(static_cast<double>(lat.count()) / 1e6); // ns to ms
    }

    std::sort(latenciesMs.begin(), latenciesMs.end());

    LatencyStats stats;
    stats.count = latenciesMs.size();
    stats.maxMs = latenciesMs.back();
    stats.avgMs = std::accumulate(latenciesMs.begin(), latenciesMs.end(), 0.0) / latenciesMs.size();

    size_t medianIdx = latenciesMs.size() / 2;
    if (latenciesMs.size() % 2 == 0)
    {
        stats.medianMs = (latenciesMs[medianIdx - 1] + latenciesMs[medianIdx]) / 2.0;
    }
    else
    {
        stats.medianMs = latenciesMs[medianIdx];
    }

    return stats;
}

void printLatencyStats(const LatencyStats &stats)
{
    std::cout << "============== Latency Statistics ==============" << std::endl;
    std::cout << "Total add operations: " << stats.count << std::endl;
    std::cout << "Max latency: " << stats.maxMs << " ms" << std::endl;
    std::cout << "Average latency: " << stats.avgMs << " ms" << std::endl;
    std::cout << "Median latency: " << stats.medianMs << " ms" << std::endl;
    std::cout << "===============================================" << std::endl;
}
