#ifndef BENCHMARK_UTILS_HPP
#define BENCHMARK_UTILS_HPP

#include "ShardedCounter.hpp"
#include "CounterService.hpp"
#include <vector>
#include <string>
#include <iostream>
#include <chrono>
#include <algorithm>
#include <numeric>

class LatencyCollector
{
private:
    std::vector<std::chrono::nanoseconds> latencies;

public:
    void addMeasurement(std::chrono::nanoseconds latency)
    {
        latencies.push_back(latency);
    }

    void reserve(size_t capacity)
    {
        latencies.reserve(capacity);
    }

    const std::vector<std::chrono::nanoseconds> &getMeasurements() const
    {
        return latencies;
    }

    // Merge another collector's measurements into this one
    void merge(const LatencyCollector &other)
    {
        const auto &otherLatencies = other.getMeasurements();
        latencies.insert(latencies.end(), otherLatencies.begin(), otherLatencies.end());
    }
};

struct LatencyStats
{
    double maxMs;
    double avgMs;
    double medianMs;
    size_t count;
};

LatencyStats calculateLatencyStats(const LatencyCollector &collector);

// Applies `increments` adds of 1 to name, timing each call.
LatencyCollector addToCounter(ShardedCounter &counter, const CounterKey &name,
                              int increments, std::optional<uint32_t> shardCount);

// Same workload through the service queue.
LatencyCollector enqueueToService(CounterService &service, const CounterKey &name,
                                  int increments, std::optional<uint32_t> shardCount);

void printLatencyStats(const LatencyStats &stats);

#endif
