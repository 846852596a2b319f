#include "BenchmarkUtils.hpp"
#include <iostream>
#include <chrono>
#include <vector>
#include <future>
#include <iomanip>

double runService(const CounterConfig &baseConfig, size_t numWorkerThreads,
                  int numProducerThreads, int incrementsPerProducer)
{
    CounterConfig config = baseConfig;
    config.numWorkerThreads = numWorkerThreads;

    CounterService service(config);
    service.start();

    auto startTime = std::chrono::high_resolution_clock::now();

    std::vector<std::future<LatencyCollector>> futures;
    for (int i = 0; i < numProducerThreads; i++)
    {
        futures.push_back(std::async(
            std::launch::async,
            enqueueToService,
            std::ref(service),
            CounterKey("counter_" + std::to_string(i % 4)),
            incrementsPerProducer,
            std::optional<uint32_t>()));
    }

    LatencyCollector masterCollector;
    for (auto &future : futures)
    {
        masterCollector.merge(future.get());
    }

    service.drain(std::chrono::minutes(5));
    auto endTime = std::chrono::high_resolution_clock::now();
    service.stop();

    printLatencyStats(calculateLatencyStats(masterCollector));

    std::chrono::duration<double> elapsed = endTime - startTime;
    return static_cast<double>(numProducerThreads) * incrementsPerProducer / elapsed.count();
}

int main()
{
    // system parameters
    CounterConfig baseConfig;
    baseConfig.queueCapacity = 1000000;
    baseConfig.maxExplicitProducers = 16;
    baseConfig.batchSize = 100;
    baseConfig.enqueueTimeout = std::chrono::milliseconds(30000);
    // benchmark parameters
    const int numProducers = 16;
    const int incrementsPerProducer = 100000;
    std::vector<size_t> workerCounts = {1, 2, 4, 8};

    std::vector<double> throughputs;
    for (size_t workers : workerCounts)
    {
        std::cout << "\nRunning benchmark with " << workers << " worker thread(s)..." << std::endl;
        throughputs.push_back(runService(baseConfig, workers, numProducers, incrementsPerProducer));
    }

    std::cout << "\n============== SERVICE THROUGHPUT SUMMARY ==============" << std::endl;
    std::cout << std::left << std::setw(20) << "Worker Threads"
              << std::setw(25) << "Throughput (updates/s)" << std::endl;
    std::cout << "--------------------------------------------------------" << std::endl;
    for (size_t i = 0; i < workerCounts.size(); i++)
    {
        std::cout << std::left << std::setw(20) << workerCounts[i]
                  << std::setw(25) << std::fixed << std::setprecision(2) << throughputs[i] << std::endl;
    }
    std::cout << "========================================================" << std::endl;

    return 0;
}
