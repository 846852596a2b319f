#include "CounterService.hpp"
#include "ShardedCounter.hpp"
#include "MemoryShardStore.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>

int main()
{
    // system parameters
    CounterConfig config;
    config.counter.defaultShardCount = 16;
    config.counter.shardCounts[CounterKey("beans")] = 10;
    config.counter.shardCounts[CounterKey("users")] = 3;
    config.counter.defaultReadFromShards = 4;
    config.queueCapacity = 1000;
    config.maxExplicitProducers = 4;
    config.batchSize = 10;
    config.numWorkerThreads = 2;
    config.enqueueTimeout = std::chrono::seconds(5);
    config.snapshotEnabled = true;
    config.basePath = "./snapshots";
    config.baseFilename = "counters";
    config.compressionLevel = 4;

    if (std::filesystem::exists(config.basePath))
    {
        std::filesystem::remove_all(config.basePath);
    }

    // Direct use of the counter
    auto store = std::make_shared<MemoryShardStore>();
    ShardedCounter counter(store, nullptr, config.counter);

    counter.add("beans", 10);
    counter.add("beans", -5);
    std::cout << "beans: " << counter.count("beans") << std::endl;

    auto friends = counter.forKey(CounterKey({"friends", int64_t(42)}));
    friends.inc();
    friends.inc();
    friends.dec();
    std::cout << friends.name().toString() << ": " << friends.count() << std::endl;

    for (int i = 0; i < 1000; ++i)
    {
        counter.add("visits");
    }
    std::cout << "visits estimate: " << counter.estimateCount("visits")
              << " exact: " << counter.count("visits") << std::endl;

    counter.rebalance("visits", 4);
    std::cout << "visits after rebalance to 4 shards: " << counter.count("visits")
              << " (" << store->scanShardsByName("visits").size() << " shards)" << std::endl;

    counter.reset("beans");
    std::cout << "beans after reset: " << counter.count("beans") << std::endl;

    // Asynchronous updates through the service
    CounterService service(config);
    service.start();

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p)
    {
        producers.emplace_back([&service]()
                               {
            auto token = service.createProducerToken();
            for (int i = 0; i < 250; ++i)
            {
                service.enqueueAdd("users", 1.0, token);
            } });
    }
    for (auto &producer : producers)
    {
        producer.join();
    }

    service.drain();
    std::cout << "users: " << service.counter().count("users") << std::endl;

    service.stop();

    // A fresh service restores the last snapshot
    CounterService restored(config);
    restored.start();
    std::cout << "users after restore: " << restored.counter().count("users") << std::endl;
    restored.stop();

    return 0;
}
