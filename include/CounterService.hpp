#ifndef COUNTER_SERVICE_HPP
#define COUNTER_SERVICE_HPP

#include "Config.hpp"
#include "MemoryShardStore.hpp"
#include "ShardedCounter.hpp"
#include "UpdateQueue.hpp"
#include "UpdateWorker.hpp"
#include "SnapshotCodec.hpp"
#include "SnapshotStorage.hpp"
#include <memory>
#include <vector>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <chrono>
#include <optional>

class CounterService
{
public:
    explicit CounterService(const CounterConfig &config,
                            std::shared_ptr<RandomSource> random = nullptr);
    ~CounterService();

    bool start();
    bool stop();

    UpdateQueue::ProducerToken createProducerToken();
    bool enqueueAdd(const CounterKey &name,
                    double delta,
                    UpdateQueue::ProducerToken &token,
                    std::optional<uint32_t> shardCount = std::nullopt,
                    std::optional<uint32_t> pinnedShard = std::nullopt);

    // Blocks until every accepted update has been applied or has failed.
    bool drain(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    // Writes the current shard set. Returns the number of shards written.
    size_t snapshotNow();
    void rebalanceAll(std::optional<uint32_t> shardCount = std::nullopt);

    size_t appliedUpdates() const;
    size_t failedUpdates() const;
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    ShardedCounter &counter() { return *m_counter; }
    std::shared_ptr<MemoryShardStore> getStore() const { return m_store; }

private:
    size_t restoreSnapshot();
    // Caller holds m_systemMutex
    size_t sumApplied() const;
    size_t sumFailed() const;

    std::shared_ptr<MemoryShardStore> m_store;            // Owns every shard record
    std::unique_ptr<ShardedCounter> m_counter;            // Sharding engine over m_store
    std::shared_ptr<UpdateQueue> m_queue;                 // Pending asynchronous updates
    std::unique_ptr<SnapshotCodec> m_codec;               // Only set when snapshots are enabled
    std::unique_ptr<SnapshotStorage> m_snapshots;         // Only set when snapshots are enabled
    std::vector<std::unique_ptr<UpdateWorker>> m_workers; // Multiple worker threads
    std::atomic<bool> m_running{false};                   // Service running state
    std::atomic<bool> m_acceptingUpdates{false};          // Controls whether new updates are accepted
    std::atomic<size_t> m_enqueuedUpdates{0};
    std::atomic<size_t> m_retiredApplied{0};              // Totals of workers from earlier runs
    std::atomic<size_t> m_retiredFailed{0};
    std::shared_mutex m_acceptMutex;                      // Enqueuers shared, stop() exclusive
    mutable std::mutex m_systemMutex;                     // For service-wide operations
    std::mutex m_snapshotMutex;

    size_t m_numWorkerThreads;
    size_t m_batchSize;
    std::chrono::milliseconds m_enqueueTimeout;
};

#endif
