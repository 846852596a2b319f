#ifndef UPDATE_WORKER_HPP
#define UPDATE_WORKER_HPP

#include <thread>
#include <atomic>
#include <memory>
#include <vector>
#include "PendingUpdate.hpp"
#include "UpdateQueue.hpp"
#include "ShardedCounter.hpp"

/**
 * @brief Background thread applying queued updates to a ShardedCounter
 *
 * Each batch is coalesced: updates with the same name, shard count and
 * pinned shard are summed and applied with a single add(). After stop() the
 * worker keeps draining until the queue is empty.
 */
class UpdateWorker
{
public:
    explicit UpdateWorker(UpdateQueue &queue,
                          ShardedCounter &counter,
                          size_t batchSize = 100);

    ~UpdateWorker();

    void start();
    void stop();
    bool isRunning() const;

    // Queue items applied / rejected by the store so far
    size_t appliedUpdates() const { return m_appliedUpdates.load(std::memory_order_acquire); }
    size_t failedUpdates() const { return m_failedUpdates.load(std::memory_order_acquire); }

private:
    void processUpdates();
    void applyBatch(std::vector<PendingUpdate> &batch);

    UpdateQueue &m_queue;
    ShardedCounter &m_counter;
    std::unique_ptr<std::thread> m_workerThread;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_appliedUpdates{0};
    std::atomic<size_t> m_failedUpdates{0};
    const size_t m_batchSize;

    UpdateQueue::ConsumerToken m_consumerToken;
};
#endif
