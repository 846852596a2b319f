#include "UpdateWorker.hpp"
#include <iostream>
#include <chrono>
#include <map>
#include <tuple>

UpdateWorker::UpdateWorker(UpdateQueue &queue,
                           ShardedCounter &counter,
                           size_t batchSize)
    : m_queue(queue),
      m_counter(counter),
      m_batchSize(batchSize),
      m_consumerToken(queue.createConsumerToken()) {}

UpdateWorker::~UpdateWorker()
{
    stop();
}

void UpdateWorker::start()
{
    if (m_running.exchange(true))
    {
        return;
    }

    m_workerThread.reset(new std::thread(&UpdateWorker::processUpdates, this));
}

void UpdateWorker::stop()
{
    if (m_running.exchange(false))
    {
        if (m_workerThread && m_workerThread->joinable())
        {
            m_workerThread->join();
        }
    }
}

bool UpdateWorker::isRunning() const
{
    return m_running.load();
}

void UpdateWorker::processUpdates()
{
    std::vector<PendingUpdate> batch;

    while (m_running)
    {
        size_t dequeued = m_queue.tryDequeueBatch(batch, m_batchSize, m_consumerToken);
        if (dequeued == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }

        applyBatch(batch);
        batch.clear();
    }

    // Drain whatever is still queued
    while (m_queue.tryDequeueBatch(batch, m_batchSize, m_consumerToken) > 0)
    {
        applyBatch(batch);
        batch.clear();
    }
}

void UpdateWorker::applyBatch(std::vector<PendingUpdate> &batch)
{
    using Target = std::tuple<CounterKey, std::optional<uint32_t>, std::optional<uint32_t>>;

    struct Coalesced
    {
        double delta = 0.0;
        size_t updates = 0;
    };

    std::map<Target, Coalesced> grouped;
    for (auto &update : batch)
    {
        Coalesced &group = grouped[Target(std::move(update.name), update.shardCount, update.pinnedShard)];
        group.delta += update.delta;
        ++group.updates;
    }

    for (const auto &[target, group] : grouped)
    {
        const auto &[name, shardCount, pinnedShard] = target;
        try
        {
            m_counter.add(name, group.delta, shardCount, pinnedShard);
            m_appliedUpdates.fetch_add(group.updates, std::memory_order_acq_rel);
        }
        catch (const std::exception &e)
        {
            std::cerr << "UpdateWorker: Failed to apply " << group.updates << " update(s) to "
                      << name.toString() << ": " << e.what() << std::endl;
            m_failedUpdates.fetch_add(group.updates, std::memory_order_acq_rel);
        }
    }
}
