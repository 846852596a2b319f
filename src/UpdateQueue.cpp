#include "UpdateQueue.hpp"
#include <algorithm>
#include <thread>

UpdateQueue::UpdateQueue(size_t capacity, size_t maxExplicitProducers)
    : m_queue(capacity, maxExplicitProducers, 0)
{
}

template <typename TryFn>
bool UpdateQueue::retryUntil(TryFn &&tryOnce, std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    int backoffMs = 1;
    const int maxBackoffMs = 100;

    while (true)
    {
        if (tryOnce())
        {
            return true;
        }

        int sleepTime = backoffMs;

        // milliseconds::max() waits forever
        if (timeout != std::chrono::milliseconds::max())
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            if (elapsed >= timeout)
            {
                return false;
            }

            // Make sure we don't sleep longer than our remaining timeout
            auto remainingTime = timeout - elapsed;
            if (remainingTime <= std::chrono::milliseconds(sleepTime))
            {
                sleepTime = std::max(1, static_cast<int>(remainingTime.count()));
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(sleepTime));
        backoffMs = std::min(backoffMs * 2, maxBackoffMs);
    }
}

bool UpdateQueue::enqueueBlocking(PendingUpdate item, ProducerToken &token, std::chrono::milliseconds timeout)
{
    return retryUntil([&]()
                      {
        PendingUpdate itemCopy = item;
        return m_queue.try_enqueue(token, std::move(itemCopy)); },
                      timeout);
}

bool UpdateQueue::enqueueBatchBlocking(std::vector<PendingUpdate> items, ProducerToken &token,
                                       std::chrono::milliseconds timeout)
{
    if (items.empty())
    {
        return true;
    }

    return retryUntil([&]()
                      {
        std::vector<PendingUpdate> itemsCopy = items;
        return m_queue.try_enqueue_bulk(token, std::make_move_iterator(itemsCopy.begin()), itemsCopy.size()); },
                      timeout);
}

bool UpdateQueue::tryDequeue(PendingUpdate &item, ConsumerToken &token)
{
    return m_queue.try_dequeue(token, item);
}

size_t UpdateQueue::tryDequeueBatch(std::vector<PendingUpdate> &items, size_t maxItems, ConsumerToken &token)
{
    items.clear();
    items.resize(maxItems);

    size_t dequeued = m_queue.try_dequeue_bulk(token, items.begin(), maxItems);
    items.resize(dequeued);

    return dequeued;
}

size_t UpdateQueue::size() const
{
    return m_queue.size_approx();
}
