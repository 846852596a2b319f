#ifndef UPDATE_QUEUE_HPP
#define UPDATE_QUEUE_HPP

#include "PendingUpdate.hpp"
#include "concurrentqueue.h"
#include <vector>
#include <chrono>

// Lock-free multi-producer queue of pending counter updates
class UpdateQueue
{
public:
    using ProducerToken = moodycamel::ProducerToken;
    using ConsumerToken = moodycamel::ConsumerToken;

private:
    moodycamel::ConcurrentQueue<PendingUpdate> m_queue;

public:
    explicit UpdateQueue(size_t capacity, size_t maxExplicitProducers);

    ProducerToken createProducerToken() { return ProducerToken(m_queue); }
    ConsumerToken createConsumerToken() { return ConsumerToken(m_queue); }

    // Retries with exponential backoff (1ms doubling, capped at 100ms) until
    // the item fits or the timeout expires.
    bool enqueueBlocking(PendingUpdate item,
                         ProducerToken &token,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    bool enqueueBatchBlocking(std::vector<PendingUpdate> items,
                              ProducerToken &token,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    bool tryDequeue(PendingUpdate &item, ConsumerToken &token);
    size_t tryDequeueBatch(std::vector<PendingUpdate> &items, size_t maxItems, ConsumerToken &token);
    size_t size() const;

    // delete copy/move
    UpdateQueue(const UpdateQueue &) = delete;
    UpdateQueue &operator=(const UpdateQueue &) = delete;
    UpdateQueue(UpdateQueue &&) = delete;
    UpdateQueue &operator=(UpdateQueue &&) = delete;

private:
    template <typename TryFn>
    bool retryUntil(TryFn &&tryOnce, std::chrono::milliseconds timeout);
};

#endif
