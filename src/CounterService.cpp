#include "CounterService.hpp"
#include <iostream>
#include <thread>
#include <filesystem>
#include <stdexcept>

CounterService::CounterService(const CounterConfig &config, std::shared_ptr<RandomSource> random)
    : m_numWorkerThreads(config.numWorkerThreads),
      m_batchSize(config.batchSize),
      m_enqueueTimeout(config.enqueueTimeout)
{
    validateConfig(config);

    m_store = std::make_shared<MemoryShardStore>();
    m_counter = std::make_unique<ShardedCounter>(m_store, std::move(random), config.counter);
    m_queue = std::make_shared<UpdateQueue>(config.queueCapacity, config.maxExplicitProducers);

    if (config.snapshotEnabled)
    {
        if (!std::filesystem::create_directories(config.basePath) &&
            !std::filesystem::exists(config.basePath))
        {
            throw std::runtime_error("Failed to create snapshot directory: " + config.basePath);
        }

        m_codec = std::make_unique<SnapshotCodec>(config.compressionLevel,
                                                  config.useEncryption,
                                                  config.encryptionKey);
        m_snapshots = std::make_unique<SnapshotStorage>(config.basePath,
                                                        config.baseFilename,
                                                        config.maxAttempts,
                                                        config.baseRetryDelay,
                                                        config.retainedSnapshots);
    }

    m_workers.reserve(m_numWorkerThreads);
}

CounterService::~CounterService()
{
    try
    {
        stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "CounterService: Error during shutdown: " << e.what() << std::endl;
    }
}

bool CounterService::start()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (m_running.load(std::memory_order_acquire))
    {
        std::cerr << "CounterService: Already running" << std::endl;
        return false;
    }

    if (m_snapshots && m_store->size() == 0)
    {
        size_t restored = restoreSnapshot();
        std::cout << "CounterService: Restored " << restored << " shards from snapshot" << std::endl;
    }

    for (size_t i = 0; i < m_numWorkerThreads; ++i)
    {
        auto worker = std::make_unique<UpdateWorker>(*m_queue, *m_counter, m_batchSize);
        worker->start();
        m_workers.push_back(std::move(worker));
    }

    m_running.store(true, std::memory_order_release);
    m_acceptingUpdates.store(true, std::memory_order_release);

    std::cout << "CounterService: Started " << m_numWorkerThreads << " worker threads" << std::endl;
    std::cout << "Rebalance policy: " << rebalancePolicyName(m_counter->settings().rebalancePolicy) << std::endl;
    std::cout << "Snapshots: " << (m_snapshots ? "Enabled" : "Disabled") << std::endl;
    return true;
}

bool CounterService::stop()
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (!m_running.load(std::memory_order_acquire))
    {
        return false;
    }

    {
        // Waits for enqueuers that already passed the accepting check
        std::unique_lock<std::shared_mutex> acceptLock(m_acceptMutex);
        m_acceptingUpdates.store(false, std::memory_order_release);
    }

    // Workers drain the queue before their threads exit
    for (auto &worker : m_workers)
    {
        worker->stop();
    }

    size_t applied = sumApplied();
    size_t failed = sumFailed();
    m_retiredApplied.store(applied, std::memory_order_release);
    m_retiredFailed.store(failed, std::memory_order_release);
    m_workers.clear();
    m_running.store(false, std::memory_order_release);

    if (failed > 0)
    {
        std::cerr << "CounterService: " << failed << " of " << (applied + failed)
                  << " queued updates failed" << std::endl;
    }

    if (m_snapshots)
    {
        snapshotNow();
    }

    std::cout << "CounterService: Stopped" << std::endl;
    return true;
}

UpdateQueue::ProducerToken CounterService::createProducerToken()
{
    return m_queue->createProducerToken();
}

bool CounterService::enqueueAdd(const CounterKey &name,
                                double delta,
                                UpdateQueue::ProducerToken &token,
                                std::optional<uint32_t> shardCount,
                                std::optional<uint32_t> pinnedShard)
{
    if (shardCount && *shardCount == 0)
    {
        throw std::invalid_argument("Shard count for " + name.toString() + " must be positive");
    }

    std::shared_lock<std::shared_mutex> acceptLock(m_acceptMutex);
    if (!m_acceptingUpdates.load(std::memory_order_acquire))
    {
        std::cerr << "CounterService: Not accepting updates" << std::endl;
        return false;
    }

    if (!m_queue->enqueueBlocking(PendingUpdate(name, delta, shardCount, pinnedShard), token, m_enqueueTimeout))
    {
        std::cerr << "CounterService: Timed out enqueueing update for " << name.toString() << std::endl;
        return false;
    }

    m_enqueuedUpdates.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

size_t CounterService::appliedUpdates() const
{
    std::lock_guard<std::mutex> lock(m_systemMutex);
    return sumApplied();
}

size_t CounterService::failedUpdates() const
{
    std::lock_guard<std::mutex> lock(m_systemMutex);
    return sumFailed();
}

size_t CounterService::sumApplied() const
{
    size_t total = m_retiredApplied.load(std::memory_order_acquire);
    for (const auto &worker : m_workers)
    {
        total += worker->appliedUpdates();
    }
    return total;
}

size_t CounterService::sumFailed() const
{
    size_t total = m_retiredFailed.load(std::memory_order_acquire);
    for (const auto &worker : m_workers)
    {
        total += worker->failedUpdates();
    }
    return total;
}

bool CounterService::drain(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(m_systemMutex);

    if (!m_running.load(std::memory_order_acquire))
    {
        return sumApplied() + sumFailed() >= m_enqueuedUpdates.load(std::memory_order_acquire);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (sumApplied() + sumFailed() < m_enqueuedUpdates.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            std::cerr << "CounterService: Timed out draining update queue" << std::endl;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

size_t CounterService::snapshotNow()
{
    if (!m_snapshots)
    {
        throw std::runtime_error("Snapshots are not enabled");
    }

    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    std::vector<Shard> shards = m_store->scanAll();
    m_snapshots->write(m_codec->encode(shards));
    return shards.size();
}

size_t CounterService::restoreSnapshot()
{
    std::optional<std::vector<uint8_t>> frame = m_snapshots->readLatest();
    if (!frame)
    {
        return 0;
    }

    std::vector<Shard> shards = m_codec->decode(std::move(*frame));
    for (const auto &shard : shards)
    {
        m_store->putShard(shard.name, shard.shardIndex, shard.value);
    }
    return shards.size();
}

void CounterService::rebalanceAll(std::optional<uint32_t> shardCount)
{
    for (const auto &name : m_store->listNames())
    {
        m_counter->rebalance(name, shardCount);
    }
}
