#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstdint>
#include <mutex>
#include <random>

/**
 * @brief Source of uniform random indices
 *
 * Shard selection and sampling draw all their randomness from here so that
 * tests can substitute a deterministic sequence. Implementations must be
 * safe to call from multiple threads.
 */
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Draws uniformly from [0, bound)
     *
     * @param bound Exclusive upper limit, must be positive
     */
    virtual uint32_t uniformIndex(uint32_t bound) = 0;
};

// Default source: one std::mt19937 per thread, seeded from std::random_device,
// so writers never contend on a shared engine.
class ThreadLocalRandomSource : public RandomSource
{
public:
    uint32_t uniformIndex(uint32_t bound) override;
};

// Reproducible source for simulations and benchmarks.
class SeededRandomSource : public RandomSource
{
public:
    explicit SeededRandomSource(uint64_t seed);

    uint32_t uniformIndex(uint32_t bound) override;

private:
    std::mutex m_mutex;
    std::mt19937_64 m_engine;
};

#endif
