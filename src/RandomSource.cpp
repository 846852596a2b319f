#include "RandomSource.hpp"
#include <stdexcept>

uint32_t ThreadLocalRandomSource::uniformIndex(uint32_t bound)
{
    if (bound == 0)
    {
        throw std::invalid_argument("Random bound must be positive");
    }

    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, bound - 1);
    return dist(engine);
}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : m_engine(seed)
{
}

uint32_t SeededRandomSource::uniformIndex(uint32_t bound)
{
    if (bound == 0)
    {
        throw std::invalid_argument("Random bound must be positive");
    }

    std::uniform_int_distribution<uint32_t> dist(0, bound - 1);
    std::lock_guard<std::mutex> lock(m_mutex);
    return dist(m_engine);
}
