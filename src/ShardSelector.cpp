#include "ShardSelector.hpp"
#include <stdexcept>
#include <utility>

ShardSelector::ShardSelector(std::shared_ptr<RandomSource> random)
    : m_random(std::move(random))
{
    if (!m_random)
    {
        throw std::invalid_argument("ShardSelector requires a random source");
    }
}

uint32_t ShardSelector::select(uint32_t shardCount, std::optional<uint32_t> pinnedShard) const
{
    if (pinnedShard)
    {
        return *pinnedShard;
    }
    return m_random->uniformIndex(shardCount);
}
