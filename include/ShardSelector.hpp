#ifndef SHARD_SELECTOR_HPP
#define SHARD_SELECTOR_HPP

#include "RandomSource.hpp"
#include <memory>
#include <optional>
#include <cstdint>

// Picks the shard a write lands on. Stateless apart from the random draw.
class ShardSelector
{
public:
    explicit ShardSelector(std::shared_ptr<RandomSource> random);

    /**
     * @brief Chooses the shard index for one write
     *
     * A pinned shard is returned unchanged, even when it lies outside
     * [0, shardCount). Otherwise the index is drawn uniformly from
     * [0, shardCount).
     */
    uint32_t select(uint32_t shardCount, std::optional<uint32_t> pinnedShard = std::nullopt) const;

private:
    std::shared_ptr<RandomSource> m_random;
};

#endif
