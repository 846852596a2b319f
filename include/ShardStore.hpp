#ifndef SHARD_STORE_HPP
#define SHARD_STORE_HPP

#include "Shard.hpp"
#include <optional>
#include <vector>
#include <functional>
#include <stdexcept>
#include <string>

// Raised by store implementations when the substrate is unavailable or a
// transaction cannot be committed. The counter core never retries it.
class ShardStoreError : public std::runtime_error
{
public:
    explicit ShardStoreError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Transactional substrate holding shard records
 *
 * Records are addressed by (name, shardIndex). Every single-record mutation
 * is atomic; nothing spans more than one record.
 */
class ShardStore
{
public:
    // Receives the current value (nullopt if the record does not exist) and
    // returns the value to store.
    using Mutator = std::function<double(std::optional<double>)>;

    virtual ~ShardStore() = default;

    virtual std::optional<Shard> getShard(const CounterKey &name, uint32_t shardIndex) const = 0;

    // Insert-or-overwrite.
    virtual void putShard(const CounterKey &name, uint32_t shardIndex, double value) = 0;

    /**
     * @brief Atomic read-modify-write of a single record
     *
     * The mutator runs while the record is held exclusively, so concurrent
     * updates of the same (name, shardIndex) are serialized. A mutator that
     * throws leaves the record untouched.
     *
     * @return The value stored
     */
    virtual double updateShard(const CounterKey &name, uint32_t shardIndex, const Mutator &mutator) = 0;

    // Returns false if the record did not exist.
    virtual bool deleteShard(const ShardId &id) = 0;

    // All records of a name, ordered by shard index.
    virtual std::vector<Shard> scanShardsByName(const CounterKey &name) const = 0;
};

#endif
