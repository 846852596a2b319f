#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "CounterKey.hpp"
#include <string>
#include <chrono>
#include <map>
#include <vector>
#include <cstdint>

constexpr uint32_t DEFAULT_SHARD_COUNT = 16;
constexpr uint32_t DEFAULT_READ_FROM_SHARDS = 1;
constexpr int MAX_COMPRESSION_LEVEL = 9;
constexpr size_t MAX_RETRY_ATTEMPTS = 16;

// How rebalance spreads a counter's total over its shards
enum class RebalancePolicy
{
    EVEN = 0,     // every shard holds total / shardCount
    INTEGRAL = 1, // whole-unit remainder handed out to the lowest indices
};

struct CounterSettings
{
    uint32_t defaultShardCount = DEFAULT_SHARD_COUNT;
    std::map<CounterKey, uint32_t> shardCounts; // per-name overrides
    uint32_t defaultReadFromShards = DEFAULT_READ_FROM_SHARDS;
    RebalancePolicy rebalancePolicy = RebalancePolicy::EVEN;
};

struct CounterConfig
{
    // counter
    CounterSettings counter;
    // update queue
    size_t queueCapacity = 8192;
    size_t maxExplicitProducers = 16; // maximum number of producers creating a producer token
    std::chrono::milliseconds enqueueTimeout = std::chrono::milliseconds(30000);
    // update workers
    size_t batchSize = 100;
    size_t numWorkerThreads = 2;
    // snapshots
    bool snapshotEnabled = false;
    std::string basePath = "./snapshots";
    std::string baseFilename = "counters";
    int compressionLevel = 6; // 0 = no compression, 1-9 = compression levels
    bool useEncryption = false;
    std::vector<uint8_t> encryptionKey; // 32 bytes when useEncryption is set
    size_t maxAttempts = 5; // 1 to MAX_RETRY_ATTEMPTS
    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1);
    size_t retainedSnapshots = 1;
};

// Parses `key=value` lines; '#' starts a comment. Throws std::runtime_error if
// the file cannot be read and std::invalid_argument on bad values.
CounterConfig loadConfigFromFile(const std::string &configFilePath);

// Applies a single setting, e.g. ("shards.beans", "10").
void applySetting(CounterConfig &config, const std::string &key, const std::string &value);

// Throw std::invalid_argument describing the first offending field.
void validateSettings(const CounterSettings &settings);
void validateConfig(const CounterConfig &config);

RebalancePolicy parseRebalancePolicy(const std::string &value);
std::string rebalancePolicyName(RebalancePolicy policy);

#endif
