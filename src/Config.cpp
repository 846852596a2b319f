#include "Config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>

namespace
{
    const std::string SHARDS_PREFIX = "shards.";

    std::string trim(const std::string &str)
    {
        size_t first = 0;
        while (first < str.size() && std::isspace(static_cast<unsigned char>(str[first])))
            ++first;
        size_t last = str.size();
        while (last > first && std::isspace(static_cast<unsigned char>(str[last - 1])))
            --last;
        return str.substr(first, last - first);
    }

    unsigned long long parseUnsigned(const std::string &key, const std::string &value)
    {
        if (value.empty() || value[0] == '-')
        {
            throw std::invalid_argument("Invalid value for " + key + ": " + value);
        }
        try
        {
            size_t consumed = 0;
            unsigned long long result = std::stoull(value, &consumed);
            if (consumed != value.size())
            {
                throw std::invalid_argument("trailing characters");
            }
            return result;
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid value for " + key + ": " + value);
        }
    }

    unsigned long long parseBounded(const std::string &key, const std::string &value,
                                    unsigned long long maxValue)
    {
        unsigned long long result = parseUnsigned(key, value);
        if (result > maxValue)
        {
            throw std::invalid_argument("Value out of range for " + key + ": " + value);
        }
        return result;
    }

    uint32_t parseUint32(const std::string &key, const std::string &value)
    {
        return static_cast<uint32_t>(parseBounded(key, value, UINT32_MAX));
    }

    std::chrono::milliseconds parseMilliseconds(const std::string &key, const std::string &value)
    {
        auto maxCount = static_cast<unsigned long long>(std::chrono::milliseconds::max().count());
        return std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(parseBounded(key, value, maxCount)));
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        if (value == "true" || value == "1")
            return true;
        if (value == "false" || value == "0")
            return false;
        throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
    }

    std::vector<uint8_t> parseHex(const std::string &key, const std::string &value)
    {
        if (value.size() % 2 != 0)
        {
            throw std::invalid_argument("Odd-length hex string for " + key);
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(value.size() / 2);
        for (size_t i = 0; i < value.size(); i += 2)
        {
            if (!std::isxdigit(static_cast<unsigned char>(value[i])) ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 1])))
            {
                throw std::invalid_argument("Invalid hex string for " + key);
            }
            bytes.push_back(static_cast<uint8_t>(std::stoul(value.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }
}

CounterConfig loadConfigFromFile(const std::string &configFilePath)
{
    std::ifstream file(configFilePath);
    if (!file)
    {
        throw std::runtime_error("Failed to load config file: " + configFilePath);
    }

    CounterConfig config;
    std::string line;
    while (std::getline(file, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (std::getline(iss, key, '=') && std::getline(iss, value))
        {
            applySetting(config, trim(key), trim(value));
        }
        else
        {
            throw std::invalid_argument("Malformed config line: " + line);
        }
    }

    validateConfig(config);
    return config;
}

void applySetting(CounterConfig &config, const std::string &key, const std::string &value)
{
    if (key.compare(0, SHARDS_PREFIX.size(), SHARDS_PREFIX) == 0 && key.size() > SHARDS_PREFIX.size())
    {
        config.counter.shardCounts[CounterKey(key.substr(SHARDS_PREFIX.size()))] = parseUint32(key, value);
    }
    else if (key == "defaultShardCount")
        config.counter.defaultShardCount = parseUint32(key, value);
    else if (key == "readFromShards")
        config.counter.defaultReadFromShards = parseUint32(key, value);
    else if (key == "rebalancePolicy")
        config.counter.rebalancePolicy = parseRebalancePolicy(value);
    else if (key == "queueCapacity")
        config.queueCapacity = parseUnsigned(key, value);
    else if (key == "maxExplicitProducers")
        config.maxExplicitProducers = parseUnsigned(key, value);
    else if (key == "enqueueTimeout")
        config.enqueueTimeout = parseMilliseconds(key, value);
    else if (key == "batchSize")
        config.batchSize = parseUnsigned(key, value);
    else if (key == "numWorkerThreads")
        config.numWorkerThreads = parseUnsigned(key, value);
    else if (key == "snapshotEnabled")
        config.snapshotEnabled = parseBool(key, value);
    else if (key == "basePath")
        config.basePath = value;
    else if (key == "baseFilename")
        config.baseFilename = value;
    else if (key == "compressionLevel")
        config.compressionLevel = static_cast<int>(parseBounded(key, value, MAX_COMPRESSION_LEVEL));
    else if (key == "useEncryption")
        config.useEncryption = parseBool(key, value);
    else if (key == "encryptionKeyHex")
        config.encryptionKey = parseHex(key, value);
    else if (key == "maxAttempts")
        config.maxAttempts = parseBounded(key, value, MAX_RETRY_ATTEMPTS);
    else if (key == "baseRetryDelay")
        config.baseRetryDelay = parseMilliseconds(key, value);
    else if (key == "retainedSnapshots")
        config.retainedSnapshots = parseUnsigned(key, value);
    else
        throw std::invalid_argument("Unknown config key: " + key);
}

void validateSettings(const CounterSettings &settings)
{
    if (settings.defaultShardCount == 0)
    {
        throw std::invalid_argument("defaultShardCount must be positive");
    }
    if (settings.defaultReadFromShards == 0)
    {
        throw std::invalid_argument("readFromShards must be positive");
    }
    for (const auto &[name, shardCount] : settings.shardCounts)
    {
        if (shardCount == 0)
        {
            throw std::invalid_argument("Shard count for " + name.toString() + " must be positive");
        }
    }
}

void validateConfig(const CounterConfig &config)
{
    validateSettings(config.counter);

    if (config.queueCapacity == 0)
        throw std::invalid_argument("queueCapacity must be positive");
    if (config.batchSize == 0)
        throw std::invalid_argument("batchSize must be positive");
    if (config.numWorkerThreads == 0)
        throw std::invalid_argument("numWorkerThreads must be positive");
    if (config.compressionLevel < 0 || config.compressionLevel > MAX_COMPRESSION_LEVEL)
        throw std::invalid_argument("compressionLevel must be between 0 and 9");
    if (config.maxAttempts == 0 || config.maxAttempts > MAX_RETRY_ATTEMPTS)
        throw std::invalid_argument("maxAttempts must be between 1 and " + std::to_string(MAX_RETRY_ATTEMPTS));
    if (config.retainedSnapshots == 0)
        throw std::invalid_argument("retainedSnapshots must be positive");

    if (config.snapshotEnabled)
    {
        if (config.basePath.empty() || config.baseFilename.empty())
            throw std::invalid_argument("Snapshot basePath and baseFilename must be set");
        if (config.useEncryption && config.encryptionKey.size() != 32)
            throw std::invalid_argument("Encryption requires a 32 byte key");
    }
}

RebalancePolicy parseRebalancePolicy(const std::string &value)
{
    if (value == "even")
        return RebalancePolicy::EVEN;
    if (value == "integral")
        return RebalancePolicy::INTEGRAL;
    throw std::invalid_argument("Unknown rebalance policy: " + value);
}

std::string rebalancePolicyName(RebalancePolicy policy)
{
    switch (policy)
    {
    case RebalancePolicy::EVEN:
        return "even";
    case RebalancePolicy::INTEGRAL:
        return "integral";
    }
    return "unknown";
}
