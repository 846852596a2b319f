#include "CounterKey.hpp"
#include <cstring>
#include <sstream>
#include <algorithm>

namespace
{
    void appendToVector(std::vector<uint8_t> &vec, const void *data, size_t size)
    {
        const uint8_t *bytes = static_cast<const uint8_t *>(data);
        vec.insert(vec.end(), bytes, bytes + size);
    }

    bool extractFromVector(const std::vector<uint8_t> &vec, size_t &offset, void *data, size_t size)
    {
        if (offset + size > vec.size())
        {
            return false;
        }
        std::memcpy(data, vec.data() + offset, size);
        offset += size;
        return true;
    }
}

CounterKey::CounterKey(const char *name)
    : m_parts{Part(std::string(name))}
{
}

CounterKey::CounterKey(std::string name)
    : m_parts{Part(std::move(name))}
{
}

CounterKey::CounterKey(std::initializer_list<Part> parts)
    : m_parts(parts)
{
}

CounterKey::CounterKey(std::vector<Part> parts)
    : m_parts(std::move(parts))
{
}

std::string CounterKey::toString() const
{
    if (m_parts.size() == 1 && std::holds_alternative<std::string>(m_parts[0]))
    {
        return std::get<std::string>(m_parts[0]);
    }

    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < m_parts.size(); ++i)
    {
        if (i > 0)
        {
            ss << ",";
        }
        if (std::holds_alternative<int64_t>(m_parts[i]))
        {
            ss << std::get<int64_t>(m_parts[i]);
        }
        else
        {
            ss << "\"" << std::get<std::string>(m_parts[i]) << "\"";
        }
    }
    ss << "]";
    return ss.str();
}

size_t CounterKey::hash() const
{
    // boost::hash_combine mixing, seeded with the part count
    size_t seed = m_parts.size();
    for (const auto &part : m_parts)
    {
        size_t h = std::holds_alternative<int64_t>(part)
                       ? std::hash<int64_t>{}(std::get<int64_t>(part))
                       : std::hash<std::string>{}(std::get<std::string>(part));
        h ^= part.index();
        seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

void CounterKey::serializeInto(std::vector<uint8_t> &out) const
{
    // [4 bytes] part count, then per part: [1 byte] tag + payload
    // integer payload: 8 bytes, string payload: [4 bytes] length + bytes
    uint32_t partCount = static_cast<uint32_t>(m_parts.size());
    appendToVector(out, &partCount, sizeof(partCount));

    for (const auto &part : m_parts)
    {
        if (std::holds_alternative<int64_t>(part))
        {
            uint8_t tag = static_cast<uint8_t>(PartTag::INTEGER);
            int64_t value = std::get<int64_t>(part);
            appendToVector(out, &tag, sizeof(tag));
            appendToVector(out, &value, sizeof(value));
        }
        else
        {
            uint8_t tag = static_cast<uint8_t>(PartTag::STRING);
            const std::string &value = std::get<std::string>(part);
            uint32_t length = static_cast<uint32_t>(value.size());
            appendToVector(out, &tag, sizeof(tag));
            appendToVector(out, &length, sizeof(length));
            if (length > 0)
            {
                appendToVector(out, value.data(), length);
            }
        }
    }
}

std::vector<uint8_t> CounterKey::serialize() const
{
    std::vector<uint8_t> result;
    serializeInto(result);
    return result;
}

bool CounterKey::deserialize(const std::vector<uint8_t> &data, size_t &offset)
{
    size_t cursor = offset;
    uint32_t partCount = 0;
    if (!extractFromVector(data, cursor, &partCount, sizeof(partCount)))
    {
        return false;
    }

    std::vector<Part> parts;
    parts.reserve(std::min<size_t>(partCount, data.size() - cursor));
    for (uint32_t i = 0; i < partCount; ++i)
    {
        uint8_t tag = 0;
        if (!extractFromVector(data, cursor, &tag, sizeof(tag)))
        {
            return false;
        }

        if (tag == static_cast<uint8_t>(PartTag::INTEGER))
        {
            int64_t value = 0;
            if (!extractFromVector(data, cursor, &value, sizeof(value)))
            {
                return false;
            }
            parts.emplace_back(value);
        }
        else if (tag == static_cast<uint8_t>(PartTag::STRING))
        {
            uint32_t length = 0;
            if (!extractFromVector(data, cursor, &length, sizeof(length)))
            {
                return false;
            }
            if (cursor + length > data.size())
            {
                return false;
            }
            parts.emplace_back(std::string(reinterpret_cast<const char *>(data.data() + cursor), length));
            cursor += length;
        }
        else
        {
            return false;
        }
    }

    m_parts = std::move(parts);
    offset = cursor;
    return true;
}
