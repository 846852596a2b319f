#ifndef COUNTER_KEY_HPP
#define COUNTER_KEY_HPP

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <initializer_list>

/**
 * @brief Name of a logical counter
 *
 * A key is an ordered tuple of parts, each either a string or a 64-bit
 * integer. Plain string names are the single-part case and convert
 * implicitly, so `counter.add("beans", 1)` works. Composite keys such as
 * {userId, "followers"} compare structurally.
 */
class CounterKey
{
public:
    using Part = std::variant<int64_t, std::string>;

    CounterKey() = default;
    CounterKey(const char *name);
    CounterKey(std::string name);
    CounterKey(std::initializer_list<Part> parts);
    explicit CounterKey(std::vector<Part> parts);

    const std::vector<Part> &parts() const { return m_parts; }
    size_t size() const { return m_parts.size(); }
    bool empty() const { return m_parts.empty(); }

    // Human readable form: a single string part prints as-is,
    // anything else as a bracketed list.
    std::string toString() const;

    size_t hash() const;

    void serializeInto(std::vector<uint8_t> &out) const;
    std::vector<uint8_t> serialize() const;
    // Reads a key starting at offset; advances offset on success.
    bool deserialize(const std::vector<uint8_t> &data, size_t &offset);

    bool operator==(const CounterKey &other) const { return m_parts == other.m_parts; }
    bool operator!=(const CounterKey &other) const { return m_parts != other.m_parts; }
    bool operator<(const CounterKey &other) const { return m_parts < other.m_parts; }

private:
    enum class PartTag : uint8_t
    {
        INTEGER = 0,
        STRING = 1,
    };

    std::vector<Part> m_parts;
};

namespace std
{
    template <>
    struct hash<CounterKey>
    {
        size_t operator()(const CounterKey &key) const { return key.hash(); }
    };
}

#endif
