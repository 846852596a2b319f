#ifndef SNAPSHOT_CODEC_HPP
#define SNAPSHOT_CODEC_HPP

#include "Shard.hpp"
#include <vector>
#include <cstdint>
#include <zlib.h>

/**
 * @brief Turns a set of shard records into a self-describing snapshot frame
 *
 * Frame layout:
 * [4 bytes]    Magic "SCSN"
 * [1 byte]     Format version
 * [1 byte]     Flags (bit 0 compressed, bit 1 encrypted)
 * [4 bytes]    Body size (N)
 * [N bytes]    Body
 *
 * The body is the serialized shard batch. When compression is on it becomes
 * [4 bytes] uncompressed size followed by the zlib stream; decoding refuses
 * sizes above MAX_BODY_SIZE and streams that inflate past the declared size.
 * When encryption is on it is then sealed with AES-256-GCM:
 * [12 bytes] IV, ciphertext, [16 bytes] tag.
 *
 * decode() honours the flags stored in the frame, not the codec's own
 * settings, so a frame written with other settings still decodes as long as
 * the key matches.
 */
class SnapshotCodec
{
public:
    static constexpr uint8_t FORMAT_VERSION = 1;
    static constexpr uint8_t FLAG_COMPRESSED = 0x01;
    static constexpr uint8_t FLAG_ENCRYPTED = 0x02;
    static constexpr size_t HEADER_SIZE = 10;
    static constexpr size_t KEY_SIZE = 32;     // 256 bits
    static constexpr size_t GCM_IV_SIZE = 12;  // 96 bits (recommended for GCM)
    static constexpr size_t GCM_TAG_SIZE = 16; // 128 bits
    static constexpr size_t MAX_BODY_SIZE = 256u * 1024u * 1024u;

    SnapshotCodec(int compressionLevel = Z_DEFAULT_COMPRESSION,
                  bool useEncryption = false,
                  std::vector<uint8_t> key = {});

    std::vector<uint8_t> encode(const std::vector<Shard> &shards) const;
    std::vector<Shard> decode(std::vector<uint8_t> &&frame) const;

    static std::vector<uint8_t> compress(const std::vector<uint8_t> &data, int level);
    static std::vector<uint8_t> decompress(const std::vector<uint8_t> &body,
                                           size_t maxSize = MAX_BODY_SIZE);

    static std::vector<uint8_t> encrypt(const std::vector<uint8_t> &plaintext,
                                        const std::vector<uint8_t> &key);
    static std::vector<uint8_t> decrypt(const std::vector<uint8_t> &sealed,
                                        const std::vector<uint8_t> &key);

private:
    int m_compressionLevel;
    bool m_useEncryption;
    std::vector<uint8_t> m_key;
};

#endif
