#include "SnapshotCodec.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace
{
    const uint8_t MAGIC[4] = {'S', 'C', 'S', 'N'};

    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherContext newCipherContext()
    {
        CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
        if (!ctx)
        {
            throw std::runtime_error("Failed to create cipher context");
        }
        return ctx;
    }
}

SnapshotCodec::SnapshotCodec(int compressionLevel, bool useEncryption, std::vector<uint8_t> key)
    : m_compressionLevel(compressionLevel),
      m_useEncryption(useEncryption),
      m_key(std::move(key))
{
    if (m_useEncryption && m_key.size() != KEY_SIZE)
    {
        throw std::invalid_argument("Invalid key size. Expected 32 bytes for AES-256");
    }
}

std::vector<uint8_t> SnapshotCodec::encode(const std::vector<Shard> &shards) const
{
    uint8_t flags = 0;
    std::vector<uint8_t> body = Shard::serializeBatch(shards);

    if (m_compressionLevel != 0)
    {
        body = compress(body, m_compressionLevel);
        flags |= FLAG_COMPRESSED;
    }
    if (m_useEncryption)
    {
        body = encrypt(body, m_key);
        flags |= FLAG_ENCRYPTED;
    }

    std::vector<uint8_t> frame(HEADER_SIZE + body.size());
    uint32_t bodySize = static_cast<uint32_t>(body.size());
    std::memcpy(frame.data(), MAGIC, sizeof(MAGIC));
    frame[4] = FORMAT_VERSION;
    frame[5] = flags;
    std::memcpy(frame.data() + 6, &bodySize, sizeof(bodySize));
    std::memcpy(frame.data() + HEADER_SIZE, body.data(), body.size());
    return frame;
}

std::vector<Shard> SnapshotCodec::decode(std::vector<uint8_t> &&frame) const
{
    if (frame.size() < HEADER_SIZE || std::memcmp(frame.data(), MAGIC, sizeof(MAGIC)) != 0)
    {
        throw std::runtime_error("Not a snapshot frame");
    }
    if (frame[4] != FORMAT_VERSION)
    {
        throw std::runtime_error("Unsupported snapshot version " + std::to_string(frame[4]));
    }

    uint8_t flags = frame[5];
    uint32_t bodySize = 0;
    std::memcpy(&bodySize, frame.data() + 6, sizeof(bodySize));
    if (HEADER_SIZE + static_cast<size_t>(bodySize) != frame.size())
    {
        throw std::runtime_error("Snapshot frame truncated");
    }

    std::vector<uint8_t> body(frame.begin() + HEADER_SIZE, frame.end());

    if (flags & FLAG_ENCRYPTED)
    {
        if (m_key.size() != KEY_SIZE)
        {
            throw std::runtime_error("Snapshot is encrypted but no key is configured");
        }
        body = decrypt(body, m_key);
    }
    if (flags & FLAG_COMPRESSED)
    {
        body = decompress(body);
    }

    return Shard::deserializeBatch(std::move(body));
}

std::vector<uint8_t> SnapshotCodec::compress(const std::vector<uint8_t> &data, int level)
{
    if (data.size() > MAX_BODY_SIZE)
    {
        throw std::runtime_error("Snapshot body too large to compress");
    }

    uint32_t rawSize = static_cast<uint32_t>(data.size());
    uLongf deflatedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> result(sizeof(rawSize) + deflatedSize);
    std::memcpy(result.data(), &rawSize, sizeof(rawSize));

    int ret = compress2(result.data() + sizeof(rawSize), &deflatedSize,
                        data.data(), static_cast<uLong>(data.size()), level);
    if (ret != Z_OK)
    {
        throw std::runtime_error("zlib compression failed: " + std::to_string(ret));
    }

    result.resize(sizeof(rawSize) + deflatedSize);
    return result;
}

std::vector<uint8_t> SnapshotCodec::decompress(const std::vector<uint8_t> &body, size_t maxSize)
{
    uint32_t rawSize = 0;
    if (body.size() < sizeof(rawSize))
    {
        throw std::runtime_error("Compressed snapshot body truncated");
    }
    std::memcpy(&rawSize, body.data(), sizeof(rawSize));
    if (rawSize > maxSize)
    {
        throw std::runtime_error("Compressed snapshot declares " + std::to_string(rawSize) +
                                 " bytes, limit is " + std::to_string(maxSize));
    }

    // Output is capped at the declared size; a stream inflating past it fails
    std::vector<uint8_t> result(rawSize);
    uLongf inflatedSize = rawSize;
    int ret = uncompress(result.data(), &inflatedSize,
                         body.data() + sizeof(rawSize),
                         static_cast<uLong>(body.size() - sizeof(rawSize)));
    if (ret != Z_OK)
    {
        throw std::runtime_error("zlib decompression failed: " + std::to_string(ret));
    }
    if (inflatedSize != rawSize)
    {
        throw std::runtime_error("Compressed snapshot size mismatch");
    }
    return result;
}

std::vector<uint8_t> SnapshotCodec::encrypt(const std::vector<uint8_t> &plaintext,
                                            const std::vector<uint8_t> &key)
{
    if (key.size() != KEY_SIZE)
        throw std::runtime_error("Invalid key size");

    // Fresh IV per snapshot; GCM must never reuse an IV under one key
    std::vector<uint8_t> result(GCM_IV_SIZE + plaintext.size() + GCM_TAG_SIZE);
    if (RAND_bytes(result.data(), static_cast<int>(GCM_IV_SIZE)) != 1)
    {
        throw std::runtime_error("Failed to generate IV");
    }

    CipherContext ctx = newCipherContext();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), result.data()) != 1)
    {
        throw std::runtime_error("Failed to initialize encryption");
    }

    int encryptedLen = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), result.data() + GCM_IV_SIZE, &encryptedLen,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        throw std::runtime_error("Failed during encryption update");
    }

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), result.data() + GCM_IV_SIZE + encryptedLen, &finalLen) != 1)
    {
        throw std::runtime_error("Failed to finalize encryption");
    }

    if (encryptedLen + finalLen != static_cast<int>(plaintext.size()))
    {
        throw std::runtime_error("Unexpected encryption output size");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            result.data() + GCM_IV_SIZE + plaintext.size()) != 1)
    {
        throw std::runtime_error("Failed to get authentication tag");
    }

    return result;
}

std::vector<uint8_t> SnapshotCodec::decrypt(const std::vector<uint8_t> &sealed,
                                            const std::vector<uint8_t> &key)
{
    if (key.size() != KEY_SIZE)
        throw std::runtime_error("Invalid key size");
    if (sealed.size() < GCM_IV_SIZE + GCM_TAG_SIZE)
        throw std::runtime_error("Encrypted data too small");

    const size_t ciphertextSize = sealed.size() - GCM_IV_SIZE - GCM_TAG_SIZE;
    const uint8_t *iv = sealed.data();
    const uint8_t *ciphertext = sealed.data() + GCM_IV_SIZE;
    std::vector<uint8_t> tag(sealed.end() - GCM_TAG_SIZE, sealed.end());

    CipherContext ctx = newCipherContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
    {
        throw std::runtime_error("Failed to initialize decryption");
    }

    std::vector<uint8_t> plaintext(ciphertextSize);
    int decryptedLen = 0;
    if (ciphertextSize > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &decryptedLen,
                          ciphertext, static_cast<int>(ciphertextSize)) != 1)
    {
        throw std::runtime_error("Failed during decryption update");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1)
    {
        throw std::runtime_error("Failed to set authentication tag");
    }

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + decryptedLen, &finalLen) != 1)
    {
        throw std::runtime_error("Authentication failed: snapshot tampered or wrong key");
    }

    plaintext.resize(decryptedLen + finalLen);
    return plaintext;
}
