#include "itemcrypt/core/CipherEngine.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/crypto/CbcCipher.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <optional>
#include <utility>
#include <vector>

namespace itemcrypt::core
{
namespace
{

using itemcrypt::crypto::CbcCipher;
using itemcrypt::crypto::CipherDirection;
using itemcrypt::security::SecureBuffer;

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

// Pulls chunks of at most bufferSize bytes from `read` until it returns 0, pushes cipher output to `write`.
// `read` fills the span it is given and returns the byte count; `write` consumes a span.
template <class ReadChunk, class WriteChunk>
void runCbcLoop(CbcCipher& cipher, std::size_t bufferSize, ReadChunk&& read, WriteChunk&& write)
{
    SecureBuffer inBuf(bufferSize);
    SecureBuffer outBuf(bufferSize + itemcrypt::crypto::g_cbcBlockBytes);

    for (;;)
    {
        const std::size_t got{ read(std::span<std::uint8_t>{ inBuf }) };
        if (got == 0U)
        {
            break;
        }
        const std::size_t produced{ cipher.update(std::span<const std::uint8_t>{ inBuf }.first(got), outBuf) };
        write(std::span<const std::uint8_t>{ outBuf }.first(produced));
    }

    const std::optional<std::size_t> tail{ cipher.finish(outBuf) };
    if (!tail)
    {
        throw DecryptionFailed{};
    }
    write(std::span<const std::uint8_t>{ outBuf }.first(*tail));
}

// In-memory source for the chunk loop.
class SpanReader final
{
public:
    explicit SpanReader(std::span<const std::uint8_t> source) noexcept : m_source{ source }
    {
    }

    std::size_t operator()(std::span<std::uint8_t> chunk) noexcept
    {
        const std::size_t n{ std::min(chunk.size(), m_source.size() - m_offset) };
        if (n != 0U)
        {
            std::memcpy(chunk.data(), m_source.data() + m_offset, n);
        }
        m_offset += n;
        return n;
    }

private:
    std::span<const std::uint8_t> m_source;
    std::size_t m_offset{};
};

class IstreamReader final
{
public:
    explicit IstreamReader(std::istream& in) noexcept : m_in{ &in }
    {
    }

    std::size_t operator()(std::span<std::uint8_t> chunk)
    {
        if (m_in->eof())
        {
            return 0U;
        }
        if (m_in->fail())
        {
            throw StreamFailure{ "input stream is not readable" };
        }
        m_in->read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (m_in->bad())
        {
            throw StreamFailure{ "input stream read failed" };
        }
        return static_cast<std::size_t>(m_in->gcount());
    }

private:
    std::istream* m_in;
};

void writeTo(std::ostream& out, std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out)
    {
        throw StreamFailure{ "output stream write failed" };
    }
}

void requireMatchingVersion(const EncryptedItem& item, const EncryptionKey& key)
{
    if (item.version() != key.scheme().version())
    {
        throw IncorrectVersion{ "item version does not match the key scheme" };
    }
}

void requireStreamable(const EncryptionKey& key)
{
    if (!key.scheme().isStreamable())
    {
        throw UnsupportedOperation{ "streaming is not supported by scheme " + std::string{ key.scheme().name() } };
    }
}

std::vector<std::uint8_t> cbcEncrypt(std::span<const std::uint8_t> plainText, const EncryptionKey& key)
{
    CbcCipher cipher{ CipherDirection::Encrypt, key.keyData(), key.initializationVector() };
    std::vector<std::uint8_t> out{};
    out.reserve(plainText.size() + itemcrypt::crypto::g_cbcBlockBytes);
    runCbcLoop(cipher, key.scheme().bufferSize(), SpanReader{ plainText },
               [&out](std::span<const std::uint8_t> chunk) { out.insert(out.end(), chunk.begin(), chunk.end()); });
    return out;
}

SecureBuffer cbcDecrypt(const EncryptedItem& item, const EncryptionKey& key)
{
    CbcCipher cipher{ CipherDirection::Decrypt, key.keyData(), item.iv() };
    SecureBuffer out{};
    out.reserve(item.cipherText().size());
    runCbcLoop(cipher, key.scheme().bufferSize(), SpanReader{ item.cipherText() },
               [&out](std::span<const std::uint8_t> chunk) { out.insert(out.end(), chunk.begin(), chunk.end()); });
    return out;
}

EncryptedItem aeadSeal(itemcrypt::crypto::ICryptoProvider& crypto, std::span<const std::byte> plainText,
                       const EncryptionKey& key, const itemcrypt::crypto::AeadNonce& nonce)
{
    const Scheme::Tag tag{ key.scheme().tag() };
    itemcrypt::crypto::AeadBox box{ crypto.aeadEncrypt(key.keyData(), nonce, plainText,
                                                       std::as_bytes(std::span<const std::uint8_t>{ tag })) };

    return EncryptedItem{ key.scheme().version(), std::vector<std::uint8_t>(box.nonce.begin(), box.nonce.end()),
                          std::move(box.cipherText), std::vector<std::uint8_t>(box.tag.begin(), box.tag.end()) };
}

SecureBuffer aeadOpen(itemcrypt::crypto::ICryptoProvider& crypto, const EncryptedItem& item, const EncryptionKey& key)
{
    itemcrypt::crypto::AeadBox box{};
    std::copy(item.iv().begin(), item.iv().end(), box.nonce.begin());
    std::copy(item.salt().begin(), item.salt().end(), box.tag.begin());
    box.cipherText = item.cipherText();

    const Scheme::Tag tag{ item.scheme().tag() };
    std::optional<SecureBuffer> plainText{ crypto.aeadDecrypt(key.keyData(), box,
                                                              std::as_bytes(std::span<const std::uint8_t>{ tag })) };
    if (!plainText)
    {
        throw DecryptionFailed{};
    }
    return std::move(*plainText);
}

} // namespace

EncryptedItem CipherEngine::encrypt(std::span<const std::byte> plainText, const EncryptionKey& key)
{
    switch (key.scheme().cipher())
    {
    case CipherAlgorithm::Aes256CbcPkcs7:
        return EncryptedItem{ key.scheme().version(), key.initializationVector(), cbcEncrypt(asU8(plainText), key),
                              key.salt() };
    case CipherAlgorithm::ChaCha20Poly1305:
    {
        itemcrypt::crypto::AeadNonce nonce{};
        if (!m_crypto->randomBytes(nonce))
        {
            throw RandomFailure{ "secure random generator failed" };
        }
        return aeadSeal(*m_crypto, plainText, key, nonce);
    }
    }
    throw UnsupportedOperation{ "unknown cipher" };
}

EncryptedItem CipherEngine::encrypt(std::span<const std::byte> plainText, const EncryptionKey& key,
                                    const itemcrypt::crypto::AeadNonce& nonce)
{
    if (key.scheme().cipher() != CipherAlgorithm::ChaCha20Poly1305)
    {
        throw UnsupportedOperation{ "a caller-chosen nonce needs an AEAD scheme" };
    }
    return aeadSeal(*m_crypto, plainText, key, nonce);
}

SecureBuffer CipherEngine::decrypt(const EncryptedItem& item, const EncryptionKey& key)
{
    requireMatchingVersion(item, key);

    switch (key.scheme().cipher())
    {
    case CipherAlgorithm::Aes256CbcPkcs7:
        return cbcDecrypt(item, key);
    case CipherAlgorithm::ChaCha20Poly1305:
        return aeadOpen(*m_crypto, item, key);
    }
    throw UnsupportedOperation{ "unknown cipher" };
}

void CipherEngine::encryptStream(std::istream& input, const EncryptionKey& key, std::ostream& output)
{
    requireStreamable(key);

    CbcCipher cipher{ CipherDirection::Encrypt, key.keyData(), key.initializationVector() };
    runCbcLoop(cipher, key.scheme().bufferSize(), IstreamReader{ input },
               [&output](std::span<const std::uint8_t> chunk) { writeTo(output, chunk); });
    output.flush();
    if (!output)
    {
        throw StreamFailure{ "output stream flush failed" };
    }
}

// Plaintext already written stays in the output if the final padding check fails.
void CipherEngine::decryptStream(std::istream& input, const EncryptionKey& key, std::ostream& output)
{
    requireStreamable(key);

    CbcCipher cipher{ CipherDirection::Decrypt, key.keyData(), key.initializationVector() };
    runCbcLoop(cipher, key.scheme().bufferSize(), IstreamReader{ input },
               [&output](std::span<const std::uint8_t> chunk) { writeTo(output, chunk); });
    output.flush();
    if (!output)
    {
        throw StreamFailure{ "output stream flush failed" };
    }
}

} // namespace itemcrypt::core
