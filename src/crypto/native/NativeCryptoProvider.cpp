#include "itemcrypt/crypto/providers/NativeProviderFactory.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include "itemcrypt/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace itemcrypt::crypto::providers
{
namespace
{

void requireKey(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != itemcrypt::crypto::g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

// Monocypher AEAD context for one message. Key-derived state is wiped when the session ends.
class IetfSession final
{
public:
    IetfSession(std::span<const std::uint8_t> key, const AeadNonce& nonce, std::span<const std::byte> associatedData)
        : m_ad{ associatedData }
    {
        crypto_aead_init_ietf(&m_ctx, key.data(), nonce.data());
    }

    IetfSession(const IetfSession&) = delete;
    IetfSession& operator=(const IetfSession&) = delete;
    IetfSession(IetfSession&&) = delete;
    IetfSession& operator=(IetfSession&&) = delete;

    ~IetfSession()
    {
        itemcrypt::security::secureWipe(std::as_writable_bytes(std::span{ &m_ctx, 1 }));
    }

    void seal(std::span<const std::byte> plainText, AeadBox& box)
    {
        box.cipherText.resize(plainText.size());
        crypto_aead_write(&m_ctx, box.cipherText.data(), box.tag.data(), adData(), m_ad.size(),
                          reinterpret_cast<const std::uint8_t*>(plainText.data()), plainText.size());
    }

    [[nodiscard]] bool open(const AeadBox& box, itemcrypt::security::SecureBuffer& plainText)
    {
        plainText.resize(box.cipherText.size());
        return crypto_aead_read(&m_ctx, plainText.data(), box.tag.data(), adData(), m_ad.size(),
                                box.cipherText.data(), box.cipherText.size()) == 0;
    }

private:
    [[nodiscard]] const std::uint8_t* adData() const noexcept
    {
        return reinterpret_cast<const std::uint8_t*>(m_ad.data());
    }

    crypto_aead_ctx m_ctx{};
    std::span<const std::byte> m_ad;
};

class NativeCryptoProvider final : public itemcrypt::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return itemcrypt::security::secureRandomFill(out);
    }

    [[nodiscard]] itemcrypt::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key, const AeadNonce& nonce,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData) override
    {
        requireKey(key, "aeadEncrypt: key");

        itemcrypt::crypto::AeadBox box{ .nonce = nonce };
        IetfSession session{ key, box.nonce, associatedData };
        session.seal(plainText, box);
        return box;
    }

    [[nodiscard]] std::optional<itemcrypt::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const itemcrypt::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireKey(key, "aeadDecrypt: key");
        if (box.cipherText.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        itemcrypt::security::SecureBuffer plainText{};
        IetfSession session{ key, box.nonce, associatedData };
        if (!session.open(box, plainText))
        {
            itemcrypt::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace itemcrypt::crypto::providers
