#include "itemcrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include "itemcrypt/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace itemcrypt::crypto::providers
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

// Shared setup for both directions: algorithm, nonce length, key/nonce, then AAD.
void initChaCha(EVP_CIPHER_CTX* ctx, bool encrypt, std::span<const std::uint8_t> key, const AeadNonce& nonce,
                std::span<const std::byte> associatedData)
{
    const int enc{ encrypt ? 1 : 0 };
    if (EVP_CipherInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, enc) != 1)
    {
        throw std::runtime_error("aead: EVP_CipherInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aead: set ivlen failed");
    }
    if (EVP_CipherInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
    {
        throw std::runtime_error("aead: set key/nonce failed");
    }
    if (!associatedData.empty())
    {
        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_CipherUpdate(ctx, nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aead: add aad failed");
        }
    }
}

class OpenSslCryptoProvider final : public itemcrypt::crypto::ICryptoProvider
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
        requireExactSize(key, itemcrypt::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        initChaCha(ctx.get(), true, key, nonce, associatedData);

        itemcrypt::crypto::AeadBox box{};
        box.nonce = nonce;
        box.cipherText.resize(plainText.size());

        int outLen{ 0 };
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr,
                                  static_cast<int>(plainText.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: encrypt update failed");
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        // ChaCha20-Poly1305 is a stream cipher; final never emits bytes.
        std::array<unsigned char, 1> finalSink{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalSink.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        box.cipherText.resize(static_cast<std::size_t>(outLen));

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<itemcrypt::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const itemcrypt::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, itemcrypt::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        initChaCha(ctx.get(), false, key, box.nonce, associatedData);

        itemcrypt::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        int outLen{ 0 };
        if (!box.cipherText.empty())
        {
            if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                  static_cast<int>(box.cipherText.size())) != 1)
            {
                itemcrypt::security::secureRelease(plainText);
                return std::nullopt;
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            itemcrypt::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, itemcrypt::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 1> finalSink{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalSink.data(), &finalLen) != 1 || finalLen != 0)
        {
            itemcrypt::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(static_cast<std::size_t>(outLen));

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace itemcrypt::crypto::providers
