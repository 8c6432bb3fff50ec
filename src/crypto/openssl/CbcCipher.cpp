#include "itemcrypt/crypto/CbcCipher.hpp"

#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace itemcrypt::crypto
{

struct CbcCipher::Context
{
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> evp{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
};

CbcCipher::CbcCipher(CipherDirection direction, std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv)
    : m_direction{ direction }, m_ctx{ std::make_unique<Context>() }
{
    if (key.size() != g_cbcKeyBytes)
    {
        throw std::invalid_argument("CbcCipher: key must be 32 bytes");
    }
    if (iv.size() != g_cbcBlockBytes)
    {
        throw std::invalid_argument("CbcCipher: iv must be 16 bytes");
    }
    if (!m_ctx->evp)
    {
        throw std::runtime_error("CbcCipher: EVP_CIPHER_CTX_new failed");
    }

    const int enc{ direction == CipherDirection::Encrypt ? 1 : 0 };
    if (EVP_CipherInit_ex(m_ctx->evp.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data(), enc) != 1)
    {
        throw std::runtime_error("CbcCipher: EVP_CipherInit_ex failed");
    }
    if (EVP_CIPHER_CTX_set_padding(m_ctx->evp.get(), 1) != 1)
    {
        throw std::runtime_error("CbcCipher: set padding failed");
    }
}

CbcCipher::~CbcCipher() = default;
CbcCipher::CbcCipher(CbcCipher&&) noexcept = default;
CbcCipher& CbcCipher::operator=(CbcCipher&&) noexcept = default;

std::size_t CbcCipher::update(std::span<const std::uint8_t> input, std::span<std::uint8_t> output)
{
    if (!m_ctx)
    {
        throw std::logic_error("CbcCipher: moved-from cipher");
    }
    if (input.empty())
    {
        return 0U;
    }
    if (input.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) - g_cbcBlockBytes)
    {
        throw std::invalid_argument("CbcCipher: input too large");
    }
    if (output.size() < input.size() + g_cbcBlockBytes)
    {
        throw std::invalid_argument("CbcCipher: output buffer too small");
    }

    int outLen{ 0 };
    if (EVP_CipherUpdate(m_ctx->evp.get(), output.data(), &outLen, input.data(), static_cast<int>(input.size())) != 1)
    {
        throw std::runtime_error("CbcCipher: EVP_CipherUpdate failed");
    }
    if (outLen < 0)
    {
        throw std::runtime_error("CbcCipher: invalid output length");
    }
    return static_cast<std::size_t>(outLen);
}

std::optional<std::size_t> CbcCipher::finish(std::span<std::uint8_t> output)
{
    if (!m_ctx)
    {
        throw std::logic_error("CbcCipher: moved-from cipher");
    }
    if (output.size() < g_cbcBlockBytes)
    {
        throw std::invalid_argument("CbcCipher: output buffer too small");
    }

    int outLen{ 0 };
    if (EVP_CipherFinal_ex(m_ctx->evp.get(), output.data(), &outLen) != 1)
    {
        if (m_direction == CipherDirection::Decrypt)
        {
            return std::nullopt;
        }
        throw std::runtime_error("CbcCipher: EVP_CipherFinal_ex failed");
    }
    if (outLen < 0)
    {
        throw std::runtime_error("CbcCipher: invalid output length");
    }
    return static_cast<std::size_t>(outLen);
}

} // namespace itemcrypt::crypto
