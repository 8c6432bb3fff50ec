#ifndef INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "itemcrypt/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace itemcrypt::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

using AeadNonce = std::array<std::uint8_t, g_aeadNonceBytes>;

struct AeadBox final
{
    AeadNonce nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce). The caller owns nonce uniqueness.
    // Bad key sizes throw std::invalid_argument; backend failures throw std::runtime_error.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, const AeadNonce& nonce,
                                              std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<itemcrypt::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
