#ifndef INCLUDE_ITEMCRYPT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace itemcrypt::crypto
{

enum class HashAlgorithm : std::uint8_t
{
    Sha256 = 1U,
    Sha512 = 2U,
};

[[nodiscard]] constexpr std::size_t digestBytes(HashAlgorithm alg) noexcept
{
    switch (alg)
    {
    case HashAlgorithm::Sha256:
        return 32U;
    case HashAlgorithm::Sha512:
        return 64U;
    }
    return 0U;
}

// OpenSSL digest names as accepted by EVP_MD_fetch / OSSL_MAC_PARAM_DIGEST.
[[nodiscard]] constexpr const char* digestName(HashAlgorithm alg) noexcept
{
    switch (alg)
    {
    case HashAlgorithm::Sha256:
        return "SHA256";
    case HashAlgorithm::Sha512:
        return "SHA512";
    }
    return "";
}

struct Pbkdf2Params final
{
    HashAlgorithm prf;
    std::uint32_t iterations;
    std::uint32_t derivedKeyBytes;
};

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_KDFPARAMS_HPP
