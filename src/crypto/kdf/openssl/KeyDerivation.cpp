#include "itemcrypt/crypto/KeyDerivation.hpp"

#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <stdexcept>

namespace itemcrypt::crypto
{
namespace
{

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

constexpr std::uint32_t g_kIterationsCap{ 10U * 1000U * 1000U };
constexpr std::uint32_t g_kDerivedKeyBytesCap{ 64U };

void requirePbkdf2ParamsSafe(const Pbkdf2Params& params)
{
    if (digestBytes(params.prf) == 0U)
    {
        throw std::invalid_argument("deriveKeyPbkdf2: unsupported PRF");
    }
    if (params.iterations == 0U || params.iterations > g_kIterationsCap)
    {
        throw std::invalid_argument("deriveKeyPbkdf2: invalid iteration count");
    }
    if (params.derivedKeyBytes == 0U || params.derivedKeyBytes > g_kDerivedKeyBytesCap)
    {
        throw std::invalid_argument("deriveKeyPbkdf2: invalid derived key length");
    }
}

} // namespace

[[nodiscard]] itemcrypt::security::SecureBuffer
deriveKeyPbkdf2(std::span<const std::byte> password, std::span<const std::uint8_t> salt, const Pbkdf2Params& params)
{
    requirePbkdf2ParamsSafe(params);
    if (salt.empty())
    {
        throw std::invalid_argument("deriveKeyPbkdf2: empty salt");
    }

    EvpKdfPtr kdf{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr), &EVP_KDF_free };
    if (!kdf)
    {
        throw std::runtime_error("deriveKeyPbkdf2: OpenSSL PBKDF2 not available");
    }
    EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(kdf.get()), &EVP_KDF_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("deriveKeyPbkdf2: EVP_KDF_CTX_new failed");
    }

    // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies.
    itemcrypt::security::SecureBuffer passwordCopy{};
    passwordCopy.resize(password.size());
    if (!password.empty())
    {
        std::memcpy(passwordCopy.data(), password.data(), password.size());
    }
    std::vector<std::uint8_t> saltCopy(salt.begin(), salt.end());

    std::uint32_t iterations{ params.iterations };
    // Lower-bound checks are a FIPS policy; callers here own their parameter choices.
    int pkcs5Checks{ 1 };
    char* digest{ const_cast<char*>(digestName(params.prf)) };

    OSSL_PARAM kdfParams[]{
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
        OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iterations),
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Checks),
        OSSL_PARAM_construct_end(),
    };

    itemcrypt::security::SecureBuffer out{};
    out.resize(params.derivedKeyBytes);
    if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), kdfParams) <= 0)
    {
        throw std::runtime_error("deriveKeyPbkdf2: EVP_KDF_derive failed");
    }
    return out;
}

[[nodiscard]] std::vector<std::uint8_t> hmacDigest(HashAlgorithm alg, std::span<const std::uint8_t> key,
                                                   std::span<const std::string> messages)
{
    if (key.empty())
    {
        throw std::invalid_argument("hmacDigest: empty key");
    }
    const std::size_t outBytes{ digestBytes(alg) };
    if (outBytes == 0U)
    {
        throw std::invalid_argument("hmacDigest: unsupported digest");
    }

    EvpMacPtr mac{ EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr), &EVP_MAC_free };
    if (!mac)
    {
        throw std::runtime_error("hmacDigest: OpenSSL HMAC not available");
    }
    EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(mac.get()), &EVP_MAC_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("hmacDigest: EVP_MAC_CTX_new failed");
    }

    char* digest{ const_cast<char*>(digestName(alg)) };
    OSSL_PARAM macParams[]{
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_end(),
    };

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), macParams) != 1)
    {
        throw std::runtime_error("hmacDigest: EVP_MAC_init failed");
    }

    for (const std::string& message : messages)
    {
        if (message.empty())
        {
            continue;
        }
        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        if (EVP_MAC_update(ctx.get(), msg, message.size()) != 1)
        {
            throw std::runtime_error("hmacDigest: EVP_MAC_update failed");
        }
    }

    std::vector<std::uint8_t> out(outBytes);
    std::size_t written{ out.size() };
    if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
    {
        throw std::runtime_error("hmacDigest: EVP_MAC_final failed");
    }
    return out;
}

} // namespace itemcrypt::crypto
