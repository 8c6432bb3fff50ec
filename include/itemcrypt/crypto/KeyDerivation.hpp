#ifndef INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP

#include "itemcrypt/crypto/KdfParams.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace itemcrypt::crypto
{

// PBKDF2 over `password` and `salt`. Throws std::invalid_argument on unusable
// parameters and std::runtime_error if the OpenSSL KDF fails.
[[nodiscard]] itemcrypt::security::SecureBuffer
deriveKeyPbkdf2(std::span<const std::byte> password, std::span<const std::uint8_t> salt, const Pbkdf2Params& params);

// HMAC keyed with `key` over `messages`, fed in order.
[[nodiscard]] std::vector<std::uint8_t> hmacDigest(HashAlgorithm alg, std::span<const std::uint8_t> key,
                                                   std::span<const std::string> messages);

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP
