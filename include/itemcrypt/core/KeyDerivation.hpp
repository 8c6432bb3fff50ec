#ifndef INCLUDE_ITEMCRYPT_CORE_KEYDERIVATION_HPP
#define INCLUDE_ITEMCRYPT_CORE_KEYDERIVATION_HPP

#include "itemcrypt/core/EncryptionKey.hpp"
#include "itemcrypt/core/Scheme.hpp"
#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace itemcrypt::core
{

// Trims leading/trailing Unicode whitespace, applies canonical decomposition (NFD), encodes as UTF-8.
// Throws EmptyPassword if nothing is left, std::invalid_argument on invalid UTF-8.
[[nodiscard]] itemcrypt::security::SecureBuffer normalizePassword(const itemcrypt::security::SecureString& password);

// HMAC(key = seed) over the keywords in order. Order matters.
// Throws ImproperKeyMaterial{Seed} on a seed of the wrong length.
[[nodiscard]] std::vector<std::uint8_t> stretchSalt(std::span<const std::uint8_t> seed,
                                                    std::span<const std::string> contextKeywords, const Scheme& scheme);

// Seed path: stretches the seed, then continues with the salt path.
[[nodiscard]] EncryptionKey deriveKey(const itemcrypt::security::SecureString& password,
                                      std::span<const std::uint8_t> seed, std::span<const std::string> contextKeywords,
                                      std::span<const std::uint8_t> iv, const Scheme& scheme);

// Salt path: re-derives a key from a stored stretched salt and IV.
// Throws ImproperKeyMaterial{Salt} or ImproperKeyMaterial{InitializationVector} on wrong lengths.
[[nodiscard]] EncryptionKey deriveKey(const itemcrypt::security::SecureString& password,
                                      std::span<const std::uint8_t> treatedSalt, std::span<const std::uint8_t> iv,
                                      const Scheme& scheme);

// Throws RandomFailure when the CSPRNG does not deliver.
[[nodiscard]] std::vector<std::uint8_t> randomBytes(itemcrypt::crypto::ICryptoProvider& provider, std::size_t count);

// Fresh random seed and IV, then the seed path.
[[nodiscard]] EncryptionKey deriveRandomKey(itemcrypt::crypto::ICryptoProvider& provider,
                                            const itemcrypt::security::SecureString& password,
                                            std::span<const std::string> contextKeywords, const Scheme& scheme);

} // namespace itemcrypt::core

#endif // INCLUDE_ITEMCRYPT_CORE_KEYDERIVATION_HPP
