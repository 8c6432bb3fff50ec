#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace itemcrypt::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Returns `count` random bytes, or std::nullopt if the OS source fails.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> secureRandomBytes(std::size_t count);

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP
