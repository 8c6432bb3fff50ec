#include "itemcrypt/security/SecureRandom.hpp"
#include <cerrno>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace itemcrypt::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* cursor{ out.data() };
    std::size_t remaining{ out.size() };

#if defined(_WIN32)
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(cursor), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }
        remaining -= chunk;
        cursor += chunk;
    }
#elif defined(__linux__)
    while (remaining > 0U)
    {
        const ssize_t got{ ::getrandom(cursor, remaining, 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0 || static_cast<std::size_t>(got) > remaining)
        {
            return false;
        }
        remaining -= static_cast<std::size_t>(got);
        cursor += got;
    }
#endif
    return true;
}

std::optional<std::vector<std::uint8_t>> secureRandomBytes(std::size_t count)
{
    std::vector<std::uint8_t> out(count);
    if (!secureRandomFill(std::span<std::uint8_t>{ out }))
    {
        return std::nullopt;
    }
    return out;
}

} // namespace itemcrypt::security
