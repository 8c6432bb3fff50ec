#ifndef INCLUDE_ITEMCRYPT_CORE_SCHEME_HPP
#define INCLUDE_ITEMCRYPT_CORE_SCHEME_HPP

#include "itemcrypt/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

namespace itemcrypt::core
{

enum class FormatVersion : std::uint8_t
{
    V1 = 1,
    V2 = 2,
};

enum class CipherAlgorithm : std::uint8_t
{
    Aes256CbcPkcs7,
    ChaCha20Poly1305,
};

// One container format and every cryptographic parameter that goes with it.
// All values are pure functions of the version; there is no runtime registry.
class Scheme final
{
public:
    static constexpr std::size_t g_tagBytes{ 3 };
    using Tag = std::array<std::uint8_t, g_tagBytes>;

    constexpr explicit Scheme(FormatVersion version) noexcept : m_version{ version }
    {
    }

    // Newest format; new items are written with it unless a caller asks otherwise.
    [[nodiscard]] static constexpr Scheme latest() noexcept
    {
        return Scheme{ FormatVersion::V2 };
    }

    [[nodiscard]] static constexpr Scheme defaultScheme() noexcept
    {
        return latest();
    }

    // Recognises a known tag in the first g_tagBytes bytes; std::nullopt otherwise.
    [[nodiscard]] static constexpr std::optional<FormatVersion> versionFromTag(std::span<const std::uint8_t> bytes) noexcept
    {
        if (bytes.size() < g_tagBytes || bytes[0] != 0U || bytes[1] != 0U)
        {
            return std::nullopt;
        }
        switch (bytes[2])
        {
        case static_cast<std::uint8_t>(FormatVersion::V1):
            return FormatVersion::V1;
        case static_cast<std::uint8_t>(FormatVersion::V2):
            return FormatVersion::V2;
        default:
            return std::nullopt;
        }
    }

    [[nodiscard]] constexpr FormatVersion version() const noexcept
    {
        return m_version;
    }

    [[nodiscard]] constexpr Tag tag() const noexcept
    {
        return Tag{ 0U, 0U, static_cast<std::uint8_t>(m_version) };
    }

    [[nodiscard]] constexpr std::string_view name() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return "v1";
        case FormatVersion::V2:
            return "v2";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr itemcrypt::crypto::HashAlgorithm keyDerivationPrf() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return itemcrypt::crypto::HashAlgorithm::Sha256;
        case FormatVersion::V2:
            return itemcrypt::crypto::HashAlgorithm::Sha512;
        }
        return itemcrypt::crypto::HashAlgorithm::Sha256;
    }

    [[nodiscard]] constexpr itemcrypt::crypto::HashAlgorithm saltHmac() const noexcept
    {
        return itemcrypt::crypto::HashAlgorithm::Sha256;
    }

    [[nodiscard]] constexpr std::uint32_t iterations() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return 100'000U;
        case FormatVersion::V2:
            return 210'000U;
        }
        return 0U;
    }

    [[nodiscard]] constexpr std::size_t derivedKeyLength() const noexcept
    {
        return 32U;
    }

    [[nodiscard]] constexpr std::size_t seedSize() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return 16U;
        case FormatVersion::V2:
            return 12U;
        }
        return 0U;
    }

    [[nodiscard]] constexpr std::size_t initializationVectorSize() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return 16U;
        case FormatVersion::V2:
            return 12U;
        }
        return 0U;
    }

    [[nodiscard]] constexpr std::size_t stretchedSaltSize() const noexcept
    {
        return itemcrypt::crypto::digestBytes(saltHmac());
    }

    [[nodiscard]] constexpr CipherAlgorithm cipher() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return CipherAlgorithm::Aes256CbcPkcs7;
        case FormatVersion::V2:
            return CipherAlgorithm::ChaCha20Poly1305;
        }
        return CipherAlgorithm::Aes256CbcPkcs7;
    }

    // Chunk size of the streaming loop; zero when the format cannot be streamed.
    [[nodiscard]] constexpr std::size_t bufferSize() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return 1024U;
        case FormatVersion::V2:
            return 0U;
        }
        return 0U;
    }

    [[nodiscard]] constexpr bool isStreamable() const noexcept
    {
        return bufferSize() != 0U;
    }

    // Width of the container field after the tag: IV for V1, nonce for V2.
    [[nodiscard]] constexpr std::size_t itemIvSize() const noexcept
    {
        return initializationVectorSize();
    }

    // Width of the trailing container field: stretched salt for V1, Poly1305 tag for V2.
    [[nodiscard]] constexpr std::size_t itemSaltSize() const noexcept
    {
        switch (m_version)
        {
        case FormatVersion::V1:
            return stretchedSaltSize();
        case FormatVersion::V2:
            return 16U;
        }
        return 0U;
    }

    [[nodiscard]] constexpr itemcrypt::crypto::Pbkdf2Params pbkdf2Params() const noexcept
    {
        return itemcrypt::crypto::Pbkdf2Params{
            .prf = keyDerivationPrf(),
            .iterations = iterations(),
            .derivedKeyBytes = static_cast<std::uint32_t>(derivedKeyLength()),
        };
    }

    [[nodiscard]] friend constexpr bool operator==(const Scheme& a, const Scheme& b) noexcept
    {
        return a.m_version == b.m_version;
    }

private:
    FormatVersion m_version;
};

} // namespace itemcrypt::core

template <> struct std::hash<itemcrypt::core::Scheme>
{
    std::size_t operator()(const itemcrypt::core::Scheme& scheme) const noexcept
    {
        return std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(scheme.version()));
    }
};

#endif // INCLUDE_ITEMCRYPT_CORE_SCHEME_HPP
