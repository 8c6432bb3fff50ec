#ifndef INCLUDE_ITEMCRYPT_CORE_ENCRYPTEDITEM_HPP
#define INCLUDE_ITEMCRYPT_CORE_ENCRYPTEDITEM_HPP

#include "itemcrypt/core/Scheme.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace itemcrypt::core
{

// Wire form: version tag || iv slot || ciphertext || salt slot.
// Slot widths come from the version (V1: IV and stretched salt, V2: nonce and Poly1305 tag).
class EncryptedItem final
{
public:
    // Throws std::invalid_argument when iv or salt do not fill their slots exactly.
    EncryptedItem(FormatVersion version, std::vector<std::uint8_t> iv, std::vector<std::uint8_t> cipherText,
                  std::vector<std::uint8_t> salt);

    [[nodiscard]] FormatVersion version() const noexcept
    {
        return m_version;
    }
    [[nodiscard]] Scheme scheme() const noexcept
    {
        return Scheme{ m_version };
    }
    [[nodiscard]] const std::vector<std::uint8_t>& iv() const noexcept
    {
        return m_iv;
    }
    [[nodiscard]] const std::vector<std::uint8_t>& cipherText() const noexcept
    {
        return m_cipherText;
    }
    [[nodiscard]] const std::vector<std::uint8_t>& salt() const noexcept
    {
        return m_salt;
    }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    [[nodiscard]] friend bool operator==(const EncryptedItem& a, const EncryptedItem& b) noexcept
    {
        return a.m_version == b.m_version && a.m_iv == b.m_iv && a.m_cipherText == b.m_cipherText &&
               a.m_salt == b.m_salt;
    }

private:
    FormatVersion m_version;
    std::vector<std::uint8_t> m_iv;
    std::vector<std::uint8_t> m_cipherText;
    std::vector<std::uint8_t> m_salt;
};

[[nodiscard]] inline std::vector<std::uint8_t> serialize(const EncryptedItem& item)
{
    return item.serialize();
}

// BadData on an unknown tag or a buffer shorter than tag + iv slot + salt slot.
[[nodiscard]] SerializationResult<EncryptedItem> parseEncryptedItem(std::span<const std::uint8_t> bytes);

} // namespace itemcrypt::core

template <> struct std::hash<itemcrypt::core::EncryptedItem>
{
    std::size_t operator()(const itemcrypt::core::EncryptedItem& item) const;
};

#endif // INCLUDE_ITEMCRYPT_CORE_ENCRYPTEDITEM_HPP
