#ifndef INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONKEY_HPP
#define INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONKEY_HPP

#include "itemcrypt/core/Scheme.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace itemcrypt::core
{

// Symmetric key plus the IV and stretched salt it was derived with.
// The context is a free-text label; it is not bound into the key and takes no part in equality.
class EncryptionKey final
{
public:
    // Throws ImproperKeyMaterial when a field length disagrees with the scheme.
    EncryptionKey(Scheme scheme, itemcrypt::security::SecureBuffer keyData, std::vector<std::uint8_t> initializationVector,
                  std::vector<std::uint8_t> salt, std::optional<std::string> context = std::nullopt);

    EncryptionKey(const EncryptionKey&) = default;
    EncryptionKey& operator=(const EncryptionKey&) = default;
    EncryptionKey(EncryptionKey&&) noexcept = default;
    EncryptionKey& operator=(EncryptionKey&&) noexcept = default;
    ~EncryptionKey() = default;

    [[nodiscard]] const Scheme& scheme() const noexcept
    {
        return m_scheme;
    }
    [[nodiscard]] const itemcrypt::security::SecureBuffer& keyData() const noexcept
    {
        return m_keyData;
    }
    [[nodiscard]] const std::vector<std::uint8_t>& initializationVector() const noexcept
    {
        return m_iv;
    }
    [[nodiscard]] const std::vector<std::uint8_t>& salt() const noexcept
    {
        return m_salt;
    }
    [[nodiscard]] const std::optional<std::string>& context() const noexcept
    {
        return m_context;
    }

    [[nodiscard]] EncryptionKey withContext(std::optional<std::string> context) const;

    // tag || keyData || iv || salt
    [[nodiscard]] itemcrypt::security::SecureBuffer rawData() const;

    // Throws MalformedData on an unknown tag, short buffer or wrong key length.
    [[nodiscard]] static EncryptionKey fromRawData(std::span<const std::uint8_t> raw,
                                                   std::optional<std::string> context = std::nullopt);

    [[nodiscard]] friend bool operator==(const EncryptionKey& a, const EncryptionKey& b) noexcept;

private:
    Scheme m_scheme;
    itemcrypt::security::SecureBuffer m_keyData;
    std::vector<std::uint8_t> m_iv;
    std::vector<std::uint8_t> m_salt;
    std::optional<std::string> m_context;
};

} // namespace itemcrypt::core

#endif // INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONKEY_HPP
