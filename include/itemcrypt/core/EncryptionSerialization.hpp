#ifndef INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONSERIALIZATION_HPP
#define INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONSERIALIZATION_HPP

#include "itemcrypt/core/CipherEngine.hpp"
#include "itemcrypt/core/EncryptedItem.hpp"
#include "itemcrypt/core/EncryptionKey.hpp"
#include "itemcrypt/core/Scheme.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <variant>

namespace itemcrypt::core
{

// Empty success value for operations that only report an outcome.
struct Done final
{
};

// Entry point for turning payload bytes into encrypted containers and back.
// Every operation returns a SerializationResult; only std::bad_alloc escapes.
class EncryptionSerialization final
{
public:
    explicit EncryptionSerialization(itemcrypt::crypto::ICryptoProvider& crypto,
                                     Scheme defaultScheme = Scheme::defaultScheme()) noexcept
        : m_crypto{ &crypto }, m_defaultScheme{ defaultScheme }
    {
    }

    [[nodiscard]] const Scheme& defaultScheme() const noexcept
    {
        return m_defaultScheme;
    }

    // Fresh seed per call. For V2 the seed doubles as the nonce, so the password alone re-derives the key.
    [[nodiscard]] SerializationResult<EncryptedItem>
    encryptedItem(std::span<const std::byte> data, const itemcrypt::security::SecureString& password) const;
    [[nodiscard]] SerializationResult<EncryptedItem> encryptedItem(std::span<const std::byte> data,
                                                                   const itemcrypt::security::SecureString& password,
                                                                   const Scheme& scheme) const;

    [[nodiscard]] SerializationResult<EncryptedItem> encryptedItem(std::span<const std::byte> data,
                                                                   const EncryptionKey& key) const;

    [[nodiscard]] SerializationResult<itemcrypt::security::SecureBuffer>
    data(const EncryptedItem& item, const itemcrypt::security::SecureString& password) const;

    [[nodiscard]] SerializationResult<itemcrypt::security::SecureBuffer> data(const EncryptedItem& item,
                                                                              const EncryptionKey& key) const;

    [[nodiscard]] SerializationResult<EncryptedItem> parse(std::span<const std::uint8_t> bytes) const;

    [[nodiscard]] SerializationResult<Done> encryptStream(std::istream& input, const EncryptionKey& key,
                                                          std::ostream& output) const;
    [[nodiscard]] SerializationResult<Done> decryptStream(std::istream& input, const EncryptionKey& key,
                                                          std::ostream& output) const;

    [[nodiscard]] SerializationResult<EncryptionKey> randomKey(const itemcrypt::security::SecureString& password,
                                                               std::span<const std::string> contextKeywords,
                                                               const Scheme& scheme) const;

private:
    itemcrypt::crypto::ICryptoProvider* m_crypto;
    Scheme m_defaultScheme;
};

} // namespace itemcrypt::core

#endif // INCLUDE_ITEMCRYPT_CORE_ENCRYPTIONSERIALIZATION_HPP
