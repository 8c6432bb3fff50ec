#ifndef INCLUDE_ITEMCRYPT_STORAGE_IKEYSTORE_HPP
#define INCLUDE_ITEMCRYPT_STORAGE_IKEYSTORE_HPP

#include "itemcrypt/core/EncryptionKey.hpp"
#include <optional>
#include <string_view>

namespace itemcrypt::storage
{

// Persistent home for EncryptionKeys, addressed by a caller-chosen tag.
// Keys are stored in their raw form; the key context travels alongside as the account.
class IKeyStore
{
public:
    IKeyStore() = default;
    IKeyStore(const IKeyStore&) = delete;
    IKeyStore& operator=(const IKeyStore&) = delete;
    IKeyStore(IKeyStore&&) = delete;
    IKeyStore& operator=(IKeyStore&&) = delete;
    virtual ~IKeyStore() = default;

    // std::nullopt if nothing is stored under the tag. Stored bytes that are not a key throw MalformedData.
    [[nodiscard]] virtual std::optional<itemcrypt::core::EncryptionKey> key(std::string_view tag) const = 0;

    // Replaces whatever is stored under the tag and returns the key as read back.
    virtual itemcrypt::core::EncryptionKey setKey(const itemcrypt::core::EncryptionKey& key, std::string_view tag) = 0;

    // Removes the entry; returns the removed key if it was a valid one.
    virtual std::optional<itemcrypt::core::EncryptionKey> deleteKey(std::string_view tag) = 0;
};

} // namespace itemcrypt::storage

#endif // INCLUDE_ITEMCRYPT_STORAGE_IKEYSTORE_HPP
