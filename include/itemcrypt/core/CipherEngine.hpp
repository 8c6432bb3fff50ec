#ifndef INCLUDE_ITEMCRYPT_CORE_CIPHERENGINE_HPP
#define INCLUDE_ITEMCRYPT_CORE_CIPHERENGINE_HPP

#include "itemcrypt/core/EncryptedItem.hpp"
#include "itemcrypt/core/EncryptionKey.hpp"
#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <cstddef>
#include <istream>
#include <ostream>
#include <span>

namespace itemcrypt::core
{

// Per-scheme symmetric transform. V1 runs AES-256-CBC/PKCS7 through a bufferSize() chunk loop;
// V2 seals with ChaCha20-Poly1305 using the version tag as associated data.
//
// Errors are thrown: IncorrectVersion, DecryptionFailed, UnsupportedOperation, RandomFailure,
// StreamFailure, std::invalid_argument / std::runtime_error from the backends.
class CipherEngine final
{
public:
    explicit CipherEngine(itemcrypt::crypto::ICryptoProvider& crypto) noexcept : m_crypto{ &crypto }
    {
    }

    // V1 uses key.initializationVector(); V2 draws a fresh random nonce.
    [[nodiscard]] EncryptedItem encrypt(std::span<const std::byte> plainText, const EncryptionKey& key);

    // V2 only: the caller supplies the nonce and guarantees it is unique for the key.
    [[nodiscard]] EncryptedItem encrypt(std::span<const std::byte> plainText, const EncryptionKey& key,
                                        const itemcrypt::crypto::AeadNonce& nonce);

    // The item version is checked against the key scheme before any decryption work.
    [[nodiscard]] itemcrypt::security::SecureBuffer decrypt(const EncryptedItem& item, const EncryptionKey& key);

    // Raw V1 ciphertext (no container) between caller streams, bufferSize() bytes at a time.
    void encryptStream(std::istream& input, const EncryptionKey& key, std::ostream& output);
    void decryptStream(std::istream& input, const EncryptionKey& key, std::ostream& output);

private:
    itemcrypt::crypto::ICryptoProvider* m_crypto;
};

} // namespace itemcrypt::core

#endif // INCLUDE_ITEMCRYPT_CORE_CIPHERENGINE_HPP
