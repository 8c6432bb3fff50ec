#include "itemcrypt/core/EncryptionSerialization.hpp"
#include "itemcrypt/core/KeyDerivation.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace itemcrypt::core
{
namespace
{

using itemcrypt::security::SecureBuffer;
using itemcrypt::security::SecureString;

[[nodiscard]] SerializationError toError(const ImproperKeyMaterial& e) noexcept
{
    switch (e.field())
    {
    case KeyMaterialField::Seed:
        return SerializationError::ImproperSeed;
    case KeyMaterialField::Salt:
        return SerializationError::ImproperSalt;
    case KeyMaterialField::InitializationVector:
        return SerializationError::ImproperInitializationVector;
    case KeyMaterialField::KeyData:
        return SerializationError::BadData;
    }
    return SerializationError::BadData;
}

// Runs one facade operation and maps the typed exceptions of the lower layers onto result values.
// Order matters: the specific types derive from std::invalid_argument / std::runtime_error.
template <class T, class Fn> [[nodiscard]] SerializationResult<T> guarded(Fn&& fn)
{
    try
    {
        return SerializationResult<T>{ std::in_place_index<0>, fn() };
    }
    catch (const EmptyPassword&)
    {
        return SerializationError::NoPassword;
    }
    catch (const ImproperKeyMaterial& e)
    {
        return toError(e);
    }
    catch (const IncorrectVersion&)
    {
        return SerializationError::IncorrectVersion;
    }
    catch (const UnsupportedOperation&)
    {
        return SerializationError::UnsupportedOperation;
    }
    catch (const DecryptionFailed&)
    {
        return SerializationError::DecryptionFailed;
    }
    catch (const MalformedData&)
    {
        return SerializationError::BadData;
    }
    catch (const RandomFailure&)
    {
        return SerializationError::RandomFailed;
    }
    catch (const StreamFailure&)
    {
        return SerializationError::StreamError;
    }
    catch (const std::invalid_argument&)
    {
        return SerializationError::BadData;
    }
    catch (const std::runtime_error&)
    {
        return SerializationError::CryptoError;
    }
}

[[nodiscard]] itemcrypt::crypto::AeadNonce nonceFrom(std::span<const std::uint8_t> seed)
{
    if (seed.size() != itemcrypt::crypto::g_aeadNonceBytes)
    {
        throw ImproperKeyMaterial{ KeyMaterialField::Seed, itemcrypt::crypto::g_aeadNonceBytes, seed.size() };
    }
    itemcrypt::crypto::AeadNonce nonce{};
    std::copy(seed.begin(), seed.end(), nonce.begin());
    return nonce;
}

} // namespace

SerializationResult<EncryptedItem> EncryptionSerialization::encryptedItem(std::span<const std::byte> data,
                                                                          const SecureString& password) const
{
    return encryptedItem(data, password, m_defaultScheme);
}

SerializationResult<EncryptedItem> EncryptionSerialization::encryptedItem(std::span<const std::byte> data,
                                                                          const SecureString& password,
                                                                          const Scheme& scheme) const
{
    if (password.empty())
    {
        return SerializationError::NoPassword;
    }

    return guarded<EncryptedItem>(
        [&]
        {
            CipherEngine engine{ *m_crypto };
            const std::vector<std::uint8_t> seed{ randomBytes(*m_crypto, scheme.seedSize()) };

            switch (scheme.version())
            {
            case FormatVersion::V1:
            {
                const std::vector<std::uint8_t> iv{ randomBytes(*m_crypto, scheme.initializationVectorSize()) };
                const EncryptionKey key{ deriveKey(password, seed, {}, iv, scheme) };
                return engine.encrypt(data, key);
            }
            case FormatVersion::V2:
            {
                // The seed is stored as the nonce; the salt slot holds the tag.
                const EncryptionKey key{ deriveKey(password, seed, {}, seed, scheme) };
                return engine.encrypt(data, key, nonceFrom(seed));
            }
            }
            throw UnsupportedOperation{ "unknown format version" };
        });
}

SerializationResult<EncryptedItem> EncryptionSerialization::encryptedItem(std::span<const std::byte> data,
                                                                          const EncryptionKey& key) const
{
    return guarded<EncryptedItem>(
        [&]
        {
            CipherEngine engine{ *m_crypto };
            return engine.encrypt(data, key);
        });
}

SerializationResult<SecureBuffer> EncryptionSerialization::data(const EncryptedItem& item,
                                                                const SecureString& password) const
{
    if (password.empty())
    {
        return SerializationError::NoPassword;
    }

    return guarded<SecureBuffer>(
        [&]
        {
            const Scheme scheme{ item.scheme() };
            CipherEngine engine{ *m_crypto };

            switch (scheme.version())
            {
            case FormatVersion::V1:
            {
                const EncryptionKey key{ deriveKey(password, item.salt(), item.iv(), scheme) };
                return engine.decrypt(item, key);
            }
            case FormatVersion::V2:
            {
                const EncryptionKey key{ deriveKey(password, item.iv(), {}, item.iv(), scheme) };
                return engine.decrypt(item, key);
            }
            }
            throw UnsupportedOperation{ "unknown format version" };
        });
}

SerializationResult<SecureBuffer> EncryptionSerialization::data(const EncryptedItem& item,
                                                                const EncryptionKey& key) const
{
    if (item.scheme() != key.scheme())
    {
        return SerializationError::IncorrectVersion;
    }

    return guarded<SecureBuffer>(
        [&]
        {
            CipherEngine engine{ *m_crypto };
            return engine.decrypt(item, key);
        });
}

SerializationResult<EncryptedItem> EncryptionSerialization::parse(std::span<const std::uint8_t> bytes) const
{
    return parseEncryptedItem(bytes);
}

SerializationResult<Done> EncryptionSerialization::encryptStream(std::istream& input, const EncryptionKey& key,
                                                                 std::ostream& output) const
{
    return guarded<Done>(
        [&]
        {
            CipherEngine engine{ *m_crypto };
            engine.encryptStream(input, key, output);
            return Done{};
        });
}

SerializationResult<Done> EncryptionSerialization::decryptStream(std::istream& input, const EncryptionKey& key,
                                                                 std::ostream& output) const
{
    return guarded<Done>(
        [&]
        {
            CipherEngine engine{ *m_crypto };
            engine.decryptStream(input, key, output);
            return Done{};
        });
}

SerializationResult<EncryptionKey> EncryptionSerialization::randomKey(const SecureString& password,
                                                                      std::span<const std::string> contextKeywords,
                                                                      const Scheme& scheme) const
{
    if (password.empty())
    {
        return SerializationError::NoPassword;
    }

    return guarded<EncryptionKey>([&] { return deriveRandomKey(*m_crypto, password, contextKeywords, scheme); });
}

} // namespace itemcrypt::core
