#include "itemcrypt/core/EncryptionKey.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"

#include <utility>

namespace itemcrypt::core
{

EncryptionKey::EncryptionKey(Scheme scheme, itemcrypt::security::SecureBuffer keyData,
                             std::vector<std::uint8_t> initializationVector, std::vector<std::uint8_t> salt,
                             std::optional<std::string> context)
    : m_scheme{ scheme }, m_keyData{ std::move(keyData) }, m_iv{ std::move(initializationVector) },
      m_salt{ std::move(salt) }, m_context{ std::move(context) }
{
    if (m_keyData.size() != m_scheme.derivedKeyLength())
    {
        throw ImproperKeyMaterial{ KeyMaterialField::KeyData, m_scheme.derivedKeyLength(), m_keyData.size() };
    }
    if (m_iv.size() != m_scheme.initializationVectorSize())
    {
        throw ImproperKeyMaterial{ KeyMaterialField::InitializationVector, m_scheme.initializationVectorSize(),
                                   m_iv.size() };
    }
    if (m_salt.size() != m_scheme.stretchedSaltSize())
    {
        throw ImproperKeyMaterial{ KeyMaterialField::Salt, m_scheme.stretchedSaltSize(), m_salt.size() };
    }
}

EncryptionKey EncryptionKey::withContext(std::optional<std::string> context) const
{
    EncryptionKey copy{ *this };
    copy.m_context = std::move(context);
    return copy;
}

itemcrypt::security::SecureBuffer EncryptionKey::rawData() const
{
    itemcrypt::security::SecureBuffer out{};
    out.reserve(Scheme::g_tagBytes + m_keyData.size() + m_iv.size() + m_salt.size());

    const Scheme::Tag tag{ m_scheme.tag() };
    out.insert(out.end(), tag.begin(), tag.end());
    out.insert(out.end(), m_keyData.begin(), m_keyData.end());
    out.insert(out.end(), m_iv.begin(), m_iv.end());
    out.insert(out.end(), m_salt.begin(), m_salt.end());
    return out;
}

EncryptionKey EncryptionKey::fromRawData(std::span<const std::uint8_t> raw, std::optional<std::string> context)
{
    const std::optional<FormatVersion> version{ Scheme::versionFromTag(raw) };
    if (!version)
    {
        throw MalformedData{ "raw key: unrecognized scheme tag" };
    }
    const Scheme scheme{ *version };

    const std::size_t saltBytes{ scheme.stretchedSaltSize() };
    const std::size_t ivBytes{ scheme.initializationVectorSize() };
    if (raw.size() < Scheme::g_tagBytes + ivBytes + saltBytes)
    {
        throw MalformedData{ "raw key: buffer too short" };
    }

    // Salt sits at the back, the IV right before it, the key fills the gap after the tag.
    const auto body{ raw.subspan(Scheme::g_tagBytes) };
    const auto salt{ body.last(saltBytes) };
    const auto iv{ body.first(body.size() - saltBytes).last(ivBytes) };
    const auto keyData{ body.first(body.size() - saltBytes - ivBytes) };
    if (keyData.size() != scheme.derivedKeyLength())
    {
        throw MalformedData{ "raw key: wrong key length" };
    }

    return EncryptionKey{ scheme, itemcrypt::security::secureBufferFrom(keyData),
                          std::vector<std::uint8_t>(iv.begin(), iv.end()),
                          std::vector<std::uint8_t>(salt.begin(), salt.end()), std::move(context) };
}

bool operator==(const EncryptionKey& a, const EncryptionKey& b) noexcept
{
    return a.m_scheme == b.m_scheme && a.m_iv == b.m_iv && a.m_salt == b.m_salt &&
           itemcrypt::security::secureEquals(std::span<const std::uint8_t>{ a.m_keyData },
                                             std::span<const std::uint8_t>{ b.m_keyData });
}

} // namespace itemcrypt::core
