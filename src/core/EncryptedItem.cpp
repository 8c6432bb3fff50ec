#include "itemcrypt/core/EncryptedItem.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

namespace itemcrypt::core
{

EncryptedItem::EncryptedItem(FormatVersion version, std::vector<std::uint8_t> iv, std::vector<std::uint8_t> cipherText,
                             std::vector<std::uint8_t> salt)
    : m_version{ version }, m_iv{ std::move(iv) }, m_cipherText{ std::move(cipherText) }, m_salt{ std::move(salt) }
{
    const Scheme scheme{ m_version };
    if (m_iv.size() != scheme.itemIvSize())
    {
        throw std::invalid_argument("EncryptedItem: iv does not match the version's slot width");
    }
    if (m_salt.size() != scheme.itemSaltSize())
    {
        throw std::invalid_argument("EncryptedItem: salt does not match the version's slot width");
    }
}

std::vector<std::uint8_t> EncryptedItem::serialize() const
{
    std::vector<std::uint8_t> out{};
    out.reserve(Scheme::g_tagBytes + m_iv.size() + m_cipherText.size() + m_salt.size());

    const Scheme::Tag tag{ Scheme{ m_version }.tag() };
    out.insert(out.end(), tag.begin(), tag.end());
    out.insert(out.end(), m_iv.begin(), m_iv.end());
    out.insert(out.end(), m_cipherText.begin(), m_cipherText.end());
    out.insert(out.end(), m_salt.begin(), m_salt.end());
    return out;
}

SerializationResult<EncryptedItem> parseEncryptedItem(std::span<const std::uint8_t> bytes)
{
    const std::optional<FormatVersion> version{ Scheme::versionFromTag(bytes) };
    if (!version)
    {
        return SerializationError::BadData;
    }

    const Scheme scheme{ *version };
    const std::size_t ivBytes{ scheme.itemIvSize() };
    const std::size_t saltBytes{ scheme.itemSaltSize() };
    if (bytes.size() < Scheme::g_tagBytes + ivBytes + saltBytes)
    {
        return SerializationError::BadData;
    }

    const auto body{ bytes.subspan(Scheme::g_tagBytes) };
    const auto iv{ body.first(ivBytes) };
    const auto salt{ body.last(saltBytes) };
    const auto cipherText{ body.subspan(ivBytes, body.size() - ivBytes - saltBytes) };

    return EncryptedItem{ *version, std::vector<std::uint8_t>(iv.begin(), iv.end()),
                          std::vector<std::uint8_t>(cipherText.begin(), cipherText.end()),
                          std::vector<std::uint8_t>(salt.begin(), salt.end()) };
}

} // namespace itemcrypt::core

std::size_t std::hash<itemcrypt::core::EncryptedItem>::operator()(const itemcrypt::core::EncryptedItem& item) const
{
    const std::vector<std::uint8_t> bytes{ item.serialize() };
    const std::string_view view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() };
    return std::hash<std::string_view>{}(view);
}
