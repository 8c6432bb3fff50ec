#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "itemcrypt/core/EncryptionKey.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"

namespace
{

using itemcrypt::core::EncryptionKey;
using itemcrypt::core::FormatVersion;
using itemcrypt::core::Scheme;

[[nodiscard]] EncryptionKey makeKey(FormatVersion version, std::uint8_t seed)
{
    const Scheme scheme{ version };
    itemcrypt::security::SecureBuffer keyData(scheme.derivedKeyLength(), seed);
    return EncryptionKey{ scheme, std::move(keyData),
                          std::vector<std::uint8_t>(scheme.initializationVectorSize(),
                                                    static_cast<std::uint8_t>(seed + 1U)),
                          std::vector<std::uint8_t>(scheme.stretchedSaltSize(), static_cast<std::uint8_t>(seed + 2U)) };
}

} // namespace

TEST(EncryptionKey, RawDataLayout)
{
    const auto key{ makeKey(FormatVersion::V1, 0x10U) };
    const auto raw{ key.rawData() };

    ASSERT_EQ(raw.size(), 3U + 32U + 16U + 32U);
    EXPECT_EQ(raw[0], 0x00U);
    EXPECT_EQ(raw[1], 0x00U);
    EXPECT_EQ(raw[2], 0x01U);
    EXPECT_EQ(raw[3], 0x10U);
    EXPECT_EQ(raw[3U + 32U], 0x11U);
    EXPECT_EQ(raw.back(), 0x12U);
}

TEST(EncryptionKey, RawDataParsesBackForBothSchemes)
{
    for (const auto version : { FormatVersion::V1, FormatVersion::V2 })
    {
        const auto key{ makeKey(version, 0x20U) };
        const auto parsed{ EncryptionKey::fromRawData(key.rawData(), std::string{ "mail" }) };

        EXPECT_EQ(parsed, key);
        EXPECT_EQ(parsed.scheme().version(), version);
        ASSERT_TRUE(parsed.context().has_value());
        EXPECT_EQ(*parsed.context(), "mail");
    }
}

TEST(EncryptionKey, ContextDoesNotAffectEquality)
{
    const auto key{ makeKey(FormatVersion::V2, 0x30U) };
    const auto labelled{ key.withContext(std::string{ "work" }) };

    EXPECT_EQ(key, labelled);
    EXPECT_FALSE(key.context().has_value());
    EXPECT_EQ(labelled.context(), std::optional<std::string>{ "work" });
}

TEST(EncryptionKey, DifferentKeyBytesAreNotEqual)
{
    EXPECT_FALSE(makeKey(FormatVersion::V1, 0x01U) == makeKey(FormatVersion::V1, 0x02U));
    EXPECT_FALSE(makeKey(FormatVersion::V1, 0x01U) == makeKey(FormatVersion::V2, 0x01U));
}

TEST(EncryptionKey, ConstructorValidatesFieldLengths)
{
    const Scheme v1{ FormatVersion::V1 };
    const std::vector<std::uint8_t> iv(v1.initializationVectorSize());
    const std::vector<std::uint8_t> salt(v1.stretchedSaltSize());

    EXPECT_THROW((EncryptionKey{ v1, itemcrypt::security::SecureBuffer(16U), iv, salt }),
                 itemcrypt::core::ImproperKeyMaterial);
    EXPECT_THROW((EncryptionKey{ v1, itemcrypt::security::SecureBuffer(32U), std::vector<std::uint8_t>(12U), salt }),
                 itemcrypt::core::ImproperKeyMaterial);
    EXPECT_THROW((EncryptionKey{ v1, itemcrypt::security::SecureBuffer(32U), iv, std::vector<std::uint8_t>(16U) }),
                 itemcrypt::core::ImproperKeyMaterial);
}

TEST(EncryptionKey, FromRawDataRejectsMalformedInput)
{
    const auto raw{ makeKey(FormatVersion::V1, 0x40U).rawData() };

    auto unknownTag{ raw };
    unknownTag[2] = 0x09U;
    EXPECT_THROW((void)EncryptionKey::fromRawData(unknownTag), itemcrypt::core::MalformedData);

    auto truncated{ raw };
    truncated.resize(20U);
    EXPECT_THROW((void)EncryptionKey::fromRawData(truncated), itemcrypt::core::MalformedData);

    auto extraKeyByte{ raw };
    extraKeyByte.insert(extraKeyByte.begin() + 3, 0xAAU);
    EXPECT_THROW((void)EncryptionKey::fromRawData(extraKeyByte), itemcrypt::core::MalformedData);

    EXPECT_THROW((void)EncryptionKey::fromRawData({}), itemcrypt::core::MalformedData);
}
