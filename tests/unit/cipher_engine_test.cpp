#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "itemcrypt/core/CipherEngine.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using itemcrypt::core::CipherEngine;
using itemcrypt::core::EncryptedItem;
using itemcrypt::core::EncryptionKey;
using itemcrypt::core::FormatVersion;
using itemcrypt::core::Scheme;
using itemcrypt::test_utils::asBytes;

[[nodiscard]] EncryptionKey makeKey(FormatVersion version, std::uint8_t fill)
{
    const Scheme scheme{ version };
    return EncryptionKey{ scheme, itemcrypt::security::SecureBuffer(scheme.derivedKeyLength(), fill),
                          std::vector<std::uint8_t>(scheme.initializationVectorSize(), 0x5AU),
                          std::vector<std::uint8_t>(scheme.stretchedSaltSize(), 0xA5U) };
}

[[nodiscard]] std::string patterned(std::size_t n)
{
    std::string out(n, '\0');
    for (std::size_t i{}; i < n; ++i)
    {
        out[i] = static_cast<char>('a' + (i % 26U));
    }
    return out;
}

[[nodiscard]] std::string asString(const itemcrypt::security::SecureBuffer& b)
{
    return std::string{ itemcrypt::test_utils::asStringView(b) };
}

class CipherEngineTest : public ::testing::Test
{
protected:
    std::unique_ptr<itemcrypt::crypto::ICryptoProvider> m_provider{
        itemcrypt::crypto::providers::makeOpenSslCryptoProvider()
    }; // NOLINT
    CipherEngine m_engine{ *m_provider }; // NOLINT
};

} // namespace

TEST_F(CipherEngineTest, V1RoundTrip)
{
    const auto key{ makeKey(FormatVersion::V1, 0x01U) };
    constexpr std::string_view kPlain{ "Hello, world!" };

    const auto item{ m_engine.encrypt(asBytes(kPlain), key) };
    EXPECT_EQ(item.version(), FormatVersion::V1);
    EXPECT_EQ(item.iv(), key.initializationVector());
    EXPECT_EQ(item.salt(), key.salt());
    EXPECT_EQ(item.cipherText().size(), 16U);

    EXPECT_EQ(asString(m_engine.decrypt(item, key)), kPlain);
}

TEST_F(CipherEngineTest, V1SpansSeveralBuffers)
{
    const auto key{ makeKey(FormatVersion::V1, 0x02U) };
    const std::string plain{ patterned(3U * 1024U + 7U) };

    const auto item{ m_engine.encrypt(asBytes(plain), key) };
    EXPECT_EQ(item.cipherText().size(), ((plain.size() / 16U) + 1U) * 16U);
    EXPECT_EQ(asString(m_engine.decrypt(item, key)), plain);
}

TEST_F(CipherEngineTest, V2RoundTripUsesFreshNonces)
{
    const auto key{ makeKey(FormatVersion::V2, 0x03U) };
    constexpr std::string_view kPlain{ "Hello, world!" };

    const auto a{ m_engine.encrypt(asBytes(kPlain), key) };
    const auto b{ m_engine.encrypt(asBytes(kPlain), key) };

    EXPECT_EQ(a.version(), FormatVersion::V2);
    EXPECT_EQ(a.cipherText().size(), kPlain.size());
    EXPECT_EQ(a.salt().size(), 16U);
    EXPECT_NE(a.iv(), b.iv());
    EXPECT_EQ(asString(m_engine.decrypt(a, key)), kPlain);
    EXPECT_EQ(asString(m_engine.decrypt(b, key)), kPlain);
}

TEST_F(CipherEngineTest, V2CallerNonceIsStored)
{
    const auto key{ makeKey(FormatVersion::V2, 0x04U) };
    itemcrypt::crypto::AeadNonce nonce{};
    nonce.fill(0x77U);

    const auto item{ m_engine.encrypt(asBytes("payload"), key, nonce) };
    EXPECT_EQ(item.iv(), std::vector<std::uint8_t>(nonce.begin(), nonce.end()));
    EXPECT_EQ(asString(m_engine.decrypt(item, key)), "payload");
}

TEST_F(CipherEngineTest, CallerNonceNeedsAeadScheme)
{
    const auto key{ makeKey(FormatVersion::V1, 0x05U) };
    const itemcrypt::crypto::AeadNonce nonce{};
    EXPECT_THROW((void)m_engine.encrypt(asBytes("payload"), key, nonce), itemcrypt::core::UnsupportedOperation);
}

TEST_F(CipherEngineTest, EmptyPayloadRoundTripsForBothSchemes)
{
    for (const auto version : { FormatVersion::V1, FormatVersion::V2 })
    {
        const auto key{ makeKey(version, 0x06U) };
        const auto item{ m_engine.encrypt({}, key) };
        EXPECT_EQ(item.cipherText().size(), version == FormatVersion::V1 ? 16U : 0U);
        EXPECT_TRUE(m_engine.decrypt(item, key).empty());
    }
}

TEST_F(CipherEngineTest, WrongKeyFailsToDecrypt)
{
    for (const auto version : { FormatVersion::V1, FormatVersion::V2 })
    {
        const auto key{ makeKey(version, 0x07U) };
        const auto other{ makeKey(version, 0x08U) };
        const auto item{ m_engine.encrypt(asBytes("attack at dawn"), key) };

        if (version == FormatVersion::V2)
        {
            EXPECT_THROW((void)m_engine.decrypt(item, other), itemcrypt::core::DecryptionFailed);
            continue;
        }
        // CBC without a MAC can pass the padding check by chance; it must not return the plaintext.
        try
        {
            EXPECT_NE(asString(m_engine.decrypt(item, other)), "attack at dawn");
        }
        catch (const itemcrypt::core::DecryptionFailed&)
        {
            SUCCEED();
        }
    }
}

TEST_F(CipherEngineTest, V2TamperingIsDetected)
{
    const auto key{ makeKey(FormatVersion::V2, 0x09U) };
    const auto item{ m_engine.encrypt(asBytes("attack at dawn"), key) };

    auto cipherText{ item.cipherText() };
    cipherText[0] ^= 0x01U;
    const EncryptedItem flipped{ item.version(), item.iv(), cipherText, item.salt() };
    EXPECT_THROW((void)m_engine.decrypt(flipped, key), itemcrypt::core::DecryptionFailed);

    auto tag{ item.salt() };
    tag.back() ^= 0x01U;
    const EncryptedItem badTag{ item.version(), item.iv(), item.cipherText(), tag };
    EXPECT_THROW((void)m_engine.decrypt(badTag, key), itemcrypt::core::DecryptionFailed);
}

TEST_F(CipherEngineTest, V1TruncatedCipherTextFails)
{
    const auto key{ makeKey(FormatVersion::V1, 0x0AU) };
    const auto item{ m_engine.encrypt(asBytes("attack at dawn"), key) };

    auto cipherText{ item.cipherText() };
    cipherText.pop_back();
    const EncryptedItem truncated{ item.version(), item.iv(), cipherText, item.salt() };
    EXPECT_THROW((void)m_engine.decrypt(truncated, key), itemcrypt::core::DecryptionFailed);
}

TEST_F(CipherEngineTest, VersionMismatchIsRejectedBeforeDecrypting)
{
    const auto v1Key{ makeKey(FormatVersion::V1, 0x0BU) };
    const auto v2Key{ makeKey(FormatVersion::V2, 0x0BU) };

    const auto v1Item{ m_engine.encrypt(asBytes("data"), v1Key) };
    const auto v2Item{ m_engine.encrypt(asBytes("data"), v2Key) };

    EXPECT_THROW((void)m_engine.decrypt(v1Item, v2Key), itemcrypt::core::IncorrectVersion);
    EXPECT_THROW((void)m_engine.decrypt(v2Item, v1Key), itemcrypt::core::IncorrectVersion);
}

TEST_F(CipherEngineTest, StreamMatchesInMemoryCipherText)
{
    const auto key{ makeKey(FormatVersion::V1, 0x0CU) };
    const std::string plain{ patterned(2500U) };

    std::istringstream in{ plain };
    std::ostringstream out{};
    m_engine.encryptStream(in, key, out);

    const auto item{ m_engine.encrypt(asBytes(plain), key) };
    const std::string streamed{ out.str() };
    EXPECT_EQ(streamed, std::string(item.cipherText().begin(), item.cipherText().end()));

    std::istringstream cipherIn{ streamed };
    std::ostringstream plainOut{};
    m_engine.decryptStream(cipherIn, key, plainOut);
    EXPECT_EQ(plainOut.str(), plain);
}

TEST_F(CipherEngineTest, StreamHandlesExactBufferMultipleAndEmptyInput)
{
    const auto key{ makeKey(FormatVersion::V1, 0x0DU) };

    for (const std::size_t size : { std::size_t{ 0U }, std::size_t{ 1024U }, std::size_t{ 2048U } })
    {
        const std::string plain{ patterned(size) };
        std::istringstream in{ plain };
        std::ostringstream out{};
        m_engine.encryptStream(in, key, out);
        EXPECT_EQ(out.str().size(), size + 16U);

        std::istringstream cipherIn{ out.str() };
        std::ostringstream plainOut{};
        m_engine.decryptStream(cipherIn, key, plainOut);
        EXPECT_EQ(plainOut.str(), plain);
    }
}

TEST_F(CipherEngineTest, StreamingIsUnsupportedForV2)
{
    const auto key{ makeKey(FormatVersion::V2, 0x0EU) };
    std::istringstream in{ "data" };
    std::ostringstream out{};

    EXPECT_THROW(m_engine.encryptStream(in, key, out), itemcrypt::core::UnsupportedOperation);
    EXPECT_THROW(m_engine.decryptStream(in, key, out), itemcrypt::core::UnsupportedOperation);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CipherEngineTest, StreamDecryptOfCorruptInputFails)
{
    const auto key{ makeKey(FormatVersion::V1, 0x0FU) };
    std::istringstream in{ std::string(17U, 'x') };
    std::ostringstream out{};

    EXPECT_THROW(m_engine.decryptStream(in, key, out), itemcrypt::core::DecryptionFailed);
}

TEST_F(CipherEngineTest, LargeStreamRoundTrip)
{
    if (!itemcrypt::test_utils::envFlagSet("ITEMCRYPT_RUN_SLOW_TESTS"))
    {
        GTEST_SKIP() << "Set ITEMCRYPT_RUN_SLOW_TESTS=1 to run large-payload stream tests.";
    }

    constexpr std::size_t kPayloadBytes{ 16U * 1024U * 1024U + 5U };
    const auto key{ makeKey(FormatVersion::V1, 0x10U) };
    const std::string plain{ patterned(kPayloadBytes) };

    std::istringstream in{ plain };
    std::ostringstream out{};
    m_engine.encryptStream(in, key, out);
    EXPECT_EQ(out.str().size(), ((kPayloadBytes / 16U) + 1U) * 16U);

    std::istringstream cipherIn{ out.str() };
    std::ostringstream plainOut{};
    m_engine.decryptStream(cipherIn, key, plainOut);
    EXPECT_TRUE(plainOut.str() == plain);
}
