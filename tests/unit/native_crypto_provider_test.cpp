#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "itemcrypt/crypto/providers/NativeProviderFactory.hpp"
#include "itemcrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using itemcrypt::test_utils::asBytes;

constexpr std::uint8_t g_keyByteBase{ 0xA0U };

[[nodiscard]] std::array<std::uint8_t, itemcrypt::crypto::g_aeadKeyBytes> makeKey() noexcept
{
    std::array<std::uint8_t, itemcrypt::crypto::g_aeadKeyBytes> key{};
    for (std::size_t i{}; i < key.size(); ++i)
    {
        key[i] = static_cast<std::uint8_t>(g_keyByteBase + i);
    }
    return key;
}

} // namespace

TEST(NativeCryptoProvider, AeadRoundTrip)
{
    auto provider = itemcrypt::crypto::providers::makeNativeCryptoProvider();

    const auto key{ makeKey() };
    constexpr std::string_view kAd{ "header" };
    constexpr std::string_view kPlain{ "secret-data" };
    itemcrypt::crypto::AeadNonce nonce{};
    nonce.fill(0x05U);

    const auto box = provider->aeadEncrypt(std::span<const std::uint8_t>{ key }, nonce, asBytes(kPlain), asBytes(kAd));
    const auto decrypted = provider->aeadDecrypt(std::span<const std::uint8_t>{ key }, box, asBytes(kAd));

    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(itemcrypt::test_utils::asStringView(*decrypted), kPlain);
}

TEST(NativeCryptoProvider, AeadTamperFails)
{
    auto provider = itemcrypt::crypto::providers::makeNativeCryptoProvider();

    const auto key{ makeKey() };
    constexpr std::string_view kAd{ "header" };
    itemcrypt::crypto::AeadNonce nonce{};

    auto box = provider->aeadEncrypt(std::span<const std::uint8_t>{ key }, nonce, asBytes("secret-data"), asBytes(kAd));
    box.tag[0] ^= 0x01U;

    const auto decrypted = provider->aeadDecrypt(std::span<const std::uint8_t>{ key }, box, asBytes(kAd));
    EXPECT_FALSE(decrypted.has_value());
}

TEST(NativeCryptoProvider, RejectsWrongKeySize)
{
    auto provider = itemcrypt::crypto::providers::makeNativeCryptoProvider();

    std::array<std::uint8_t, itemcrypt::crypto::g_aeadKeyBytes - 1U> key{};
    const itemcrypt::crypto::AeadNonce nonce{};
    EXPECT_THROW((void)provider->aeadEncrypt(std::span<const std::uint8_t>{ key }, nonce, asBytes("x"), asBytes("")),
                 std::invalid_argument);
}

TEST(NativeCryptoProvider, SealsIdenticallyToOpenSsl)
{
    auto native = itemcrypt::crypto::providers::makeNativeCryptoProvider();
    auto openssl = itemcrypt::crypto::providers::makeOpenSslCryptoProvider();

    const auto key{ makeKey() };
    itemcrypt::crypto::AeadNonce nonce{};
    nonce.fill(0x42U);
    constexpr std::string_view kAd{ "\x00\x00\x02", 3U };
    constexpr std::string_view kPlain{ "the same bytes through both backends" };

    const auto a = native->aeadEncrypt(std::span<const std::uint8_t>{ key }, nonce, asBytes(kPlain), asBytes(kAd));
    const auto b = openssl->aeadEncrypt(std::span<const std::uint8_t>{ key }, nonce, asBytes(kPlain), asBytes(kAd));

    EXPECT_EQ(a.cipherText, b.cipherText);
    EXPECT_EQ(a.tag, b.tag);

    const auto opened = openssl->aeadDecrypt(std::span<const std::uint8_t>{ key }, a, asBytes(kAd));
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(itemcrypt::test_utils::asStringView(*opened), kPlain);
}
