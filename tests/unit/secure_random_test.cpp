#include "itemcrypt/security/SecureRandom.hpp"
#include <array>
#include <gtest/gtest.h>

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0> bytes{};
    EXPECT_TRUE(itemcrypt::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, FillNonEmptyReturnsTrue)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> bytes{};
    EXPECT_TRUE(itemcrypt::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, BytesHaveRequestedLength)
{
    constexpr std::size_t kBytesLen{ 48U };
    const auto bytes{ itemcrypt::security::secureRandomBytes(kBytesLen) };
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size(), kBytesLen);
}

TEST(SecureRandom, ConsecutiveDrawsDiffer)
{
    constexpr std::size_t kBytesLen{ 32U };
    const auto a{ itemcrypt::security::secureRandomBytes(kBytesLen) };
    const auto b{ itemcrypt::security::secureRandomBytes(kBytesLen) };
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
}

TEST(SecureRandom, ZeroBytesIsEmpty)
{
    const auto bytes{ itemcrypt::security::secureRandomBytes(0U) };
    ASSERT_TRUE(bytes.has_value());
    EXPECT_TRUE(bytes->empty());
}
