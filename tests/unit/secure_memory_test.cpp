#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "itemcrypt/security/SecureMemory.hpp"

namespace
{

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

void expectAllBytesEq(std::span<const std::uint8_t> buffer, std::uint8_t expected)
{
    for (const auto b : buffer)
    {
        EXPECT_EQ(b, expected);
    }
}

} // namespace

TEST(SecureMemory, SecureWipeZerosBytes)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    itemcrypt::security::secureWipe(std::span<std::uint8_t>{ buffer });

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(SecureMemory, SecureWipeEmptyIsNoOp)
{
    std::span<std::byte> empty{};
    itemcrypt::security::secureWipe(empty);
    SUCCEED();
}

TEST(SecureMemory, ScopeWipeWipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const itemcrypt::security::ScopeWipe guard{ std::as_writable_bytes(std::span{ buffer }) };
        expectAllBytesEq(buffer, g_nonZeroByte);
    }

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(SecureMemory, ZeroAllocatorVectorGrowsAndKeepsValues)
{
    constexpr int kTestVal1 = 42;
    constexpr int kTestVal2 = 100;
    constexpr std::size_t kLargeSize = 1000;

    std::vector<int, itemcrypt::security::ZeroAllocator<int>> secureVec;
    secureVec.push_back(kTestVal1);
    secureVec.push_back(kTestVal2);

    // Forces re-allocation and wiping of old memory
    secureVec.resize(kLargeSize, 0);

    ASSERT_EQ(secureVec.size(), kLargeSize);
    EXPECT_EQ(secureVec[0], kTestVal1);
    EXPECT_EQ(secureVec[1], kTestVal2);
}

TEST(SecureMemory, ZeroAllocatorsCompareEqualAcrossTypes)
{
    const itemcrypt::security::ZeroAllocator<int> alloc1{};
    const itemcrypt::security::ZeroAllocator<double> alloc2(alloc1);

    EXPECT_TRUE(alloc1 == alloc1);
    EXPECT_TRUE(alloc1 == alloc2);
}

TEST(SecureMemory, SecureReleaseEmptiesContainer)
{
    auto s{ itemcrypt::security::secureStringFrom("correct horse") };
    ASSERT_FALSE(s.empty());

    itemcrypt::security::secureRelease(s);

    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
}

TEST(SecureMemory, SecureStringRoundTripsThroughStringView)
{
    constexpr std::string_view kText{ "p@ss w0rd" };
    const auto s{ itemcrypt::security::secureStringFrom(kText) };

    EXPECT_EQ(itemcrypt::security::asStringView(s), kText);
    EXPECT_EQ(itemcrypt::security::asBytes(s).size(), kText.size());
}

TEST(SecureMemory, EmptySecureStringViewIsEmpty)
{
    const itemcrypt::security::SecureString s{};
    EXPECT_TRUE(itemcrypt::security::asStringView(s).empty());
}

TEST(SecureMemory, SecureEqualsComparesContentAndLength)
{
    const std::array<std::uint8_t, 4> a{ 1U, 2U, 3U, 4U };
    const std::array<std::uint8_t, 4> same{ 1U, 2U, 3U, 4U };
    const std::array<std::uint8_t, 4> lastDiffers{ 1U, 2U, 3U, 5U };
    const std::array<std::uint8_t, 3> shorter{ 1U, 2U, 3U };

    EXPECT_TRUE(itemcrypt::security::secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ same }));
    EXPECT_FALSE(
        itemcrypt::security::secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ lastDiffers }));
    EXPECT_FALSE(
        itemcrypt::security::secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ shorter }));
}

TEST(SecureMemory, SecureBufferFromCopiesBytes)
{
    const std::array<std::uint8_t, 3> src{ 7U, 8U, 9U };
    const auto buffer{ itemcrypt::security::secureBufferFrom(std::span<const std::uint8_t>{ src }) };

    ASSERT_EQ(buffer.size(), src.size());
    EXPECT_EQ(buffer[0], 7U);
    EXPECT_EQ(buffer[2], 9U);
}
