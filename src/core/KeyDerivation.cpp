#include "itemcrypt/core/KeyDerivation.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/crypto/KeyDerivation.hpp"

#include <limits>
#include <stdexcept>
#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <utility>

namespace itemcrypt::core
{
namespace
{

using SecureUString = std::vector<UChar, itemcrypt::security::ZeroAllocator<UChar>>;

int32_t toInt32(std::size_t size)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
    {
        throw std::invalid_argument("password too long");
    }
    return static_cast<int32_t>(size);
}

SecureUString utf8ToUtf16(std::string_view utf8)
{
    const int32_t srcLength{ toInt32(utf8.size()) };
    int32_t needed{ 0 };
    UErrorCode status{ U_ZERO_ERROR };
    u_strFromUTF8(nullptr, 0, &needed, utf8.data(), srcLength, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status))
    {
        throw std::invalid_argument("password is not valid UTF-8");
    }

    SecureUString out(static_cast<std::size_t>(needed) + 1U);
    status = U_ZERO_ERROR;
    u_strFromUTF8(out.data(), toInt32(out.size()), &needed, utf8.data(), srcLength, &status);
    if (U_FAILURE(status))
    {
        throw std::invalid_argument("password is not valid UTF-8");
    }
    out.resize(static_cast<std::size_t>(needed));
    return out;
}

// Returns [begin, end) of the text with Unicode whitespace removed from both ends.
std::pair<int32_t, int32_t> trimmedRange(const SecureUString& text)
{
    const int32_t length{ toInt32(text.size()) };
    int32_t begin{ 0 };
    while (begin < length)
    {
        int32_t next{ begin };
        UChar32 c{};
        U16_NEXT(text.data(), next, length, c);
        if (u_isUWhiteSpace(c) == 0)
        {
            break;
        }
        begin = next;
    }

    int32_t end{ length };
    while (end > begin)
    {
        int32_t prev{ end };
        UChar32 c{};
        U16_PREV(text.data(), begin, prev, c);
        if (u_isUWhiteSpace(c) == 0)
        {
            break;
        }
        end = prev;
    }
    return { begin, end };
}

SecureUString decomposeCanonical(const UChar* text, int32_t length)
{
    UErrorCode status{ U_ZERO_ERROR };
    const UNormalizer2* nfd{ unorm2_getNFDInstance(&status) };
    if (U_FAILURE(status) || nfd == nullptr)
    {
        throw std::runtime_error("normalizePassword: ICU NFD instance not available");
    }

    SecureUString out(static_cast<std::size_t>(length) * 3U + 16U);
    int32_t written{ unorm2_normalize(nfd, text, length, out.data(), toInt32(out.size()), &status) };
    if (status == U_BUFFER_OVERFLOW_ERROR)
    {
        out.assign(static_cast<std::size_t>(written), UChar{});
        status = U_ZERO_ERROR;
        written = unorm2_normalize(nfd, text, length, out.data(), toInt32(out.size()), &status);
    }
    if (U_FAILURE(status))
    {
        throw std::runtime_error("normalizePassword: unorm2_normalize failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

itemcrypt::security::SecureBuffer utf16ToUtf8(const SecureUString& text)
{
    const int32_t srcLength{ toInt32(text.size()) };
    int32_t needed{ 0 };
    UErrorCode status{ U_ZERO_ERROR };
    u_strToUTF8(nullptr, 0, &needed, text.data(), srcLength, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status))
    {
        throw std::runtime_error("normalizePassword: u_strToUTF8 failed");
    }

    itemcrypt::security::SecureBuffer out(static_cast<std::size_t>(needed) + 1U);
    status = U_ZERO_ERROR;
    u_strToUTF8(reinterpret_cast<char*>(out.data()), toInt32(out.size()), &needed, text.data(), srcLength, &status);
    if (U_FAILURE(status))
    {
        throw std::runtime_error("normalizePassword: u_strToUTF8 failed");
    }
    out.resize(static_cast<std::size_t>(needed));
    return out;
}

void requireSize(std::span<const std::uint8_t> bytes, std::size_t expected, KeyMaterialField field)
{
    if (bytes.size() != expected)
    {
        throw ImproperKeyMaterial{ field, expected, bytes.size() };
    }
}

} // namespace

itemcrypt::security::SecureBuffer normalizePassword(const itemcrypt::security::SecureString& password)
{
    if (password.empty())
    {
        throw EmptyPassword{};
    }

    const SecureUString wide{ utf8ToUtf16(itemcrypt::security::asStringView(password)) };
    const auto [begin, end]{ trimmedRange(wide) };
    if (begin == end)
    {
        throw EmptyPassword{};
    }

    const SecureUString decomposed{ decomposeCanonical(wide.data() + begin, end - begin) };
    return utf16ToUtf8(decomposed);
}

std::vector<std::uint8_t> stretchSalt(std::span<const std::uint8_t> seed, std::span<const std::string> contextKeywords,
                                      const Scheme& scheme)
{
    requireSize(seed, scheme.seedSize(), KeyMaterialField::Seed);
    return itemcrypt::crypto::hmacDigest(scheme.saltHmac(), seed, contextKeywords);
}

EncryptionKey deriveKey(const itemcrypt::security::SecureString& password, std::span<const std::uint8_t> seed,
                        std::span<const std::string> contextKeywords, std::span<const std::uint8_t> iv,
                        const Scheme& scheme)
{
    const std::vector<std::uint8_t> treatedSalt{ stretchSalt(seed, contextKeywords, scheme) };
    return deriveKey(password, treatedSalt, iv, scheme);
}

EncryptionKey deriveKey(const itemcrypt::security::SecureString& password, std::span<const std::uint8_t> treatedSalt,
                        std::span<const std::uint8_t> iv, const Scheme& scheme)
{
    requireSize(treatedSalt, scheme.stretchedSaltSize(), KeyMaterialField::Salt);
    requireSize(iv, scheme.initializationVectorSize(), KeyMaterialField::InitializationVector);

    const itemcrypt::security::SecureBuffer normalized{ normalizePassword(password) };
    itemcrypt::security::SecureBuffer keyData{ itemcrypt::crypto::deriveKeyPbkdf2(
        itemcrypt::security::asBytes(normalized), treatedSalt, scheme.pbkdf2Params()) };

    return EncryptionKey{ scheme, std::move(keyData), std::vector<std::uint8_t>(iv.begin(), iv.end()),
                          std::vector<std::uint8_t>(treatedSalt.begin(), treatedSalt.end()) };
}

std::vector<std::uint8_t> randomBytes(itemcrypt::crypto::ICryptoProvider& provider, std::size_t count)
{
    std::vector<std::uint8_t> out(count);
    if (!provider.randomBytes(out))
    {
        throw RandomFailure{ "secure random generator failed" };
    }
    return out;
}

EncryptionKey deriveRandomKey(itemcrypt::crypto::ICryptoProvider& provider,
                              const itemcrypt::security::SecureString& password,
                              std::span<const std::string> contextKeywords, const Scheme& scheme)
{
    const std::vector<std::uint8_t> seed{ randomBytes(provider, scheme.seedSize()) };
    const std::vector<std::uint8_t> iv{ randomBytes(provider, scheme.initializationVectorSize()) };
    return deriveKey(password, seed, contextKeywords, iv, scheme);
}

} // namespace itemcrypt::core
