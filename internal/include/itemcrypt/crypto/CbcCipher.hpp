#ifndef INCLUDE_ITEMCRYPT_CRYPTO_CBCCIPHER_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_CBCCIPHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace itemcrypt::crypto
{

constexpr std::size_t g_cbcKeyBytes{ 32 };
constexpr std::size_t g_cbcBlockBytes{ 16 };

enum class CipherDirection : std::uint8_t
{
    Encrypt,
    Decrypt,
};

// Incremental AES-256-CBC with PKCS7 padding.
// update() never writes more than input.size() + g_cbcBlockBytes bytes; finish() at most g_cbcBlockBytes.
class CbcCipher final
{
public:
    // Throws std::invalid_argument on key/iv size mismatch, std::runtime_error on backend failure.
    CbcCipher(CipherDirection direction, std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv);
    ~CbcCipher();

    CbcCipher(const CbcCipher&) = delete;
    CbcCipher& operator=(const CbcCipher&) = delete;
    CbcCipher(CbcCipher&&) noexcept;
    CbcCipher& operator=(CbcCipher&&) noexcept;

    [[nodiscard]] std::size_t update(std::span<const std::uint8_t> input, std::span<std::uint8_t> output);

    // std::nullopt when the padding does not check out on decryption.
    [[nodiscard]] std::optional<std::size_t> finish(std::span<std::uint8_t> output);

private:
    struct Context;

    CipherDirection m_direction;
    std::unique_ptr<Context> m_ctx;
};

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_CBCCIPHER_HPP
