#ifndef INCLUDE_ITEMCRYPT_CORE_SERIALIZATIONERRORS_HPP
#define INCLUDE_ITEMCRYPT_CORE_SERIALIZATIONERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace itemcrypt::core
{

// Result-level errors returned by the facade.
enum class SerializationError : std::uint8_t
{
    NoPassword,
    ImproperSeed,
    ImproperSalt,
    ImproperInitializationVector,
    IncorrectVersion,
    BadData,
    DecryptionFailed,
    UnsupportedOperation,
    StreamError,
    RandomFailed,
    CryptoError,
};

template <class T> using SerializationResult = std::variant<T, SerializationError>;

[[nodiscard]] std::string_view describe(SerializationError error) noexcept;

enum class KeyMaterialField : std::uint8_t
{
    Seed,
    Salt,
    InitializationVector,
    KeyData,
};

[[nodiscard]] std::string_view fieldName(KeyMaterialField field) noexcept;

// Seed, salt, IV or key bytes of the wrong length for the scheme in use.
class ImproperKeyMaterial final : public std::invalid_argument
{
public:
    ImproperKeyMaterial(KeyMaterialField field, std::size_t expected, std::size_t actual);

    [[nodiscard]] KeyMaterialField field() const noexcept
    {
        return m_field;
    }
    [[nodiscard]] std::size_t expected() const noexcept
    {
        return m_expected;
    }
    [[nodiscard]] std::size_t actual() const noexcept
    {
        return m_actual;
    }

private:
    KeyMaterialField m_field;
    std::size_t m_expected;
    std::size_t m_actual;
};

class EmptyPassword final : public std::invalid_argument
{
public:
    EmptyPassword() : std::invalid_argument{ "password is empty" }
    {
    }
};

// Item version and key scheme disagree.
class IncorrectVersion final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class UnsupportedOperation final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Bytes that do not form a valid container or raw key.
class MalformedData final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Wrong key, wrong password and tampering all surface as this one error.
class DecryptionFailed final : public std::runtime_error
{
public:
    DecryptionFailed() : std::runtime_error{ "failed to decrypt: wrong password or corrupted data" }
    {
    }
};

class RandomFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class StreamFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace itemcrypt::core

#endif // INCLUDE_ITEMCRYPT_CORE_SERIALIZATIONERRORS_HPP
