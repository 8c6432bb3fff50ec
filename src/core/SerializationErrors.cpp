#include "itemcrypt/core/SerializationErrors.hpp"

namespace itemcrypt::core
{

std::string_view describe(SerializationError error) noexcept
{
    switch (error)
    {
    case SerializationError::NoPassword:
        return "no password given";
    case SerializationError::ImproperSeed:
        return "seed has the wrong length for the scheme";
    case SerializationError::ImproperSalt:
        return "salt has the wrong length for the scheme";
    case SerializationError::ImproperInitializationVector:
        return "initialization vector has the wrong length for the scheme";
    case SerializationError::IncorrectVersion:
        return "item version does not match the key scheme";
    case SerializationError::BadData:
        return "data is not a valid encrypted item";
    case SerializationError::DecryptionFailed:
        return "failed to decrypt: wrong password or corrupted data";
    case SerializationError::UnsupportedOperation:
        return "operation is not supported by this scheme";
    case SerializationError::StreamError:
        return "stream read or write failed";
    case SerializationError::RandomFailed:
        return "secure random generator failed";
    case SerializationError::CryptoError:
        return "cryptographic backend failure";
    }
    return "unknown error";
}

std::string_view fieldName(KeyMaterialField field) noexcept
{
    switch (field)
    {
    case KeyMaterialField::Seed:
        return "seed";
    case KeyMaterialField::Salt:
        return "salt";
    case KeyMaterialField::InitializationVector:
        return "initialization vector";
    case KeyMaterialField::KeyData:
        return "key data";
    }
    return "key material";
}

ImproperKeyMaterial::ImproperKeyMaterial(KeyMaterialField field, std::size_t expected, std::size_t actual)
    : std::invalid_argument{ "improper " + std::string{ fieldName(field) } + ": expected " + std::to_string(expected) +
                             " bytes, got " + std::to_string(actual) },
      m_field{ field }, m_expected{ expected }, m_actual{ actual }
{
}

} // namespace itemcrypt::core
