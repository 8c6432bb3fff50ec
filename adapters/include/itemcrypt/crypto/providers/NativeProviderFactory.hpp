#ifndef INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include <memory>

namespace itemcrypt::crypto::providers
{

[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace itemcrypt::crypto::providers

#endif // INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
