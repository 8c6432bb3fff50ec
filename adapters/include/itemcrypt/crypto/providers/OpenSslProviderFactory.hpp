#ifndef INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include <memory>

namespace itemcrypt::crypto::providers
{

[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace itemcrypt::crypto::providers

#endif // INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
