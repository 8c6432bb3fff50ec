#ifndef INCLUDE_ITEMCRYPT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_ITEMCRYPT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace itemcrypt::storage
{

class KeyStoreError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace itemcrypt::storage

#endif // INCLUDE_ITEMCRYPT_STORAGE_STORAGEERRORS_HPP
