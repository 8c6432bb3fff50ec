#ifndef INCLUDE_ITEMCRYPT_STORAGE_SQLITE_SQLITEKEYSTOREFACTORY_HPP
#define INCLUDE_ITEMCRYPT_STORAGE_SQLITE_SQLITEKEYSTOREFACTORY_HPP

#include "itemcrypt/storage/IKeyStore.hpp"
#include <filesystem>
#include <memory>

namespace itemcrypt::storage::sqlite
{

// Opens (creating if needed) a SQLite key database. Throws KeyStoreError when it cannot be opened.
[[nodiscard]] std::unique_ptr<itemcrypt::storage::IKeyStore> makeSqliteKeyStore(const std::filesystem::path& dbPath);

} // namespace itemcrypt::storage::sqlite

#endif // INCLUDE_ITEMCRYPT_STORAGE_SQLITE_SQLITEKEYSTOREFACTORY_HPP
