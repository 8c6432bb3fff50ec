#ifndef ITEMCRYPT_UI_CLI_CONSOLEUTILS_HPP
#define ITEMCRYPT_UI_CLI_CONSOLEUTILS_HPP

#include "itemcrypt/security/SecureMemory.hpp"
#include <string>

namespace itemcrypt::ui::cli
{

// Best effort: pins pages and disables core dumps so key material does not reach disk.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo switched off.
[[nodiscard]] itemcrypt::security::SecureString readPassword(const std::string& prompt);

} // namespace itemcrypt::ui::cli

#endif // ITEMCRYPT_UI_CLI_CONSOLEUTILS_HPP
