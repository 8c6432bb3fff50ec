#ifndef ITEMCRYPT_UI_CLI_COMMANDLINE_HPP
#define ITEMCRYPT_UI_CLI_COMMANDLINE_HPP

#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include "itemcrypt/security/SecureMemory.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace itemcrypt::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<itemcrypt::security::SecureString(const std::string&)>;

struct CryptOptions final
{
    std::string input;
    std::string output;
    std::string scheme;
    std::string store;
    std::string keyTag;
    bool stream{ false };
};

struct KeyOptions final
{
    std::string tag;
    std::string store;
    std::string scheme;
    std::string context;
    std::vector<std::string> keywords;
};

// `itemcrypt` command set: encrypt, decrypt and key create|show|rm.
// Status goes to `out`, diagnostics to `err`; run() returns the process exit code.
class CommandLine final
{
public:
    CommandLine(itemcrypt::crypto::ICryptoProvider& crypto, std::ostream& out, std::ostream& err,
                PasswordReader pwdReader);

    // `args` excludes the program name.
    int run(const std::vector<std::string>& args);

private:
    itemcrypt::crypto::ICryptoProvider& m_crypto;
    std::ostream& m_out;
    std::ostream& m_err;
    PasswordReader m_pwdReader;

    int doEncrypt(const CryptOptions& opts);
    int doDecrypt(const CryptOptions& opts);
    int doKeyCreate(const KeyOptions& opts);
    int doKeyShow(const KeyOptions& opts);
    int doKeyRm(const KeyOptions& opts);

    [[nodiscard]] std::optional<itemcrypt::security::SecureString> readNewPassword();
    int fail(const std::string& message);
};

} // namespace itemcrypt::ui::cli

#endif // ITEMCRYPT_UI_CLI_COMMANDLINE_HPP
