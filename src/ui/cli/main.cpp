#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include "itemcrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#if defined(ITEMCRYPT_HAS_NATIVE_PROVIDER)
#include "itemcrypt/crypto/providers/NativeProviderFactory.hpp"
#endif

namespace
{

[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeProvider()
{
#if defined(ITEMCRYPT_HAS_NATIVE_PROVIDER)
    return itemcrypt::crypto::providers::makeNativeCryptoProvider();
#else
    return itemcrypt::crypto::providers::makeOpenSslCryptoProvider();
#endif
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        itemcrypt::ui::cli::lockProcessMemory();

        auto crypto{ makeProvider() };
        itemcrypt::ui::cli::CommandLine commandLine{ *crypto, std::cout, std::cerr,
                                                     &itemcrypt::ui::cli::readPassword };

        std::vector<std::string> args{};
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return commandLine.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
