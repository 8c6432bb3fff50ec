#include "CommandLine.hpp"

#include "itemcrypt/core/EncryptionSerialization.hpp"
#include "itemcrypt/core/Scheme.hpp"
#include "itemcrypt/core/SerializationErrors.hpp"
#include "itemcrypt/storage/StorageErrors.hpp"
#include "itemcrypt/storage/sqlite/SqliteKeyStoreFactory.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <utility>
#include <variant>

namespace itemcrypt::ui::cli
{
namespace
{

using itemcrypt::core::EncryptedItem;
using itemcrypt::core::EncryptionKey;
using itemcrypt::core::Scheme;
using itemcrypt::core::SerializationError;
using itemcrypt::security::SecureBuffer;

[[nodiscard]] Scheme schemeFromName(const std::string& name)
{
    if (name == Scheme{ itemcrypt::core::FormatVersion::V1 }.name())
    {
        return Scheme{ itemcrypt::core::FormatVersion::V1 };
    }
    return Scheme{ itemcrypt::core::FormatVersion::V2 };
}

[[nodiscard]] std::optional<SecureBuffer> readFile(const std::string& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        return std::nullopt;
    }
    SecureBuffer bytes(std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{});
    if (in.bad())
    {
        return std::nullopt;
    }
    return bytes;
}

[[nodiscard]] bool writeFile(const std::string& path, std::span<const std::uint8_t> bytes)
{
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    return static_cast<bool>(out);
}

// Stream output may hold a partial result once a stream operation fails.
void discardOutput(std::ofstream& out, const std::string& path) noexcept
{
    out.close();
    std::error_code ec{};
    std::filesystem::remove(path, ec);
}

[[nodiscard]] std::string errorText(SerializationError error)
{
    return std::string{ itemcrypt::core::describe(error) };
}

} // namespace

CommandLine::CommandLine(itemcrypt::crypto::ICryptoProvider& crypto, std::ostream& out, std::ostream& err,
                         PasswordReader pwdReader)
    : m_crypto(crypto), m_out(out), m_err(err), m_pwdReader(std::move(pwdReader))
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    const std::string defaultScheme{ Scheme::defaultScheme().name() };
    const std::vector<std::string> schemeNames{ std::string{ Scheme{ itemcrypt::core::FormatVersion::V1 }.name() },
                                                std::string{ Scheme{ itemcrypt::core::FormatVersion::V2 }.name() } };

    CLI::App app{ "itemcrypt - password and key based item encryption", "itemcrypt" };
    app.require_subcommand(1);

    CryptOptions encOpts{};
    encOpts.scheme = defaultScheme;
    auto* subEncrypt = app.add_subcommand("encrypt", "Encrypt a file into an item container");
    subEncrypt->add_option("input", encOpts.input, "Plaintext file")->required();
    subEncrypt->add_option("output", encOpts.output, "Destination file")->required();
    subEncrypt->add_option("--scheme", encOpts.scheme, "Format for password encryption")
        ->check(CLI::IsMember(schemeNames));
    auto* encStore = subEncrypt->add_option("--store", encOpts.store, "Key database");
    auto* encKey = subEncrypt->add_option("--key", encOpts.keyTag, "Tag of a stored key to encrypt with");
    encKey->needs(encStore);
    subEncrypt->add_flag("--stream", encOpts.stream, "Write raw ciphertext in bounded chunks (v1 keys)")->needs(encKey);

    CryptOptions decOpts{};
    decOpts.scheme = defaultScheme;
    auto* subDecrypt = app.add_subcommand("decrypt", "Decrypt an item container into a file");
    subDecrypt->add_option("input", decOpts.input, "Encrypted file")->required();
    subDecrypt->add_option("output", decOpts.output, "Destination file")->required();
    auto* decStore = subDecrypt->add_option("--store", decOpts.store, "Key database");
    auto* decKey = subDecrypt->add_option("--key", decOpts.keyTag, "Tag of a stored key to decrypt with");
    decKey->needs(decStore);
    subDecrypt->add_flag("--stream", decOpts.stream, "Read raw ciphertext in bounded chunks (v1 keys)")->needs(decKey);

    auto* subKey = app.add_subcommand("key", "Manage stored keys");
    subKey->require_subcommand(1);

    KeyOptions createOpts{};
    createOpts.scheme = defaultScheme;
    auto* subCreate = subKey->add_subcommand("create", "Derive a fresh key from a password and store it");
    subCreate->add_option("tag", createOpts.tag, "Key tag")->required();
    subCreate->add_option("--store", createOpts.store, "Key database")->required();
    subCreate->add_option("--scheme", createOpts.scheme, "Key format")->check(CLI::IsMember(schemeNames));
    subCreate->add_option("--context", createOpts.context, "Free-text label kept with the key");
    subCreate->add_option("--keyword", createOpts.keywords, "Context keyword mixed into the salt (ordered)");

    KeyOptions showOpts{};
    auto* subShow = subKey->add_subcommand("show", "Describe a stored key");
    subShow->add_option("tag", showOpts.tag, "Key tag")->required();
    subShow->add_option("--store", showOpts.store, "Key database")->required();

    KeyOptions rmOpts{};
    auto* subRm = subKey->add_subcommand("rm", "Delete a stored key");
    subRm->add_option("tag", rmOpts.tag, "Key tag")->required();
    subRm->add_option("--store", rmOpts.store, "Key database")->required();

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1U);
        std::string programName{ "itemcrypt" };
        argv.push_back(programName.data());
        std::vector<std::string> argsCopy{ args };
        for (auto& arg : argsCopy)
        {
            argv.push_back(arg.data());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, m_out, m_err);
    }

    try
    {
        if (subEncrypt->parsed())
        {
            return doEncrypt(encOpts);
        }
        if (subDecrypt->parsed())
        {
            return doDecrypt(decOpts);
        }
        if (subCreate->parsed())
        {
            return doKeyCreate(createOpts);
        }
        if (subShow->parsed())
        {
            return doKeyShow(showOpts);
        }
        if (subRm->parsed())
        {
            return doKeyRm(rmOpts);
        }
    }
    catch (const itemcrypt::storage::KeyStoreError& e)
    {
        return fail(e.what());
    }
    catch (const itemcrypt::core::MalformedData& e)
    {
        return fail(e.what());
    }
    return fail("no command given");
}

int CommandLine::fail(const std::string& message)
{
    m_err << "Error: " << message << "\n";
    return 1;
}

std::optional<itemcrypt::security::SecureString> CommandLine::readNewPassword()
{
    auto p1 = m_pwdReader("Password: ");
    auto p2 = m_pwdReader("Confirm Password: ");
    if (itemcrypt::security::asStringView(p1) != itemcrypt::security::asStringView(p2))
    {
        return std::nullopt;
    }
    return p1;
}

int CommandLine::doEncrypt(const CryptOptions& opts)
{
    const itemcrypt::core::EncryptionSerialization serializer{ m_crypto };

    if (opts.stream)
    {
        auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
        const auto key = store->key(opts.keyTag);
        if (!key)
        {
            return fail("no key stored under '" + opts.keyTag + "'");
        }
        std::ifstream in{ opts.input, std::ios::binary };
        std::ofstream out{ opts.output, std::ios::binary | std::ios::trunc };
        if (!in || !out)
        {
            if (out.is_open())
            {
                discardOutput(out, opts.output);
            }
            return fail("cannot open input or output file");
        }
        const auto res = serializer.encryptStream(in, *key, out);
        if (const auto* err = std::get_if<SerializationError>(&res))
        {
            discardOutput(out, opts.output);
            return fail(errorText(*err));
        }
        m_out << "Stream encrypted with scheme " << key->scheme().name() << ".\n";
        return 0;
    }

    const auto plainText = readFile(opts.input);
    if (!plainText)
    {
        return fail("cannot read '" + opts.input + "'");
    }

    itemcrypt::core::SerializationResult<EncryptedItem> res{ SerializationError::NoPassword };
    if (!opts.keyTag.empty())
    {
        auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
        const auto key = store->key(opts.keyTag);
        if (!key)
        {
            return fail("no key stored under '" + opts.keyTag + "'");
        }
        res = serializer.encryptedItem(itemcrypt::security::asBytes(*plainText), *key);
    }
    else
    {
        const auto password = readNewPassword();
        if (!password)
        {
            return fail("passwords do not match");
        }
        res = serializer.encryptedItem(itemcrypt::security::asBytes(*plainText), *password,
                                       schemeFromName(opts.scheme));
    }

    if (const auto* err = std::get_if<SerializationError>(&res))
    {
        return fail(errorText(*err));
    }
    const auto& item = std::get<EncryptedItem>(res);
    if (!writeFile(opts.output, item.serialize()))
    {
        return fail("cannot write '" + opts.output + "'");
    }
    m_out << "Encrypted " << plainText->size() << " bytes with scheme " << item.scheme().name() << ".\n";
    return 0;
}

int CommandLine::doDecrypt(const CryptOptions& opts)
{
    const itemcrypt::core::EncryptionSerialization serializer{ m_crypto };

    if (opts.stream)
    {
        auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
        const auto key = store->key(opts.keyTag);
        if (!key)
        {
            return fail("no key stored under '" + opts.keyTag + "'");
        }
        std::ifstream in{ opts.input, std::ios::binary };
        std::ofstream out{ opts.output, std::ios::binary | std::ios::trunc };
        if (!in || !out)
        {
            if (out.is_open())
            {
                discardOutput(out, opts.output);
            }
            return fail("cannot open input or output file");
        }
        const auto res = serializer.decryptStream(in, *key, out);
        if (const auto* err = std::get_if<SerializationError>(&res))
        {
            discardOutput(out, opts.output);
            return fail(errorText(*err));
        }
        m_out << "Stream decrypted.\n";
        return 0;
    }

    const auto bytes = readFile(opts.input);
    if (!bytes)
    {
        return fail("cannot read '" + opts.input + "'");
    }
    const auto parsed = serializer.parse(*bytes);
    if (const auto* err = std::get_if<SerializationError>(&parsed))
    {
        return fail(errorText(*err));
    }
    const auto& item = std::get<EncryptedItem>(parsed);

    itemcrypt::core::SerializationResult<SecureBuffer> res{ SerializationError::NoPassword };
    if (!opts.keyTag.empty())
    {
        auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
        const auto key = store->key(opts.keyTag);
        if (!key)
        {
            return fail("no key stored under '" + opts.keyTag + "'");
        }
        res = serializer.data(item, *key);
    }
    else
    {
        const auto password = m_pwdReader("Password: ");
        res = serializer.data(item, password);
    }

    if (const auto* err = std::get_if<SerializationError>(&res))
    {
        return fail(errorText(*err));
    }
    const auto& plainText = std::get<SecureBuffer>(res);
    if (!writeFile(opts.output, plainText))
    {
        return fail("cannot write '" + opts.output + "'");
    }
    m_out << "Decrypted " << plainText.size() << " bytes.\n";
    return 0;
}

int CommandLine::doKeyCreate(const KeyOptions& opts)
{
    const auto password = readNewPassword();
    if (!password)
    {
        return fail("passwords do not match");
    }

    const itemcrypt::core::EncryptionSerialization serializer{ m_crypto };
    const auto res = serializer.randomKey(*password, opts.keywords, schemeFromName(opts.scheme));
    if (const auto* err = std::get_if<SerializationError>(&res))
    {
        return fail(errorText(*err));
    }

    std::optional<std::string> context{};
    if (!opts.context.empty())
    {
        context = opts.context;
    }
    const EncryptionKey key{ std::get<EncryptionKey>(res).withContext(std::move(context)) };

    auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
    const EncryptionKey stored{ store->setKey(key, opts.tag) };
    m_out << "Key stored under '" << opts.tag << "' (scheme " << stored.scheme().name() << ").\n";
    return 0;
}

int CommandLine::doKeyShow(const KeyOptions& opts)
{
    auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
    const auto key = store->key(opts.tag);
    if (!key)
    {
        return fail("no key stored under '" + opts.tag + "'");
    }
    m_out << "tag: " << opts.tag << "\n";
    m_out << "scheme: " << key->scheme().name() << "\n";
    m_out << "context: " << key->context().value_or("(none)") << "\n";
    return 0;
}

int CommandLine::doKeyRm(const KeyOptions& opts)
{
    auto store = itemcrypt::storage::sqlite::makeSqliteKeyStore(opts.store);
    const auto removed = store->deleteKey(opts.tag);
    if (removed)
    {
        m_out << "Key '" << opts.tag << "' deleted.\n";
    }
    else
    {
        m_out << "No key under '" << opts.tag << "'.\n";
    }
    return 0;
}

} // namespace itemcrypt::ui::cli
