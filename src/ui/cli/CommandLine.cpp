#include "CommandLine.hpp"
#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/HashedKey.hpp"
#include "credhash/core/HashedPassword.hpp"
#include "credhash/core/Identifier.hpp"
#include "credhash/core/KeyHasher.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/security/MemoryWiper.hpp"
#include "credhash/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <iomanip>
#include <span>
#include <stdexcept>
#include <utility>

namespace credhash::ui::cli
{

namespace
{

// Wipes argument strings when parsing and dispatch leave scope, also on exceptions thrown from
// subcommand callbacks.
class ArgumentWipe final
{
public:
    explicit ArgumentWipe(std::vector<std::string>& args) noexcept : m_args{ &args }
    {
    }

    ArgumentWipe(const ArgumentWipe&) = delete;
    ArgumentWipe& operator=(const ArgumentWipe&) = delete;

    ~ArgumentWipe() noexcept
    {
        for (auto& arg : *m_args)
        {
            credhash::security::secureWipe(arg);
        }
    }

private:
    std::vector<std::string>* m_args{ nullptr };
};

} // namespace

CommandLine::CommandLine(const credhash::crypto::IHashProvider& provider, std::ostream& out, std::ostream& err,
                         PasswordReader pwdReader)
    : m_provider(provider), m_out(out), m_err(err), m_pwdReader(std::move(pwdReader))
{
}

int CommandLine::run(std::vector<std::string>& args)
{
    try
    {
        return dispatch(args);
    }
    catch (const credhash::core::CredentialError& e)
    {
        m_err << "Error (" << credhash::core::toString(e.code()) << "): " << e.what() << "\n";
        return g_kExitDataError;
    }
    catch (const std::runtime_error& e)
    {
        m_err << "Fatal: " << e.what() << "\n";
        return g_kExitSoftware;
    }
}

int CommandLine::dispatch(std::vector<std::string>& args)
{
    const ArgumentWipe wipeArgs{ args };
    std::vector<std::string> argvStorage;
    const ArgumentWipe wipeArgv{ argvStorage };
    argvStorage.reserve(args.size() + 1);
    argvStorage.emplace_back("credhash");
    argvStorage.insert(argvStorage.end(), args.begin(), args.end());

    CLI::App app{ "Credential hashing and identifier tool" };
    app.require_subcommand(1);

    int exitCode{ g_kExitOk };

    // HASH-PASSWORD
    std::vector<std::string> passwords;
    std::string algorithmName;
    std::uint32_t iterations{};
    bool verbose{ false };
    auto* subHash = app.add_subcommand("hash-password", "Hash passwords (prompts when none are given)");
    subHash->add_flag("-v,--verbose", verbose, "Print the time taken per hash");
    subHash->add_option("-a,--algorithm", algorithmName, "Password algorithm name");
    auto* iterOpt = subHash->add_option("-i,--iterations", iterations, "Iteration count");
    subHash->add_option("password", passwords, "Passwords to hash");
    subHash->callback([&]() {
        exitCode = doHashPassword(passwords, algorithmName, (iterOpt->count() > 0U) ? &iterations : nullptr, verbose);
    });

    // VERIFY-PASSWORD
    std::string encodedArg;
    auto* subVerify = app.add_subcommand("verify-password", "Check a password against a stored hash");
    subVerify->add_option("encoded", encodedArg, "Encoded password hash")->required();
    subVerify->callback([&]() { exitCode = doVerifyPassword(encodedArg); });

    // GENERATE-KEY
    auto* subGenKey = app.add_subcommand("generate-key", "Generate a random key and its hash");
    subGenKey->add_option("-a,--algorithm", algorithmName, "Key algorithm name");
    subGenKey->callback([&]() { exitCode = doGenerateKey(algorithmName); });

    // VERIFY-KEY
    std::string keyArg;
    auto* subVerifyKey = app.add_subcommand("verify-key", "Check a key against a stored hash");
    subVerifyKey->add_option("encoded", encodedArg, "Encoded key hash")->required();
    subVerifyKey->add_option("key", keyArg, "Key, base64url (put -- first if it starts with -)")->required();
    subVerifyKey->callback([&]() { exitCode = doVerifyKey(encodedArg, keyArg); });

    // IDENTIFIER
    bool small{ false };
    std::size_t count{ 1U };
    auto* subId = app.add_subcommand("identifier", "Generate random identifiers");
    subId->add_flag("--small", small, "64-bit identifiers");
    subId->add_option("-n,--count", count, "Number of identifiers")->check(CLI::PositiveNumber);
    subId->callback([&]() { exitCode = doIdentifier(small, count); });

    // ALGORITHMS
    app.add_subcommand("algorithms", "List supported algorithms")->callback([&]() { exitCode = doAlgorithms(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(argvStorage.size());
        for (auto& arg : argvStorage)
        {
            argv.push_back(arg.data());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
        return g_kExitOk;
    }
    catch (const CLI::ParseError& e)
    {
        m_err << "Syntax Error: " << e.what() << "\n";
        return g_kExitUsage;
    }
    return exitCode;
}

// --- Handlers ---

int CommandLine::doHashPassword(std::vector<std::string>& passwords, const std::string& algorithmName,
                                const std::uint32_t* iterations, bool verbose)
{
    credhash::core::PasswordPolicy policy{ credhash::core::defaultPasswordPolicy() };
    if (!algorithmName.empty())
    {
        policy.algorithm = credhash::core::requirePasswordAlgorithm(algorithmName);
    }
    if (iterations != nullptr)
    {
        policy.iterations = *iterations;
    }
    const credhash::core::PasswordHasher hasher{ m_provider, policy };

    std::vector<credhash::security::SecureString> secrets;
    secrets.reserve(passwords.empty() ? 1U : passwords.size());
    for (auto& p : passwords)
    {
        secrets.push_back(credhash::security::secureStringTake(p));
    }
    if (secrets.empty())
    {
        secrets.push_back(m_pwdReader("Password: "));
    }

    for (auto& secret : secrets)
    {
        auto wipeSecret = credhash::security::scopeWipe(secret);

        const auto start{ std::chrono::steady_clock::now() };
        const credhash::core::HashedPassword hashed{ hasher.hashPassword(credhash::security::asStringView(secret)) };
        const auto elapsed{ std::chrono::steady_clock::now() - start };

        m_out << hashed.toString() << "\n";
        if (verbose)
        {
            const auto micros{ std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() };
            m_out << "Completed in " << (micros / 1000) << "." << std::setw(3) << std::setfill('0') << (micros % 1000)
                  << std::setfill(' ') << " ms\n";
            if ((micros / 1000) < g_kSuggestMoreIterationsMs)
            {
                m_err << "Password was hashed in under " << g_kSuggestMoreIterationsMs
                      << " ms, recommend increasing the iterations (currently " << policy.iterations << ")\n";
            }
        }
    }
    return g_kExitOk;
}

int CommandLine::doVerifyPassword(const std::string& encoded)
{
    const auto hashed{ credhash::core::HashedPassword::valueOf(encoded) };
    const credhash::core::PasswordHasher hasher{ m_provider };

    auto pass = m_pwdReader("Password: ");
    auto wipePass = credhash::security::scopeWipe(pass);

    if (!hasher.matches(*hashed, credhash::security::asStringView(pass)))
    {
        m_out << "no match\n";
        return g_kExitMismatch;
    }
    m_out << "match\n";
    if (hasher.isRehashRecommended(*hashed))
    {
        m_out << "rehash recommended\n";
    }
    return g_kExitOk;
}

int CommandLine::doGenerateKey(const std::string& algorithmName)
{
    const credhash::crypto::KeyAlgorithm algorithm{ algorithmName.empty()
                                                        ? credhash::core::recommendedKeyAlgorithm()
                                                        : credhash::core::requireKeyAlgorithm(algorithmName) };
    const credhash::core::KeyHasher hasher{ m_provider };

    credhash::security::SecureBuffer key{ hasher.generateKey(algorithm) };
    const credhash::core::HashedKey hashed{ hasher.hashKey(algorithm, credhash::security::asSpan(key)) };

    m_out << "key: " << credhash::core::base64UrlEncode(credhash::security::asSpan(key)) << "\n";
    m_out << "hashed: " << hashed.toString() << "\n";
    return g_kExitOk;
}

int CommandLine::doVerifyKey(const std::string& encoded, std::string& key)
{
    auto wipeKey = credhash::security::ScopeWipe{ std::as_writable_bytes(std::span<char>{ key.data(), key.size() }) };
    const auto hashed{ credhash::core::HashedKey::valueOf(encoded) };
    const credhash::core::KeyHasher hasher{ m_provider };

    const credhash::security::SecureBuffer keyBytes{ credhash::core::base64UrlDecode(key) };
    if (!hasher.matches(*hashed, credhash::security::asSpan(keyBytes)))
    {
        m_out << "no match\n";
        return g_kExitMismatch;
    }
    m_out << "match\n";
    return g_kExitOk;
}

int CommandLine::doIdentifier(bool small, std::size_t count)
{
    for (std::size_t i{}; i < count; ++i)
    {
        if (small)
        {
            m_out << credhash::core::SmallIdentifier::random().toString() << "\n";
        }
        else
        {
            m_out << credhash::core::Identifier::random().toString() << "\n";
        }
    }
    return g_kExitOk;
}

int CommandLine::doAlgorithms()
{
    const credhash::core::PasswordPolicy policy{ credhash::core::defaultPasswordPolicy() };
    const credhash::crypto::KeyAlgorithm recommendedKey{ credhash::core::recommendedKeyAlgorithm() };

    m_out << "Password algorithms (weakest first):\n";
    for (const auto& info : credhash::crypto::passwordAlgorithms())
    {
        m_out << "  " << std::left << std::setw(22) << info.name << std::right << " salt=" << info.saltBytes
              << " hash=" << info.hashBytes;
        if (info.algorithm == policy.algorithm)
        {
            m_out << " (recommended, " << policy.iterations << " iterations)";
        }
        if (!m_provider.supports(info.algorithm))
        {
            m_out << " (unavailable)";
        }
        m_out << "\n";
    }

    m_out << "Key algorithms (weakest first):\n";
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        m_out << "  " << std::left << std::setw(22) << info.name << std::right << " key=" << info.keyBytes
              << " hash=" << info.hashBytes;
        if (info.algorithm == recommendedKey)
        {
            m_out << " (recommended)";
        }
        if (!m_provider.supports(info.algorithm))
        {
            m_out << " (unavailable)";
        }
        m_out << "\n";
    }
    return g_kExitOk;
}

} // namespace credhash::ui::cli
