#ifndef CREDHASH_UI_CLI_COMMANDLINE_HPP
#define CREDHASH_UI_CLI_COMMANDLINE_HPP

#include "credhash/crypto/IHashProvider.hpp"
#include "credhash/security/SecureString.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace credhash::ui::cli
{

// sysexits.h values.
constexpr int g_kExitOk{ 0 };
constexpr int g_kExitMismatch{ 1 };
constexpr int g_kExitUsage{ 2 };
constexpr int g_kExitDataError{ 65 };
constexpr int g_kExitSoftware{ 70 };

// Below this, hash-password -v recommends more iterations.
constexpr long long g_kSuggestMoreIterationsMs{ 100 };

// In tests: returns a pre-determined string.
using PasswordReader = std::function<credhash::security::SecureString(const std::string&)>;

class CommandLine final
{
public:
    CommandLine(const credhash::crypto::IHashProvider& provider, std::ostream& out, std::ostream& err,
                PasswordReader pwdReader);

    // args excludes the program name and may carry passwords; every string in it is wiped and
    // emptied before run returns. Returns the process exit code.
    int run(std::vector<std::string>& args);

private:
    const credhash::crypto::IHashProvider& m_provider;
    std::ostream& m_out;
    std::ostream& m_err;
    PasswordReader m_pwdReader;

    int dispatch(std::vector<std::string>& args);

    int doHashPassword(std::vector<std::string>& passwords, const std::string& algorithmName,
                       const std::uint32_t* iterations, bool verbose);
    int doVerifyPassword(const std::string& encoded);
    int doGenerateKey(const std::string& algorithmName);
    int doVerifyKey(const std::string& encoded, std::string& key);
    int doIdentifier(bool small, std::size_t count);
    int doAlgorithms();
};

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_COMMANDLINE_HPP
