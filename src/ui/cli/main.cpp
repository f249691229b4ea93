#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "credhash/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstring>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        credhash::ui::cli::lockProcessMemory();

        auto provider{ credhash::crypto::providers::makeOpenSslHashProvider() };
        const credhash::ui::cli::PasswordReader fromConsole{ [](const std::string& prompt) {
            return credhash::ui::cli::readPassword(prompt);
        } };
        credhash::ui::cli::CommandLine commandLine{ *provider, std::cout, std::cerr, fromConsole };

        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i{ 1 }; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
            // Keeps command-line passwords out of /proc/<pid>/cmdline.
            credhash::security::secureWipe(std::span<char>{ argv[i], std::strlen(argv[i]) });
        }
        return commandLine.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return credhash::ui::cli::g_kExitSoftware;
    }
}
