#include "ConsoleUtils.hpp"
#include "credhash/security/SecureString.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#endif

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    EXPECT_NO_THROW(credhash::ui::cli::lockProcessMemory());

#if defined(__linux__)
    munlockall();
#endif
}

TEST(ConsoleUtilsTest, ReadPasswordWritesPromptAndReturnsLine)
{
    std::istringstream in{ "hunter2\nleftover\n" };
    std::ostringstream prompt;

    const auto password{ credhash::ui::cli::readPassword("Password: ", in, prompt) };

    EXPECT_EQ(credhash::security::asStringView(password), "hunter2");
    EXPECT_EQ(prompt.str(), "Password: ");

    std::string rest;
    std::getline(in, rest);
    EXPECT_EQ(rest, "leftover");
}

TEST(ConsoleUtilsTest, ReadPasswordDropsCarriageReturn)
{
    std::istringstream in{ "p\xC3\xA4ssw\xC3\xB6rd\r\n" };
    std::ostringstream prompt;

    const auto password{ credhash::ui::cli::readPassword("Password: ", in, prompt) };

    EXPECT_EQ(credhash::security::asStringView(password), "p\xC3\xA4ssw\xC3\xB6rd");
}

TEST(ConsoleUtilsTest, ReadPasswordAtEndOfInputIsEmpty)
{
    std::istringstream in{ "" };
    std::ostringstream prompt;

    const auto password{ credhash::ui::cli::readPassword("Password: ", in, prompt) };

    EXPECT_TRUE(password.empty());
}
