#ifndef CREDHASH_UI_CLI_CONSOLEUTILS_HPP
#define CREDHASH_UI_CLI_CONSOLEUTILS_HPP

#include "credhash/security/SecureString.hpp"
#include <iosfwd>
#include <string>

namespace credhash::ui::cli
{

// Locks pages in RAM and disables core dumps so plaintext passwords are not swapped or dumped.
void lockProcessMemory() noexcept;

// Writes the prompt to `prompt` and reads one line from `in`. Terminal echo is switched off
// while reading when `in` is std::cin attached to a terminal. A trailing '\r' is dropped.
[[nodiscard]] credhash::security::SecureString readPassword(const std::string& promptText, std::istream& in,
                                                            std::ostream& prompt);

// readPassword over std::cin, prompting on std::cerr.
[[nodiscard]] credhash::security::SecureString readPassword(const std::string& promptText);

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_CONSOLEUTILS_HPP
