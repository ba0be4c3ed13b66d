#ifndef KMSLOCAL_UI_CLI_CONSOLEUTILS_HPP
#define KMSLOCAL_UI_CLI_CONSOLEUTILS_HPP

#include "kmslocal/security/SecureString.hpp"
#include <string>

namespace kmslocal::ui::cli
{

// Keeps key material out of swap and core dumps. Best effort.
void lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo disabled.
[[nodiscard]] kmslocal::security::SecureString readSecret(const std::string& prompt);

} // namespace kmslocal::ui::cli

#endif // KMSLOCAL_UI_CLI_CONSOLEUTILS_HPP
