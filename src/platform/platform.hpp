#pragma once

#include <filesystem>

namespace platform {

// Returns the user's home directory. ECHOTERM_HOME overrides HOME; if
// neither is set the password database is consulted.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
