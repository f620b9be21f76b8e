#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns ~/.cumulus (not created).
std::filesystem::path cumulus_home();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Writes content to a fresh file in the temp dir named "<prefix>_<random>".
// Returns the path, or an empty path if the file could not be written.
std::filesystem::path write_temp_file(const std::string& prefix, const std::string& content);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
