/**
 * @file FileUtils.hpp
 * @brief Standard directory lookup and small filesystem helpers.
 *
 * Directories come from QStandardPaths so they follow XDG on Linux.
 */

#pragma once
#include <filesystem>
#include <string_view>
#include "Result.hpp"

namespace nd::file {

namespace fs = std::filesystem;

fs::path configDir();
fs::path dataDir();
fs::path cacheDir();

// Creates the directory (and parents) if missing
Result<void> ensureDir(const fs::path& dir);

// Expands a leading "~/" to $HOME
fs::path expandPath(std::string_view path);

} // namespace nd::file
