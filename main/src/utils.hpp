#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_verbose(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Verbosity control
void set_verbose_mode(bool enable);
bool get_verbose_mode();
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Joins an archive entry path under root. Throws LtarException(InvalidEntryPath)
// if the path is absolute or climbs out of root.
fs::path validate_path(const fs::path& path, const fs::path& root);

// Converts a host relative path to the '/'-separated form stored in archives.
std::string to_archive_path(const fs::path& relative);

// Strips a leading "./" and trailing '/' from a path read out of an archive.
std::string normalize_entry_path(std::string_view path);
