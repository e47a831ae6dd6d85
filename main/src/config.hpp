#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

// Extension that marks a path as an archive in in-place mode
inline constexpr std::string_view TAR_EXTENSION = ".tar";

// Suffix of the staging file an archive is written to before it is renamed
inline constexpr std::string_view STAGING_SUFFIX = ".part";

// Block size handed to libarchive when opening an archive for reading
inline constexpr size_t ARCHIVE_READ_BLOCK_SIZE = 10240;

// Buffer used to stream regular file content into the archive
inline constexpr size_t COPY_BUFFER_SIZE = 8192;

// Directory holding the <lang>.txt translation files
extern std::filesystem::path L10N_DIR;

void set_l10n_dir(const std::string& dir);
