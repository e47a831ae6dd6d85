#pragma once

#include "archive.hpp"

#include <filesystem>
#include <vector>

// Recreates every entry of the tar at archive_path under output_dir, creating
// output_dir and any missing parent directories on demand. Symlinks are
// restored with their stored targets verbatim. Entries that would land outside
// output_dir raise LtarException(InvalidEntryPath).
void extract_archive(const std::filesystem::path& output_dir, const std::filesystem::path& archive_path);

// Entry headers of the tar at archive_path, in stream order.
std::vector<ArchiveEntry> list_archive(const std::filesystem::path& archive_path);
