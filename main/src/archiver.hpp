#pragma once

#include <filesystem>
#include <string>

// Archives the directory named by source into an uncompressed tar at
// archive_path. A trailing separator on source archives its contents at the
// top level; without one the directory itself becomes the top-level entry.
// Symlinks are stored with their literal targets and never followed.
// The archive is written to a staging file and only renamed into place once
// complete, so a failed call leaves no archive behind.
void create_archive(const std::filesystem::path& archive_path, const std::string& source);
